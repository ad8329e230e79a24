#include <gtest/gtest.h>
#include "correction_pipeline.hpp"
#include "errors.hpp"
#include <numeric>

namespace {
class FakeSpellChecker : public SpellChecker {
public:
    FakeSpellChecker(std::string wrong, std::string right, bool* destroyed = nullptr)
        : wrong_(std::move(wrong)), right_(std::move(right)), destroyed_(destroyed) {}
    ~FakeSpellChecker() override {
        if (destroyed_) *destroyed_ = true;
    }

    std::set<std::string> Unknown(const std::set<std::string>& words) override {
        std::set<std::string> unknown;
        if (words.count(wrong_)) unknown.insert(wrong_);
        return unknown;
    }
    std::vector<std::string> Candidates(const std::string& word) override {
        return word == wrong_ ? std::vector<std::string>{right_} : std::vector<std::string>{};
    }
    std::string Name() const override { return "fake"; }

private:
    std::string wrong_;
    std::string right_;
    bool* destroyed_;
};

class FailingGrammarChecker : public GrammarChecker {
public:
    std::vector<GrammarMatch> Check(const std::string&) override {
        throw CapabilityCallFailure("server went away");
    }
    std::string Name() const override { return "failing"; }
};

// Records the text it saw so stage ordering can be checked.
class RecordingGrammarChecker : public GrammarChecker {
public:
    explicit RecordingGrammarChecker(std::string* seen) : seen_(seen) {}
    std::vector<GrammarMatch> Check(const std::string& text) override {
        *seen_ = text;
        return {};
    }
    std::string Name() const override { return "recording"; }

private:
    std::string* seen_;
};

CorrectionConfig LocalOnly() {
    CorrectionConfig config;
    config.enable_grammar = false;
    config.enable_spelling = false;
    return config;
}

void ExpectCountsConsistent(const CorrectionResult& result) {
    EXPECT_EQ(result.issue_count, result.issues.size());
    size_t total = std::accumulate(result.counts_by_kind.begin(), result.counts_by_kind.end(), size_t{0},
                                   [](size_t sum, const auto& entry) { return sum + entry.second; });
    EXPECT_EQ(total, result.issue_count);
}
}

TEST(CorrectionPipelineTest, StagesRunInFixedOrder) {
    CorrectionStage stage = CorrectionStage::Hyphenation;
    std::vector<std::string> names;
    while (stage != CorrectionStage::Done) {
        names.push_back(CorrectionPipeline::StageName(stage));
        stage = CorrectionPipeline::Next(stage);
    }
    EXPECT_EQ(names, (std::vector<std::string>{"hyphenation", "confusable", "context", "grammar", "spelling"}));
    EXPECT_EQ(CorrectionPipeline::Next(CorrectionStage::Done), CorrectionStage::Done);
}

TEST(CorrectionPipelineTest, LaterStagesSeeEarlierCorrections) {
    std::string seen;
    CorrectionConfig config;
    config.enable_spelling = false;
    CorrectionPipeline pipeline(config, std::make_unique<RecordingGrammarChecker>(&seen));

    auto result = pipeline.Run("чер-\nный 3амок");
    EXPECT_EQ(seen, "черный Замок");
    EXPECT_EQ(result.corrected_text, "черный Замок");
    ASSERT_EQ(result.issues.size(), 2u);
    EXPECT_EQ(result.issues[0].kind, IssueKind::Hyphenation);
    EXPECT_EQ(result.issues[1].kind, IssueKind::ConfusableChar);
}

TEST(CorrectionPipelineTest, ConfusableScenarioReportsEachDistinctToken) {
    CorrectionPipeline pipeline(LocalOnly());
    auto result = pipeline.Run("Привет 3 3ажигалка");

    size_t confusable = 0;
    for (const auto& issue : result.issues) {
        if (issue.kind == IssueKind::ConfusableChar) ++confusable;
    }
    EXPECT_EQ(confusable, 2u);
    EXPECT_EQ(result.counts_by_kind[IssueKind::ConfusableChar], 2u);
    EXPECT_NE(result.corrected_text.find("З Зажигалка"), std::string::npos);
    ExpectCountsConsistent(result);
}

TEST(CorrectionPipelineTest, CleanTextHasNoIssues) {
    CorrectionPipeline pipeline(LocalOnly());
    auto result = pipeline.Run("Мама мыла раму");
    EXPECT_TRUE(result.issues.empty());
    EXPECT_EQ(result.corrected_text, result.original_text);
    ExpectCountsConsistent(result);
}

TEST(CorrectionPipelineTest, FailingCapabilityIsNotFatal) {
    CorrectionPipeline pipeline(CorrectionConfig{}, std::make_unique<FailingGrammarChecker>(),
                                std::make_unique<FakeSpellChecker>("ашибка", "ошибка"));
    auto result = pipeline.Run("тут ашибка");
    ASSERT_EQ(result.issues.size(), 1u);
    EXPECT_EQ(result.issues[0].kind, IssueKind::Spelling);
    EXPECT_EQ(result.corrected_text, "тут ошибка");
}

TEST(CorrectionPipelineTest, DisabledStagesAreSkipped) {
    CorrectionConfig config;
    config.enable_confusable = false;
    config.enable_spelling = false;
    CorrectionPipeline pipeline(config, nullptr, std::make_unique<FakeSpellChecker>("ашибка", "ошибка"));

    auto result = pipeline.Run("3 ашибка");
    EXPECT_TRUE(result.issues.empty());
    EXPECT_EQ(result.corrected_text, "3 ашибка");
}

TEST(CorrectionPipelineTest, AvailabilityReflectsInjectedCapabilities) {
    CorrectionPipeline without(CorrectionConfig{});
    EXPECT_FALSE(without.Availability().grammar);
    EXPECT_FALSE(without.Availability().spelling);

    CorrectionPipeline with(CorrectionConfig{}, std::make_unique<FailingGrammarChecker>(),
                            std::make_unique<FakeSpellChecker>("а", "б"));
    EXPECT_TRUE(with.Availability().grammar);
    EXPECT_TRUE(with.Availability().spelling);
}

TEST(CorrectionPipelineTest, ShutdownReleasesCapabilities) {
    bool destroyed = false;
    CorrectionPipeline pipeline(CorrectionConfig{}, nullptr,
                                std::make_unique<FakeSpellChecker>("ашибка", "ошибка", &destroyed));
    pipeline.Shutdown();
    EXPECT_TRUE(destroyed);
    EXPECT_FALSE(pipeline.Availability().spelling);

    // Still usable for the local stages.
    auto result = pipeline.Run("ашибка 3");
    EXPECT_EQ(result.corrected_text, "ашибка З");
}

TEST(CorrectionPipelineTest, FirstOccurrenceReplacementLeavesRepeatsForNextRun) {
    CorrectionConfig config = LocalOnly();
    config.enable_spelling = true;
    CorrectionPipeline pipeline(config, nullptr, std::make_unique<FakeSpellChecker>("ашибка", "ошибка"));

    auto first = pipeline.Run("ашибка и ашибка");
    EXPECT_EQ(first.issue_count, 1u);
    EXPECT_EQ(first.corrected_text, "ошибка и ашибка");

    // Known gap: the second occurrence is reported again on the next run.
    auto second = pipeline.Run(first.corrected_text);
    EXPECT_EQ(second.issue_count, 1u);
    EXPECT_EQ(second.corrected_text, "ошибка и ошибка");
}

TEST(CorrectionPipelineTest, SpanBasedSubstitutionIsIdempotent) {
    CorrectionConfig config = LocalOnly();
    config.enable_spelling = true;
    config.substitution = SubstitutionMode::SpanBased;
    CorrectionPipeline pipeline(config, nullptr, std::make_unique<FakeSpellChecker>("ашибка", "ошибка"));

    auto first = pipeline.Run("ашибка и ашибка, 3амок");
    EXPECT_EQ(first.corrected_text, "ошибка и ошибка, Замок");
    ExpectCountsConsistent(first);

    auto second = pipeline.Run(first.corrected_text);
    EXPECT_EQ(second.issue_count, 0u);
    EXPECT_EQ(second.corrected_text, first.corrected_text);
}

TEST(CorrectionPipelineTest, SpanBasedContextLeavesOtherWordsAlone) {
    CorrectionConfig config = LocalOnly();
    config.substitution = SubstitutionMode::SpanBased;
    config.context_whole_words = true;
    CorrectionPipeline pipeline(config);

    auto result = pipeline.Run("Привет, вижу ве");
    ASSERT_EQ(result.issue_count, 1u);
    EXPECT_EQ(result.corrected_text, "Привет, вижу её");
}

TEST(CorrectionTypesTest, KindNamesAreStable) {
    EXPECT_STREQ(KindName(IssueKind::Hyphenation), "hyphenation");
    EXPECT_STREQ(KindName(IssueKind::ConfusableChar), "confusable_char");
    EXPECT_STREQ(KindName(IssueKind::Context), "context");
    EXPECT_STREQ(KindName(IssueKind::Grammar), "grammar");
    EXPECT_STREQ(KindName(IssueKind::Spelling), "spelling");
}
