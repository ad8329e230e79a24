#include <gtest/gtest.h>
#include "correction_passes.hpp"
#include "text_utils.hpp"
#include <map>

using TextUtils::ToU32;
using TextUtils::ToUtf8;

namespace {
class MapSpellChecker : public SpellChecker {
public:
    explicit MapSpellChecker(std::map<std::string, std::vector<std::string>> fixes) : fixes_(std::move(fixes)) {}

    std::set<std::string> Unknown(const std::set<std::string>& words) override {
        std::set<std::string> unknown;
        for (const auto& word : words) {
            if (fixes_.count(word)) unknown.insert(word);
        }
        return unknown;
    }
    std::vector<std::string> Candidates(const std::string& word) override {
        ++candidate_calls;
        auto it = fixes_.find(word);
        return it == fixes_.end() ? std::vector<std::string>{} : it->second;
    }
    std::string Name() const override { return "map"; }

    int candidate_calls = 0;

private:
    std::map<std::string, std::vector<std::string>> fixes_;
};

std::string Apply(const std::string& text, const std::vector<CorrectionIssue>& issues,
                  SubstitutionMode mode = SubstitutionMode::Compatible) {
    return ToUtf8(CorrectionPasses::ApplyIssues(ToU32(text), issues, mode));
}
}

TEST(HyphenationTest, RejoinsWordSplitAcrossLines) {
    auto issues = CorrectionPasses::FindHyphenation(ToU32("чер-\nный кот"));
    ASSERT_EQ(issues.size(), 1u);
    EXPECT_EQ(issues[0].kind, IssueKind::Hyphenation);
    EXPECT_EQ(issues[0].original, "чер-\nный");
    EXPECT_EQ(issues[0].suggestion, "черный");
    EXPECT_EQ(issues[0].matched_span, "р-\nн");
    EXPECT_EQ(issues[0].offset, 0u);
    EXPECT_EQ(Apply("чер-\nный кот", issues), "черный кот");
}

TEST(HyphenationTest, IgnoresOrdinaryHyphensAndLatin) {
    EXPECT_TRUE(CorrectionPasses::FindHyphenation(ToU32("из-за того")).empty());
    EXPECT_TRUE(CorrectionPasses::FindHyphenation(ToU32("black-\nboard")).empty());
    EXPECT_TRUE(CorrectionPasses::FindHyphenation(ToU32("конец -\nначало")).empty());
}

TEST(HyphenationTest, FindsSeveralBreaks) {
    const std::string text = "при-\nмер и до-\nма";
    auto issues = CorrectionPasses::FindHyphenation(ToU32(text));
    ASSERT_EQ(issues.size(), 2u);
    EXPECT_EQ(issues[1].suggestion, "дома");
    EXPECT_EQ(Apply(text, issues), "пример и дома");
}

TEST(ConfusableTest, ChangesOnlyMappedCharacters) {
    auto issues = CorrectionPasses::FindConfusables(ToU32("рl0ва"), SubstitutionMode::Compatible);
    ASSERT_EQ(issues.size(), 1u);
    EXPECT_EQ(issues[0].kind, IssueKind::ConfusableChar);
    EXPECT_EQ(issues[0].original, "рl0ва");
    EXPECT_EQ(issues[0].suggestion, "ріОва");
}

TEST(ConfusableTest, CleanTokensProduceNoIssues) {
    EXPECT_TRUE(CorrectionPasses::FindConfusables(ToU32("Привет мир"), SubstitutionMode::Compatible).empty());
    EXPECT_TRUE(CorrectionPasses::FindConfusables(ToU32("42 25"), SubstitutionMode::Compatible).empty());
}

TEST(ConfusableTest, OneIssuePerDistinctTokenInCompatibleMode) {
    auto issues = CorrectionPasses::FindConfusables(ToU32("Привет 3 3ажигалка 3"), SubstitutionMode::Compatible);
    ASSERT_EQ(issues.size(), 2u);
    EXPECT_EQ(issues[0].original, "3");
    EXPECT_EQ(issues[0].suggestion, "З");
    EXPECT_EQ(issues[1].original, "3ажигалка");
    EXPECT_EQ(issues[1].suggestion, "Зажигалка");
}

TEST(ConfusableTest, OneIssuePerOccurrenceInSpanMode) {
    auto issues = CorrectionPasses::FindConfusables(ToU32("3 и 3"), SubstitutionMode::SpanBased);
    ASSERT_EQ(issues.size(), 2u);
    EXPECT_EQ(issues[0].offset, 0u);
    EXPECT_EQ(issues[1].offset, 4u);
    EXPECT_EQ(Apply("3 и 3", issues, SubstitutionMode::SpanBased), "З и З");
}

TEST(ContextTest, CaseInsensitiveMatchUsesSamePhrase) {
    auto lower = CorrectionPasses::FindContextErrors(ToU32("смотрю в нес"), false);
    auto upper = CorrectionPasses::FindContextErrors(ToU32("СМОТРЮ В НЕС"), false);
    ASSERT_EQ(lower.size(), 1u);
    ASSERT_EQ(upper.size(), 1u);
    EXPECT_EQ(lower[0].suggestion, "в нее");
    EXPECT_EQ(upper[0].suggestion, "в нее");
    EXPECT_EQ(upper[0].original, "В НЕС");
    EXPECT_EQ(Apply("смотрю в нес", lower), "смотрю в нее");
    EXPECT_EQ(Apply("СМОТРЮ В НЕС", upper), "СМОТРЮ в нее");
}

TEST(ContextTest, SubstringMatchingByDefault) {
    auto issues = CorrectionPasses::FindContextErrors(ToU32("Привет"), false);
    ASSERT_EQ(issues.size(), 1u);
    EXPECT_EQ(issues[0].original, "ве");
    EXPECT_EQ(issues[0].offset, 3u);
}

TEST(ContextTest, WholeWordMatchingSkipsWordInteriors) {
    EXPECT_TRUE(CorrectionPasses::FindContextErrors(ToU32("Привет"), true).empty());
    auto issues = CorrectionPasses::FindContextErrors(ToU32("вижу ве"), true);
    ASSERT_EQ(issues.size(), 1u);
    EXPECT_EQ(issues[0].suggestion, "её");
}

TEST(GrammarIssuesTest, KeepsTyposAndGrammarWithReplacements) {
    const std::u32string text = ToU32("Я пашол домой");
    std::vector<GrammarMatch> matches = {
        {"TYPOS", 2, 5, {"пошёл", "пошел"}},
        {"PUNCTUATION", 0, 1, {"Я,"}},
        {"GRAMMAR", 8, 5, {}},
        {"GRAMMAR", 10, 40, {"вне текста"}},
    };
    CorrectionConfig config;
    auto issues = CorrectionPasses::BuildGrammarIssues(text, matches, config);
    ASSERT_EQ(issues.size(), 1u);
    EXPECT_EQ(issues[0].kind, IssueKind::Grammar);
    EXPECT_EQ(issues[0].original, "пашол");
    EXPECT_EQ(issues[0].suggestion, "пошёл");
    EXPECT_EQ(issues[0].policy, ReplacePolicy::ReplaceFirst);
    ASSERT_TRUE(issues[0].confidence.has_value());
    EXPECT_FLOAT_EQ(*issues[0].confidence, 0.8f);
}

TEST(GrammarIssuesTest, DefaultConfidenceIsReportedButNotApplied) {
    const std::string text = "Я пашол домой";
    std::vector<GrammarMatch> matches = {{"TYPOS", 2, 5, {"пошёл"}}};

    CorrectionConfig config;
    auto issues = CorrectionPasses::BuildGrammarIssues(ToU32(text), matches, config);
    ASSERT_EQ(issues.size(), 1u);
    EXPECT_FALSE(issues[0].auto_apply);
    EXPECT_EQ(Apply(text, issues), text);

    config.grammar_apply_threshold = 0.5f;
    issues = CorrectionPasses::BuildGrammarIssues(ToU32(text), matches, config);
    EXPECT_TRUE(issues[0].auto_apply);
    EXPECT_EQ(Apply(text, issues), "Я пошёл домой");
}

TEST(SpellingTest, ReportsUnknownRussianWordsWithCandidates) {
    MapSpellChecker checker({{"ашибка", {"ошибка", "ошибки", "ушибка", "лишнее"}}});
    CorrectionConfig config;
    auto issues = CorrectionPasses::FindSpellingErrors(ToU32("Это ашибка, word"), checker, config);
    ASSERT_EQ(issues.size(), 1u);
    EXPECT_EQ(issues[0].kind, IssueKind::Spelling);
    EXPECT_EQ(issues[0].original, "ашибка");
    EXPECT_EQ(issues[0].suggestion, "ошибка");
    EXPECT_EQ(issues[0].policy, ReplacePolicy::ReplaceFirst);
    ASSERT_TRUE(issues[0].candidates.has_value());
    EXPECT_EQ(issues[0].candidates->size(), 3u);
    EXPECT_EQ(issues[0].candidates->front(), "ошибка");
}

TEST(SpellingTest, SkipsNonRussianAndMixedTokens) {
    MapSpellChecker checker({{"word", {"world"}}, {"тек3т", {"текст"}}});
    CorrectionConfig config;
    EXPECT_TRUE(CorrectionPasses::FindSpellingErrors(ToU32("word тек3т"), checker, config).empty());
}

TEST(SpellingTest, SkipsWordsWithoutUsefulCandidate) {
    MapSpellChecker checker({{"ничего", {}}, {"такое", {"такое"}}});
    CorrectionConfig config;
    EXPECT_TRUE(CorrectionPasses::FindSpellingErrors(ToU32("ничего такое"), checker, config).empty());
}

TEST(SpellingTest, CandidatesLookedUpOncePerWord) {
    MapSpellChecker checker(std::map<std::string, std::vector<std::string>>{{"ашибка", {"ошибка"}}});
    CorrectionConfig config;
    config.substitution = SubstitutionMode::SpanBased;
    auto issues = CorrectionPasses::FindSpellingErrors(ToU32("ашибка и ашибка"), checker, config);
    EXPECT_EQ(issues.size(), 2u);
    EXPECT_EQ(checker.candidate_calls, 1);
}

TEST(ApplyIssuesTest, CompatibleModeReplacesEverySubstring) {
    CorrectionIssue issue{IssueKind::Context, "ве", "её", "ве", "Context"};
    EXPECT_EQ(Apply("ве Привет", {issue}), "её Приеёт");
}

TEST(ApplyIssuesTest, SpanModeTouchesOnlyTheFoundSpan) {
    CorrectionIssue issue{IssueKind::Context, "ве", "её", "ве", "Context"};
    issue.offset = 0;
    EXPECT_EQ(Apply("ве Привет", {issue}, SubstitutionMode::SpanBased), "её Привет");
}

TEST(ApplyIssuesTest, SpanModeSkipsStaleAndOverlappingSpans) {
    CorrectionIssue stale{IssueKind::Spelling, "кот", "кит", "кот", "Spelling"};
    stale.offset = 5;
    CorrectionIssue first{IssueKind::Context, "абв", "x", "абв", "Context"};
    first.offset = 0;
    CorrectionIssue overlapping{IssueKind::Context, "бв", "y", "бв", "Context"};
    overlapping.offset = 1;
    EXPECT_EQ(Apply("абв где", {first, overlapping, stale}, SubstitutionMode::SpanBased), "x где");
}
