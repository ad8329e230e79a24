#include "correction_pipeline.hpp"
#include "correction_passes.hpp"
#include "text_utils.hpp"
#include <iostream>
#include <iterator>
#include <utility>

CorrectionPipeline::CorrectionPipeline(const CorrectionConfig& config,
                                       std::unique_ptr<GrammarChecker> grammar,
                                       std::unique_ptr<SpellChecker> spelling)
    : config_(config), grammar_(std::move(grammar)), spelling_(std::move(spelling)) {
    if (config_.enable_grammar && !grammar_) {
        std::cerr << "[Pipeline] No grammar checker available, grammar stage disabled" << std::endl;
    }
    if (config_.enable_spelling && !spelling_) {
        std::cerr << "[Pipeline] No spell checker available, spelling stage disabled" << std::endl;
    }
}

CorrectionPipeline::~CorrectionPipeline() {
    Shutdown();
}

void CorrectionPipeline::Shutdown() {
    grammar_.reset();
    spelling_.reset();
}

CapabilityAvailability CorrectionPipeline::Availability() const {
    CapabilityAvailability availability;
    availability.grammar = grammar_ != nullptr;
    availability.spelling = spelling_ != nullptr;
    return availability;
}

CorrectionStage CorrectionPipeline::Next(CorrectionStage stage) {
    switch (stage) {
        case CorrectionStage::Hyphenation: return CorrectionStage::ConfusableChar;
        case CorrectionStage::ConfusableChar: return CorrectionStage::Context;
        case CorrectionStage::Context: return CorrectionStage::Grammar;
        case CorrectionStage::Grammar: return CorrectionStage::Spelling;
        case CorrectionStage::Spelling: return CorrectionStage::Done;
        case CorrectionStage::Done: return CorrectionStage::Done;
    }
    return CorrectionStage::Done;
}

const char* CorrectionPipeline::StageName(CorrectionStage stage) {
    switch (stage) {
        case CorrectionStage::Hyphenation: return "hyphenation";
        case CorrectionStage::ConfusableChar: return "confusable";
        case CorrectionStage::Context: return "context";
        case CorrectionStage::Grammar: return "grammar";
        case CorrectionStage::Spelling: return "spelling";
        case CorrectionStage::Done: return "done";
    }
    return "unknown";
}

bool CorrectionPipeline::Enabled(CorrectionStage stage) const {
    switch (stage) {
        case CorrectionStage::Hyphenation: return config_.enable_hyphenation;
        case CorrectionStage::ConfusableChar: return config_.enable_confusable;
        case CorrectionStage::Context: return config_.enable_context;
        case CorrectionStage::Grammar: return config_.enable_grammar && grammar_ != nullptr;
        case CorrectionStage::Spelling: return config_.enable_spelling && spelling_ != nullptr;
        case CorrectionStage::Done: return false;
    }
    return false;
}

std::vector<CorrectionIssue> CorrectionPipeline::FindIssues(CorrectionStage stage, const std::u32string& text) {
    switch (stage) {
        case CorrectionStage::Hyphenation:
            return CorrectionPasses::FindHyphenation(text);
        case CorrectionStage::ConfusableChar:
            return CorrectionPasses::FindConfusables(text, config_.substitution);
        case CorrectionStage::Context:
            return CorrectionPasses::FindContextErrors(text, config_.context_whole_words);
        case CorrectionStage::Grammar:
            return CorrectionPasses::BuildGrammarIssues(text, grammar_->Check(TextUtils::ToUtf8(text)), config_);
        case CorrectionStage::Spelling:
            return CorrectionPasses::FindSpellingErrors(text, *spelling_, config_);
        case CorrectionStage::Done:
            break;
    }
    return {};
}

CorrectionResult CorrectionPipeline::Run(const std::string& text) {
    std::cout << "[Pipeline] Checking text (" << TextUtils::CodePointCount(text) << " chars)" << std::endl;

    CorrectionResult result;
    result.original_text = text;

    std::u32string current = TextUtils::ToU32(text);
    for (CorrectionStage stage = CorrectionStage::Hyphenation; stage != CorrectionStage::Done; stage = Next(stage)) {
        if (!Enabled(stage)) continue;

        std::vector<CorrectionIssue> issues;
        try {
            issues = FindIssues(stage, current);
        } catch (const std::exception& e) {
            std::cerr << "[Pipeline] " << StageName(stage) << " stage failed, no issues taken: "
                      << e.what() << std::endl;
            continue;
        }

        current = CorrectionPasses::ApplyIssues(current, issues, config_.substitution);
        result.issues.insert(result.issues.end(), std::make_move_iterator(issues.begin()),
                             std::make_move_iterator(issues.end()));
    }

    result.corrected_text = TextUtils::ToUtf8(current);
    result.issue_count = result.issues.size();
    result.counts_by_kind = CountByKind(result.issues);

    std::cout << "[Pipeline] Issues found: " << result.issue_count << std::endl;
    return result;
}
