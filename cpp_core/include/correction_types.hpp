#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>

enum class IssueKind {
    Hyphenation,
    ConfusableChar,
    Context,
    Grammar,
    Spelling
};

// How an issue's substitution is applied to the text of its stage.
enum class ReplacePolicy {
    ReplaceAll,
    ReplaceFirst
};

enum class SubstitutionMode {
    Compatible,  // plain substring replacement, global or first occurrence
    SpanBased    // only the span the issue was found at
};

struct CorrectionIssue {
    IssueKind kind;
    std::string original;
    std::string suggestion;
    std::string matched_span;
    std::string description;
    std::optional<float> confidence;
    std::optional<std::vector<std::string>> candidates;

    ReplacePolicy policy = ReplacePolicy::ReplaceAll;
    size_t offset = 0;       // code point offset in the text the stage examined
    bool auto_apply = true;  // false for suggestions that are only reported
};

struct CorrectionResult {
    std::string original_text;
    std::string corrected_text;
    std::vector<CorrectionIssue> issues;
    size_t issue_count = 0;
    std::map<IssueKind, size_t> counts_by_kind;
};

struct CorrectionConfig {
    bool enable_hyphenation = true;
    bool enable_confusable = true;
    bool enable_context = true;
    bool enable_grammar = true;
    bool enable_spelling = true;

    float grammar_confidence = 0.8f;
    float grammar_apply_threshold = 0.8f;  // applied only when confidence is strictly above
    size_t spelling_candidates = 3;

    bool context_whole_words = false;
    SubstitutionMode substitution = SubstitutionMode::Compatible;
};

// Stable lowercase names: hyphenation, confusable_char, context, grammar, spelling.
const char* KindName(IssueKind kind);

std::map<IssueKind, size_t> CountByKind(const std::vector<CorrectionIssue>& issues);
