#include "correction_types.hpp"

const char* KindName(IssueKind kind) {
    switch (kind) {
        case IssueKind::Hyphenation: return "hyphenation";
        case IssueKind::ConfusableChar: return "confusable_char";
        case IssueKind::Context: return "context";
        case IssueKind::Grammar: return "grammar";
        case IssueKind::Spelling: return "spelling";
    }
    return "unknown";
}

std::map<IssueKind, size_t> CountByKind(const std::vector<CorrectionIssue>& issues) {
    std::map<IssueKind, size_t> counts;
    for (const auto& issue : issues) {
        ++counts[issue.kind];
    }
    return counts;
}
