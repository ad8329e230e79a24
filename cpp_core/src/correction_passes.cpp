#include "correction_passes.hpp"
#include "text_utils.hpp"
#include <algorithm>
#include <map>
#include <set>

using TextUtils::ToUtf8;

namespace {
bool IsTargetWord(const std::u32string& word) {
    return !word.empty() && std::all_of(word.begin(), word.end(), TextUtils::IsTargetLetter);
}

std::string Quoted(const std::u32string& from, const std::u32string& to) {
    return "\"" + ToUtf8(from) + "\" -> \"" + ToUtf8(to) + "\"";
}

bool AtWordBoundary(const std::u32string& text, size_t begin, size_t end) {
    bool left = begin == 0 || !TextUtils::IsWordChar(text[begin - 1]);
    bool right = end >= text.size() || !TextUtils::IsWordChar(text[end]);
    return left && right;
}

std::u32string ApplySpans(const std::u32string& text, const std::vector<CorrectionIssue>& issues) {
    struct Edit {
        size_t offset;
        size_t length;
        std::u32string to;
    };
    // Edits are taken in issue order; one that overlaps an earlier edit, or whose
    // span no longer holds its original text, is dropped.
    std::vector<Edit> edits;
    for (const auto& issue : issues) {
        if (!issue.auto_apply) continue;
        const std::u32string from = TextUtils::ToU32(issue.original);
        const size_t end = issue.offset + from.size();
        if (end > text.size() || text.compare(issue.offset, from.size(), from) != 0) continue;

        bool overlaps = std::any_of(edits.begin(), edits.end(), [&](const Edit& e) {
            return issue.offset < e.offset + e.length && e.offset < end;
        });
        if (overlaps) continue;
        edits.push_back({issue.offset, from.size(), TextUtils::ToU32(issue.suggestion)});
    }

    // Right to left so earlier offsets stay valid.
    std::sort(edits.begin(), edits.end(), [](const Edit& a, const Edit& b) { return a.offset > b.offset; });
    std::u32string out(text);
    for (const auto& edit : edits) {
        out.replace(edit.offset, edit.length, edit.to);
    }
    return out;
}
}

namespace CorrectionPasses {

    const std::vector<std::pair<char32_t, char32_t>>& ConfusableMap() {
        static const std::vector<std::pair<char32_t, char32_t>> map = {
            {U'0', U'О'},  // Cyrillic capital O
            {U'1', U'І'},  // Cyrillic capital Byelorussian-Ukrainian I
            {U'3', U'З'},  // Cyrillic capital Ze
            {U'l', U'і'},  // Cyrillic small Byelorussian-Ukrainian i
        };
        return map;
    }

    const std::vector<std::pair<std::u32string, std::u32string>>& ContextPhrases() {
        static const std::vector<std::pair<std::u32string, std::u32string>> phrases = {
            {U"в нес", U"в нее"},
            {U"на нес", U"на нее"},
            {U"к неи", U"к ней"},
            {U"из нес", U"из нее"},
            {U"для нес", U"для нее"},
            {U"ве", U"её"},
            {U"кнам", U"к нам"},
        };
        return phrases;
    }

    std::vector<CorrectionIssue> FindHyphenation(const std::u32string& text) {
        std::vector<CorrectionIssue> issues;
        size_t i = 0;
        while (i + 3 < text.size()) {
            if (!(TextUtils::IsTargetLetter(text[i]) && text[i + 1] == U'-' && text[i + 2] == U'\n' &&
                  TextUtils::IsTargetLetter(text[i + 3]))) {
                ++i;
                continue;
            }

            const size_t start = i;
            const size_t end = i + 4;

            size_t word_start = start;
            while (word_start > 0 && TextUtils::IsAlpha(text[word_start - 1])) --word_start;
            size_t word_end = end;
            while (word_end < text.size() && TextUtils::IsAlpha(text[word_end])) ++word_end;

            std::u32string original = text.substr(word_start, word_end - word_start);
            std::u32string suggestion = text.substr(word_start, start - word_start);
            suggestion += text[start];
            suggestion += text[start + 3];
            suggestion += text.substr(end, word_end - end);

            CorrectionIssue issue{IssueKind::Hyphenation, ToUtf8(original), ToUtf8(suggestion),
                                  ToUtf8(text.substr(start, end - start)),
                                  "Word break: " + Quoted(original, suggestion)};
            issue.policy = ReplacePolicy::ReplaceAll;
            issue.offset = word_start;
            issues.push_back(std::move(issue));

            i = end;
        }
        return issues;
    }

    std::vector<CorrectionIssue> FindConfusables(const std::u32string& text, SubstitutionMode mode) {
        std::vector<CorrectionIssue> issues;
        std::set<std::u32string> seen;

        for (const auto& token : TextUtils::FindWords(text, TextUtils::IsWordChar)) {
            std::u32string corrected = token.text;
            for (const auto& [bad, good] : ConfusableMap()) {
                std::replace(corrected.begin(), corrected.end(), bad, good);
            }
            if (corrected == token.text) continue;
            // A global replace already covers repeats of the same token.
            if (mode == SubstitutionMode::Compatible && !seen.insert(token.text).second) continue;

            CorrectionIssue issue{IssueKind::ConfusableChar, ToUtf8(token.text), ToUtf8(corrected),
                                  ToUtf8(token.text), "OCR confusable: " + Quoted(token.text, corrected)};
            issue.policy = ReplacePolicy::ReplaceAll;
            issue.offset = token.offset;
            issues.push_back(std::move(issue));
        }
        return issues;
    }

    std::vector<CorrectionIssue> FindContextErrors(const std::u32string& text, bool whole_words) {
        std::vector<CorrectionIssue> issues;
        const std::u32string lowered = TextUtils::ToLower(text);

        for (const auto& [wrong, right] : ContextPhrases()) {
            const std::u32string needle = TextUtils::ToLower(wrong);
            size_t pos = lowered.find(needle);
            while (pos != std::u32string::npos) {
                const size_t end = pos + needle.size();
                if (whole_words && !AtWordBoundary(text, pos, end)) {
                    pos = lowered.find(needle, pos + 1);
                    continue;
                }
                std::u32string matched = text.substr(pos, needle.size());
                CorrectionIssue issue{IssueKind::Context, ToUtf8(matched), ToUtf8(right), ToUtf8(matched),
                                      "Context: " + Quoted(matched, right)};
                issue.policy = ReplacePolicy::ReplaceAll;
                issue.offset = pos;
                issues.push_back(std::move(issue));
                pos = lowered.find(needle, end);
            }
        }
        return issues;
    }

    std::vector<CorrectionIssue> BuildGrammarIssues(const std::u32string& text,
                                                    const std::vector<GrammarMatch>& matches,
                                                    const CorrectionConfig& config) {
        std::vector<CorrectionIssue> issues;
        for (const auto& match : matches) {
            if (match.category != "TYPOS" && match.category != "GRAMMAR") continue;
            if (match.replacements.empty()) continue;
            if (match.offset + match.length > text.size()) continue;

            std::u32string original = text.substr(match.offset, match.length);
            std::u32string suggestion = TextUtils::ToU32(match.replacements.front());

            CorrectionIssue issue{IssueKind::Grammar, ToUtf8(original), ToUtf8(suggestion), ToUtf8(original),
                                  "Grammar: " + Quoted(original, suggestion)};
            issue.confidence = config.grammar_confidence;
            issue.policy = ReplacePolicy::ReplaceFirst;
            issue.offset = match.offset;
            issue.auto_apply = config.grammar_confidence > config.grammar_apply_threshold;
            issues.push_back(std::move(issue));
        }
        return issues;
    }

    std::vector<CorrectionIssue> FindSpellingErrors(const std::u32string& text, SpellChecker& checker,
                                                    const CorrectionConfig& config) {
        std::vector<TextUtils::WordSpan> words;
        std::set<std::string> unique_words;
        for (auto& token : TextUtils::FindWords(text, TextUtils::IsWordChar)) {
            if (!IsTargetWord(token.text)) continue;
            unique_words.insert(ToUtf8(token.text));
            words.push_back(std::move(token));
        }
        if (words.empty()) return {};

        const std::set<std::string> unknown = checker.Unknown(unique_words);

        std::vector<CorrectionIssue> issues;
        std::map<std::string, std::vector<std::string>> candidate_cache;
        std::set<std::string> reported;

        for (const auto& word : words) {
            const std::string spelled = ToUtf8(word.text);
            if (unknown.count(spelled) == 0) continue;
            if (config.substitution == SubstitutionMode::Compatible && !reported.insert(spelled).second) continue;

            auto cached = candidate_cache.find(spelled);
            if (cached == candidate_cache.end()) {
                cached = candidate_cache.emplace(spelled, checker.Candidates(spelled)).first;
            }
            const std::vector<std::string>& candidates = cached->second;
            if (candidates.empty() || candidates.front() == spelled) continue;

            std::vector<std::string> shown(candidates.begin(),
                                           candidates.begin() + std::min(candidates.size(), config.spelling_candidates));

            CorrectionIssue issue{IssueKind::Spelling, spelled, candidates.front(), spelled,
                                  "Spelling: " + Quoted(word.text, TextUtils::ToU32(candidates.front()))};
            issue.candidates = std::move(shown);
            issue.policy = ReplacePolicy::ReplaceFirst;
            issue.offset = word.offset;
            issues.push_back(std::move(issue));
        }
        return issues;
    }

    std::u32string ApplyIssues(const std::u32string& text, const std::vector<CorrectionIssue>& issues,
                               SubstitutionMode mode) {
        if (mode == SubstitutionMode::SpanBased) {
            return ApplySpans(text, issues);
        }

        std::u32string out(text);
        for (const auto& issue : issues) {
            if (!issue.auto_apply) continue;
            const std::u32string from = TextUtils::ToU32(issue.original);
            const std::u32string to = TextUtils::ToU32(issue.suggestion);
            if (issue.policy == ReplacePolicy::ReplaceAll) {
                TextUtils::ReplaceAll(out, from, to);
            } else {
                TextUtils::ReplaceFirst(out, from, to);
            }
        }
        return out;
    }
}
