#pragma once
#include "correction_types.hpp"
#include "grammar_checker.hpp"
#include "spell_checker.hpp"
#include <string>
#include <utility>
#include <vector>

// The five correction passes as free functions over code point text. Each
// returns the issues found in `text`; none of them modifies it.
namespace CorrectionPasses {
    const std::vector<std::pair<char32_t, char32_t>>& ConfusableMap();
    const std::vector<std::pair<std::u32string, std::u32string>>& ContextPhrases();

    std::vector<CorrectionIssue> FindHyphenation(const std::u32string& text);
    std::vector<CorrectionIssue> FindConfusables(const std::u32string& text, SubstitutionMode mode);
    std::vector<CorrectionIssue> FindContextErrors(const std::u32string& text, bool whole_words);
    std::vector<CorrectionIssue> BuildGrammarIssues(const std::u32string& text,
                                                    const std::vector<GrammarMatch>& matches,
                                                    const CorrectionConfig& config);
    std::vector<CorrectionIssue> FindSpellingErrors(const std::u32string& text, SpellChecker& checker,
                                                    const CorrectionConfig& config);

    // Applies every auto_apply issue of one stage, in order.
    std::u32string ApplyIssues(const std::u32string& text, const std::vector<CorrectionIssue>& issues,
                               SubstitutionMode mode);
}
