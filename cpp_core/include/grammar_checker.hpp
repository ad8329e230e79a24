#pragma once
#include <string>
#include <vector>

struct GrammarMatch {
    std::string category;   // e.g. TYPOS, GRAMMAR, PUNCTUATION
    size_t offset = 0;      // code points into the checked text
    size_t length = 0;      // code points
    std::vector<std::string> replacements;  // best first
};

/**
 * @class GrammarChecker
 * @brief Grammar-checking capability.
 *
 * Check throws CapabilityCallFailure when a call fails or times out.
 */
class GrammarChecker {
public:
    virtual ~GrammarChecker() = default;
    virtual std::vector<GrammarMatch> Check(const std::string& text) = 0;
    virtual std::string Name() const = 0;
};

// Word-level diff of `original` against a rewritten `corrected` text. Every
// run of replaced words becomes one match (TYPOS for a single word, GRAMMAR
// otherwise). Pure insertions and deletions are not reported.
std::vector<GrammarMatch> AlignCorrections(const std::string& original, const std::string& corrected);
