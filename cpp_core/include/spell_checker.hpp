#pragma once
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

/**
 * @class SpellChecker
 * @brief Spelling capability: dictionary membership and ranked candidates.
 */
class SpellChecker {
public:
    virtual ~SpellChecker() = default;
    // Subset of `words` not found in the dictionary, spelled as given.
    virtual std::set<std::string> Unknown(const std::set<std::string>& words) = 0;
    // Best-first corrections for `word`; empty when nothing is close enough.
    virtual std::vector<std::string> Candidates(const std::string& word) = 0;
    virtual std::string Name() const = 0;
};

/**
 * @class FrequencySpellChecker
 * @brief Word-frequency dictionary with edit-distance candidates.
 *
 * Dictionary file: UTF-8, one entry per line, "word" or "word count".
 * Lookups are case-insensitive. Candidates lie within edit distance 2 and
 * are ranked by distance, then frequency, then spelling.
 */
class FrequencySpellChecker : public SpellChecker {
public:
    explicit FrequencySpellChecker(const std::string& dictionary_path, size_t max_distance = 2);
    explicit FrequencySpellChecker(const std::unordered_map<std::string, long>& frequencies, size_t max_distance = 2);

    std::set<std::string> Unknown(const std::set<std::string>& words) override;
    std::vector<std::string> Candidates(const std::string& word) override;
    std::string Name() const override { return "frequency-dictionary"; }

    bool Known(const std::string& word) const;
    size_t Size() const { return frequencies_.size(); }

private:
    void AddWord(const std::string& word, long count);

    std::unordered_map<std::u32string, long> frequencies_;
    size_t max_distance_;
};
