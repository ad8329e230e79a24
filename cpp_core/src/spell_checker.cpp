#include "spell_checker.hpp"
#include "errors.hpp"
#include "text_utils.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <sstream>
#include <tuple>

namespace {
// Levenshtein distance with an early exit once every cell exceeds `limit`.
size_t EditDistance(const std::u32string& a, const std::u32string& b, size_t limit) {
    std::vector<size_t> prev(b.size() + 1);
    std::vector<size_t> curr(b.size() + 1);
    for (size_t j = 0; j <= b.size(); ++j) prev[j] = j;

    for (size_t i = 1; i <= a.size(); ++i) {
        curr[0] = i;
        size_t row_min = curr[0];
        for (size_t j = 1; j <= b.size(); ++j) {
            size_t cost = a[i - 1] == b[j - 1] ? 0 : 1;
            curr[j] = std::min({prev[j] + 1, curr[j - 1] + 1, prev[j - 1] + cost});
            row_min = std::min(row_min, curr[j]);
        }
        if (row_min > limit) return limit + 1;
        std::swap(prev, curr);
    }
    return prev[b.size()];
}
}

FrequencySpellChecker::FrequencySpellChecker(const std::string& dictionary_path, size_t max_distance)
    : max_distance_(max_distance) {
    std::ifstream file(dictionary_path, std::ios::binary);
    if (!file.is_open()) {
        throw CapabilityUnavailable("Could not open dictionary file: " + dictionary_path);
    }

    std::string line;
    while (std::getline(file, line)) {
        while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
            line.pop_back();
        }
        std::istringstream fields(line);
        std::string word;
        long count = 1;
        if (!(fields >> word)) continue;
        if (!(fields >> count)) count = 1;
        AddWord(word, count);
    }

    if (frequencies_.empty()) {
        throw CapabilityUnavailable("Dictionary is empty: " + dictionary_path);
    }
    std::cout << "[Spelling] Loaded dictionary with " << frequencies_.size() << " words." << std::endl;
}

FrequencySpellChecker::FrequencySpellChecker(const std::unordered_map<std::string, long>& frequencies,
                                             size_t max_distance)
    : max_distance_(max_distance) {
    for (const auto& [word, count] : frequencies) {
        AddWord(word, count);
    }
}

void FrequencySpellChecker::AddWord(const std::string& word, long count) {
    frequencies_[TextUtils::ToLower(TextUtils::ToU32(word))] += count;
}

bool FrequencySpellChecker::Known(const std::string& word) const {
    return frequencies_.count(TextUtils::ToLower(TextUtils::ToU32(word))) > 0;
}

std::set<std::string> FrequencySpellChecker::Unknown(const std::set<std::string>& words) {
    std::set<std::string> unknown;
    for (const auto& word : words) {
        if (!Known(word)) unknown.insert(word);
    }
    return unknown;
}

std::vector<std::string> FrequencySpellChecker::Candidates(const std::string& word) {
    const std::u32string target = TextUtils::ToLower(TextUtils::ToU32(word));
    if (frequencies_.count(target)) return {TextUtils::ToUtf8(target)};

    // (distance, -frequency, word) sorts best first.
    std::vector<std::tuple<size_t, long, std::u32string>> ranked;
    for (const auto& [entry, count] : frequencies_) {
        size_t length_gap = entry.size() > target.size() ? entry.size() - target.size()
                                                         : target.size() - entry.size();
        if (length_gap > max_distance_) continue;

        size_t distance = EditDistance(target, entry, max_distance_);
        if (distance <= max_distance_) {
            ranked.emplace_back(distance, -count, entry);
        }
    }
    std::sort(ranked.begin(), ranked.end());

    std::vector<std::string> candidates;
    candidates.reserve(ranked.size());
    for (const auto& candidate : ranked) {
        candidates.push_back(TextUtils::ToUtf8(std::get<2>(candidate)));
    }
    return candidates;
}
