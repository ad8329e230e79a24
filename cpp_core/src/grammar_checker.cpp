#include "grammar_checker.hpp"
#include "text_utils.hpp"
#include <algorithm>

namespace {
std::vector<TextUtils::WordSpan> SplitOnSpace(const std::u32string& text) {
    return TextUtils::FindWords(text, [](char32_t cp) { return !TextUtils::IsSpace(cp); });
}
}

std::vector<GrammarMatch> AlignCorrections(const std::string& original, const std::string& corrected) {
    const std::vector<TextUtils::WordSpan> a = SplitOnSpace(TextUtils::ToU32(original));
    const std::vector<TextUtils::WordSpan> b = SplitOnSpace(TextUtils::ToU32(corrected));

    // lcs[i][j]: longest common subsequence of a[i..] and b[j..].
    std::vector<std::vector<size_t>> lcs(a.size() + 1, std::vector<size_t>(b.size() + 1, 0));
    for (size_t i = a.size(); i-- > 0;) {
        for (size_t j = b.size(); j-- > 0;) {
            lcs[i][j] = a[i].text == b[j].text ? lcs[i + 1][j + 1] + 1
                                               : std::max(lcs[i + 1][j], lcs[i][j + 1]);
        }
    }

    std::vector<GrammarMatch> matches;
    std::vector<size_t> removed;
    std::vector<size_t> added;

    auto flush = [&]() {
        if (!removed.empty() && !added.empty()) {
            const auto& first = a[removed.front()];
            const auto& last = a[removed.back()];

            std::u32string replacement;
            for (size_t k : added) {
                if (!replacement.empty()) replacement += U' ';
                replacement += b[k].text;
            }

            GrammarMatch match;
            match.category = (removed.size() == 1 && added.size() == 1) ? "TYPOS" : "GRAMMAR";
            match.offset = first.offset;
            match.length = last.offset + last.text.size() - first.offset;
            match.replacements.push_back(TextUtils::ToUtf8(replacement));
            matches.push_back(std::move(match));
        }
        removed.clear();
        added.clear();
    };

    size_t i = 0;
    size_t j = 0;
    while (i < a.size() || j < b.size()) {
        if (i < a.size() && j < b.size() && a[i].text == b[j].text) {
            flush();
            ++i;
            ++j;
        } else if (j >= b.size() || (i < a.size() && lcs[i + 1][j] >= lcs[i][j + 1])) {
            removed.push_back(i++);
        } else {
            added.push_back(j++);
        }
    }
    flush();
    return matches;
}
