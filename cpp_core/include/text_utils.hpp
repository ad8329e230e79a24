#pragma once
#include <string>
#include <vector>

// Stateless UTF-8 / code point helpers shared by the correction passes.
// Offsets and lengths handed around by the passes are code point counts.
namespace TextUtils {
    struct WordSpan {
        size_t offset;
        std::u32string text;
    };

    std::u32string ToU32(const std::string& utf8);
    std::string ToUtf8(const std::u32string& text);
    std::string ToUtf8(char32_t cp);
    size_t CodePointCount(const std::string& utf8);

    bool IsTargetLetter(char32_t cp);  // Russian alphabet, both cases
    bool IsAlpha(char32_t cp);
    bool IsWordChar(char32_t cp);      // letters, digits, underscore
    bool IsSpace(char32_t cp);

    char32_t ToLower(char32_t cp);
    std::u32string ToLower(const std::u32string& text);

    std::string Trim(const std::string& text);
    size_t CountWords(const std::string& text);

    // Maximal runs of code points accepted by `is_word`, in text order.
    std::vector<WordSpan> FindWords(const std::u32string& text, bool (*is_word)(char32_t));

    size_t ReplaceAll(std::u32string& text, const std::u32string& from, const std::u32string& to);
    bool ReplaceFirst(std::u32string& text, const std::u32string& from, const std::u32string& to);
}
