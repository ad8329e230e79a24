#include "text_utils.hpp"
#include <algorithm>

namespace {
constexpr char32_t REPLACEMENT_CHAR = 0xFFFD;

bool IsContinuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}
}

namespace TextUtils {

    std::u32string ToU32(const std::string& utf8) {
        std::u32string out;
        out.reserve(utf8.size());

        size_t i = 0;
        const size_t n = utf8.size();
        while (i < n) {
            unsigned char lead = static_cast<unsigned char>(utf8[i]);
            char32_t cp = 0;
            size_t extra = 0;

            if (lead < 0x80) {
                out.push_back(lead);
                ++i;
                continue;
            } else if ((lead & 0xE0) == 0xC0) {
                cp = lead & 0x1F;
                extra = 1;
            } else if ((lead & 0xF0) == 0xE0) {
                cp = lead & 0x0F;
                extra = 2;
            } else if ((lead & 0xF8) == 0xF0) {
                cp = lead & 0x07;
                extra = 3;
            } else {
                out.push_back(REPLACEMENT_CHAR);
                ++i;
                continue;
            }

            bool valid = true;
            for (size_t k = 1; k <= extra; ++k) {
                if (i + k >= n) {
                    valid = false;
                    break;
                }
                unsigned char c = static_cast<unsigned char>(utf8[i + k]);
                if (!IsContinuation(c)) {
                    valid = false;
                    break;
                }
                cp = (cp << 6) | (c & 0x3F);
            }

            if (!valid) {
                out.push_back(REPLACEMENT_CHAR);
                ++i;
                continue;
            }

            out.push_back(cp);
            i += extra + 1;
        }
        return out;
    }

    std::string ToUtf8(char32_t cp) {
        std::string out;
        if (cp < 0x80) {
            out.push_back(static_cast<char>(cp));
        } else if (cp < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp < 0x10000) {
            out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp < 0x110000) {
            out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            return ToUtf8(REPLACEMENT_CHAR);
        }
        return out;
    }

    std::string ToUtf8(const std::u32string& text) {
        std::string out;
        out.reserve(text.size() * 2);
        for (char32_t cp : text) {
            out += ToUtf8(cp);
        }
        return out;
    }

    size_t CodePointCount(const std::string& utf8) {
        return ToU32(utf8).size();
    }

    bool IsTargetLetter(char32_t cp) {
        return (cp >= 0x0410 && cp <= 0x044F) || cp == 0x0401 || cp == 0x0451;
    }

    bool IsAlpha(char32_t cp) {
        if ((cp >= 'a' && cp <= 'z') || (cp >= 'A' && cp <= 'Z')) return true;
        // Latin-1 supplement and Latin Extended-A/B, minus the two operators.
        if (cp >= 0x00C0 && cp <= 0x024F) return cp != 0x00D7 && cp != 0x00F7;
        // Greek, Cyrillic and Cyrillic Supplement.
        if (cp >= 0x0370 && cp <= 0x03FF) return true;
        if (cp >= 0x0400 && cp <= 0x052F) return cp < 0x0482 || cp > 0x0489;
        return false;
    }

    bool IsWordChar(char32_t cp) {
        return IsAlpha(cp) || (cp >= '0' && cp <= '9') || cp == '_';
    }

    bool IsSpace(char32_t cp) {
        return cp == ' ' || cp == '\t' || cp == '\n' || cp == '\r' || cp == '\f' || cp == '\v' ||
               cp == 0x00A0 || cp == 0x2028 || cp == 0x2029 || (cp >= 0x2000 && cp <= 0x200A) ||
               cp == 0x3000;
    }

    char32_t ToLower(char32_t cp) {
        if (cp >= 'A' && cp <= 'Z') return cp + 0x20;
        if (cp >= 0x0410 && cp <= 0x042F) return cp + 0x20;
        if (cp >= 0x0400 && cp <= 0x040F) return cp + 0x50;
        if (cp >= 0x00C0 && cp <= 0x00DE && cp != 0x00D7) return cp + 0x20;
        return cp;
    }

    std::u32string ToLower(const std::u32string& text) {
        std::u32string out(text);
        for (auto& cp : out) {
            cp = ToLower(cp);
        }
        return out;
    }

    std::string Trim(const std::string& text) {
        std::u32string wide = ToU32(text);
        size_t begin = 0;
        while (begin < wide.size() && IsSpace(wide[begin])) ++begin;
        size_t end = wide.size();
        while (end > begin && IsSpace(wide[end - 1])) --end;
        return ToUtf8(wide.substr(begin, end - begin));
    }

    size_t CountWords(const std::string& text) {
        size_t words = 0;
        bool in_word = false;
        for (char32_t cp : ToU32(text)) {
            if (IsSpace(cp)) {
                in_word = false;
            } else if (!in_word) {
                in_word = true;
                ++words;
            }
        }
        return words;
    }

    std::vector<WordSpan> FindWords(const std::u32string& text, bool (*is_word)(char32_t)) {
        std::vector<WordSpan> words;
        size_t i = 0;
        while (i < text.size()) {
            if (!is_word(text[i])) {
                ++i;
                continue;
            }
            size_t start = i;
            while (i < text.size() && is_word(text[i])) ++i;
            words.push_back({start, text.substr(start, i - start)});
        }
        return words;
    }

    size_t ReplaceAll(std::u32string& text, const std::u32string& from, const std::u32string& to) {
        if (from.empty()) return 0;
        size_t count = 0;
        size_t pos = text.find(from);
        while (pos != std::u32string::npos) {
            text.replace(pos, from.size(), to);
            pos = text.find(from, pos + to.size());
            ++count;
        }
        return count;
    }

    bool ReplaceFirst(std::u32string& text, const std::u32string& from, const std::u32string& to) {
        if (from.empty()) return false;
        size_t pos = text.find(from);
        if (pos == std::u32string::npos) return false;
        text.replace(pos, from.size(), to);
        return true;
    }
}
