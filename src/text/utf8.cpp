#include "text/utf8.hpp"

namespace lore {
namespace utf8 {

namespace {

constexpr char32_t kReplacement = 0xFFFD;

bool is_continuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

} // anonymous namespace

char32_t decode_next(const std::string& text, size_t& pos) {
    const unsigned char lead = static_cast<unsigned char>(text[pos]);

    size_t extra = 0;
    char32_t cp = 0;
    if (lead < 0x80) {
        ++pos;
        return lead;
    } else if ((lead & 0xE0) == 0xC0) {
        extra = 1;
        cp = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        extra = 2;
        cp = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        extra = 3;
        cp = lead & 0x07;
    } else {
        ++pos;
        return kReplacement;
    }

    if (pos + extra >= text.size()) {
        ++pos;
        return kReplacement;
    }

    for (size_t i = 1; i <= extra; ++i) {
        const unsigned char c = static_cast<unsigned char>(text[pos + i]);
        if (!is_continuation(c)) {
            ++pos;
            return kReplacement;
        }
        cp = (cp << 6) | (c & 0x3F);
    }

    pos += extra + 1;
    return cp;
}

std::u32string decode(const std::string& text) {
    std::u32string result;
    result.reserve(text.size());
    size_t pos = 0;
    while (pos < text.size()) {
        result.push_back(decode_next(text, pos));
    }
    return result;
}

void append(std::string& out, char32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

std::string encode(const std::u32string& text) {
    std::string result;
    result.reserve(text.size());
    for (char32_t cp : text) {
        append(result, cp);
    }
    return result;
}

size_t length(const std::string& text) {
    size_t count = 0;
    for (unsigned char c : text) {
        if (!is_continuation(c)) ++count;
    }
    return count;
}

char32_t to_lower(char32_t cp) {
    if (cp >= 'A' && cp <= 'Z') return cp + 0x20;
    if (cp < 0xC0) return cp;
    // Latin-1 (except the multiplication sign)
    if (cp <= 0xDE && cp != 0xD7) return cp + 0x20;
    // Greek capitals (U+03A2 is unassigned)
    if (cp >= 0x0391 && cp <= 0x03A9 && cp != 0x03A2) return cp + 0x20;
    // Cyrillic: Ѐ..Џ and А..Я
    if (cp >= 0x0400 && cp <= 0x040F) return cp + 0x50;
    if (cp >= 0x0410 && cp <= 0x042F) return cp + 0x20;
    return cp;
}

char32_t to_upper(char32_t cp) {
    if (cp >= 'a' && cp <= 'z') return cp - 0x20;
    if (cp < 0xE0) return cp;
    if (cp <= 0xFE && cp != 0xF7) return cp - 0x20;
    if (cp >= 0x03B1 && cp <= 0x03C9 && cp != 0x03C2) return cp - 0x20;
    if (cp >= 0x0430 && cp <= 0x044F) return cp - 0x20;
    if (cp >= 0x0450 && cp <= 0x045F) return cp - 0x50;
    return cp;
}

std::string to_lower(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    size_t pos = 0;
    while (pos < text.size()) {
        append(result, to_lower(decode_next(text, pos)));
    }
    return result;
}

std::string to_upper(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    size_t pos = 0;
    while (pos < text.size()) {
        append(result, to_upper(decode_next(text, pos)));
    }
    return result;
}

bool is_upper(char32_t cp) {
    return to_lower(cp) != cp;
}

bool is_space(char32_t cp) {
    return cp == ' ' || cp == '\t' || cp == '\n' || cp == '\r' || cp == '\f' ||
           cp == '\v' || cp == 0x00A0 || cp == 0x2007 || cp == 0x202F ||
           (cp >= 0x2000 && cp <= 0x200B) || cp == 0x3000;
}

bool is_word_char(char32_t cp) {
    if (cp < 0x80) {
        return (cp >= 'a' && cp <= 'z') || (cp >= 'A' && cp <= 'Z') ||
               (cp >= '0' && cp <= '9') || cp == '_';
    }
    if (cp < 0xC0) return false;                      // Latin-1 symbols
    if (cp == 0xD7 || cp == 0xF7) return false;       // × ÷
    if (cp >= 0x2000 && cp <= 0x2BFF) return false;   // punctuation, arrows, math
    if (cp >= 0x3000 && cp <= 0x303F) return false;   // CJK punctuation
    if (cp == 0xFEFF || cp == 0xFFFD) return false;
    return true;
}

bool starts_upper(const std::string& text) {
    if (text.empty()) return false;
    size_t pos = 0;
    return is_upper(decode_next(text, pos));
}

std::string capitalize_first(const std::string& text) {
    if (text.empty()) return text;
    size_t pos = 0;
    char32_t first = decode_next(text, pos);
    std::string result;
    append(result, to_upper(first));
    result.append(text, pos, std::string::npos);
    return result;
}

std::string capitalize_word(const std::string& text) {
    if (text.empty()) return text;
    size_t pos = 0;
    std::string result;
    append(result, to_upper(decode_next(text, pos)));
    while (pos < text.size()) {
        append(result, to_lower(decode_next(text, pos)));
    }
    return result;
}

std::string trim(const std::string& text) {
    size_t first = text.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) return "";
    size_t last = text.find_last_not_of(" \t\n\r");
    return text.substr(first, last - first + 1);
}

} // namespace utf8
} // namespace lore
