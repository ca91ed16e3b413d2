#include "text/tokenizer.hpp"
#include "text/utf8.hpp"

namespace lore {

namespace {

bool is_joiner(char32_t cp) {
    return cp == '-' || cp == '\'' || cp == 0x2019;
}

} // anonymous namespace

std::vector<Token> tokenize(const std::string& text) {
    std::vector<Token> tokens;
    size_t pos = 0;

    while (pos < text.size()) {
        size_t start = pos;
        char32_t cp = utf8::decode_next(text, pos);

        if (utf8::is_space(cp)) {
            continue;
        }

        if (utf8::is_word_char(cp)) {
            size_t end = pos;
            while (pos < text.size()) {
                size_t next = pos;
                char32_t c = utf8::decode_next(text, next);
                if (utf8::is_word_char(c)) {
                    pos = next;
                    end = pos;
                    continue;
                }
                if (is_joiner(c) && next < text.size()) {
                    size_t after = next;
                    char32_t following = utf8::decode_next(text, after);
                    if (utf8::is_word_char(following)) {
                        pos = after;
                        end = pos;
                        continue;
                    }
                }
                break;
            }
            tokens.push_back(Token{text.substr(start, end - start), start, end});
            continue;
        }

        // Punctuation: group repeats of the same character
        size_t end = pos;
        while (pos < text.size()) {
            size_t next = pos;
            if (utf8::decode_next(text, next) != cp) break;
            pos = next;
            end = pos;
        }
        tokens.push_back(Token{text.substr(start, end - start), start, end});
    }

    return tokens;
}

std::vector<std::string> split_words(const std::string& text) {
    std::vector<std::string> words;
    for (const auto& token : tokenize(text)) {
        size_t pos = 0;
        if (utf8::is_word_char(utf8::decode_next(token.text, pos))) {
            words.push_back(token.text);
        }
    }
    return words;
}

} // namespace lore
