#include "remap/almanac.hpp"
#include "remap/error.hpp"

#include <cctype>
#include <limits>

namespace remap::almanac {

namespace {

bool is_word_char(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == ' ' || c == '-';
}

// "seed-to-soil map" -> {"seed", "soil"}; false if the header is malformed
bool split_map_header(const std::string& word, Category& source, Category& target) {
    std::string name = word.substr(0, word.find(' '));
    size_t first = name.find('-');
    if (first == std::string::npos) return false;
    size_t second = name.find('-', first + 1);
    if (second == std::string::npos) return false;

    source = name.substr(0, first);
    target = name.substr(second + 1);
    return !source.empty() && !target.empty();
}

} // namespace

std::vector<Token> lex(std::string_view text) {
    std::vector<Token> tokens;
    size_t line = 1;
    size_t pos = 0;

    while (pos < text.size()) {
        char c = text[pos];

        if (c >= 'a' && c <= 'z') {
            size_t start = pos;
            while (pos < text.size() && is_word_char(text[pos])) ++pos;
            std::string word(text.substr(start, pos - start));

            Token token = Token::at(TokenKind::Seeds, line);
            if (word.find("seeds") != std::string::npos) {
                tokens.push_back(token);
            } else if (word.find("map") != std::string::npos &&
                       split_map_header(word, token.source, token.target)) {
                token.kind = TokenKind::Map;
                tokens.push_back(std::move(token));
            }
        } else if (c >= '0' && c <= '9') {
            uint64_t number = 0;
            constexpr uint64_t max = std::numeric_limits<uint64_t>::max();
            while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
                uint64_t digit = static_cast<uint64_t>(text[pos] - '0');
                if (number > (max - digit) / 10) {
                    throw ParseError("Number does not fit in 64 bits", line);
                }
                number = number * 10 + digit;
                ++pos;
            }
            Token token = Token::at(TokenKind::Number, line);
            token.number = number;
            tokens.push_back(token);
        } else if (c == '\n') {
            tokens.push_back(Token::at(TokenKind::Newline, line));
            ++line;
            ++pos;
        } else {
            ++pos;
        }
    }

    return tokens;
}

} // namespace remap::almanac
