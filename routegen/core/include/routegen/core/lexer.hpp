#pragma once

#include "diagnostic.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace routegen {

enum class token_kind : uint8_t {
    string_literal,
    char_literal,
    number,
    identifier,
    keyword, // GET, POST, PUT, DELETE
    path_sep,
    lbrace,
    rbrace,
    lparen,
    rparen,
    lbracket,
    rbracket,
    star,
    comma,
    semicolon,
    punct,
    eof,
};

std::string_view token_kind_name(token_kind kind) noexcept;

struct token {
    token_kind kind{token_kind::eof};
    std::string_view text{}; // raw source slice, quotes included for literals
    std::string value{};     // decoded contents of a string literal
    source_position pos{};

    [[nodiscard]] bool is(token_kind k) const noexcept { return kind == k; }
};

// Tokenizer for route definitions. Tokens keep views into `source`, which must
// outlive them. Anything C++-like may appear inside opaque blocks, so the lexer
// accepts all printable ASCII punctuation.
class lexer {
public:
    explicit lexer(std::string_view source) noexcept : source_(source) {}

    parse_result<std::vector<token>> tokenize();

private:
    [[nodiscard]] bool eof() const noexcept { return pos_ >= source_.size(); }
    [[nodiscard]] char peek(size_t ahead = 0) const noexcept {
        return pos_ + ahead < source_.size() ? source_[pos_ + ahead] : '\0';
    }
    [[nodiscard]] source_position here() const noexcept { return {pos_, line_, column_}; }

    void bump() noexcept;
    std::expected<void, diagnostic> skip_trivia();
    parse_result<token> next();
    parse_result<token> lex_string(source_position start);
    parse_result<token> lex_char(source_position start);
    [[nodiscard]] size_t raw_prefix_length() const noexcept;
    parse_result<token> lex_raw_string(source_position start, size_t prefix);
    token lex_word(source_position start);
    token lex_number(source_position start);
    token make(token_kind kind, source_position start) const;

    std::string_view source_;
    size_t pos_{0};
    uint32_t line_{1};
    uint32_t column_{1};
};

inline parse_result<std::vector<token>> tokenize(std::string_view source) {
    return lexer(source).tokenize();
}

} // namespace routegen
