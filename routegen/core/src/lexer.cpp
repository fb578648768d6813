#include "routegen/core/lexer.hpp"

#include <cctype>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace routegen {

namespace {

bool is_ident_start(char c) noexcept {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool is_ident_char(char c) noexcept {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool is_method_keyword(std::string_view word) noexcept {
    return word == "GET" || word == "POST" || word == "PUT" || word == "DELETE";
}

std::string describe_char(char c) {
    if (std::isprint(static_cast<unsigned char>(c))) {
        return std::string(1, c);
    }
    static constexpr char hex[] = "0123456789abcdef";
    auto u = static_cast<unsigned char>(c);
    return std::string("\\x") + hex[u >> 4] + hex[u & 0xf];
}

} // namespace

std::string_view token_kind_name(token_kind kind) noexcept {
    switch (kind) {
    case token_kind::string_literal:
        return "string literal";
    case token_kind::char_literal:
        return "character literal";
    case token_kind::number:
        return "number";
    case token_kind::identifier:
        return "identifier";
    case token_kind::keyword:
        return "method keyword";
    case token_kind::path_sep:
        return "'::'";
    case token_kind::lbrace:
        return "'{'";
    case token_kind::rbrace:
        return "'}'";
    case token_kind::lparen:
        return "'('";
    case token_kind::rparen:
        return "')'";
    case token_kind::lbracket:
        return "'['";
    case token_kind::rbracket:
        return "']'";
    case token_kind::star:
        return "'*'";
    case token_kind::comma:
        return "','";
    case token_kind::semicolon:
        return "';'";
    case token_kind::punct:
        return "punctuation";
    case token_kind::eof:
        return "end of input";
    }
    return "token";
}

parse_result<std::vector<token>> lexer::tokenize() {
    std::vector<token> tokens;
    tokens.reserve(source_.size() / 4 + 1);
    while (true) {
        auto tok = next();
        if (!tok) {
            return std::unexpected(std::move(tok.error()));
        }
        bool done = tok->is(token_kind::eof);
        tokens.push_back(std::move(*tok));
        if (done) {
            break;
        }
    }
    return tokens;
}

void lexer::bump() noexcept {
    if (eof()) {
        return;
    }
    if (source_[pos_] == '\n') {
        ++line_;
        column_ = 1;
    } else {
        ++column_;
    }
    ++pos_;
}

std::expected<void, diagnostic> lexer::skip_trivia() {
    while (!eof()) {
        char c = peek();
        if (std::isspace(static_cast<unsigned char>(c))) {
            bump();
        } else if (c == '/' && peek(1) == '/') {
            while (!eof() && peek() != '\n') {
                bump();
            }
        } else if (c == '/' && peek(1) == '*') {
            auto start = here();
            bump();
            bump();
            while (!eof() && !(peek() == '*' && peek(1) == '/')) {
                bump();
            }
            if (eof()) {
                return std::unexpected(make_diagnostic(
                    error_code::unterminated_comment, start, "'*/'", "end of input"));
            }
            bump();
            bump();
        } else {
            break;
        }
    }
    return {};
}

token lexer::make(token_kind kind, source_position start) const {
    token t;
    t.kind = kind;
    t.text = source_.substr(start.offset, pos_ - start.offset);
    t.pos = start;
    return t;
}

parse_result<token> lexer::next() {
    if (auto trivia = skip_trivia(); !trivia) {
        return std::unexpected(std::move(trivia.error()));
    }

    auto start = here();
    if (eof()) {
        return make(token_kind::eof, start);
    }

    char c = peek();
    if (c == '"') {
        return lex_string(start);
    }
    if (c == '\'') {
        return lex_char(start);
    }
    if (auto prefix = raw_prefix_length(); prefix > 0) {
        return lex_raw_string(start, prefix);
    }
    if (is_ident_start(c)) {
        return lex_word(start);
    }
    if (std::isdigit(static_cast<unsigned char>(c))) {
        return lex_number(start);
    }
    if (c == ':' && peek(1) == ':') {
        bump();
        bump();
        return make(token_kind::path_sep, start);
    }

    token_kind kind = token_kind::punct;
    switch (c) {
    case '{':
        kind = token_kind::lbrace;
        break;
    case '}':
        kind = token_kind::rbrace;
        break;
    case '(':
        kind = token_kind::lparen;
        break;
    case ')':
        kind = token_kind::rparen;
        break;
    case '[':
        kind = token_kind::lbracket;
        break;
    case ']':
        kind = token_kind::rbracket;
        break;
    case '*':
        kind = token_kind::star;
        break;
    case ',':
        kind = token_kind::comma;
        break;
    case ';':
        kind = token_kind::semicolon;
        break;
    default:
        if (!std::isprint(static_cast<unsigned char>(c))) {
            return std::unexpected(make_diagnostic(
                error_code::unexpected_character, start, "", describe_char(c)));
        }
        break;
    }
    bump();
    return make(kind, start);
}

parse_result<token> lexer::lex_string(source_position start) {
    bump(); // opening quote
    std::string value;
    while (true) {
        if (eof() || peek() == '\n') {
            return std::unexpected(make_diagnostic(error_code::unterminated_string,
                                                   start,
                                                   "closing '\"'",
                                                   eof() ? "end of input" : "end of line"));
        }
        char c = peek();
        if (c == '"') {
            bump();
            break;
        }
        if (c != '\\') {
            value.push_back(c);
            bump();
            continue;
        }

        auto escape_pos = here();
        bump();
        char e = peek();
        switch (e) {
        case '"':
        case '\\':
        case '\'':
            value.push_back(e);
            break;
        case 'n':
            value.push_back('\n');
            break;
        case 'r':
            value.push_back('\r');
            break;
        case 't':
            value.push_back('\t');
            break;
        case '0':
            value.push_back('\0');
            break;
        default:
            return std::unexpected(make_diagnostic(error_code::unexpected_character,
                                                   escape_pos,
                                                   "escape sequence",
                                                   "\\" + describe_char(e)));
        }
        bump();
    }

    auto tok = make(token_kind::string_literal, start);
    tok.value = std::move(value);
    return tok;
}

parse_result<token> lexer::lex_char(source_position start) {
    bump(); // opening quote
    while (!eof() && peek() != '\'' && peek() != '\n') {
        if (peek() == '\\') {
            bump();
        }
        bump();
    }
    if (eof() || peek() != '\'') {
        return std::unexpected(make_diagnostic(error_code::unterminated_string,
                                               start,
                                               "closing '''",
                                               eof() ? "end of input" : "end of line"));
    }
    bump();
    return make(token_kind::char_literal, start);
}

// Length of an encoding prefix plus 'R' when a raw string literal starts here.
size_t lexer::raw_prefix_length() const noexcept {
    static constexpr std::string_view prefixes[] = {"R", "u8R", "uR", "UR", "LR"};
    auto rest = source_.substr(pos_);
    for (auto prefix : prefixes) {
        if (rest.size() > prefix.size() && rest.starts_with(prefix) && rest[prefix.size()] == '"') {
            return prefix.size();
        }
    }
    return 0;
}

// R"delim( ... )delim", may span lines; no escapes.
parse_result<token> lexer::lex_raw_string(source_position start, size_t prefix) {
    for (size_t i = 0; i <= prefix; ++i) {
        bump();
    }

    std::string delimiter;
    while (!eof() && peek() != '(') {
        char c = peek();
        if (c == ')' || c == '\\' || std::isspace(static_cast<unsigned char>(c)) ||
            delimiter.size() == 16) {
            return std::unexpected(make_diagnostic(error_code::unexpected_character,
                                                   here(),
                                                   "'(' opening the raw string",
                                                   describe_char(c)));
        }
        delimiter.push_back(c);
        bump();
    }
    if (eof()) {
        return std::unexpected(make_diagnostic(
            error_code::unterminated_string, start, "'(' opening the raw string", "end of input"));
    }
    bump(); // '('

    const std::string terminator = ")" + delimiter + "\"";
    const size_t content_begin = pos_;
    auto end = source_.find(terminator, pos_);
    if (end == std::string_view::npos) {
        return std::unexpected(make_diagnostic(error_code::unterminated_string,
                                               start,
                                               "'" + terminator + "'",
                                               "end of input"));
    }
    while (pos_ < end + terminator.size()) {
        bump();
    }

    auto tok = make(token_kind::string_literal, start);
    tok.value = std::string(source_.substr(content_begin, end - content_begin));
    return tok;
}

token lexer::lex_word(source_position start) {
    while (!eof() && is_ident_char(peek())) {
        bump();
    }
    auto tok = make(token_kind::identifier, start);
    if (is_method_keyword(tok.text)) {
        tok.kind = token_kind::keyword;
    }
    return tok;
}

token lexer::lex_number(source_position start) {
    while (!eof() && (is_ident_char(peek()) || peek() == '.' || peek() == '\'')) {
        bump();
    }
    return make(token_kind::number, start);
}

} // namespace routegen
