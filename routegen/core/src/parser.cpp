#include "routegen/core/parser.hpp"

#include <algorithm>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace routegen {

namespace {

bool is_opener(token_kind kind) noexcept {
    return kind == token_kind::lbrace || kind == token_kind::lparen ||
           kind == token_kind::lbracket;
}

bool is_closer(token_kind kind) noexcept {
    return kind == token_kind::rbrace || kind == token_kind::rparen ||
           kind == token_kind::rbracket;
}

token_kind closer_for(token_kind opener) noexcept {
    switch (opener) {
    case token_kind::lparen:
        return token_kind::rparen;
    case token_kind::lbracket:
        return token_kind::rbracket;
    default:
        return token_kind::rbrace;
    }
}

bool is_generic_open(const token& tok) noexcept {
    return tok.is(token_kind::punct) && tok.text == "<";
}

bool is_generic_close(const token& tok) noexcept {
    return tok.is(token_kind::punct) && tok.text == ">";
}

bool is_word(const token& tok, std::string_view word) noexcept {
    return tok.is(token_kind::identifier) && tok.text == word;
}

// Tokens after a statement body's '}' that continue the same statement:
// `} else`, `} catch`, `} while (x);`, `}();`, `} + 1`.
bool continues_statement(const token& next) noexcept {
    switch (next.kind) {
    case token_kind::semicolon:
    case token_kind::lparen:
    case token_kind::lbracket:
    case token_kind::comma:
    case token_kind::punct:
        return true;
    default:
        return is_word(next, "else") || is_word(next, "catch") || is_word(next, "while");
    }
}

// Marks an open '<' on the nesting stack; '>' is not a token kind of its own.
constexpr token_kind kAngle = token_kind::punct;

constexpr std::string_view kMethodList = "one of GET, POST, PUT, DELETE";

} // namespace

parser::parser(std::string_view source, std::vector<token> tokens)
    : source_(source), tokens_(std::move(tokens)) {
    if (tokens_.empty() || !tokens_.back().is(token_kind::eof)) {
        token eof;
        eof.kind = token_kind::eof;
        eof.pos = tokens_.empty() ? source_position{} : tokens_.back().pos;
        tokens_.push_back(std::move(eof));
    }
}

const token& parser::advance() noexcept {
    const token& current = tokens_[cursor_];
    if (cursor_ + 1 < tokens_.size()) {
        ++cursor_;
    }
    return current;
}

diagnostic parser::error_at(const token& tok, error_code code, std::string expected) const {
    std::string found = tok.is(token_kind::eof) ? std::string("end of input")
                                                : std::string(tok.text);
    return make_diagnostic(code, tok.pos, std::move(expected), std::move(found));
}

// Source text spanning tokens [first, last).
std::string parser::slice(size_t first, size_t last) const {
    if (first >= last) {
        return {};
    }
    size_t begin = tokens_[first].pos.offset;
    size_t end = tokens_[last - 1].pos.offset + tokens_[last - 1].text.size();
    return std::string(source_.substr(begin, end - begin));
}

parse_result<route_definition> parser::parse() {
    auto base = parse_base();
    if (!base) {
        return std::unexpected(std::move(base.error()));
    }

    if (!check(token_kind::lbrace)) {
        return std::unexpected(error_at(peek(), error_code::unexpected_token, "'{'"));
    }
    advance();

    route_table table;
    while (!check(token_kind::rbrace)) {
        if (check(token_kind::eof)) {
            return std::unexpected(
                error_at(peek(), error_code::missing_closing_brace, "'}' closing the route table"));
        }
        auto entry = parse_route();
        if (!entry) {
            return std::unexpected(std::move(entry.error()));
        }
        table.entries.push_back(std::move(*entry));
    }
    advance();

    if (!check(token_kind::eof)) {
        return std::unexpected(error_at(peek(), error_code::trailing_input, "end of input"));
    }

    return route_definition{std::move(*base), std::move(table)};
}

parse_result<std::optional<opaque_expr>> parser::parse_base() {
    if (check(token_kind::lbrace)) {
        return std::optional<opaque_expr>{};
    }
    if (check(token_kind::eof)) {
        return std::unexpected(error_at(peek(), error_code::unexpected_token, "'{'"));
    }

    const size_t first = cursor_;
    std::vector<token_kind> nesting;
    while (true) {
        const token& tok = peek();
        if (tok.is(token_kind::eof)) {
            return std::unexpected(
                error_at(tok, error_code::unexpected_token, "',' after base expression"));
        }
        if (tok.is(token_kind::comma) && nesting.empty()) {
            break;
        }
        if (is_opener(tok.kind)) {
            nesting.push_back(closer_for(tok.kind));
        } else if (is_closer(tok.kind)) {
            // An unclosed '<' before a bracket closer was a comparison.
            while (!nesting.empty() && nesting.back() == kAngle) {
                nesting.pop_back();
            }
            if (nesting.empty() || nesting.back() != tok.kind) {
                return std::unexpected(
                    error_at(tok, error_code::unexpected_token, "',' after base expression"));
            }
            nesting.pop_back();
        } else if (is_generic_open(tok) && cursor_ > first &&
                   (tokens_[cursor_ - 1].is(token_kind::identifier) ||
                    tokens_[cursor_ - 1].is(token_kind::path_sep))) {
            // Template argument list: make_router<A, B>()
            nesting.push_back(kAngle);
        } else if (is_generic_close(tok) && !nesting.empty() && nesting.back() == kAngle &&
                   !tokens_[cursor_ - 1].text.ends_with("-")) {
            nesting.pop_back();
        }
        advance();
    }

    if (cursor_ == first) {
        return std::unexpected(error_at(peek(), error_code::unexpected_token, "base expression"));
    }

    opaque_expr base{slice(first, cursor_), tokens_[first].pos};
    advance(); // ','
    return std::optional<opaque_expr>{std::move(base)};
}

parse_result<route_entry> parser::parse_route() {
    if (check(token_kind::star)) {
        auto nested = parse_nested();
        if (!nested) {
            return std::unexpected(std::move(nested.error()));
        }
        return route_entry{std::move(*nested)};
    }
    if (check(token_kind::string_literal)) {
        auto normal = parse_normal();
        if (!normal) {
            return std::unexpected(std::move(normal.error()));
        }
        return route_entry{std::move(*normal)};
    }
    return std::unexpected(
        error_at(peek(), error_code::invalid_route_start, "'*' or a string literal"));
}

parse_result<nested_route> parser::parse_nested() {
    auto pos = advance().pos; // '*'
    if (!check(token_kind::string_literal)) {
        return std::unexpected(
            error_at(peek(), error_code::unexpected_token, "mount path string literal"));
    }
    std::string mount_path = advance().value;

    auto block = parse_block();
    if (!block) {
        return std::unexpected(std::move(block.error()));
    }
    return nested_route{std::move(mount_path), std::move(*block), pos};
}

parse_result<normal_route> parser::parse_normal() {
    const token& path_tok = advance();
    normal_route route;
    route.path = path_tok.value;
    route.pos = path_tok.pos;

    auto handler = parse_path();
    if (!handler) {
        return std::unexpected(std::move(handler.error()));
    }
    route.handler = std::move(*handler);

    auto methods = parse_methods();
    if (!methods) {
        return std::unexpected(std::move(methods.error()));
    }
    route.methods = std::move(*methods);
    return route;
}

parse_result<path_template> parser::parse_path() {
    path_template tmpl;
    while (true) {
        const token& tok = peek();
        if (is_generic_open(tok)) {
            return std::unexpected(error_at(
                tok, error_code::invalid_path_segment, "identifier without generic arguments"));
        }
        // Method keywords are ordinary identifiers in a handler path.
        if (!tok.is(token_kind::identifier) && !tok.is(token_kind::keyword)) {
            return std::unexpected(
                error_at(tok, error_code::invalid_path_segment, "handler identifier"));
        }
        tmpl.segments.emplace_back(tok.text);
        advance();

        if (is_generic_open(peek())) {
            return std::unexpected(error_at(peek(),
                                            error_code::invalid_path_segment,
                                            "identifier without generic arguments"));
        }
        if (!check(token_kind::path_sep)) {
            break;
        }
        advance();
    }
    return tmpl;
}

parse_result<std::vector<method>> parser::parse_methods() {
    std::vector<method> methods;
    while (check(token_kind::identifier) || check(token_kind::keyword)) {
        const token& tok = peek();
        auto m = parse_method(tok.text);
        if (!m) {
            return std::unexpected(
                error_at(tok, error_code::unknown_method, std::string(kMethodList)));
        }
        if (std::find(methods.begin(), methods.end(), *m) != methods.end()) {
            return std::unexpected(
                error_at(tok, error_code::duplicate_method, "each method at most once"));
        }
        methods.push_back(*m);
        advance();
    }

    if (methods.empty()) {
        return std::unexpected(error_at(
            peek(), error_code::empty_method_list, "at least " + std::string(kMethodList)));
    }
    return methods;
}

parse_result<code_block> parser::parse_block() {
    if (!check(token_kind::lbrace)) {
        return std::unexpected(
            error_at(peek(), error_code::unexpected_token, "'{' starting the endpoint block"));
    }
    const size_t open = cursor_;
    advance();

    code_block block;
    block.pos = tokens_[open].pos;

    std::vector<token_kind> nesting;
    size_t statement_begin = cursor_;
    // Whether the outermost open brace is a statement body (`if (x) {`, `else {`).
    bool in_body = false;
    auto end_statement = [&](size_t last, size_t next_begin) {
        auto statement = slice(statement_begin, last);
        if (!statement.empty()) {
            block.statements.push_back(std::move(statement));
        }
        statement_begin = next_begin;
    };
    while (true) {
        const token& tok = peek();
        if (tok.is(token_kind::eof)) {
            return std::unexpected(make_diagnostic(error_code::unterminated_block,
                                                   tokens_[open].pos,
                                                   "'}' closing the endpoint block",
                                                   "end of input"));
        }
        if (is_opener(tok.kind)) {
            if (nesting.empty() && tok.is(token_kind::lbrace)) {
                const token& prev = tokens_[cursor_ - 1];
                in_body = cursor_ == statement_begin || prev.is(token_kind::rparen) ||
                          is_word(prev, "else") || is_word(prev, "do") || is_word(prev, "try");
            }
            nesting.push_back(closer_for(tok.kind));
        } else if (is_closer(tok.kind)) {
            if (nesting.empty()) {
                if (tok.is(token_kind::rbrace)) {
                    break;
                }
                return std::unexpected(error_at(tok, error_code::unexpected_token, "'}'"));
            }
            if (nesting.back() != tok.kind) {
                return std::unexpected(error_at(
                    tok, error_code::unexpected_token, std::string(token_kind_name(nesting.back()))));
            }
            nesting.pop_back();
            if (nesting.empty() && tok.is(token_kind::rbrace) && in_body &&
                !continues_statement(tokens_[cursor_ + 1])) {
                // `if (x) { ... }` is a complete statement without a ';'
                end_statement(cursor_ + 1, cursor_ + 1);
            }
        } else if (tok.is(token_kind::semicolon) && nesting.empty()) {
            end_statement(cursor_, cursor_ + 1);
        }
        advance();
    }

    const size_t close = cursor_;
    block.body = slice(open + 1, close);
    block.value = slice(statement_begin, close);
    advance(); // '}'
    return block;
}

parse_result<route_definition> parse_routes(std::string_view source) {
    auto tokens = tokenize(source);
    if (!tokens) {
        return std::unexpected(std::move(tokens.error()));
    }
    return parser(source, std::move(*tokens)).parse();
}

} // namespace routegen
