#pragma once

#include "diagnostic.hpp"
#include "lexer.hpp"
#include "route_table.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace routegen {

// Recursive-descent parser with one token of lookahead:
//
//   body    = [ EXPR "," ] "{" { route } "}" ;
//   route   = "*" STRING BLOCK | STRING path method { method } ;
//   path    = IDENT { "::" IDENT } ;
//   method  = "GET" | "POST" | "PUT" | "DELETE" ;
//
// EXPR and BLOCK are captured verbatim. The first error aborts the parse.
class parser {
public:
    parser(std::string_view source, std::vector<token> tokens);

    parse_result<route_definition> parse();

private:
    [[nodiscard]] const token& peek() const noexcept { return tokens_[cursor_]; }
    [[nodiscard]] bool check(token_kind kind) const noexcept { return peek().is(kind); }
    const token& advance() noexcept;

    [[nodiscard]] diagnostic
    error_at(const token& tok, error_code code, std::string expected) const;
    [[nodiscard]] std::string slice(size_t first, size_t last) const;

    parse_result<std::optional<opaque_expr>> parse_base();
    parse_result<route_entry> parse_route();
    parse_result<nested_route> parse_nested();
    parse_result<normal_route> parse_normal();
    parse_result<path_template> parse_path();
    parse_result<std::vector<method>> parse_methods();
    parse_result<code_block> parse_block();

    std::string_view source_;
    std::vector<token> tokens_;
    size_t cursor_{0};
};

// Tokenizes and parses `source` in one go.
parse_result<route_definition> parse_routes(std::string_view source);

} // namespace routegen
