#pragma once

#include "route_table.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace routegen {

struct codegen_options {
    // Starting expression when the definition has no base.
    std::string default_base = "route()";
    // Qualifier for the first binder of each path, e.g. "router::" -> router::get(...).
    std::string binder_prefix;
    bool multiline = true;
    int indent = 4;
};

// Double-quoted C++ string literal for `sv`.
std::string quote_cpp_string(std::string_view sv);

// Name of the builder method binding `m` ("del" for DELETE).
std::string_view binder_name(method m) noexcept;

// C++ spelling of a nested endpoint: the bare expression for `{ expr }`, an
// immediately invoked lambda for a block with statements.
std::string render_endpoint(const code_block& block);

std::string render_entry(const route_entry& entry, const codegen_options& opts);

// Left fold of the table over the base expression:
//   base.nest(...).at(...)...
std::string generate_chain(const route_table& table,
                           const std::optional<opaque_expr>& base,
                           const codegen_options& opts = {});

inline std::string generate_chain(const route_definition& def, const codegen_options& opts = {}) {
    return generate_chain(def.table, def.base, opts);
}

} // namespace routegen
