#include "routegen/core/codegen.hpp"

#include "routegen/core/handler_name.hpp"

#include <cstddef>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

namespace routegen {

std::string quote_cpp_string(std::string_view sv) {
    static constexpr char octal[] = "01234567";
    std::string out;
    out.reserve(sv.size() + 8);
    out.push_back('"');
    for (char c : sv) {
        switch (c) {
        case '\"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20 || c == 0x7f) {
                // three digits so a following digit is never absorbed
                auto u = static_cast<unsigned char>(c);
                out.push_back('\\');
                out.push_back(octal[(u >> 6) & 07]);
                out.push_back(octal[(u >> 3) & 07]);
                out.push_back(octal[u & 07]);
            } else {
                out.push_back(c);
            }
            break;
        }
    }
    out.push_back('"');
    return out;
}

std::string_view binder_name(method m) noexcept {
    switch (m) {
    case method::get:
        return "get";
    case method::post:
        return "post";
    case method::put:
        return "put";
    case method::del:
        return "del";
    }
    return "unknown";
}

std::string render_endpoint(const code_block& block) {
    if (block.empty()) {
        return "{}";
    }
    if (block.is_expression()) {
        return block.value;
    }

    std::string out = "[&]() {";
    for (const auto& statement : block.statements) {
        out += " ";
        out += statement;
        out += ";";
    }
    if (!block.value.empty()) {
        out += " return ";
        out += block.value;
        out += ";";
    }
    out += " }()";
    return out;
}

std::string render_entry(const route_entry& entry, const codegen_options& opts) {
    return std::visit(
        [&](const auto& route) -> std::string {
            using T = std::decay_t<decltype(route)>;
            if constexpr (std::is_same_v<T, nested_route>) {
                return ".nest(" + quote_cpp_string(route.mount_path) + ", " +
                       render_endpoint(route.endpoint) + ")";
            } else {
                std::string bindings;
                for (auto m : route.methods) {
                    if (bindings.empty()) {
                        bindings += opts.binder_prefix;
                    } else {
                        bindings += ".";
                    }
                    bindings += binder_name(m);
                    bindings += "(";
                    bindings += derive_handler_name(route.handler, m).to_string();
                    bindings += ")";
                }
                return ".at(" + quote_cpp_string(route.path) + ", " + bindings + ")";
            }
        },
        entry);
}

std::string generate_chain(const route_table& table,
                           const std::optional<opaque_expr>& base,
                           const codegen_options& opts) {
    std::ostringstream out;
    out << (base ? base->text : opts.default_base);

    std::string separator;
    if (opts.multiline) {
        separator = "\n";
        separator.append(static_cast<size_t>(opts.indent > 0 ? opts.indent : 0), ' ');
    }
    for (const auto& entry : table.entries) {
        out << separator << render_entry(entry, opts);
    }
    return out.str();
}

} // namespace routegen
