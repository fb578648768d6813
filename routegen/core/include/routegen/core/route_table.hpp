#pragma once

#include "diagnostic.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace routegen {

enum class method : uint8_t { get, post, put, del };

std::optional<method> parse_method(std::string_view keyword) noexcept;
std::string_view method_to_string(method m) noexcept;
// Lower-case name used as the handler prefix ("delete" for DELETE).
std::string_view method_to_lower(method m) noexcept;

struct path_template {
    std::vector<std::string> segments;

    [[nodiscard]] std::string to_string() const;

    friend bool operator==(const path_template&, const path_template&) = default;
};

// Verbatim source slice. Never re-parsed; the generator splices it as is.
struct opaque_expr {
    std::string text;
    source_position pos{};
};

// Braced block captured verbatim. `statements` are the top-level ';'
// terminated slices (without the ';'), `value` the trailing expression if any.
struct code_block {
    std::string body;
    std::vector<std::string> statements;
    std::string value;
    source_position pos{};

    [[nodiscard]] bool is_expression() const noexcept {
        return statements.empty() && !value.empty();
    }
    [[nodiscard]] bool empty() const noexcept { return statements.empty() && value.empty(); }
};

struct nested_route {
    std::string mount_path;
    code_block endpoint;
    source_position pos{};
};

struct normal_route {
    std::string path;
    path_template handler;
    std::vector<method> methods;
    source_position pos{};
};

using route_entry = std::variant<nested_route, normal_route>;

struct route_table {
    std::vector<route_entry> entries;

    [[nodiscard]] bool empty() const noexcept { return entries.empty(); }
    [[nodiscard]] size_t size() const noexcept { return entries.size(); }
};

struct route_definition {
    std::optional<opaque_expr> base;
    route_table table;
};

} // namespace routegen
