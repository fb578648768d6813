#pragma once

#include "routegen/core/codegen.hpp"
#include "routegen/core/result.hpp"
#include "routegen/core/route_table.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace routegen_tool {

using routegen::route_definition;

struct header_options {
    std::string source_name;
    std::string ns;
    std::string function = "build_routes";
    std::string return_type = "auto";
    std::string param;
    std::vector<std::string> includes;
};

// Whole contents of the route file at `path`.
routegen::result<std::string> read_source(const std::string& path);

std::string escape_json(std::string_view sv);
std::string sanitize_identifier(std::string_view name);
std::string sanitize_namespace(std::string_view ns);

std::string dump_ast_summary(const route_definition& def);

std::string generate_header(const route_definition& def,
                            const header_options& header,
                            const routegen::codegen_options& codegen);

} // namespace routegen_tool
