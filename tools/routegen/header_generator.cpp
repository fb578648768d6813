#include "generator.hpp"

#include <sstream>
#include <string>
#include <string_view>

namespace routegen_tool {

namespace {

std::string include_spelling(std::string_view header) {
    if (header.starts_with('<') || header.starts_with('"')) {
        return std::string(header);
    }
    return "\"" + std::string(header) + "\"";
}

} // namespace

std::string generate_header(const route_definition& def,
                            const header_options& header,
                            const routegen::codegen_options& codegen) {
    // The chain continues a `return` statement one level deep.
    routegen::codegen_options body_opts = codegen;
    body_opts.indent = codegen.indent + 4;
    auto chain = routegen::generate_chain(def, body_opts);

    const auto ns = sanitize_namespace(header.ns);
    const auto function = sanitize_identifier(header.function);

    std::ostringstream out;
    out << "// Generated by routegen";
    if (!header.source_name.empty()) {
        out << " from " << header.source_name;
    }
    out << ". Do not edit.\n";
    out << "#pragma once\n\n";
    for (const auto& inc : header.includes) {
        out << "#include " << include_spelling(inc) << "\n";
    }
    if (!header.includes.empty()) {
        out << "\n";
    }
    if (!ns.empty()) {
        out << "namespace " << ns << " {\n\n";
    }

    out << "inline " << (header.return_type.empty() ? "auto" : header.return_type) << " "
        << function << "(" << header.param << ") {\n";
    out << "    return " << chain << ";\n";
    out << "}\n";

    if (!ns.empty()) {
        out << "\n} // namespace " << ns << "\n";
    }
    return out.str();
}

} // namespace routegen_tool
