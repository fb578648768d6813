#include "generator.hpp"

#include "routegen/core/handler_name.hpp"

#include <sstream>
#include <string>
#include <type_traits>
#include <variant>

namespace routegen_tool {

std::string dump_ast_summary(const route_definition& def) {
    std::ostringstream os;
    os << "{";
    os << "\"base\":";
    if (def.base) {
        os << "\"" << escape_json(def.base->text) << "\"";
    } else {
        os << "null";
    }
    os << ",\"routes\":[";
    bool first_route = true;
    for (const auto& entry : def.table.entries) {
        if (!first_route) {
            os << ",";
        }
        first_route = false;
        os << "{";
        std::visit(
            [&](const auto& route) {
                using T = std::decay_t<decltype(route)>;
                if constexpr (std::is_same_v<T, routegen::nested_route>) {
                    os << "\"kind\":\"nest\",";
                    os << "\"path\":\"" << escape_json(route.mount_path) << "\",";
                    os << "\"endpoint\":\"" << escape_json(routegen::render_endpoint(route.endpoint))
                       << "\",";
                } else {
                    os << "\"kind\":\"at\",";
                    os << "\"path\":\"" << escape_json(route.path) << "\",";
                    os << "\"handler\":\"" << escape_json(route.handler.to_string()) << "\",";
                    os << "\"methods\":[";
                    bool first_method = true;
                    for (auto m : route.methods) {
                        if (!first_method) {
                            os << ",";
                        }
                        first_method = false;
                        os << "{";
                        os << "\"method\":\"" << routegen::method_to_string(m) << "\",";
                        os << "\"handler\":\""
                           << escape_json(routegen::derive_handler_name(route.handler, m).to_string())
                           << "\"";
                        os << "}";
                    }
                    os << "],";
                }
                os << "\"line\":" << route.pos.line << ",";
                os << "\"column\":" << route.pos.column;
            },
            entry);
        os << "}";
    }
    os << "]";
    os << "}";
    return os.str();
}

} // namespace routegen_tool
