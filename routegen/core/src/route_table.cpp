#include "routegen/core/route_table.hpp"

#include <string>
#include <string_view>

namespace routegen {

std::optional<method> parse_method(std::string_view keyword) noexcept {
    if (keyword == "GET") {
        return method::get;
    }
    if (keyword == "POST") {
        return method::post;
    }
    if (keyword == "PUT") {
        return method::put;
    }
    if (keyword == "DELETE") {
        return method::del;
    }
    return std::nullopt;
}

std::string_view method_to_string(method m) noexcept {
    switch (m) {
    case method::get:
        return "GET";
    case method::post:
        return "POST";
    case method::put:
        return "PUT";
    case method::del:
        return "DELETE";
    }
    return "UNKNOWN";
}

std::string_view method_to_lower(method m) noexcept {
    switch (m) {
    case method::get:
        return "get";
    case method::post:
        return "post";
    case method::put:
        return "put";
    case method::del:
        return "delete";
    }
    return "unknown";
}

std::string path_template::to_string() const {
    std::string out;
    for (const auto& segment : segments) {
        if (!out.empty()) {
            out += "::";
        }
        out += segment;
    }
    return out;
}

} // namespace routegen
