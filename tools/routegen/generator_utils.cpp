#include "generator.hpp"

#include <cctype>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>

namespace routegen_tool {

namespace fs = std::filesystem;

routegen::result<std::string> read_source(const std::string& path) {
    std::error_code ec;
    auto status = fs::status(path, ec);
    if (ec || !fs::exists(status)) {
        return std::unexpected(ec ? ec : std::make_error_code(std::errc::no_such_file_or_directory));
    }
    if (fs::is_directory(status)) {
        return std::unexpected(std::make_error_code(std::errc::is_a_directory));
    }
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::unexpected(std::make_error_code(std::errc::permission_denied));
    }
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

std::string escape_json(std::string_view sv) {
    static constexpr char hex[] = "0123456789abcdef";
    std::string out;
    out.reserve(sv.size() + 8);
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
            if (static_cast<unsigned char>(c) < 0x20) {
                auto u = static_cast<unsigned char>(c);
                out += "\\u00";
                out.push_back(hex[u >> 4]);
                out.push_back(hex[u & 0xf]);
            } else {
                out.push_back(c);
            }
            break;
        }
    }
    return out;
}

std::string sanitize_identifier(std::string_view name) {
    std::string id;
    id.reserve(name.size() + 2);
    for (char c : name) {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '_') {
            id.push_back(c);
        } else {
            id.push_back('_');
        }
    }
    if (id.empty() || std::isdigit(static_cast<unsigned char>(id.front()))) {
        id.insert(id.begin(), '_');
    }
    return id;
}

// "a::b-c::" -> "a::b_c"; empty segments are dropped.
std::string sanitize_namespace(std::string_view ns) {
    std::string out;
    while (!ns.empty()) {
        auto sep = ns.find("::");
        auto part = ns.substr(0, sep);
        if (!part.empty()) {
            if (!out.empty()) {
                out += "::";
            }
            out += sanitize_identifier(part);
        }
        if (sep == std::string_view::npos) {
            break;
        }
        ns.remove_prefix(sep + 2);
    }
    return out;
}

} // namespace routegen_tool
