#include "routegen/core/diagnostic.hpp"

#include <sstream>
#include <string>
#include <string_view>

namespace routegen {

namespace {

std::string_view line_at(std::string_view source, size_t offset) {
    if (offset > source.size()) {
        offset = source.size();
    }
    size_t begin = 0;
    if (offset > 0) {
        auto nl = source.rfind('\n', offset - 1);
        if (nl != std::string_view::npos) {
            begin = nl + 1;
        }
    }
    size_t end = source.find('\n', offset);
    if (end == std::string_view::npos) {
        end = source.size();
    }
    auto line = source.substr(begin, end - begin);
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }
    return line;
}

} // namespace

std::string diagnostic::message() const {
    std::string out = code.message();
    if (!expected.empty()) {
        out += ": expected ";
        out += expected;
    }
    if (!found.empty()) {
        out += expected.empty() ? ": found " : ", found ";
        if (found == "end of input") {
            out += found;
        } else {
            out += "'";
            out += found;
            out += "'";
        }
    }
    return out;
}

std::string diagnostic::format(std::string_view file, std::string_view source) const {
    std::ostringstream os;
    os << file << ":" << pos.line << ":" << pos.column << ": error: " << message() << "\n";
    if (!source.empty()) {
        auto line = line_at(source, pos.offset);
        os << "    " << line << "\n";
        os << "    ";
        for (uint32_t i = 1; i < pos.column && i <= line.size(); ++i) {
            os << (line[i - 1] == '\t' ? '\t' : ' ');
        }
        os << "^\n";
    }
    return os.str();
}

} // namespace routegen
