#include "routegen/core/handler_name.hpp"

#include <string>
#include <utility>

namespace routegen {

path_template derive_handler_name(const path_template& handler, method m) {
    path_template out = handler;
    if (out.segments.empty()) {
        return out;
    }
    auto& last = out.segments.back();
    std::string renamed(method_to_lower(m));
    renamed.reserve(renamed.size() + 1 + last.size());
    renamed += '_';
    renamed += last;
    last = std::move(renamed);
    return out;
}

} // namespace routegen
