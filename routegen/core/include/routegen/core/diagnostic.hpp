#pragma once

#include "result.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace routegen {

struct source_position {
    size_t offset{0};
    uint32_t line{1};
    uint32_t column{1};
};

// First error of a failed parse. `expected` names the construct the parser
// wanted, `found` is the offending source text ("end of input" at EOF).
struct diagnostic {
    std::error_code code;
    source_position pos{};
    std::string expected;
    std::string found;

    [[nodiscard]] std::string message() const;

    // file:line:col: error: message, followed by the source line and a caret
    // when `source` is non-empty.
    [[nodiscard]] std::string format(std::string_view file, std::string_view source = {}) const;
};

template <typename T> using parse_result = std::expected<T, diagnostic>;

inline diagnostic make_diagnostic(error_code code,
                                  source_position pos,
                                  std::string expected,
                                  std::string found) {
    return diagnostic{make_error_code(code), pos, std::move(expected), std::move(found)};
}

} // namespace routegen
