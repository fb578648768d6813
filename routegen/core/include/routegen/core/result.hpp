#pragma once

#include <expected>
#include <string>
#include <system_error>

namespace routegen {

template <typename T> using result = std::expected<T, std::error_code>;

enum class error_code : int {
    ok = 0,
    unexpected_character = 1,
    unterminated_string = 2,
    unterminated_comment = 3,
    unterminated_block = 4,
    unexpected_token = 5,
    missing_closing_brace = 6,
    invalid_route_start = 7,
    empty_method_list = 8,
    invalid_path_segment = 9,
    unknown_method = 10,
    duplicate_method = 11,
    trailing_input = 12,
};

class error_category : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override { return "routegen"; }

    [[nodiscard]] std::string message(int ev) const override {
        using ec = error_code;
        switch (static_cast<ec>(ev)) {
        case ec::ok:
            return "success";
        case ec::unexpected_character:
            return "unexpected character";
        case ec::unterminated_string:
            return "unterminated string literal";
        case ec::unterminated_comment:
            return "unterminated block comment";
        case ec::unterminated_block:
            return "unterminated code block";
        case ec::unexpected_token:
            return "unexpected token";
        case ec::missing_closing_brace:
            return "missing closing brace of route table";
        case ec::invalid_route_start:
            return "route must start with '*' or a string literal";
        case ec::empty_method_list:
            return "route has no HTTP methods";
        case ec::invalid_path_segment:
            return "handler path segment is not a plain identifier";
        case ec::unknown_method:
            return "unknown HTTP method";
        case ec::duplicate_method:
            return "HTTP method listed twice for one route";
        case ec::trailing_input:
            return "unexpected input after route table";
        default:
            return "unknown error";
        }
    }
};

inline const error_category& get_error_category() {
    static error_category const instance;
    return instance;
}

inline std::error_code make_error_code(error_code e) {
    return {static_cast<int>(e), get_error_category()};
}

} // namespace routegen

namespace std {
template <> struct is_error_code_enum<routegen::error_code> : true_type {};
} // namespace std
