#include "routegen/core/diagnostic.hpp"
#include "routegen/core/result.hpp"

#include <gtest/gtest.h>
#include <string>
#include <system_error>
#include <utility>

using namespace routegen;

TEST(Result, HasValueSuccess) {
    result<int> r = 42;
    EXPECT_TRUE(r.has_value());
    EXPECT_TRUE(static_cast<bool>(r));
    EXPECT_EQ(r.value(), 42);
}

TEST(Result, HasValueError) {
    result<int> r = std::unexpected(make_error_code(error_code::empty_method_list));
    EXPECT_FALSE(r.has_value());
    EXPECT_EQ(r.error(), make_error_code(error_code::empty_method_list));
}

TEST(Result, AndThenPropagatesError) {
    result<int> r = std::unexpected(make_error_code(error_code::unexpected_token));
    auto doubled = r.and_then([](int val) -> result<int> { return val * 2; });
    EXPECT_FALSE(doubled.has_value());
    EXPECT_EQ(doubled.error(), make_error_code(error_code::unexpected_token));
}

TEST(ErrorCategory, NameAndMessages) {
    auto ec = make_error_code(error_code::missing_closing_brace);
    EXPECT_STREQ(ec.category().name(), "routegen");
    EXPECT_EQ(ec.message(), "missing closing brace of route table");
    EXPECT_EQ(make_error_code(error_code::duplicate_method).message(),
              "HTTP method listed twice for one route");
    EXPECT_EQ(make_error_code(error_code::ok).message(), "success");
    EXPECT_EQ(std::error_code(999, get_error_category()).message(), "unknown error");
}

TEST(ErrorCategory, EnumConvertsImplicitly) {
    std::error_code ec = error_code::invalid_path_segment;
    EXPECT_EQ(ec, make_error_code(error_code::invalid_path_segment));
    EXPECT_NE(ec, make_error_code(error_code::invalid_route_start));
}

TEST(Diagnostic, MessageNamesExpectedAndFound) {
    auto d = make_diagnostic(error_code::unexpected_token, {4, 1, 5}, "'{'", "foo");
    EXPECT_EQ(d.message(), "unexpected token: expected '{', found 'foo'");

    auto at_eof = make_diagnostic(
        error_code::missing_closing_brace, {10, 2, 3}, "'}' closing the route table", "end of input");
    EXPECT_EQ(at_eof.message(),
              "missing closing brace of route table: expected '}' closing the route table, found "
              "end of input");

    auto bare = make_diagnostic(error_code::unexpected_character, {0, 1, 1}, "", "@");
    EXPECT_EQ(bare.message(), "unexpected character: found '@'");
}

TEST(Diagnostic, FormatPointsAtColumn) {
    const std::string source = "{\n  \"/\" index\n}\n";
    // '}' on line 3 where a method was expected
    auto d = make_diagnostic(error_code::empty_method_list, {14, 3, 1}, "a method", "}");
    auto text = d.format("api.routes", source);
    EXPECT_EQ(text,
              "api.routes:3:1: error: route has no HTTP methods: expected a method, found '}'\n"
              "    }\n"
              "    ^\n");
}

TEST(Diagnostic, FormatWithoutSourceIsOneLine) {
    auto d = make_diagnostic(error_code::trailing_input, {7, 2, 4}, "end of input", "x");
    EXPECT_EQ(d.format("<input>"),
              "<input>:2:4: error: unexpected input after route table: expected end of input, "
              "found 'x'\n");
}
