#include "routegen/core/codegen.hpp"
#include "routegen/core/parser.hpp"

#include <gtest/gtest.h>

#include <string>
#include <string_view>

using namespace routegen;

namespace {

route_definition parse_ok(std::string_view source) {
    auto res = parse_routes(source);
    EXPECT_TRUE(res) << (res ? "" : res.error().message());
    return res ? std::move(*res) : route_definition{};
}

} // namespace

TEST(Codegen, CanonicalExample) {
    auto def = parse_ok(R"({ "/" index GET
        "/pastes" paste::pastes GET
        "/pastes/:id" paste::paste GET POST
        *"/admin" { admin::build_routes() } })");

    EXPECT_EQ(generate_chain(def),
              "route()\n"
              "    .at(\"/\", get(get_index))\n"
              "    .at(\"/pastes\", get(paste::get_pastes))\n"
              "    .at(\"/pastes/:id\", get(paste::get_paste).post(paste::post_paste))\n"
              "    .nest(\"/admin\", admin::build_routes())");
}

TEST(Codegen, EmptyTableYieldsBaseUnchanged) {
    EXPECT_EQ(generate_chain(parse_ok("{}")), "route()");
    EXPECT_EQ(generate_chain(parse_ok("app.router(/* keep */ 1), {}")), "app.router(/* keep */ 1)");
}

TEST(Codegen, ExplicitBaseWinsOverDefault) {
    codegen_options opts;
    opts.default_base = "Router{}";
    EXPECT_EQ(generate_chain(parse_ok(R"(r, { "/" index GET })"), opts),
              "r\n    .at(\"/\", get(get_index))");
    EXPECT_EQ(generate_chain(parse_ok(R"({ "/" index GET })"), opts),
              "Router{}\n    .at(\"/\", get(get_index))");
}

TEST(Codegen, PreservesSourceOrder) {
    auto def = parse_ok(R"({
        *"/z" { z() }
        "/b" b GET
        "/a" a GET
        *"/y" { y() }
    })");
    codegen_options opts;
    opts.multiline = false;
    EXPECT_EQ(generate_chain(def, opts),
              "route().nest(\"/z\", z()).at(\"/b\", get(get_b)).at(\"/a\", get(get_a))"
              ".nest(\"/y\", y())");
}

TEST(Codegen, MethodOrderFollowsSource) {
    codegen_options opts;
    opts.multiline = false;
    EXPECT_EQ(generate_chain(parse_ok(R"({ "/r" res DELETE PUT GET POST })"), opts),
              "route().at(\"/r\", del(delete_res).put(put_res).get(get_res).post(post_res))");
}

TEST(Codegen, BinderPrefixOnlyOnFirstMethod) {
    codegen_options opts;
    opts.multiline = false;
    opts.binder_prefix = "router::";
    EXPECT_EQ(generate_chain(parse_ok(R"({ "/foo" module::foo GET POST })"), opts),
              "route().at(\"/foo\", router::get(module::get_foo).post(module::post_foo))");
}

TEST(Codegen, IndentWidth) {
    codegen_options opts;
    opts.indent = 2;
    EXPECT_EQ(generate_chain(parse_ok(R"({ "/" index GET })"), opts),
              "route()\n  .at(\"/\", get(get_index))");
}

TEST(Codegen, PathsAreEscaped) {
    codegen_options opts;
    opts.multiline = false;
    EXPECT_EQ(generate_chain(parse_ok(R"({ "/q\"uote\\d" q GET })"), opts),
              "route().at(\"/q\\\"uote\\\\d\", get(get_q))");
}

TEST(Codegen, QuoteControlCharacters) {
    EXPECT_EQ(quote_cpp_string("a\nb"), "\"a\\nb\"");
    EXPECT_EQ(quote_cpp_string(std::string("x\0" "1", 3)), "\"x\\0001\"");
    EXPECT_EQ(quote_cpp_string("\x1b"), "\"\\033\"");
}

TEST(Codegen, EndpointBlocks) {
    code_block expr;
    expr.value = "files(\"./static\")";
    EXPECT_EQ(render_endpoint(expr), "files(\"./static\")");

    code_block empty;
    EXPECT_EQ(render_endpoint(empty), "{}");

    code_block stmts;
    stmts.statements = {"auto d = dir()", "log(d)"};
    stmts.value = "files(d)";
    EXPECT_EQ(render_endpoint(stmts), "[&]() { auto d = dir(); log(d); return files(d); }()");

    code_block no_value;
    no_value.statements = {"setup()"};
    EXPECT_EQ(render_endpoint(no_value), "[&]() { setup(); }()");
}

TEST(Codegen, NestedStatementBlockEndToEnd) {
    codegen_options opts;
    opts.multiline = false;
    auto def = parse_ok(R"({ *"/static" { auto dir = root() + "/static"; files(dir) } })");
    EXPECT_EQ(generate_chain(def, opts),
              "route().nest(\"/static\", [&]() { auto dir = root() + \"/static\"; "
              "return files(dir); }())");
}

TEST(Codegen, ControlFlowStatementIsNotReturned) {
    codegen_options opts;
    opts.multiline = false;
    auto def = parse_ok(R"({ *"/a" { auto r = sub(); if (debug) { r = r.with_log(); } } })");
    EXPECT_EQ(generate_chain(def, opts),
              "route().nest(\"/a\", [&]() { auto r = sub(); "
              "if (debug) { r = r.with_log(); }; }())");

    auto with_value = parse_ok(R"({ *"/b" {
        auto r = sub();
        for (auto& m : mods) { r = m(r); }
        if (debug) { r = log(r); } else { r = quiet(r); }
        r
    } })");
    EXPECT_EQ(generate_chain(with_value, opts),
              "route().nest(\"/b\", [&]() { auto r = sub(); for (auto& m : mods) { r = m(r); }; "
              "if (debug) { r = log(r); } else { r = quiet(r); }; return r; }())");
}

TEST(Codegen, RawStringInBlockSplicedVerbatim) {
    codegen_options opts;
    opts.multiline = false;
    auto def = parse_ok(R"routes({ *"/a" { auto s = R"x(a)b;")x"; files(s) } })routes");
    EXPECT_EQ(generate_chain(def, opts),
              "route().nest(\"/a\", [&]() { auto s = R\"x(a)b;\")x\"; return files(s); }())");
}

TEST(Codegen, GenerationIsIdempotent) {
    auto def = parse_ok(R"(base(), {
        "/" index GET POST
        *"/n" { auto x = 1; make(x) }
        "/d" a::b::c DELETE
    })");
    auto first = generate_chain(def);
    auto second = generate_chain(def);
    EXPECT_EQ(first, second);
}

TEST(Codegen, BinderNames) {
    EXPECT_EQ(binder_name(method::get), "get");
    EXPECT_EQ(binder_name(method::post), "post");
    EXPECT_EQ(binder_name(method::put), "put");
    EXPECT_EQ(binder_name(method::del), "del");
}
