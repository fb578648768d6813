#include "mounted_routes.hpp"
#include "pastebin_routes.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using fixture::binding;
using fixture::operation;

namespace {

void expect_bindings(const operation& op, const std::vector<binding>& expected) {
    ASSERT_EQ(op.bindings.size(), expected.size()) << op.path;
    for (size_t i = 0; i < expected.size(); ++i) {
        EXPECT_EQ(op.bindings[i].method, expected[i].method) << op.path;
        EXPECT_EQ(op.bindings[i].handler, expected[i].handler) << op.path;
    }
}

} // namespace

TEST(GeneratedRouter, RegistersPastebinRoutesInSourceOrder) {
    auto r = fixture::build_pastebin();
    EXPECT_EQ(r.label(), "root");

    const auto& ops = r.operations();
    ASSERT_EQ(ops.size(), 5U);

    EXPECT_EQ(ops[0].kind, "at");
    EXPECT_EQ(ops[0].path, "/");
    expect_bindings(ops[0], {{"GET", "get_index"}});

    EXPECT_EQ(ops[1].path, "/pastes");
    expect_bindings(ops[1], {{"GET", "paste::get_pastes"}});

    EXPECT_EQ(ops[2].path, "/pastes/:id");
    expect_bindings(ops[2], {{"GET", "paste::get_paste"}, {"POST", "paste::post_paste"}});

    EXPECT_EQ(ops[3].path, "/pastes/:id/raw");
    expect_bindings(ops[3], {{"PUT", "paste::put_raw"}, {"DELETE", "paste::delete_raw"}});

    EXPECT_EQ(ops[4].kind, "nest");
    EXPECT_EQ(ops[4].path, "/admin");
    EXPECT_EQ(ops[4].mounted, "admin");
}

TEST(GeneratedRouter, ChainsOntoBaseExpressionAndRunsStatementBlocks) {
    auto r = fixture::build_mounted("/v1");
    EXPECT_EQ(r.label(), "base:/v1");

    const auto& ops = r.operations();
    ASSERT_EQ(ops.size(), 2U);

    EXPECT_EQ(ops[0].kind, "at");
    EXPECT_EQ(ops[0].path, "/health");
    expect_bindings(ops[0], {{"GET", "get_health"}});

    EXPECT_EQ(ops[1].kind, "nest");
    EXPECT_EQ(ops[1].path, "/static");
    EXPECT_EQ(ops[1].mounted, "static:./static");
}
