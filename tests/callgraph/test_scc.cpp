/**
 * @file test_scc.cpp
 * @brief Tarjan decomposition order and independent groups
 */

#include "ecv/callgraph.hpp"

#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace ecv::callgraph::test {

namespace {

/// Program whose function i calls every id in edges[i].
ast::Program make_program(const std::vector<std::vector<std::string>>& edges)
{
    ast::Program program;
    for (std::size_t i = 0; i < edges.size(); ++i) {
        ast::Function fn;
        fn.id = "n" + std::to_string(i);
        fn.name = fn.id;
        for (const auto& callee : edges[i]) {
            fn.body.push_back(ast::expr_stmt(ast::call(callee, {})));
        }
        program.functions.push_back(std::move(fn));
    }
    return program;
}

}  // namespace

TEST(SccTest, ChainIsCalleeFirst)
{
    const auto program = make_program({{"n1"}, {"n2"}, {}});
    auto graph = CallGraph::build(program);
    ASSERT_TRUE(graph);
    auto scc = decompose(*graph);
    ASSERT_TRUE(scc) << scc.error().message;

    ASSERT_EQ(scc->components.size(), 3U);
    EXPECT_EQ(scc->components[0], std::vector<std::size_t>{2});
    EXPECT_EQ(scc->components[1], std::vector<std::size_t>{1});
    EXPECT_EQ(scc->components[2], std::vector<std::size_t>{0});
    EXPECT_FALSE(scc->is_recursive(0, *graph));
}

TEST(SccTest, CyclesCollapse)
{
    // n0 -> n1 <-> n2 -> n3, n3 self-recursive
    const auto program = make_program({{"n1"}, {"n2"}, {"n1", "n3"}, {"n3"}});
    auto graph = CallGraph::build(program);
    ASSERT_TRUE(graph);
    auto scc = decompose(*graph);
    ASSERT_TRUE(scc);

    ASSERT_EQ(scc->components.size(), 3U);
    EXPECT_EQ(scc->component_of[1], scc->component_of[2]);
    EXPECT_EQ(scc->components[scc->component_of[1]], (std::vector<std::size_t>{1, 2}));
    EXPECT_TRUE(scc->is_recursive(scc->component_of[1], *graph));
    EXPECT_TRUE(scc->is_recursive(scc->component_of[3], *graph));
    EXPECT_FALSE(scc->is_recursive(scc->component_of[0], *graph));

    EXPECT_LT(scc->component_of[3], scc->component_of[1]);
    EXPECT_LT(scc->component_of[1], scc->component_of[0]);
    EXPECT_TRUE(check_callee_first(*graph, *scc));
}

TEST(SccTest, CheckRejectsCallerBeforeCallee)
{
    const auto program = make_program({{"n1"}, {}});
    auto graph = CallGraph::build(program);
    ASSERT_TRUE(graph);

    SccDecomposition bad;
    bad.components = {{0}, {1}};
    bad.component_of = {0, 1};
    auto order = check_callee_first(*graph, bad);
    ASSERT_FALSE(order);
    EXPECT_EQ(order.error().code, "InternalInvariant");

    SccDecomposition missing;
    missing.components = {{1}};
    missing.component_of = {0, 0};
    EXPECT_FALSE(check_callee_first(*graph, missing));
}

TEST(SccTest, IndependentGroups)
{
    // {n0 -> n1}, {n2}, {n3 -> n4, n5 -> n4}
    const auto program = make_program({{"n1"}, {}, {}, {"n4"}, {}, {"n4"}});
    auto graph = CallGraph::build(program);
    ASSERT_TRUE(graph);
    auto scc = decompose(*graph);
    ASSERT_TRUE(scc);

    const auto groups = independent_groups(*graph, *scc);
    ASSERT_EQ(groups.size(), 3U);

    std::vector<std::size_t> seen;
    for (const auto& group : groups) {
        for (std::size_t i = 1; i < group.size(); ++i) {
            EXPECT_LT(group[i - 1], group[i]);
        }
        seen.insert(seen.end(), group.begin(), group.end());
    }
    EXPECT_EQ(seen.size(), scc->components.size());

    const auto group_of = [&](std::size_t node) {
        for (std::size_t g = 0; g < groups.size(); ++g) {
            for (const std::size_t c : groups[g]) {
                if (c == scc->component_of[node]) {
                    return g;
                }
            }
        }
        return groups.size();
    };
    EXPECT_EQ(group_of(0), group_of(1));
    EXPECT_EQ(group_of(3), group_of(4));
    EXPECT_EQ(group_of(5), group_of(4));
    EXPECT_NE(group_of(0), group_of(2));
    EXPECT_NE(group_of(2), group_of(3));
}

TEST(SccTest, DeepChainDoesNotRecurse)
{
    std::vector<std::vector<std::string>> edges(5000);
    for (std::size_t i = 0; i + 1 < edges.size(); ++i) {
        edges[i] = {"n" + std::to_string(i + 1)};
    }
    const auto program = make_program(edges);
    auto graph = CallGraph::build(program);
    ASSERT_TRUE(graph);
    auto scc = decompose(*graph);
    ASSERT_TRUE(scc);
    EXPECT_EQ(scc->components.size(), edges.size());
    EXPECT_EQ(scc->components.front(), std::vector<std::size_t>{edges.size() - 1});
}

}  // namespace ecv::callgraph::test
