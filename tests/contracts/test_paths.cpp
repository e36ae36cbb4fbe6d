/**
 * @file test_paths.cpp
 * @brief Path enumeration: substitution, pruning and limits
 */

#include "ecv/paths.hpp"

#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace ecv::contracts::test {

namespace {

using ast::BinaryOp;

ast::Function make_function(std::vector<ast::StmtPtr> body)
{
    ast::Function fn;
    fn.id = "f001";
    fn.name = "f";
    fn.params = {
        {.name = "x", .type = "int"}
    };
    fn.return_type = "int";
    fn.body = std::move(body);
    return fn;
}

ast::ExprPtr x_lt_zero()
{
    return ast::binary(BinaryOp::kLt, ast::var("x"), ast::int_lit(0));
}

std::vector<std::string> rendered(const std::vector<ast::ExprPtr>& conditions)
{
    std::vector<std::string> out;
    for (const auto& c : conditions) {
        out.push_back(ast::to_string(*c));
    }
    return out;
}

}  // namespace

TEST(PathsTest, ThenBranchFirst)
{
    const auto fn = make_function({
        ast::if_stmt(x_lt_zero(), {ast::return_stmt(ast::int_lit(0))}),
        ast::return_stmt(ast::var("x")),
    });
    auto paths = enumerate_paths(fn, 16);
    ASSERT_TRUE(paths);
    ASSERT_EQ(paths->paths.size(), 2U);
    EXPECT_EQ(rendered(paths->paths[0].conditions), std::vector<std::string>{"x < 0"});
    EXPECT_EQ(ast::to_string(*paths->paths[0].returned), "0");
    EXPECT_EQ(rendered(paths->paths[1].conditions), std::vector<std::string>{"!(x < 0)"});
    EXPECT_EQ(ast::to_string(*paths->paths[1].returned), "x");
    EXPECT_EQ(paths->thrown, 0U);
}

TEST(PathsTest, LocalBindingsAreSubstituted)
{
    const auto fn = make_function({
        ast::let_stmt("y", ast::binary(BinaryOp::kAdd, ast::var("x"), ast::int_lit(1))),
        ast::if_stmt(ast::binary(BinaryOp::kGt, ast::var("y"), ast::int_lit(10)),
                     {ast::assign_stmt("y", ast::int_lit(10))}),
        ast::return_stmt(ast::var("y")),
    });
    auto paths = enumerate_paths(fn, 16);
    ASSERT_TRUE(paths);
    ASSERT_EQ(paths->paths.size(), 2U);
    EXPECT_EQ(rendered(paths->paths[0].conditions), std::vector<std::string>{"(x + 1) > 10"});
    EXPECT_EQ(ast::to_string(*paths->paths[0].returned), "10");
    EXPECT_EQ(ast::to_string(*paths->paths[1].returned), "x + 1");
}

TEST(PathsTest, InfeasibleBranchesArePruned)
{
    const auto fn = make_function({
        ast::if_stmt(x_lt_zero(),
                     {ast::if_stmt(x_lt_zero(),
                                   {ast::return_stmt(ast::int_lit(1))},
                                   {ast::return_stmt(ast::int_lit(2))})}),
        ast::if_stmt(ast::bool_lit(false), {ast::return_stmt(ast::int_lit(3))}),
        ast::if_stmt(ast::bool_lit(true), {ast::return_stmt(ast::int_lit(4))}),
        ast::return_stmt(ast::int_lit(5)),
    });
    auto paths = enumerate_paths(fn, 16);
    ASSERT_TRUE(paths);
    ASSERT_EQ(paths->paths.size(), 2U);
    EXPECT_EQ(rendered(paths->paths[0].conditions), std::vector<std::string>{"x < 0"});
    EXPECT_EQ(ast::to_string(*paths->paths[0].returned), "1");
    EXPECT_EQ(rendered(paths->paths[1].conditions), std::vector<std::string>{"!(x < 0)"});
    EXPECT_EQ(ast::to_string(*paths->paths[1].returned), "4");
}

TEST(PathsTest, ThrowingPathsAreCountedNotReturned)
{
    const auto fn = make_function({
        ast::if_stmt(x_lt_zero(), {ast::throw_stmt()}),
        ast::return_stmt(ast::var("x")),
    });
    auto paths = enumerate_paths(fn, 16);
    ASSERT_TRUE(paths);
    ASSERT_EQ(paths->paths.size(), 1U);
    EXPECT_EQ(paths->thrown, 1U);
}

TEST(PathsTest, FallingOffTheEndHasNoReturnedValue)
{
    const auto empty = make_function({});
    auto paths = enumerate_paths(empty, 16);
    ASSERT_TRUE(paths);
    ASSERT_EQ(paths->paths.size(), 1U);
    EXPECT_TRUE(paths->paths[0].conditions.empty());
    EXPECT_EQ(paths->paths[0].returned, nullptr);

    const auto bare_return = make_function({ast::return_stmt(nullptr)});
    auto bare = enumerate_paths(bare_return, 16);
    ASSERT_TRUE(bare);
    ASSERT_EQ(bare->paths.size(), 1U);
    EXPECT_EQ(bare->paths[0].returned, nullptr);
}

TEST(PathsTest, LoopsAreUnsupported)
{
    const auto fn = make_function({
        ast::if_stmt(x_lt_zero(), {ast::while_stmt(ast::bool_lit(true), {})}),
        ast::return_stmt(ast::var("x")),
    });
    auto paths = enumerate_paths(fn, 16);
    ASSERT_FALSE(paths);
    EXPECT_EQ(paths.error().kind, FailureKind::kUnsupported);
    EXPECT_EQ(paths.error().construct, "loop");
}

TEST(PathsTest, PathLimit)
{
    std::vector<ast::StmtPtr> body;
    for (int i = 0; i < 3; ++i) {
        body.push_back(ast::if_stmt(ast::binary(BinaryOp::kGt, ast::var("x"), ast::int_lit(i)),
                                    {ast::expr_stmt(ast::var("x"))}));
    }
    body.push_back(ast::return_stmt(ast::var("x")));
    const auto fn = make_function(body);

    auto within = enumerate_paths(fn, 8);
    ASSERT_TRUE(within);
    EXPECT_EQ(within->paths.size(), 8U);

    auto over = enumerate_paths(fn, 4);
    ASSERT_FALSE(over);
    EXPECT_EQ(over.error().kind, FailureKind::kTooComplex);
}

}  // namespace ecv::contracts::test
