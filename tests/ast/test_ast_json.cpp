/**
 * @file test_ast_json.cpp
 * @brief program.v1 loading, rendering and substitution
 */

#include "ecv/ast.hpp"

#include <filesystem>
#include <fstream>
#include <map>
#include <string>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace ecv::ast::test {

namespace {

using nlohmann::json;

json int_json(std::int64_t value)
{
    return json{
        { "kind",   "int"},
        {"value", value}
    };
}

json var_json(const std::string& name)
{
    return json{
        {"kind",  "var"},
        {"name", name}
    };
}

json binary_json(const std::string& op, json lhs, json rhs)
{
    return json{
        {"kind", "binary"},
        {  "op",       op},
        { "lhs",      lhs},
        { "rhs",      rhs}
    };
}

json clamp_program()
{
    json body = json::array({
        json{{"kind", "if"},
             {"cond", binary_json("<", var_json("x"), int_json(0))},
             {"then", json::array({json{{"kind", "return"}, {"value", int_json(0)}}})},
             {"else", json::array()},
             {"loc", {{"file", "clamp.src"}, {"line", 3}, {"col", 5}}}},
        json{{"kind", "return"}, {"value", var_json("x")}}
    });
    return json{
        {"schema_version", "ecv.program.v1"},
        {        "module",          "Clamp"},
        {     "functions",
         json::array({json{{"id", "f001"},
         {"name", "clamp"},
         {"params", json::array({{{"name", "x"}, {"type", "int"}}})},
         {"return_type", "int"},
         {"effects", json::array({"cw"})},
         {"requires", json::array({binary_json(">", var_json("x"), int_json(-100))})},
         {"ensures", json::array({binary_json(">=", var_json("result"), int_json(0))})},
         {"body", body}}})}
    };
}

class TempDir
{
public:
    explicit TempDir(const std::string& name)
        : m_path(std::filesystem::temp_directory_path() / name)
    {
        std::filesystem::remove_all(m_path);
        std::filesystem::create_directories(m_path);
    }
    ~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return m_path; }

private:
    std::filesystem::path m_path;
};

}  // namespace

TEST(AstJsonTest, LoadsFunctionsAndContracts)
{
    auto program = program_from_json(clamp_program());
    ASSERT_TRUE(program) << program.error().message;
    EXPECT_EQ(program->module, "Clamp");
    ASSERT_EQ(program->functions.size(), 1U);

    const Function& fn = program->functions.front();
    EXPECT_EQ(fn.id, "f001");
    EXPECT_EQ(fn.name, "clamp");
    ASSERT_EQ(fn.params.size(), 1U);
    EXPECT_EQ(fn.params[0].type, "int");
    EXPECT_EQ(fn.effects, std::vector<std::string>{"cw"});
    ASSERT_EQ(fn.preconditions.size(), 1U);
    ASSERT_EQ(fn.postconditions.size(), 1U);
    EXPECT_EQ(to_string(*fn.postconditions[0]), "result >= 0");
    ASSERT_EQ(fn.body.size(), 2U);
    EXPECT_EQ(fn.body[0]->kind, StmtKind::kIf);
    ASSERT_TRUE(fn.body[0]->loc.has_value());
    EXPECT_EQ(fn.body[0]->loc->line, 3);
}

TEST(AstJsonTest, SerializedFormLoadsBackEqual)
{
    auto program = program_from_json(clamp_program());
    ASSERT_TRUE(program);
    auto reloaded = program_from_json(to_json(*program));
    ASSERT_TRUE(reloaded) << reloaded.error().message;
    const auto& a = program->functions.front();
    const auto& b = reloaded->functions.front();
    EXPECT_TRUE(structurally_equal(*a.postconditions[0], *b.postconditions[0]));
    EXPECT_EQ(to_json(a), to_json(b));
}

TEST(AstJsonTest, RejectsUnknownKinds)
{
    json doc = clamp_program();
    doc["functions"][0]["ensures"][0]["kind"] = "lambda";
    auto bad_expr = program_from_json(doc);
    ASSERT_FALSE(bad_expr);
    EXPECT_EQ(bad_expr.error().code, "InvalidExpression");

    doc = clamp_program();
    doc["functions"][0]["body"][1]["kind"] = "goto";
    auto bad_stmt = program_from_json(doc);
    ASSERT_FALSE(bad_stmt);
    EXPECT_EQ(bad_stmt.error().code, "InvalidStatement");

    doc = clamp_program();
    doc["functions"][0]["ensures"][0]["op"] = "<=>";
    auto bad_op = program_from_json(doc);
    ASSERT_FALSE(bad_op);
    EXPECT_EQ(bad_op.error().code, "InvalidOperator");
}

TEST(AstJsonTest, RejectsMissingFieldsAndVersions)
{
    json doc = clamp_program();
    doc["functions"][0].erase("id");
    auto missing = program_from_json(doc);
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, "MissingField");

    doc = clamp_program();
    doc["schema_version"] = "ecv.program.v9";
    auto version = program_from_json(doc);
    ASSERT_FALSE(version);
    EXPECT_EQ(version.error().code, "UnsupportedSchemaVersion");
}

TEST(AstJsonTest, LoadProgramFileValidatesSchema)
{
    TempDir dir("ecv_test_ast_json");
    const auto good = dir.path() / "good.json";
    const auto bad = dir.path() / "bad.json";
    {
        std::ofstream(good) << clamp_program().dump();
        json doc = clamp_program();
        doc["functions"][0]["params"] = "x";
        std::ofstream(bad) << doc.dump();
    }

    auto loaded = load_program_file(good.string(), ECV_SCHEMA_DIR);
    ASSERT_TRUE(loaded) << loaded.error().message;
    EXPECT_EQ(loaded->functions.size(), 1U);

    auto invalid = load_program_file(bad.string(), ECV_SCHEMA_DIR);
    ASSERT_FALSE(invalid);
    EXPECT_EQ(invalid.error().code, "SchemaInvalid");

    auto absent = load_program_file((dir.path() / "absent.json").string(), ECV_SCHEMA_DIR);
    ASSERT_FALSE(absent);
    EXPECT_EQ(absent.error().code, "IOError");
}

TEST(AstTest, RendersInfixWithParentheses)
{
    auto expr = binary(BinaryOp::kImplies,
                       binary(BinaryOp::kGt, var("x"), int_lit(0)),
                       unary(UnaryOp::kNot, call("is_empty", {var("s")})));
    EXPECT_EQ(to_string(*expr), "(x > 0) -> !is_empty(s)");

    auto q = quantifier(ExprKind::kForall,
                        "i",
                        "int",
                        int_lit(0),
                        var("n"),
                        binary(BinaryOp::kGe, var("i"), int_lit(0)));
    EXPECT_EQ(to_string(*q), "forall i in [0, n): (i >= 0)");
}

TEST(AstTest, NegateFoldsLiteralsAndDoubleNegation)
{
    EXPECT_FALSE(negate(bool_lit(true))->bool_value);
    auto x = var("x");
    auto not_x = negate(x);
    EXPECT_EQ(not_x->kind, ExprKind::kUnary);
    EXPECT_EQ(negate(not_x), x);
}

TEST(AstTest, SubstituteRespectsQuantifierBinding)
{
    auto body = binary(BinaryOp::kLt, var("i"), var("n"));
    auto q = quantifier(ExprKind::kExists, "i", "int", var("i"), var("n"), body);
    const std::map<std::string, ExprPtr> env = {
        {"i", int_lit(7)},
        {"n", int_lit(9)}
    };
    auto replaced = substitute(q, env);
    EXPECT_EQ(to_string(*replaced), "exists i in [7, 9): (i < 9)");

    auto untouched = var("y");
    EXPECT_EQ(substitute(untouched, env), untouched);
}

TEST(AstTest, StructuralEqualityIgnoresLocations)
{
    Expr with_loc = *var("x");
    with_loc.loc = SourceLoc{.file = "a.src", .line = 1, .col = 2};
    EXPECT_TRUE(structurally_equal(with_loc, *var("x")));
    EXPECT_FALSE(structurally_equal(*var("x"), *var("y")));
    EXPECT_FALSE(structurally_equal(*int_lit(1), *bool_lit(true)));
}

}  // namespace ecv::ast::test
