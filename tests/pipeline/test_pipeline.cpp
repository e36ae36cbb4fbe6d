/**
 * @file test_pipeline.cpp
 * @brief End-to-end verification pass over in-memory programs
 */

#include "ecv/pipeline.hpp"

#include <algorithm>
#include <filesystem>
#include <stop_token>
#include <string>

#include <gtest/gtest.h>

namespace ecv::pipeline::test {

namespace {

using ast::BinaryOp;

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

ast::Function make_function(const std::string& id,
                            const std::string& name,
                            std::vector<std::string> declared)
{
    ast::Function fn;
    fn.id = id;
    fn.name = name;
    fn.return_type = "void";
    fn.effects = std::move(declared);
    return fn;
}

ast::Function make_int_function(const std::string& id,
                                const std::string& name,
                                std::vector<ast::StmtPtr> body)
{
    auto fn = make_function(id, name, {});
    fn.params = {
        {.name = "x", .type = "int"}
    };
    fn.return_type = "int";
    fn.postconditions = {ast::binary(BinaryOp::kGe, ast::var("result"), ast::int_lit(0))};
    fn.body = std::move(body);
    return fn;
}

/// Log: undeclared console write; Clamp: proven; Dec: disproven; Printer: declares cw.
ast::Program sample_program()
{
    ast::Program program;
    program.module = "Sample";

    auto log = make_function("f001", "Log", {});
    log.body = {ast::expr_stmt(ast::call("System.Console.WriteLine", {ast::string_lit("hi")}))};

    auto clamp = make_int_function(
        "f002",
        "Clamp",
        {ast::if_stmt(ast::binary(BinaryOp::kLt, ast::var("x"), ast::int_lit(0)),
                      {ast::return_stmt(ast::int_lit(0))}),
         ast::return_stmt(ast::var("x"))});

    auto dec = make_int_function(
        "f003", "Dec", {ast::return_stmt(ast::binary(BinaryOp::kSub, ast::var("x"), ast::int_lit(1)))});

    auto printer = make_function("f004", "Printer", {"cw"});
    printer.body = {ast::expr_stmt(ast::call("f001", {}))};

    program.functions = {log, clamp, dec, printer};
    return program;
}

manifest::JsonManifestResolver make_resolver()
{
    manifest::JsonManifestResolver resolver;
    auto added = resolver.add_document(
        nlohmann::json{
            {"namespaces",
             {{"System",
               {{"types",
                 {{"Console", {{"members", {{"WriteLine", nlohmann::json::array({"cw"})}}}}}}}}}}}
    },
        "test");
    EXPECT_TRUE(added);
    return resolver;
}

const diag::Diagnostic* find_kind(const PassResult& result, diag::DiagnosticKind kind)
{
    auto it = std::ranges::find_if(result.diagnostics,
                                   [kind](const diag::Diagnostic& d) { return d.kind == kind; });
    return it == result.diagnostics.end() ? nullptr : &*it;
}

VerificationConfig base_config()
{
    VerificationConfig config;
    config.jobs = 2;
    return config;
}

}  // namespace

TEST(VerificationPassTest, EffectsAndContracts)
{
    const auto resolver = make_resolver();
    const VerificationPass pass(base_config(), resolver, ECV_SCHEMA_DIR);

    auto result = pass.run(sample_program());
    ASSERT_TRUE(result) << result.error().message;

    EXPECT_EQ(result->function_ids, (std::vector<std::string>{"f001", "f002", "f003", "f004"}));
    ASSERT_TRUE(result->effects.has_value());
    EXPECT_FALSE(result->cancelled);

    const auto* violation = find_kind(*result, diag::DiagnosticKind::kEffectViolation);
    ASSERT_NE(violation, nullptr);
    EXPECT_EQ(violation->function_id, "f001");
    EXPECT_EQ(violation->severity, diag::Severity::kError);
    EXPECT_EQ(violation->effect, "cw");

    const auto* disproven = find_kind(*result, diag::DiagnosticKind::kContractDisproven);
    ASSERT_NE(disproven, nullptr);
    EXPECT_EQ(disproven->function_id, "f003");
    EXPECT_EQ(disproven->severity, diag::Severity::kWarning);
    EXPECT_TRUE(disproven->message.starts_with(
        "Postcondition 'result >= 0' may be violated in function 'Dec'. Counterexample: x = "));

    EXPECT_EQ(result->diagnostics.size(), 2U);
    EXPECT_EQ(result->summary.proven, 1U);
    EXPECT_EQ(result->summary.disproven, 1U);
    EXPECT_EQ(result->summary.elided, 1U);
    EXPECT_EQ(result->summary.kept, 1U);
    EXPECT_EQ(result->verifications.size(), 2U);
    EXPECT_FALSE(result->cache.has_value());
    EXPECT_EQ(exit_code(*result), 1);
}

TEST(VerificationPassTest, EffectEnforcementCanBeDisabled)
{
    const auto resolver = make_resolver();
    auto config = base_config();
    config.enforce_effects = false;
    const VerificationPass pass(config, resolver, ECV_SCHEMA_DIR);

    auto result = pass.run(sample_program());
    ASSERT_TRUE(result) << result.error().message;
    EXPECT_FALSE(result->effects.has_value());
    EXPECT_EQ(find_kind(*result, diag::DiagnosticKind::kEffectViolation), nullptr);
    EXPECT_EQ(exit_code(*result), 0);

    config.elision.disproven_is_error = true;
    const VerificationPass strict(config, resolver, ECV_SCHEMA_DIR);
    auto strict_result = strict.run(sample_program());
    ASSERT_TRUE(strict_result);
    EXPECT_EQ(exit_code(*strict_result), 1);
}

TEST(VerificationPassTest, StaticVerificationDisabledKeepsEveryCheck)
{
    const auto resolver = make_resolver();
    auto config = base_config();
    config.static_enabled = false;
    const VerificationPass pass(config, resolver, ECV_SCHEMA_DIR);

    auto result = pass.run(sample_program());
    ASSERT_TRUE(result) << result.error().message;
    EXPECT_EQ(result->summary.unverified, 2U);
    EXPECT_EQ(result->summary.proven, 0U);
    EXPECT_EQ(result->summary.elided, 0U);
    EXPECT_EQ(result->summary.kept, 2U);
    EXPECT_TRUE(result->ledger.empty());
    for (const auto& [id, verification] : result->verifications) {
        EXPECT_EQ(verification.solver_queries, 0U) << id;
        for (const auto& contract : verification.contracts) {
            EXPECT_FALSE(contract.outcome.has_value()) << contract.contract_id;
        }
    }
    EXPECT_EQ(find_kind(*result, diag::DiagnosticKind::kContractDisproven), nullptr);
}

TEST(VerificationPassTest, ProofCacheServesSecondRun)
{
    TempDir dir("ecv_test_pipeline_cache");
    const auto resolver = make_resolver();
    auto config = base_config();
    config.cache_dir = dir.path();
    const VerificationPass pass(config, resolver, ECV_SCHEMA_DIR);

    auto first = pass.run(sample_program());
    ASSERT_TRUE(first) << first.error().message;
    ASSERT_TRUE(first->cache.has_value());
    EXPECT_EQ(first->cache->misses, 2U);
    EXPECT_EQ(first->cache->hits, 0U);
    EXPECT_EQ(first->cache->stored, 2U);
    EXPECT_TRUE(first->notes.empty());

    auto second = pass.run(sample_program());
    ASSERT_TRUE(second) << second.error().message;
    EXPECT_EQ(second->cache->hits, 2U);
    EXPECT_EQ(second->cache->stored, 0U);
    EXPECT_TRUE(second->verifications.at("f002").from_cache);
    EXPECT_EQ(second->verifications.at("f002").solver_queries, 0U);
    EXPECT_EQ(second->summary.proven, first->summary.proven);
    EXPECT_EQ(second->summary.disproven, first->summary.disproven);
}

TEST(VerificationPassTest, StopBeforeRunCancels)
{
    const auto resolver = make_resolver();
    const VerificationPass pass(base_config(), resolver, ECV_SCHEMA_DIR);
    std::stop_source source;
    source.request_stop();

    auto result = pass.run(sample_program(), source.get_token());
    ASSERT_TRUE(result) << result.error().message;
    EXPECT_TRUE(result->cancelled);
    EXPECT_FALSE(result->effects.has_value());
    EXPECT_EQ(result->summary.unproven, 2U);
    ASSERT_EQ(result->ledger.size(), 2U);
    EXPECT_EQ(result->ledger[0].note, "unproven (cancelled): cancelled");
    EXPECT_EQ(exit_code(*result), 0);
}

TEST(VerificationPassTest, MalformedInputIsAnError)
{
    const auto resolver = make_resolver();
    const VerificationPass pass(base_config(), resolver, ECV_SCHEMA_DIR);

    auto duplicate = sample_program();
    duplicate.functions[1].id = "f001";
    auto result = pass.run(duplicate);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, "MalformedInput");

    auto bad_code = sample_program();
    bad_code.functions[3].effects = {"teleport"};
    auto bad = pass.run(bad_code);
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().code, "UnknownEffectCode");
}

}  // namespace ecv::pipeline::test
