/**
 * @file test_diagnostics.cpp
 * @brief Diagnostic ordering, chain rendering and JSON form
 */

#include "ecv/diagnostics.hpp"

#include <vector>

#include <gtest/gtest.h>

namespace ecv::diag::test {

namespace {

Diagnostic make(std::string function_id, DiagnosticKind kind, Severity severity, std::string message)
{
    Diagnostic d;
    d.function_id = std::move(function_id);
    d.kind = kind;
    d.severity = severity;
    d.message = std::move(message);
    return d;
}

}  // namespace

TEST(DiagnosticsTest, Names)
{
    EXPECT_EQ(kind_name(DiagnosticKind::kEffectViolation), "effect-violation");
    EXPECT_EQ(kind_name(DiagnosticKind::kUnknownExternalEffect), "unknown-external-effect");
    EXPECT_EQ(kind_name(DiagnosticKind::kContractDisproven), "contract-disproven");
    EXPECT_EQ(kind_name(DiagnosticKind::kPreconditionUnsatisfiable), "precondition-unsatisfiable");
    EXPECT_EQ(severity_name(Severity::kWarning), "warning");
    EXPECT_EQ(link_kind_name(ChainLinkKind::kPrimitive), "primitive");
}

TEST(DiagnosticsTest, SortIsIndependentOfInsertionOrder)
{
    std::vector<Diagnostic> a = {
        make("f002", DiagnosticKind::kEffectViolation, Severity::kError, "b"),
        make("f001", DiagnosticKind::kContractDisproven, Severity::kWarning, "c"),
        make("f001", DiagnosticKind::kEffectViolation, Severity::kError, "z"),
        make("f001", DiagnosticKind::kEffectViolation, Severity::kError, "a"),
    };
    std::vector<Diagnostic> b(a.rbegin(), a.rend());
    sort_diagnostics(a);
    sort_diagnostics(b);

    ASSERT_EQ(a.size(), b.size());
    for (std::size_t i = 0; i < a.size(); ++i) {
        EXPECT_EQ(to_json(a[i]), to_json(b[i]));
    }
    EXPECT_EQ(a[0].function_id, "f001");
    EXPECT_EQ(a[0].message, "a");
    EXPECT_EQ(a[1].message, "z");
    EXPECT_EQ(a[2].kind, DiagnosticKind::kContractDisproven);
    EXPECT_EQ(a[3].function_id, "f002");
}

TEST(DiagnosticsTest, HasErrors)
{
    std::vector<Diagnostic> diagnostics = {
        make("f001", DiagnosticKind::kUnknownExternalEffect, Severity::kWarning, "w"),
    };
    EXPECT_FALSE(has_errors(diagnostics));
    diagnostics.push_back(make("f001", DiagnosticKind::kEffectViolation, Severity::kError, "e"));
    EXPECT_TRUE(has_errors(diagnostics));
    EXPECT_FALSE(has_errors({}));
}

TEST(DiagnosticsTest, ChainRendering)
{
    std::vector<ChainLink> chain = {
        {.function_id = "f001", .target = "f002", .kind = ChainLinkKind::kInternal, .site_index = 0},
        {.function_id = "f002", .target = "Net.Send", .kind = ChainLinkKind::kExternal, .site_index = 1},
    };
    EXPECT_EQ(render_chain(chain), "f001 → f002 → Net.Send");
    EXPECT_EQ(render_chain({}), "");
}

TEST(DiagnosticsTest, JsonCarriesOptionalFieldsOnlyWhenSet)
{
    Diagnostic d = make("f001", DiagnosticKind::kEffectViolation, Severity::kError, "msg");
    auto plain = to_json(d);
    EXPECT_FALSE(plain.contains("contract_id"));
    EXPECT_FALSE(plain.contains("effect"));
    EXPECT_FALSE(plain.contains("loc"));
    EXPECT_TRUE(plain.at("chain").empty());
    EXPECT_EQ(plain.at("kind"), "effect-violation");

    d.effect = "net:w";
    d.contract_id = "f001#post0";
    d.loc = ast::SourceLoc{.file = "a.src", .line = 4, .col = 2};
    d.counterexample = {
        {"x", "0"}
    };
    d.chain.push_back(ChainLink{.function_id = "f001",
                                .target = "http_post",
                                .kind = ChainLinkKind::kPrimitive,
                                .site_index = 2,
                                .loc = std::nullopt});
    auto full = to_json(d);
    EXPECT_EQ(full.at("effect"), "net:w");
    EXPECT_EQ(full.at("contract_id"), "f001#post0");
    EXPECT_EQ(full.at("loc").at("line"), 4);
    EXPECT_EQ(full.at("counterexample").at("x"), "0");
    EXPECT_EQ(full.at("chain")[0].at("kind"), "primitive");
    EXPECT_EQ(full.at("chain")[0].at("site_index"), 2);
}

}  // namespace ecv::diag::test
