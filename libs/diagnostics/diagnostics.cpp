/**
 * @file diagnostics.cpp
 * @brief Diagnostic naming, ordering and JSON form
 */

#include "ecv/diagnostics.hpp"

#include <algorithm>
#include <string>
#include <tuple>
#include <vector>

namespace ecv::diag {

namespace {

[[nodiscard]] nlohmann::json loc_json(const ast::SourceLoc& loc)
{
    return nlohmann::json{
        {"file", loc.file},
        {"line", loc.line},
        { "col",  loc.col}
    };
}

}  // namespace

std::string_view kind_name(DiagnosticKind kind)
{
    switch (kind) {
        case DiagnosticKind::kEffectViolation:
            return "effect-violation";
        case DiagnosticKind::kUnknownExternalEffect:
            return "unknown-external-effect";
        case DiagnosticKind::kContractDisproven:
            return "contract-disproven";
        case DiagnosticKind::kPreconditionUnsatisfiable:
            return "precondition-unsatisfiable";
    }
    return "unknown";
}

std::string_view severity_name(Severity severity)
{
    return severity == Severity::kError ? "error" : "warning";
}

std::string_view link_kind_name(ChainLinkKind kind)
{
    switch (kind) {
        case ChainLinkKind::kInternal:
            return "internal";
        case ChainLinkKind::kExternal:
            return "external";
        case ChainLinkKind::kPrimitive:
            return "primitive";
    }
    return "unknown";
}

bool diagnostic_less(const Diagnostic& lhs, const Diagnostic& rhs)
{
    const auto key = [](const Diagnostic& d) {
        return std::tie(d.function_id, d.kind, d.contract_id, d.effect, d.message);
    };
    return key(lhs) < key(rhs);
}

void sort_diagnostics(std::vector<Diagnostic>& diagnostics)
{
    std::ranges::stable_sort(diagnostics, diagnostic_less);
}

bool has_errors(const std::vector<Diagnostic>& diagnostics)
{
    return std::ranges::any_of(diagnostics,
                               [](const Diagnostic& d) { return d.severity == Severity::kError; });
}

std::string render_chain(const std::vector<ChainLink>& chain)
{
    if (chain.empty()) {
        return {};
    }
    std::string out = chain.front().function_id;
    for (const auto& link : chain) {
        out += " → " + link.target;
    }
    return out;
}

nlohmann::json to_json(const Diagnostic& diagnostic)
{
    nlohmann::json chain = nlohmann::json::array();
    for (const auto& link : diagnostic.chain) {
        nlohmann::json j{
            {"function_id",                 link.function_id},
            {     "target",                      link.target},
            {       "kind", std::string(link_kind_name(link.kind))},
            { "site_index",                  link.site_index}
        };
        if (link.loc) {
            j["loc"] = loc_json(*link.loc);
        }
        chain.push_back(std::move(j));
    }

    nlohmann::json j{
        {          "kind",   std::string(kind_name(diagnostic.kind))},
        {      "severity", std::string(severity_name(diagnostic.severity))},
        {   "function_id",                  diagnostic.function_id},
        {       "message",                      diagnostic.message},
        {         "chain",                                   chain},
        {"counterexample",               diagnostic.counterexample}
    };
    if (diagnostic.contract_id) {
        j["contract_id"] = *diagnostic.contract_id;
    }
    if (diagnostic.effect) {
        j["effect"] = *diagnostic.effect;
    }
    if (diagnostic.loc) {
        j["loc"] = loc_json(*diagnostic.loc);
    }
    return j;
}

}  // namespace ecv::diag
