#pragma once

/**
 * @file diagnostics.hpp
 * @brief Structured diagnostics produced by the verification pass
 */

#include "ecv/ast.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace ecv::diag {

enum class DiagnosticKind {
    kEffectViolation,
    kUnknownExternalEffect,
    kContractDisproven,
    kPreconditionUnsatisfiable,
};

enum class Severity { kError, kWarning };

enum class ChainLinkKind { kInternal, kExternal, kPrimitive };

/// One call-site reference in an effect-violation chain.
struct ChainLink
{
    std::string function_id;  ///< Function containing the site
    std::string target;       ///< Callee id, qualified name or primitive op
    ChainLinkKind kind = ChainLinkKind::kInternal;
    std::size_t site_index = 0;  ///< Index into the function's call or primitive sites
    std::optional<ast::SourceLoc> loc;
};

struct Diagnostic
{
    DiagnosticKind kind = DiagnosticKind::kEffectViolation;
    Severity severity = Severity::kError;
    std::string function_id;
    std::optional<std::string> contract_id;
    std::string message;
    /// Offending effect code for effect diagnostics ("*" for unknown).
    std::optional<std::string> effect;
    std::vector<ChainLink> chain;
    std::map<std::string, std::string> counterexample;
    std::optional<ast::SourceLoc> loc;
};

[[nodiscard]] std::string_view kind_name(DiagnosticKind kind);
[[nodiscard]] std::string_view severity_name(Severity severity);
[[nodiscard]] std::string_view link_kind_name(ChainLinkKind kind);

/// Total order used for deterministic output.
[[nodiscard]] bool diagnostic_less(const Diagnostic& lhs, const Diagnostic& rhs);

void sort_diagnostics(std::vector<Diagnostic>& diagnostics);

[[nodiscard]] bool has_errors(const std::vector<Diagnostic>& diagnostics);

/// "f → g → Net.Send"
[[nodiscard]] std::string render_chain(const std::vector<ChainLink>& chain);

[[nodiscard]] nlohmann::json to_json(const Diagnostic& diagnostic);

}  // namespace ecv::diag
