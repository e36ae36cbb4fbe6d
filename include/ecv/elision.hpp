#pragma once

/**
 * @file elision.hpp
 * @brief Outcome -> diagnostic and runtime-check decision
 */

#include "ecv/ast.hpp"
#include "ecv/diagnostics.hpp"
#include "ecv/smt_verifier.hpp"

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace ecv::pipeline {

struct ElisionOptions
{
    bool disproven_is_error = false;
};

struct ContractDecision
{
    std::string contract_id;
    std::string function_id;
    smt::ContractKind kind = smt::ContractKind::kPostcondition;
    std::string text;
    /// Absent for preconditions and when static verification is disabled.
    std::optional<smt::Outcome> outcome;
    bool elide = false;
};

/// A contract that stays checked at runtime without a finding.
struct LedgerEntry
{
    std::string contract_id;
    std::string function_id;
    std::string note;
};

struct ElisionResult
{
    std::vector<ContractDecision> decisions;
    std::vector<diag::Diagnostic> diagnostics;
    std::vector<LedgerEntry> ledger;
};

/**
 * Map the verification of one function to diagnostics and keep/elide
 * decisions. Only Proven postconditions are elided; preconditions are
 * always kept.
 */
[[nodiscard]] ElisionResult decide(const ast::Function& function,
                                   const smt::FunctionVerification& verification,
                                   const ElisionOptions& options);

/// "x = 0, result = -1"
[[nodiscard]] std::string describe_counterexample(
    const std::map<std::string, std::string>& counterexample);

[[nodiscard]] nlohmann::json to_json(const ContractDecision& decision);
[[nodiscard]] nlohmann::json to_json(const LedgerEntry& entry);

}  // namespace ecv::pipeline
