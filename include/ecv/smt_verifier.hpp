#pragma once

/**
 * @file smt_verifier.hpp
 * @brief Static contract verification with Z3
 */

#include "ecv/ast.hpp"

#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace ecv::smt {

enum class OutcomeKind { kProven, kDisproven, kUnproven, kUnsupported };

enum class UnprovenReason { kTimeout, kComplexity, kCancelled };

struct Outcome
{
    OutcomeKind kind = OutcomeKind::kUnproven;
    /// Disproven: parameter and `result` values.
    std::map<std::string, std::string> counterexample;
    /// Unproven only.
    UnprovenReason reason = UnprovenReason::kComplexity;
    /// Unsupported construct or Unproven detail.
    std::string detail;

    [[nodiscard]] static Outcome proven() { return Outcome{.kind = OutcomeKind::kProven}; }
    [[nodiscard]] static Outcome disproven(std::map<std::string, std::string> counterexample)
    {
        return Outcome{.kind = OutcomeKind::kDisproven, .counterexample = std::move(counterexample)};
    }
    [[nodiscard]] static Outcome unproven(UnprovenReason reason, std::string detail)
    {
        return Outcome{.kind = OutcomeKind::kUnproven,
                       .counterexample = {},
                       .reason = reason,
                       .detail = std::move(detail)};
    }
    [[nodiscard]] static Outcome unsupported(std::string construct)
    {
        return Outcome{.kind = OutcomeKind::kUnsupported,
                       .counterexample = {},
                       .reason = UnprovenReason::kComplexity,
                       .detail = std::move(construct)};
    }

    bool operator==(const Outcome&) const = default;
};

[[nodiscard]] std::string_view outcome_kind_name(OutcomeKind kind);
[[nodiscard]] std::string_view unproven_reason_name(UnprovenReason reason);

[[nodiscard]] nlohmann::json to_json(const Outcome& outcome);
/// Inverse of to_json; std::nullopt for malformed input.
[[nodiscard]] std::optional<Outcome> outcome_from_json(const nlohmann::json& j);

enum class ContractKind { kPrecondition, kPostcondition };

/// "<function id>#pre<N>" / "<function id>#post<N>"
[[nodiscard]] std::string contract_id(std::string_view function_id, ContractKind kind, std::size_t index);

struct ContractResult
{
    std::string contract_id;
    ContractKind kind = ContractKind::kPostcondition;
    std::size_t index = 0;
    std::string text;
    /// Preconditions are not verified and carry no outcome.
    std::optional<Outcome> outcome;
};

struct FunctionVerification
{
    std::string function_id;
    std::vector<ContractResult> contracts;
    bool preconditions_unsatisfiable = false;
    std::size_t solver_queries = 0;
    bool from_cache = false;
};

struct VerifierOptions
{
    std::chrono::milliseconds timeout{5000};
    std::map<std::string, std::chrono::milliseconds> function_timeouts;
    std::size_t max_paths = 1024;
    std::size_t max_quantifier_expansion = 64;
    bool check_preconditions = true;
};

/**
 * @brief Verifies the postconditions of one function per call
 *
 * Every call creates its own z3::context, so concurrent calls on the same
 * verifier are safe. A stop request interrupts a running query; contracts
 * not yet started become Unproven(cancelled).
 */
class SmtVerifier
{
public:
    explicit SmtVerifier(VerifierOptions options);

    [[nodiscard]] FunctionVerification verify(const ast::Function& function,
                                              std::stop_token stop = {}) const;

    [[nodiscard]] std::chrono::milliseconds timeout_for(std::string_view function_id) const;

    [[nodiscard]] const VerifierOptions& options() const { return m_options; }

private:
    VerifierOptions m_options;
};

/// Contract results without solving, for runs with static verification disabled.
[[nodiscard]] FunctionVerification unverified(const ast::Function& function);

/// "major.minor.build.revision" of the linked Z3.
[[nodiscard]] std::string solver_version();

}  // namespace ecv::smt
