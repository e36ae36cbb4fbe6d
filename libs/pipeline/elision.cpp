/**
 * @file elision.cpp
 * @brief Diagnostic and keep/elide policy for contract outcomes
 */

#include "ecv/elision.hpp"

#include <format>
#include <string>
#include <utility>

namespace ecv::pipeline {

namespace {

using smt::OutcomeKind;

[[nodiscard]] std::optional<ast::SourceLoc> contract_loc(const ast::Function& function,
                                                         const smt::ContractResult& contract)
{
    const auto& list = contract.kind == smt::ContractKind::kPrecondition ? function.preconditions
                                                                          : function.postconditions;
    if (contract.index < list.size() && list[contract.index]->loc) {
        return list[contract.index]->loc;
    }
    return function.loc;
}

[[nodiscard]] std::string ledger_note(const smt::Outcome& outcome)
{
    if (outcome.kind == OutcomeKind::kUnsupported) {
        return std::format("unsupported: {}", outcome.detail);
    }
    if (outcome.detail.empty()) {
        return std::format("unproven ({})", smt::unproven_reason_name(outcome.reason));
    }
    return std::format("unproven ({}): {}", smt::unproven_reason_name(outcome.reason), outcome.detail);
}

}  // namespace

std::string describe_counterexample(const std::map<std::string, std::string>& counterexample)
{
    std::string out;
    const auto append = [&out](const std::string& name, const std::string& value) {
        if (!out.empty()) {
            out += ", ";
        }
        out += std::format("{} = {}", name, value);
    };
    for (const auto& [name, value] : counterexample) {
        if (name != "result") {
            append(name, value);
        }
    }
    if (auto it = counterexample.find("result"); it != counterexample.end()) {
        append(it->first, it->second);
    }
    return out;
}

ElisionResult decide(const ast::Function& function,
                     const smt::FunctionVerification& verification,
                     const ElisionOptions& options)
{
    ElisionResult result;

    if (verification.preconditions_unsatisfiable) {
        result.diagnostics.push_back(diag::Diagnostic{
            .kind = diag::DiagnosticKind::kPreconditionUnsatisfiable,
            .severity = diag::Severity::kWarning,
            .function_id = function.id,
            .contract_id = std::nullopt,
            .message = std::format(
                "Preconditions of function '{}' can never hold together; its postconditions hold vacuously",
                function.name),
            .effect = std::nullopt,
            .chain = {},
            .counterexample = {},
            .loc = function.loc});
    }

    for (const auto& contract : verification.contracts) {
        ContractDecision decision{.contract_id = contract.contract_id,
                                  .function_id = function.id,
                                  .kind = contract.kind,
                                  .text = contract.text,
                                  .outcome = contract.outcome,
                                  .elide = false};
        if (contract.kind == smt::ContractKind::kPrecondition || !contract.outcome) {
            result.decisions.push_back(std::move(decision));
            continue;
        }

        const smt::Outcome& outcome = *contract.outcome;
        switch (outcome.kind) {
            case OutcomeKind::kProven:
                decision.elide = true;
                break;
            case OutcomeKind::kDisproven:
                result.diagnostics.push_back(diag::Diagnostic{
                    .kind = diag::DiagnosticKind::kContractDisproven,
                    .severity = options.disproven_is_error ? diag::Severity::kError
                                                           : diag::Severity::kWarning,
                    .function_id = function.id,
                    .contract_id = contract.contract_id,
                    .message = std::format("Postcondition '{}' may be violated in function '{}'. Counterexample: {}",
                                           contract.text,
                                           function.name,
                                           describe_counterexample(outcome.counterexample)),
                    .effect = std::nullopt,
                    .chain = {},
                    .counterexample = outcome.counterexample,
                    .loc = contract_loc(function, contract)});
                break;
            case OutcomeKind::kUnproven:
            case OutcomeKind::kUnsupported:
                result.ledger.push_back(LedgerEntry{.contract_id = contract.contract_id,
                                                    .function_id = function.id,
                                                    .note = ledger_note(outcome)});
                break;
        }
        result.decisions.push_back(std::move(decision));
    }
    return result;
}

nlohmann::json to_json(const ContractDecision& decision)
{
    nlohmann::json j{
        {"contract_id", decision.contract_id},
        {"function_id", decision.function_id},
        {       "kind", decision.kind == smt::ContractKind::kPrecondition ? "precondition" : "postcondition"},
        {       "text", decision.text},
        {      "elide", decision.elide}
    };
    if (decision.outcome) {
        j["outcome"] = smt::to_json(*decision.outcome);
    }
    return j;
}

nlohmann::json to_json(const LedgerEntry& entry)
{
    return nlohmann::json{
        {"contract_id", entry.contract_id},
        {"function_id", entry.function_id},
        {       "note",        entry.note}
    };
}

}  // namespace ecv::pipeline
