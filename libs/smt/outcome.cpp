/**
 * @file outcome.cpp
 * @brief Verification outcome naming and JSON form
 */

#include "ecv/smt_verifier.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace ecv::smt {

std::string_view outcome_kind_name(OutcomeKind kind)
{
    switch (kind) {
        case OutcomeKind::kProven:
            return "proven";
        case OutcomeKind::kDisproven:
            return "disproven";
        case OutcomeKind::kUnproven:
            return "unproven";
        case OutcomeKind::kUnsupported:
            return "unsupported";
    }
    return "unknown";
}

std::string_view unproven_reason_name(UnprovenReason reason)
{
    switch (reason) {
        case UnprovenReason::kTimeout:
            return "timeout";
        case UnprovenReason::kComplexity:
            return "complexity";
        case UnprovenReason::kCancelled:
            return "cancelled";
    }
    return "unknown";
}

std::string contract_id(std::string_view function_id, ContractKind kind, std::size_t index)
{
    return std::string(function_id) + (kind == ContractKind::kPrecondition ? "#pre" : "#post")
           + std::to_string(index);
}

nlohmann::json to_json(const Outcome& outcome)
{
    nlohmann::json j{
        {"kind", std::string(outcome_kind_name(outcome.kind))}
    };
    switch (outcome.kind) {
        case OutcomeKind::kProven:
            break;
        case OutcomeKind::kDisproven:
            j["counterexample"] = outcome.counterexample;
            break;
        case OutcomeKind::kUnproven:
            j["reason"] = std::string(unproven_reason_name(outcome.reason));
            j["detail"] = outcome.detail;
            break;
        case OutcomeKind::kUnsupported:
            j["construct"] = outcome.detail;
            break;
    }
    return j;
}

std::optional<Outcome> outcome_from_json(const nlohmann::json& j)
{
    if (!j.is_object() || !j.contains("kind") || !j.at("kind").is_string()) {
        return std::nullopt;
    }
    const auto kind = j.at("kind").get<std::string>();
    if (kind == "proven") {
        return Outcome::proven();
    }
    if (kind == "disproven") {
        std::map<std::string, std::string> counterexample;
        if (auto it = j.find("counterexample"); it != j.end()) {
            if (!it->is_object()) {
                return std::nullopt;
            }
            for (const auto& [name, value] : it->items()) {
                if (!value.is_string()) {
                    return std::nullopt;
                }
                counterexample.emplace(name, value.get<std::string>());
            }
        }
        return Outcome::disproven(std::move(counterexample));
    }
    if (kind == "unsupported") {
        return Outcome::unsupported(j.value("construct", std::string{}));
    }
    if (kind == "unproven") {
        const auto reason = j.value("reason", std::string{});
        UnprovenReason parsed = UnprovenReason::kComplexity;
        if (reason == "timeout") {
            parsed = UnprovenReason::kTimeout;
        } else if (reason == "cancelled") {
            parsed = UnprovenReason::kCancelled;
        } else if (reason != "complexity") {
            return std::nullopt;
        }
        return Outcome::unproven(parsed, j.value("detail", std::string{}));
    }
    return std::nullopt;
}

}  // namespace ecv::smt
