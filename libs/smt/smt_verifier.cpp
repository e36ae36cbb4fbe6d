/**
 * @file smt_verifier.cpp
 * @brief Per-function postcondition verification with Z3
 */

#include "ecv/smt_verifier.hpp"

#include "ecv/formula.hpp"
#include "ecv/paths.hpp"
#include "z3_encoder.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <z3++.h>

namespace ecv::smt {

namespace {

using contracts::FormulaPtr;
using contracts::TranslationFailure;
using Clock = std::chrono::steady_clock;

[[nodiscard]] Outcome from_failure(const TranslationFailure& failure)
{
    if (failure.kind == contracts::FailureKind::kUnsupported) {
        return Outcome::unsupported(failure.construct);
    }
    return Outcome::unproven(UnprovenReason::kComplexity, failure.construct);
}

/// Bitvector model value as a signed or unsigned decimal.
[[nodiscard]] std::string decimal(const z3::expr& value, contracts::IntType type)
{
    uint64_t bits = 0;
    if (!value.is_numeral_u64(bits)) {
        return value.get_decimal_string(0);
    }
    if (!type.is_signed) {
        return std::to_string(bits);
    }
    if (type.width < 64 && (bits >> (type.width - 1)) != 0) {
        // Sign bit set: subtract 2^width.
        return std::to_string(static_cast<int64_t>(bits) - (int64_t{1} << type.width));
    }
    return std::to_string(static_cast<int64_t>(bits));
}

/// One returning path as solver assumptions.
struct PathQuery
{
    std::vector<FormulaPtr> assumptions;
};

/// Postcondition prepared for solving, or already decided without the solver.
struct PostPlan
{
    std::size_t contract_slot = 0;
    FormulaPtr post;
    std::optional<Outcome> decided;
};

class FunctionSession
{
public:
    FunctionSession(const contracts::FormulaTranslator& translator,
                    std::chrono::milliseconds budget,
                    std::stop_token stop,
                    FunctionVerification& out)
        : m_translator(translator)
        , m_deadline(Clock::now() + budget)
        , m_stop(std::move(stop))
        , m_out(out)
        , m_encoder(m_ctx)
        , m_on_stop(m_stop, [this] { m_ctx.interrupt(); })
    {}

    /// True if the hypotheses alone are unsatisfiable.
    [[nodiscard]] bool hypotheses_unsatisfiable(const std::vector<FormulaPtr>& hypotheses)
    {
        const auto remaining = remaining_ms();
        if (!remaining || m_stop.stop_requested()) {
            return false;
        }
        try {
            z3::solver solver(m_ctx);
            solver.set("timeout", *remaining);
            for (const auto& h : hypotheses) {
                solver.add(m_encoder.encode(*h));
            }
            ++m_out.solver_queries;
            return solver.check() == z3::unsat;
        } catch (const z3::exception&) {
            // Informational check only; an inconclusive answer is not a finding.
            return false;
        }
    }

    [[nodiscard]] Outcome solve(const FormulaPtr& post,
                                const std::vector<FormulaPtr>& hypotheses,
                                const std::vector<PathQuery>& paths,
                                const std::optional<TranslationFailure>& weakened)
    {
        try {
            return solve_paths(post, hypotheses, paths, weakened);
        } catch (const z3::exception& ex) {
            if (m_stop.stop_requested()) {
                return Outcome::unproven(UnprovenReason::kCancelled, "cancelled");
            }
            return Outcome::unproven(UnprovenReason::kComplexity, ex.msg());
        }
    }

private:
    [[nodiscard]] std::optional<unsigned> remaining_ms() const
    {
        const auto left =
            std::chrono::duration_cast<std::chrono::milliseconds>(m_deadline - Clock::now());
        if (left.count() <= 0) {
            return std::nullopt;
        }
        return static_cast<unsigned>(left.count());
    }

    [[nodiscard]] UnprovenReason classify_unknown(const std::string& reason) const
    {
        if (m_stop.stop_requested()) {
            return UnprovenReason::kCancelled;
        }
        if (reason.find("timeout") != std::string::npos
            || reason.find("canceled") != std::string::npos) {
            return UnprovenReason::kTimeout;
        }
        return UnprovenReason::kComplexity;
    }

    [[nodiscard]] std::map<std::string, std::string> counterexample(const z3::model& model)
    {
        std::map<std::string, std::string> values;
        auto vars = m_translator.variables();
        if (auto result = m_translator.result_variable()) {
            vars.push_back(std::move(*result));
        }
        for (const auto& var : vars) {
            const z3::expr value = model.eval(m_encoder.variable(var), true);
            if (var.sort == contracts::Sort::kBool) {
                values.emplace(var.name, value.bool_value() == Z3_L_TRUE ? "true" : "false");
                continue;
            }
            values.emplace(var.name, decimal(value, var.int_type));
        }
        return values;
    }

    [[nodiscard]] Outcome solve_paths(const FormulaPtr& post,
                                      const std::vector<FormulaPtr>& hypotheses,
                                      const std::vector<PathQuery>& paths,
                                      const std::optional<TranslationFailure>& weakened)
    {
        std::optional<Outcome> inconclusive;
        for (const auto& path : paths) {
            if (m_stop.stop_requested()) {
                return Outcome::unproven(UnprovenReason::kCancelled, "cancelled");
            }
            const auto remaining = remaining_ms();
            if (!remaining) {
                return Outcome::unproven(UnprovenReason::kTimeout, "time budget exhausted");
            }

            z3::solver solver(m_ctx);
            solver.set("timeout", *remaining);
            for (const auto& h : hypotheses) {
                solver.add(m_encoder.encode(*h));
            }
            for (const auto& a : path.assumptions) {
                solver.add(m_encoder.encode(*a));
            }
            solver.add(!m_encoder.encode(*post));
            ++m_out.solver_queries;

            switch (solver.check()) {
                case z3::sat:
                    if (weakened) {
                        // The model may violate a precondition that could not be encoded.
                        inconclusive = Outcome::unproven(
                            UnprovenReason::kComplexity,
                            "precondition not encodable: " + weakened->construct);
                        break;
                    }
                    return Outcome::disproven(counterexample(solver.get_model()));
                case z3::unknown: {
                    const auto reason = solver.reason_unknown();
                    if (!inconclusive) {
                        inconclusive = Outcome::unproven(classify_unknown(reason), reason);
                    }
                    break;
                }
                case z3::unsat:
                    break;
            }
        }
        return inconclusive ? *inconclusive : Outcome::proven();
    }

    const contracts::FormulaTranslator& m_translator;
    Clock::time_point m_deadline;
    std::stop_token m_stop;
    FunctionVerification& m_out;
    z3::context m_ctx;
    Z3Encoder m_encoder;
    std::stop_callback<std::function<void()>> m_on_stop;
};

}  // namespace

SmtVerifier::SmtVerifier(VerifierOptions options)
    : m_options(std::move(options))
{}

std::chrono::milliseconds SmtVerifier::timeout_for(std::string_view function_id) const
{
    auto it = m_options.function_timeouts.find(std::string(function_id));
    return it == m_options.function_timeouts.end() ? m_options.timeout : it->second;
}

FunctionVerification unverified(const ast::Function& function)
{
    FunctionVerification out;
    out.function_id = function.id;
    for (std::size_t i = 0; i < function.preconditions.size(); ++i) {
        out.contracts.push_back(
            ContractResult{.contract_id = contract_id(function.id, ContractKind::kPrecondition, i),
                           .kind = ContractKind::kPrecondition,
                           .index = i,
                           .text = ast::to_string(*function.preconditions[i]),
                           .outcome = std::nullopt});
    }
    for (std::size_t i = 0; i < function.postconditions.size(); ++i) {
        out.contracts.push_back(
            ContractResult{.contract_id = contract_id(function.id, ContractKind::kPostcondition, i),
                           .kind = ContractKind::kPostcondition,
                           .index = i,
                           .text = ast::to_string(*function.postconditions[i]),
                           .outcome = std::nullopt});
    }
    return out;
}

FunctionVerification SmtVerifier::verify(const ast::Function& function, std::stop_token stop) const
{
    FunctionVerification out = unverified(function);
    if (function.postconditions.empty() && function.preconditions.empty()) {
        return out;
    }
    const std::size_t first_post = function.preconditions.size();

    const contracts::FormulaTranslator translator(
        function,
        contracts::TranslatorOptions{.max_quantifier_expansion = m_options.max_quantifier_expansion});

    // Translation and path enumeration happen before any solver call.
    std::vector<FormulaPtr> hypotheses;
    std::optional<TranslationFailure> precondition_failure;
    for (const auto& pre : function.preconditions) {
        auto formula = translator.translate_condition(*pre);
        if (!formula) {
            if (!precondition_failure) {
                precondition_failure = formula.error();
            }
            continue;
        }
        hypotheses.push_back(std::move(*formula));
    }

    std::optional<TranslationFailure> path_failure;
    std::vector<PathQuery> queries;
    if (!function.postconditions.empty()) {
        auto paths = contracts::enumerate_paths(function, m_options.max_paths);
        if (!paths) {
            path_failure = paths.error();
        } else {
            const auto result_sort = translator.result_sort();
            for (const auto& path : paths->paths) {
                PathQuery query;
                for (const auto& condition : path.conditions) {
                    auto formula = translator.translate_condition(*condition);
                    if (!formula) {
                        path_failure = formula.error();
                        break;
                    }
                    query.assumptions.push_back(std::move(*formula));
                }
                if (path_failure) {
                    break;
                }
                if (path.returned && result_sort) {
                    auto binding = translator.translate_result_binding(*path.returned);
                    if (!binding) {
                        path_failure = binding.error();
                        break;
                    }
                    query.assumptions.push_back(std::move(*binding));
                }
                queries.push_back(std::move(query));
            }
        }
    }

    std::vector<PostPlan> plans;
    for (std::size_t i = 0; i < function.postconditions.size(); ++i) {
        PostPlan plan;
        plan.contract_slot = first_post + i;
        auto formula = translator.translate_condition(*function.postconditions[i]);
        if (!formula) {
            plan.decided = from_failure(formula.error());
        } else if (path_failure) {
            plan.decided = from_failure(*path_failure);
        } else {
            plan.post = std::move(*formula);
        }
        plans.push_back(std::move(plan));
    }

    const bool any_to_solve =
        std::ranges::any_of(plans, [](const PostPlan& p) { return !p.decided.has_value(); });
    const bool check_pre = m_options.check_preconditions && !function.preconditions.empty()
                           && !precondition_failure && (any_to_solve || plans.empty());
    if (!any_to_solve && !check_pre) {
        for (auto& plan : plans) {
            out.contracts[plan.contract_slot].outcome = std::move(plan.decided);
        }
        return out;
    }

    FunctionSession session(translator, timeout_for(function.id), stop, out);
    if (check_pre) {
        out.preconditions_unsatisfiable = session.hypotheses_unsatisfiable(hypotheses);
    }
    for (auto& plan : plans) {
        auto& slot = out.contracts[plan.contract_slot];
        if (plan.decided) {
            slot.outcome = std::move(plan.decided);
        } else if (stop.stop_requested()) {
            slot.outcome = Outcome::unproven(UnprovenReason::kCancelled, "cancelled");
        } else {
            slot.outcome = session.solve(plan.post, hypotheses, queries, precondition_failure);
        }
    }
    return out;
}

std::string solver_version()
{
    unsigned major = 0;
    unsigned minor = 0;
    unsigned build = 0;
    unsigned revision = 0;
    Z3_get_version(&major, &minor, &build, &revision);
    return std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(build) + "."
           + std::to_string(revision);
}

}  // namespace ecv::smt
