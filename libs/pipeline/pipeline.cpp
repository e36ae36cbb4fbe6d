/**
 * @file pipeline.cpp
 * @brief Verification pass: effects and contracts over one snapshot
 */

#include "ecv/pipeline.hpp"

#include "ecv/callgraph.hpp"
#include "ecv/proof_cache.hpp"
#include "ecv/worker_pool.hpp"

#include <memory>
#include <utility>

namespace ecv::pipeline {

namespace {

/// Per-function output of the contract phase, owned by one worker.
struct ContractSlot
{
    bool done = false;
    smt::FunctionVerification verification;
    std::vector<std::string> notes;
    bool stored = false;
};

[[nodiscard]] smt::FunctionVerification cancelled_verification(const ast::Function& function)
{
    auto verification = smt::unverified(function);
    for (auto& contract : verification.contracts) {
        if (contract.kind == smt::ContractKind::kPostcondition) {
            contract.outcome = smt::Outcome::unproven(smt::UnprovenReason::kCancelled, "cancelled");
        }
    }
    return verification;
}

void count(OutcomeSummary& summary, const ContractDecision& decision)
{
    if (decision.elide) {
        ++summary.elided;
    } else {
        ++summary.kept;
    }
    if (decision.kind == smt::ContractKind::kPrecondition) {
        return;
    }
    if (!decision.outcome) {
        ++summary.unverified;
        return;
    }
    switch (decision.outcome->kind) {
        case smt::OutcomeKind::kProven:
            ++summary.proven;
            break;
        case smt::OutcomeKind::kDisproven:
            ++summary.disproven;
            break;
        case smt::OutcomeKind::kUnproven:
            ++summary.unproven;
            break;
        case smt::OutcomeKind::kUnsupported:
            ++summary.unsupported;
            break;
    }
}

void verify_one(const ast::Function& function,
                const smt::SmtVerifier& verifier,
                cache::ProofCache* cache,
                std::stop_token stop,
                ContractSlot& slot)
{
    std::optional<std::string> key;
    if (cache != nullptr) {
        auto computed = cache::ProofCache::key_for(function, verifier.options());
        if (computed) {
            key = std::move(*computed);
        } else {
            slot.notes.push_back("proof cache skipped for " + function.id + ": "
                                 + computed.error().message);
        }
    }

    if (key) {
        auto hit = cache->lookup(function, *key);
        if (!hit) {
            slot.notes.push_back("proof cache entry ignored for " + function.id + ": "
                                 + hit.error().message);
        } else if (hit->has_value()) {
            slot.verification = std::move(**hit);
            slot.done = true;
            return;
        }
    }

    slot.verification = verifier.verify(function, stop);
    slot.done = true;

    if (key) {
        auto stored = cache->store(*key, slot.verification);
        if (!stored) {
            slot.notes.push_back("proof cache write failed for " + function.id + ": "
                                 + stored.error().message);
        } else {
            slot.stored = *stored;
        }
    }
}

}  // namespace

VerificationPass::VerificationPass(VerificationConfig config,
                                   const manifest::ManifestResolver& resolver,
                                   std::filesystem::path schema_dir)
    : m_config(std::move(config))
    , m_resolver(resolver)
    , m_schema_dir(std::move(schema_dir))
{}

ecv::Result<PassResult> VerificationPass::run(const ast::Program& program,
                                              std::stop_token stop) const
{
    PassResult result;
    for (const auto& function : program.functions) {
        result.function_ids.push_back(function.id);
    }

    auto graph = callgraph::CallGraph::build(program);
    if (!graph) {
        return std::unexpected(graph.error());
    }

    // Effects
    if (m_config.enforce_effects) {
        auto scc = callgraph::decompose(*graph);
        if (!scc) {
            return std::unexpected(scc.error());
        }
        const effects::EffectPropagator propagator(
            program,
            *graph,
            *scc,
            m_resolver,
            effects::PropagationOptions{.unknown_mode = m_config.unknown_mode,
                                        .jobs = m_config.jobs});
        auto propagated = propagator.run(stop);
        if (propagated) {
            for (const auto& d : propagated->diagnostics) {
                result.diagnostics.push_back(d);
            }
            result.effects = std::move(*propagated);
        } else if (propagated.error().code == "Cancelled") {
            result.cancelled = true;
        } else {
            return std::unexpected(propagated.error());
        }
    }

    // Contracts
    std::vector<const ast::Function*> targets;
    for (const auto& function : program.functions) {
        if (!function.preconditions.empty() || !function.postconditions.empty()) {
            targets.push_back(&function);
        }
    }

    std::vector<ContractSlot> slots(targets.size());
    std::unique_ptr<cache::ProofCache> cache;
    if (m_config.static_enabled) {
        if (m_config.cache_dir) {
            cache = std::make_unique<cache::ProofCache>(*m_config.cache_dir, m_schema_dir);
        }
        const smt::SmtVerifier verifier(m_config.verifier);
        common::parallel_for(targets.size(),
                             m_config.jobs,
                             stop,
                             [&](std::size_t i, std::stop_token task_stop) {
                                 verify_one(*targets[i], verifier, cache.get(), task_stop, slots[i]);
                             });
    }

    for (std::size_t i = 0; i < targets.size(); ++i) {
        const ast::Function& function = *targets[i];
        ContractSlot& slot = slots[i];
        if (!m_config.static_enabled) {
            slot.verification = smt::unverified(function);
        } else if (!slot.done) {
            slot.verification = cancelled_verification(function);
            result.cancelled = true;
        }
        if (stop.stop_requested()) {
            result.cancelled = true;
        }

        auto decided = decide(function, slot.verification, m_config.elision);
        for (auto& decision : decided.decisions) {
            count(result.summary, decision);
            result.decisions.push_back(std::move(decision));
        }
        for (auto& d : decided.diagnostics) {
            result.diagnostics.push_back(std::move(d));
        }
        for (auto& entry : decided.ledger) {
            result.ledger.push_back(std::move(entry));
        }
        for (auto& note : slot.notes) {
            result.notes.push_back(std::move(note));
        }
        result.verifications.emplace(function.id, std::move(slot.verification));
    }

    if (cache) {
        CacheStats stats{.hits = cache->hits(), .misses = cache->misses(), .stored = 0};
        for (const auto& slot : slots) {
            stats.stored += slot.stored ? 1 : 0;
        }
        result.cache = stats;
    }

    diag::sort_diagnostics(result.diagnostics);
    return result;
}

int exit_code(const PassResult& result)
{
    return diag::has_errors(result.diagnostics) ? 1 : 0;
}

}  // namespace ecv::pipeline
