#pragma once

/**
 * @file effect_propagator.hpp
 * @brief Interprocedural effect inference and enforcement
 */

#include "ecv/ast.hpp"
#include "ecv/callgraph.hpp"
#include "ecv/common.hpp"
#include "ecv/diagnostics.hpp"
#include "ecv/effects.hpp"
#include "ecv/manifest.hpp"

#include <cstddef>
#include <map>
#include <stop_token>
#include <string>
#include <vector>

namespace ecv::effects {

enum class UnknownMode { kStrict, kPermissive };

struct PropagationOptions
{
    UnknownMode unknown_mode = UnknownMode::kStrict;
    std::size_t jobs = 0;  ///< 0 = hardware concurrency
};

enum class NodeState { kPending, kPropagating, kResolved };

struct FunctionEffects
{
    EffectSet declared;
    /// Local effects joined with external resolutions (no internal callees).
    EffectSet local;
    EffectSet computed;
    NodeState state = NodeState::kPending;
};

struct PropagationResult
{
    std::map<std::string, FunctionEffects> functions;
    std::vector<diag::Diagnostic> diagnostics;
    /// Resolution of every distinct external qualified name.
    std::map<std::string, manifest::Resolution> resolutions;
};

/**
 * @brief Computes per-function effects over an SCC-decomposed call graph
 *
 * Inputs are borrowed and must outlive the propagator. `run` is re-entrant
 * and does not mutate the inputs.
 */
class EffectPropagator
{
public:
    EffectPropagator(const ast::Program& program,
                     const callgraph::CallGraph& graph,
                     const callgraph::SccDecomposition& scc,
                     const manifest::ManifestResolver& resolver,
                     PropagationOptions options);

    /**
     * Propagate and check declared effects.
     * @return Error "UnknownEffectCode" for an invalid declared code,
     *         "InternalInvariant" if a callee is consumed before it is resolved
     */
    [[nodiscard]] ecv::Result<PropagationResult> run(std::stop_token stop = {}) const;

private:
    const ast::Program& m_program;
    const callgraph::CallGraph& m_graph;
    const callgraph::SccDecomposition& m_scc;
    const manifest::ManifestResolver& m_resolver;
    PropagationOptions m_options;
};

}  // namespace ecv::effects
