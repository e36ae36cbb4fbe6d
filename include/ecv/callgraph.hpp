#pragma once

/**
 * @file callgraph.hpp
 * @brief Call graph, primitive sites and SCC decomposition
 */

#include "ecv/ast.hpp"
#include "ecv/common.hpp"
#include "ecv/effects.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ecv::callgraph {

enum class CallTargetKind { kInternal, kExternal };

struct CallSite
{
    std::string caller_id;
    std::size_t ordinal = 0;  ///< Position among the caller's call sites, body order
    CallTargetKind target_kind = CallTargetKind::kExternal;
    /// Resolved function id (internal) or raw qualified name (external).
    std::string target;
    std::size_t target_index = 0;  ///< Node index when internal
    std::vector<ast::ExprPtr> args;
    std::optional<ast::SourceLoc> loc;
};

struct PrimitiveSite
{
    std::string function_id;
    std::size_t ordinal = 0;
    std::string op;
    effects::EffectSet effects;
    std::optional<ast::SourceLoc> loc;
};

struct FunctionNode
{
    std::string id;
    std::string name;
    std::vector<CallSite> calls;
    std::vector<PrimitiveSite> primitives;
    /// Distinct internal callee indices, ascending.
    std::vector<std::size_t> callees;
};

/**
 * @brief Function -> callee graph of one program
 *
 * Node indices follow program order. Callee names resolve first against
 * function ids, then against unique function names; anything else is an
 * external edge.
 */
class CallGraph
{
public:
    /**
     * Build the graph.
     * @return Error "MalformedInput" for empty/duplicate ids, empty callees,
     *         ambiguous function names used as call targets and unknown
     *         primitive operations
     */
    [[nodiscard]] static ecv::Result<CallGraph> build(const ast::Program& program);

    [[nodiscard]] std::size_t size() const { return m_nodes.size(); }
    [[nodiscard]] const FunctionNode& node(std::size_t index) const { return m_nodes.at(index); }
    [[nodiscard]] const std::vector<FunctionNode>& nodes() const { return m_nodes; }
    [[nodiscard]] std::optional<std::size_t> index_of(std::string_view function_id) const;

    /// Distinct external qualified names, sorted.
    [[nodiscard]] std::vector<std::string> external_targets() const;

private:
    std::vector<FunctionNode> m_nodes;
    std::map<std::string, std::size_t, std::less<>> m_index;
};

/**
 * @brief Strongly connected components, callee-first
 *
 * For every internal edge from a member of component A to a member of
 * component B with A != B, B appears before A in `components`.
 */
struct SccDecomposition
{
    /// Node indices per component, ascending within a component.
    std::vector<std::vector<std::size_t>> components;
    /// Component index of every node.
    std::vector<std::size_t> component_of;

    /// True for multi-member components and self-recursive singletons.
    [[nodiscard]] bool is_recursive(std::size_t component, const CallGraph& graph) const;
};

/// Iterative Tarjan. Fails with "InternalInvariant" if the ordering check fails.
[[nodiscard]] ecv::Result<SccDecomposition> decompose(const CallGraph& graph);

/// Check that every node is in exactly one component and the callee-first order holds.
[[nodiscard]] ecv::VoidResult check_callee_first(const CallGraph& graph, const SccDecomposition& scc);

/**
 * Weakly connected components of the SCC DAG.
 *
 * Each group lists component indices in callee-first order; groups are
 * ordered by their first component. Groups share no call path.
 */
[[nodiscard]] std::vector<std::vector<std::size_t>> independent_groups(const CallGraph& graph,
                                                                       const SccDecomposition& scc);

}  // namespace ecv::callgraph
