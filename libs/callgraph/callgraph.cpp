/**
 * @file callgraph.cpp
 * @brief Call graph construction from function bodies
 */

#include "ecv/callgraph.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace ecv::callgraph {

namespace {

[[nodiscard]] ecv::Error malformed(std::string message)
{
    return Error::make("MalformedInput", std::move(message));
}

/// Name -> node index for unique names; ambiguous names map to std::nullopt.
using NameIndex = std::map<std::string, std::optional<std::size_t>, std::less<>>;

class SiteCollector
{
public:
    SiteCollector(FunctionNode& node,
                  const std::map<std::string, std::size_t, std::less<>>& ids,
                  const NameIndex& names)
        : m_node(node)
        , m_ids(ids)
        , m_names(names)
    {}

    [[nodiscard]] ecv::VoidResult collect_block(const std::vector<ast::StmtPtr>& block)
    {
        for (const auto& stmt : block) {
            if (auto result = collect_stmt(*stmt); !result) {
                return result;
            }
        }
        return {};
    }

private:
    [[nodiscard]] ecv::VoidResult collect_stmt(const ast::Stmt& stmt)
    {
        if (stmt.kind == ast::StmtKind::kThrow) {
            if (auto result = add_primitive("throw", stmt.loc); !result) {
                return result;
            }
        }
        if (stmt.cond) {
            if (auto result = collect_expr(*stmt.cond); !result) {
                return result;
            }
        }
        if (stmt.value) {
            if (auto result = collect_expr(*stmt.value); !result) {
                return result;
            }
        }
        if (auto result = collect_block(stmt.then_body); !result) {
            return result;
        }
        return collect_block(stmt.else_body);
    }

    [[nodiscard]] ecv::VoidResult collect_expr(const ast::Expr& expr)
    {
        if (expr.kind == ast::ExprKind::kCall) {
            if (auto result = add_call(expr); !result) {
                return result;
            }
        } else if (expr.kind == ast::ExprKind::kPrimitive) {
            if (auto result = add_primitive(expr.name, expr.loc); !result) {
                return result;
            }
        }
        for (const auto& operand : expr.operands) {
            if (!operand) {
                continue;
            }
            if (auto result = collect_expr(*operand); !result) {
                return result;
            }
        }
        return {};
    }

    [[nodiscard]] ecv::VoidResult add_call(const ast::Expr& expr)
    {
        if (expr.name.empty()) {
            return std::unexpected(malformed("Empty callee name in function '" + m_node.id + "'"));
        }
        CallSite site{.caller_id = m_node.id,
                      .ordinal = m_node.calls.size(),
                      .target_kind = CallTargetKind::kExternal,
                      .target = expr.name,
                      .target_index = 0,
                      .args = expr.operands,
                      .loc = expr.loc};

        if (auto id_it = m_ids.find(expr.name); id_it != m_ids.end()) {
            site.target_kind = CallTargetKind::kInternal;
            site.target_index = id_it->second;
        } else if (auto name_it = m_names.find(expr.name); name_it != m_names.end()) {
            if (!name_it->second) {
                return std::unexpected(malformed("Ambiguous call target '" + expr.name
                                                 + "' in function '" + m_node.id
                                                 + "': several functions share this name"));
            }
            site.target_kind = CallTargetKind::kInternal;
            site.target_index = *name_it->second;
        }
        m_node.calls.push_back(std::move(site));
        return {};
    }

    [[nodiscard]] ecv::VoidResult add_primitive(const std::string& op,
                                                const std::optional<ast::SourceLoc>& loc)
    {
        auto effects = effects::primitive_effects(op);
        if (!effects) {
            return std::unexpected(malformed("Unknown primitive operation '" + op
                                             + "' in function '" + m_node.id + "'"));
        }
        m_node.primitives.push_back(PrimitiveSite{.function_id = m_node.id,
                                                  .ordinal = m_node.primitives.size(),
                                                  .op = op,
                                                  .effects = *effects,
                                                  .loc = loc});
        return {};
    }

    FunctionNode& m_node;
    const std::map<std::string, std::size_t, std::less<>>& m_ids;
    const NameIndex& m_names;
};

}  // namespace

ecv::Result<CallGraph> CallGraph::build(const ast::Program& program)
{
    CallGraph graph;
    NameIndex names;
    graph.m_nodes.reserve(program.functions.size());

    for (std::size_t i = 0; i < program.functions.size(); ++i) {
        const auto& fn = program.functions[i];
        if (fn.id.empty()) {
            return std::unexpected(
                malformed("Function at index " + std::to_string(i) + " has an empty id"));
        }
        if (!graph.m_index.emplace(fn.id, i).second) {
            return std::unexpected(malformed("Duplicate function id '" + fn.id + "'"));
        }
        auto [it, inserted] = names.emplace(fn.name, i);
        if (!inserted) {
            it->second = std::nullopt;
        }
        graph.m_nodes.push_back(FunctionNode{.id = fn.id, .name = fn.name, .calls = {}, .primitives = {}, .callees = {}});
    }

    for (std::size_t i = 0; i < program.functions.size(); ++i) {
        auto& node = graph.m_nodes[i];
        SiteCollector collector(node, graph.m_index, names);
        if (auto result = collector.collect_block(program.functions[i].body); !result) {
            return std::unexpected(result.error());
        }
        std::set<std::size_t> callees;
        for (const auto& site : node.calls) {
            if (site.target_kind == CallTargetKind::kInternal) {
                callees.insert(site.target_index);
            }
        }
        node.callees.assign(callees.begin(), callees.end());
    }
    return graph;
}

std::optional<std::size_t> CallGraph::index_of(std::string_view function_id) const
{
    auto it = m_index.find(function_id);
    if (it == m_index.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> CallGraph::external_targets() const
{
    std::set<std::string> targets;
    for (const auto& node : m_nodes) {
        for (const auto& site : node.calls) {
            if (site.target_kind == CallTargetKind::kExternal) {
                targets.insert(site.target);
            }
        }
    }
    return {targets.begin(), targets.end()};
}

}  // namespace ecv::callgraph
