/**
 * @file scc.cpp
 * @brief Iterative Tarjan SCC decomposition and independent groups
 */

#include "ecv/callgraph.hpp"

#include <algorithm>
#include <limits>
#include <map>
#include <numeric>
#include <string>
#include <vector>

namespace ecv::callgraph {

namespace {

constexpr std::size_t kUnvisited = std::numeric_limits<std::size_t>::max();

struct Frame
{
    std::size_t node;
    std::size_t next_edge;
};

class DisjointSet
{
public:
    explicit DisjointSet(std::size_t size)
        : m_parent(size)
    {
        std::iota(m_parent.begin(), m_parent.end(), std::size_t{0});
    }

    [[nodiscard]] std::size_t find(std::size_t x)
    {
        while (m_parent[x] != x) {
            m_parent[x] = m_parent[m_parent[x]];
            x = m_parent[x];
        }
        return x;
    }

    void unite(std::size_t a, std::size_t b)
    {
        a = find(a);
        b = find(b);
        if (a != b) {
            m_parent[std::max(a, b)] = std::min(a, b);
        }
    }

private:
    std::vector<std::size_t> m_parent;
};

}  // namespace

bool SccDecomposition::is_recursive(std::size_t component, const CallGraph& graph) const
{
    const auto& members = components.at(component);
    if (members.size() > 1) {
        return true;
    }
    const auto& callees = graph.node(members.front()).callees;
    return std::ranges::binary_search(callees, members.front());
}

ecv::Result<SccDecomposition> decompose(const CallGraph& graph)
{
    const std::size_t n = graph.size();
    SccDecomposition result;
    result.component_of.assign(n, kUnvisited);

    std::vector<std::size_t> index(n, kUnvisited);
    std::vector<std::size_t> lowlink(n, 0);
    std::vector<bool> on_stack(n, false);
    std::vector<std::size_t> stack;
    std::vector<Frame> call_stack;
    std::size_t counter = 0;

    for (std::size_t root = 0; root < n; ++root) {
        if (index[root] != kUnvisited) {
            continue;
        }
        call_stack.push_back(Frame{.node = root, .next_edge = 0});
        index[root] = lowlink[root] = counter++;
        stack.push_back(root);
        on_stack[root] = true;

        while (!call_stack.empty()) {
            Frame& frame = call_stack.back();
            const auto& callees = graph.node(frame.node).callees;
            if (frame.next_edge < callees.size()) {
                const std::size_t w = callees[frame.next_edge++];
                if (index[w] == kUnvisited) {
                    index[w] = lowlink[w] = counter++;
                    stack.push_back(w);
                    on_stack[w] = true;
                    call_stack.push_back(Frame{.node = w, .next_edge = 0});
                } else if (on_stack[w]) {
                    lowlink[frame.node] = std::min(lowlink[frame.node], index[w]);
                }
                continue;
            }

            const std::size_t v = frame.node;
            call_stack.pop_back();
            if (!call_stack.empty()) {
                const std::size_t parent = call_stack.back().node;
                lowlink[parent] = std::min(lowlink[parent], lowlink[v]);
            }
            if (lowlink[v] != index[v]) {
                continue;
            }
            std::vector<std::size_t> members;
            std::size_t w = kUnvisited;
            do {
                w = stack.back();
                stack.pop_back();
                on_stack[w] = false;
                result.component_of[w] = result.components.size();
                members.push_back(w);
            } while (w != v);
            std::ranges::sort(members);
            result.components.push_back(std::move(members));
        }
    }

    if (auto check = check_callee_first(graph, result); !check) {
        return std::unexpected(check.error());
    }
    return result;
}

ecv::VoidResult check_callee_first(const CallGraph& graph, const SccDecomposition& scc)
{
    if (scc.component_of.size() != graph.size()) {
        return std::unexpected(
            Error::make("InternalInvariant", "SCC decomposition does not cover every function"));
    }
    std::vector<std::size_t> seen(graph.size(), 0);
    for (std::size_t c = 0; c < scc.components.size(); ++c) {
        for (const std::size_t member : scc.components[c]) {
            if (member >= graph.size() || scc.component_of[member] != c) {
                return std::unexpected(Error::make("InternalInvariant",
                                                   "Inconsistent SCC membership for function index "
                                                       + std::to_string(member)));
            }
            ++seen[member];
        }
    }
    for (std::size_t v = 0; v < graph.size(); ++v) {
        if (seen[v] != 1) {
            return std::unexpected(Error::make(
                "InternalInvariant",
                "Function '" + graph.node(v).id + "' is not in exactly one SCC"));
        }
        for (const std::size_t w : graph.node(v).callees) {
            if (scc.component_of[w] > scc.component_of[v]) {
                return std::unexpected(Error::make("InternalInvariant",
                                                   "SCC order violated: callee '" + graph.node(w).id
                                                       + "' is scheduled after caller '"
                                                       + graph.node(v).id + "'"));
            }
        }
    }
    return {};
}

std::vector<std::vector<std::size_t>> independent_groups(const CallGraph& graph,
                                                         const SccDecomposition& scc)
{
    DisjointSet sets(scc.components.size());
    for (std::size_t v = 0; v < graph.size(); ++v) {
        for (const std::size_t w : graph.node(v).callees) {
            sets.unite(scc.component_of[v], scc.component_of[w]);
        }
    }
    std::map<std::size_t, std::vector<std::size_t>> by_root;
    for (std::size_t c = 0; c < scc.components.size(); ++c) {
        by_root[sets.find(c)].push_back(c);
    }
    std::vector<std::vector<std::size_t>> groups;
    groups.reserve(by_root.size());
    for (auto& [root, members] : by_root) {
        groups.push_back(std::move(members));
    }
    std::ranges::sort(groups, {}, [](const auto& g) { return g.front(); });
    return groups;
}

}  // namespace ecv::callgraph
