/**
 * @file effect_propagator.cpp
 * @brief SCC fixed point, effect violation detection and call chains
 */

#include "ecv/effect_propagator.hpp"

#include "ecv/worker_pool.hpp"

#include <cstddef>
#include <deque>
#include <format>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace ecv::effects {

namespace {

using callgraph::CallTargetKind;
using diag::ChainLink;
using diag::ChainLinkKind;
using diag::Diagnostic;
using diag::DiagnosticKind;
using diag::Severity;

/// Per-group result slot; written by exactly one worker.
struct GroupSlot
{
    std::map<std::size_t, FunctionEffects> states;
    std::vector<Diagnostic> diagnostics;
    std::optional<ecv::Error> error;
};

class GroupWorker
{
public:
    GroupWorker(const ast::Program& program,
                const callgraph::CallGraph& graph,
                const callgraph::SccDecomposition& scc,
                const std::vector<EffectSet>& declared,
                const std::map<std::string, manifest::Resolution>& resolutions,
                UnknownMode mode,
                GroupSlot& slot)
        : m_program(program)
        , m_graph(graph)
        , m_scc(scc)
        , m_declared(declared)
        , m_resolutions(resolutions)
        , m_mode(mode)
        , m_slot(slot)
    {}

    void run(const std::vector<std::size_t>& components)
    {
        for (const std::size_t c : components) {
            for (const std::size_t v : m_scc.components[c]) {
                m_slot.states.emplace(v, FunctionEffects{.declared = m_declared[v],
                                                         .local = {},
                                                         .computed = {},
                                                         .state = NodeState::kPending});
            }
        }
        for (const std::size_t c : components) {
            if (auto result = propagate_component(c); !result) {
                m_slot.error = result.error();
                return;
            }
        }
        for (const std::size_t c : components) {
            for (const std::size_t v : m_scc.components[c]) {
                check_declared(v);
            }
        }
    }

private:
    /// Effects an external call site contributes to its caller.
    [[nodiscard]] EffectSet external_contribution(const callgraph::CallSite& site) const
    {
        const auto& resolution = m_resolutions.at(site.target);
        switch (resolution.status) {
            case manifest::ResolutionStatus::kKnown:
                return resolution.effects;
            case manifest::ResolutionStatus::kUnknown:
                return m_mode == UnknownMode::kPermissive ? EffectSet::top() : EffectSet{};
            case manifest::ResolutionStatus::kError:
                return EffectSet::top();
        }
        return EffectSet::top();
    }

    void report_unresolved(std::size_t v)
    {
        const auto& node = m_graph.node(v);
        std::set<std::string> reported;
        for (const auto& site : node.calls) {
            if (site.target_kind != CallTargetKind::kExternal || !reported.insert(site.target).second) {
                continue;
            }
            const auto& resolution = m_resolutions.at(site.target);
            if (resolution.status == manifest::ResolutionStatus::kKnown) {
                continue;
            }
            Diagnostic d;
            d.kind = DiagnosticKind::kUnknownExternalEffect;
            d.function_id = node.id;
            d.loc = site.loc;
            d.chain.push_back(ChainLink{.function_id = node.id,
                                        .target = site.target,
                                        .kind = ChainLinkKind::kExternal,
                                        .site_index = site.ordinal,
                                        .loc = site.loc});
            if (resolution.status == manifest::ResolutionStatus::kError) {
                d.severity = Severity::kError;
                d.message = std::format("Cannot resolve effects of external call '{}': {}",
                                        site.target,
                                        resolution.detail);
            } else if (m_mode == UnknownMode::kStrict) {
                d.severity = Severity::kError;
                d.message = std::format(
                    "Unknown external call to '{}'. Add an effect declaration to a manifest.", site.target);
            } else {
                d.severity = Severity::kWarning;
                d.message =
                    std::format("Unknown external call to '{}' - assuming worst-case effects.", site.target);
            }
            m_slot.diagnostics.push_back(std::move(d));
        }
    }

    [[nodiscard]] ecv::VoidResult propagate_component(std::size_t c)
    {
        const auto& members = m_scc.components[c];

        for (const std::size_t v : members) {
            auto& state = m_slot.states.at(v);
            state.state = NodeState::kPropagating;
            const auto& node = m_graph.node(v);
            for (const auto& prim : node.primitives) {
                state.local.join_in(prim.effects);
            }
            for (const auto& site : node.calls) {
                if (site.target_kind == CallTargetKind::kExternal) {
                    state.local.join_in(external_contribution(site));
                }
            }
            report_unresolved(v);
            state.computed = state.local;
        }

        for (const std::size_t v : members) {
            auto& state = m_slot.states.at(v);
            for (const std::size_t w : m_graph.node(v).callees) {
                if (m_scc.component_of[w] == c) {
                    continue;
                }
                auto it = m_slot.states.find(w);
                if (it == m_slot.states.end() || it->second.state != NodeState::kResolved) {
                    return std::unexpected(Error::make(
                        "InternalInvariant",
                        std::format("Callee '{}' consumed before it was resolved (caller '{}')",
                                    m_graph.node(w).id,
                                    m_graph.node(v).id)));
                }
                state.computed.join_in(it->second.computed);
            }
        }

        // Lattice height bounds the number of rounds.
        bool changed = true;
        while (changed) {
            changed = false;
            for (const std::size_t v : members) {
                for (const std::size_t w : m_graph.node(v).callees) {
                    if (m_scc.component_of[w] != c || w == v) {
                        continue;
                    }
                    const EffectSet callee = m_slot.states.at(w).computed;
                    changed = m_slot.states.at(v).computed.join_in(callee) || changed;
                }
            }
        }

        for (const std::size_t v : members) {
            m_slot.states.at(v).state = NodeState::kResolved;
        }
        return {};
    }

    /// True if `set` provides `code`; std::nullopt asks for top.
    [[nodiscard]] static bool provides(const EffectSet& set, const std::optional<Effect>& code)
    {
        return code ? set.contains(*code) : set.is_top();
    }

    /// Breadth-first search for the nearest site introducing `code`.
    [[nodiscard]] std::vector<ChainLink> find_chain(std::size_t origin,
                                                    const std::optional<Effect>& code) const
    {
        struct Parent
        {
            std::size_t caller;
            const callgraph::CallSite* site;
        };
        std::map<std::size_t, std::optional<Parent>> parents;
        parents.emplace(origin, std::nullopt);
        std::deque<std::size_t> queue{origin};

        const auto path_to = [&](std::size_t v) {
            std::vector<ChainLink> links;
            for (auto p = parents.at(v); p; p = parents.at(p->caller)) {
                links.push_back(ChainLink{.function_id = m_graph.node(p->caller).id,
                                          .target = p->site->target,
                                          .kind = ChainLinkKind::kInternal,
                                          .site_index = p->site->ordinal,
                                          .loc = p->site->loc});
            }
            return std::vector<ChainLink>(links.rbegin(), links.rend());
        };

        while (!queue.empty()) {
            const std::size_t v = queue.front();
            queue.pop_front();
            const auto& node = m_graph.node(v);

            for (const auto& prim : node.primitives) {
                if (provides(prim.effects, code)) {
                    auto chain = path_to(v);
                    chain.push_back(ChainLink{.function_id = node.id,
                                              .target = prim.op,
                                              .kind = ChainLinkKind::kPrimitive,
                                              .site_index = prim.ordinal,
                                              .loc = prim.loc});
                    return chain;
                }
            }
            for (const auto& site : node.calls) {
                if (site.target_kind == CallTargetKind::kExternal
                    && provides(external_contribution(site), code)) {
                    auto chain = path_to(v);
                    chain.push_back(ChainLink{.function_id = node.id,
                                              .target = site.target,
                                              .kind = ChainLinkKind::kExternal,
                                              .site_index = site.ordinal,
                                              .loc = site.loc});
                    return chain;
                }
            }
            for (const auto& site : node.calls) {
                if (site.target_kind != CallTargetKind::kInternal
                    || parents.contains(site.target_index)) {
                    continue;
                }
                auto it = m_slot.states.find(site.target_index);
                if (it == m_slot.states.end() || !provides(it->second.computed, code)) {
                    continue;
                }
                parents.emplace(site.target_index, Parent{.caller = v, .site = &site});
                queue.push_back(site.target_index);
            }
        }
        return {};
    }

    void check_declared(std::size_t v)
    {
        const auto& state = m_slot.states.at(v);
        const auto uncovered = state.computed.uncovered_by(state.declared);
        if (uncovered.is_empty()) {
            return;
        }
        const auto& fn = m_program.functions[v];
        const auto declared_text = state.declared.to_display_string();

        const auto emit = [&](const std::optional<Effect>& code) {
            Diagnostic d;
            d.kind = DiagnosticKind::kEffectViolation;
            d.severity = Severity::kError;
            d.function_id = fn.id;
            d.loc = fn.loc;
            d.effect = code ? std::string(effect_code(*code)) : std::string("*");
            if (code) {
                d.message = std::format("Function '{}' uses effect '{}' but does not declare it (declared: {})",
                                        fn.name,
                                        *d.effect,
                                        declared_text);
            } else {
                d.message = std::format(
                    "Function '{}' may have any effect through an unresolved external call but declares only {}",
                    fn.name,
                    declared_text);
            }
            d.chain = find_chain(v, code);
            m_slot.diagnostics.push_back(std::move(d));
        };

        if (uncovered.is_top()) {
            emit(std::nullopt);
            return;
        }
        for (const Effect code : uncovered.members()) {
            emit(code);
        }
    }

    const ast::Program& m_program;
    const callgraph::CallGraph& m_graph;
    const callgraph::SccDecomposition& m_scc;
    const std::vector<EffectSet>& m_declared;
    const std::map<std::string, manifest::Resolution>& m_resolutions;
    UnknownMode m_mode;
    GroupSlot& m_slot;
};

}  // namespace

EffectPropagator::EffectPropagator(const ast::Program& program,
                                   const callgraph::CallGraph& graph,
                                   const callgraph::SccDecomposition& scc,
                                   const manifest::ManifestResolver& resolver,
                                   PropagationOptions options)
    : m_program(program)
    , m_graph(graph)
    , m_scc(scc)
    , m_resolver(resolver)
    , m_options(options)
{}

ecv::Result<PropagationResult> EffectPropagator::run(std::stop_token stop) const
{
    if (m_program.functions.size() != m_graph.size()) {
        return std::unexpected(
            Error::make("InternalInvariant", "Call graph does not match the program"));
    }

    std::vector<EffectSet> declared;
    declared.reserve(m_program.functions.size());
    for (const auto& fn : m_program.functions) {
        auto set = EffectSet::from_codes(fn.effects);
        if (!set) {
            return std::unexpected(Error::make(
                "UnknownEffectCode",
                std::format("Function '{}' declares an invalid effect: {}", fn.id, set.error().message)));
        }
        declared.push_back(std::move(*set));
    }

    PropagationResult result;
    for (const auto& target : m_graph.external_targets()) {
        result.resolutions.emplace(target, m_resolver.resolve(target));
    }

    const auto groups = callgraph::independent_groups(m_graph, m_scc);
    std::vector<GroupSlot> slots(groups.size());
    common::parallel_for(groups.size(), m_options.jobs, stop, [&](std::size_t g, std::stop_token) {
        GroupWorker worker(m_program,
                           m_graph,
                           m_scc,
                           declared,
                           result.resolutions,
                           m_options.unknown_mode,
                           slots[g]);
        worker.run(groups[g]);
    });
    if (stop.stop_requested()) {
        return std::unexpected(Error::make("Cancelled", "Effect propagation was cancelled"));
    }

    for (auto& slot : slots) {
        if (slot.error) {
            return std::unexpected(*slot.error);
        }
        for (auto& [v, state] : slot.states) {
            result.functions.emplace(m_graph.node(v).id, std::move(state));
        }
        for (auto& d : slot.diagnostics) {
            result.diagnostics.push_back(std::move(d));
        }
    }
    diag::sort_diagnostics(result.diagnostics);
    return result;
}

}  // namespace ecv::effects
