/**
 * @file call_graph.cpp
 * @brief Worklist construction of the CHA call graph
 */

#include "stuckrank/callgraph.hpp"

#include <algorithm>
#include <deque>
#include <format>
#include <map>
#include <string>
#include <utility>

namespace stuckrank::callgraph {

namespace {

using program::CallKind;

struct DispatchKey
{
    CallKind kind;
    ClassRef klass;
    std::string sub_signature;

    auto operator<=>(const DispatchKey&) const = default;
};

/// Resolves call records with a per-build cache of dispatch results.
class CallResolver
{
public:
    explicit CallResolver(const program::ProgramView& view)
        : m_view(view)
        , m_hierarchy(view)
    {}

    /// std::nullopt when the target class is not loaded.
    [[nodiscard]] std::optional<std::vector<MethodRef>> resolve(const program::CallRecord& call)
    {
        const auto klass = m_view.find_class(call.target.declaring_class);
        if (!klass) {
            return std::nullopt;
        }
        DispatchKey key{.kind = normalize(call.kind),
                        .klass = *klass,
                        .sub_signature = call.target.sub_signature()};
        if (auto it = m_cache.find(key); it != m_cache.end()) {
            return it->second;
        }
        std::vector<MethodRef> targets;
        if (key.kind == CallKind::kVirtual) {
            targets = m_hierarchy.resolve_virtual(key.klass, key.sub_signature);
        } else if (auto method = m_hierarchy.find_in_superclasses(key.klass, key.sub_signature, false)) {
            targets.push_back(*method);
        } else if (auto fallback = m_hierarchy.find_default_method(key.klass, key.sub_signature)) {
            targets.push_back(*fallback);
        }
        m_cache.emplace(std::move(key), targets);
        return targets;
    }

private:
    // Interface and virtual calls share the CHA resolution.
    [[nodiscard]] static CallKind normalize(CallKind kind) noexcept
    {
        if (kind == CallKind::kInterface) {
            return CallKind::kVirtual;
        }
        if (kind == CallKind::kSpecial) {
            return CallKind::kStatic;
        }
        return kind;
    }

    const program::ProgramView& m_view;
    ClassHierarchy m_hierarchy;
    std::map<DispatchKey, std::vector<MethodRef>> m_cache;
};

}  // namespace

const std::vector<MethodRef>& CallGraph::callees_of(StmtRef stmt) const
{
    static const std::vector<MethodRef> kNoCallees;
    const auto it = m_callees.find(stmt);
    if (it == m_callees.end()) {
        return kNoCallees;
    }
    return it->second;
}

bool CallGraph::is_reachable(MethodRef method) const
{
    const auto index = index_of(method);
    return index < m_reachable.size() && m_reachable[index];
}

Result<std::vector<MethodRef>> resolve_entry_points(const program::ProgramView& view,
                                                    std::span<const program::MethodQuery> entry_points)
{
    std::vector<MethodRef> methods;
    for (const auto& query : entry_points) {
        auto method = view.resolve(query);
        if (!method) {
            return std::unexpected(method.error());
        }
        if (std::ranges::find(methods, *method) == methods.end()) {
            methods.push_back(*method);
        }
    }
    return methods;
}

Result<CallGraph> build_call_graph(const program::ProgramView& view,
                                   std::span<const program::MethodQuery> entry_points,
                                   const Diagnostics& diagnostics)
{
    if (entry_points.empty()) {
        return std::unexpected(
            Error::make("InvalidEntryPoint", "At least one entry point is required"));
    }
    auto entries = resolve_entry_points(view, entry_points);
    if (!entries) {
        return std::unexpected(entries.error());
    }

    CallGraph graph;
    graph.m_entry_methods = std::move(*entries);
    graph.m_reachable.assign(view.method_count(), false);

    std::deque<MethodRef> queue;
    for (const auto method : graph.m_entry_methods) {
        graph.m_reachable[index_of(method)] = true;
        graph.m_reachable_methods.push_back(method);
        queue.push_back(method);
    }

    CallResolver resolver(view);
    auto& stats = graph.m_stats;
    while (!queue.empty()) {
        const auto current = queue.front();
        queue.pop_front();
        const auto& method = view.method(current);
        if (!method.has_body) {
            continue;
        }
        for (const auto stmt_ref : method.statements) {
            const auto& stmt = view.statement(stmt_ref);
            if (!stmt.call) {
                continue;
            }
            ++stats.call_sites;
            if (stmt.call->kind == CallKind::kDynamic) {
                ++stats.dynamic_call_sites;
                continue;
            }
            auto callees = resolver.resolve(*stmt.call);
            if (!callees || callees->empty()) {
                ++stats.unresolved_call_sites;
                diagnostics.debug("[callgraph] Unresolved call {} in {}",
                                  stmt.call->target.to_string(), method.signature.to_string());
                continue;
            }
            for (const auto callee : *callees) {
                if (!graph.m_reachable[index_of(callee)]) {
                    graph.m_reachable[index_of(callee)] = true;
                    graph.m_reachable_methods.push_back(callee);
                    queue.push_back(callee);
                }
            }
            stats.edges += callees->size();
            graph.m_callees.emplace(stmt_ref, std::move(*callees));
        }
    }

    stats.entry_methods = graph.m_entry_methods.size();
    stats.reachable_methods = graph.m_reachable_methods.size();
    diagnostics.info(
        "[callgraph] {} entry methods, {} reachable methods, {} edges, {} unresolved call sites",
        stats.entry_methods, stats.reachable_methods, stats.edges, stats.unresolved_call_sites);
    return graph;
}

}  // namespace stuckrank::callgraph
