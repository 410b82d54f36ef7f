#pragma once

/**
 * @file callgraph.hpp
 * @brief Class hierarchy and CHA call graph rooted at the fuzz entry points
 */

#include "stuckrank/common.hpp"
#include "stuckrank/diagnostics.hpp"
#include "stuckrank/program.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace stuckrank::callgraph {

/**
 * @brief Supertype/subtype relations between the classes of a view
 *
 * Types named in the view but not loaded (library classes) are ignored.
 */
class ClassHierarchy
{
public:
    explicit ClassHierarchy(const program::ProgramView& view);

    [[nodiscard]] std::optional<ClassRef> superclass_of(ClassRef klass) const;

    /// Loaded interfaces directly implemented (or extended) by the class.
    [[nodiscard]] const std::vector<ClassRef>& interfaces_of(ClassRef klass) const;

    /// Direct subclasses and implementors.
    [[nodiscard]] const std::vector<ClassRef>& direct_subtypes_of(ClassRef klass) const;

    /// The class and all its transitive subtypes, ascending by ClassRef.
    [[nodiscard]] std::vector<ClassRef> subtype_closure(ClassRef klass) const;

    /**
     * First method with the sub-signature found walking up the superclass
     * chain from klass. With concrete_only, methods without a body are
     * skipped.
     */
    [[nodiscard]] std::optional<MethodRef> find_in_superclasses(ClassRef klass,
                                                               std::string_view sub_signature,
                                                               bool concrete_only) const;

    /// Default method with a body reachable through the class's interfaces.
    [[nodiscard]] std::optional<MethodRef> find_default_method(ClassRef klass,
                                                              std::string_view sub_signature) const;

    /// Runtime dispatch of a sub-signature on an object of exactly this class.
    [[nodiscard]] std::optional<MethodRef> dispatch(ClassRef klass,
                                                    std::string_view sub_signature) const;

    /// Method with a body declared directly in the class.
    [[nodiscard]] std::optional<MethodRef> concrete_declared_method(ClassRef klass,
                                                                   std::string_view sub_signature) const;

    /**
     * Class hierarchy analysis of a virtual or interface call. The targets
     * are the static type's own dispatch target, every implementation
     * declared in its subtype closure (abstract classes and interfaces
     * included), and the dispatch target of every concrete subtype. Sorted
     * and free of duplicates.
     */
    [[nodiscard]] std::vector<MethodRef> resolve_virtual(ClassRef static_type,
                                                         std::string_view sub_signature) const;

    [[nodiscard]] const program::ProgramView& view() const noexcept { return *m_view; }

private:
    const program::ProgramView* m_view;
    std::vector<std::optional<ClassRef>> m_superclass;
    std::vector<std::vector<ClassRef>> m_interfaces;
    std::vector<std::vector<ClassRef>> m_subtypes;
};

struct CallGraphStats
{
    std::size_t entry_methods = 0;
    std::size_t reachable_methods = 0;
    std::size_t edges = 0;                  ///< (call site, callee) pairs
    std::size_t call_sites = 0;             ///< call statements in reachable methods
    std::size_t unresolved_call_sites = 0;  ///< non-dynamic call sites without any callee
    std::size_t dynamic_call_sites = 0;     ///< never resolved
};

class CallGraph;

/**
 * Build the CHA call graph rooted at the entry points.
 * Fails with InvalidEntryPoint when no entry point is given.
 */
[[nodiscard]] Result<CallGraph> build_call_graph(const program::ProgramView& view,
                                                 std::span<const program::MethodQuery> entry_points,
                                                 const Diagnostics& diagnostics = Diagnostics::silent());

/**
 * @brief Whole-program call graph
 *
 * Only methods reachable from the entry points have outgoing edges.
 * Immutable after build.
 */
class CallGraph
{
public:
    CallGraph() = default;

    /// Resolved callees of a call statement; empty for other statements.
    [[nodiscard]] const std::vector<MethodRef>& callees_of(StmtRef stmt) const;

    [[nodiscard]] bool is_reachable(MethodRef method) const;

    [[nodiscard]] const std::vector<MethodRef>& entry_methods() const noexcept
    {
        return m_entry_methods;
    }

    /// Reachable methods in discovery (breadth-first) order.
    [[nodiscard]] const std::vector<MethodRef>& reachable_methods() const noexcept
    {
        return m_reachable_methods;
    }

    [[nodiscard]] const CallGraphStats& stats() const noexcept { return m_stats; }

private:
    friend Result<CallGraph> build_call_graph(const program::ProgramView& view,
                                              std::span<const program::MethodQuery> entry_points,
                                              const Diagnostics& diagnostics);

    std::vector<MethodRef> m_entry_methods;
    std::vector<MethodRef> m_reachable_methods;
    std::vector<bool> m_reachable;
    std::unordered_map<StmtRef, std::vector<MethodRef>> m_callees;
    CallGraphStats m_stats;
};

/**
 * Resolve every entry-point query. The first failure (EntryPointNotFound,
 * AmbiguousEntryPoint) is returned; duplicates collapse to one method.
 */
[[nodiscard]] Result<std::vector<MethodRef>>
resolve_entry_points(const program::ProgramView& view,
                     std::span<const program::MethodQuery> entry_points);

}  // namespace stuckrank::callgraph
