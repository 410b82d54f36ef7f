#pragma once

/**
 * @file icfg.hpp
 * @brief Interprocedural control-flow graph over a program view
 *
 * Nodes are statements. Edges are the intraprocedural successors plus
 * call-site -> callee-entry edges. Return edges from a callee's exit back to
 * the caller are not modelled; forward reachability does not need them.
 */

#include "stuckrank/callgraph.hpp"
#include "stuckrank/common.hpp"
#include "stuckrank/program.hpp"

#include <span>
#include <vector>

namespace stuckrank::icfg {

/**
 * @brief Read-only graph index shared by all scoring tasks
 *
 * Borrows the view; owns the call graph.
 */
class Icfg
{
public:
    Icfg(const program::ProgramView& view, callgraph::CallGraph call_graph);

    /// Intraprocedural successors within the owning method.
    [[nodiscard]] std::span<const StmtRef> successors_of(StmtRef stmt) const;

    [[nodiscard]] bool is_call_site(StmtRef stmt) const;

    /// Callees resolved by the call graph; empty for dynamic or unresolved calls.
    [[nodiscard]] std::span<const MethodRef> callees_of(StmtRef stmt) const;

    /// Entry statements of a method; empty when the method has no body.
    [[nodiscard]] std::span<const StmtRef> entry_statements_of(MethodRef method) const;

    [[nodiscard]] MethodRef owner_of(StmtRef stmt) const;

    [[nodiscard]] const program::ProgramView& view() const noexcept { return *m_view; }
    [[nodiscard]] const callgraph::CallGraph& call_graph() const noexcept { return m_call_graph; }

private:
    const program::ProgramView* m_view;
    callgraph::CallGraph m_call_graph;
};

}  // namespace stuckrank::icfg
