/**
 * @file icfg.cpp
 * @brief Interprocedural control-flow graph queries
 */

#include "stuckrank/icfg.hpp"

#include <utility>

namespace stuckrank::icfg {

Icfg::Icfg(const program::ProgramView& view, callgraph::CallGraph call_graph)
    : m_view(&view)
    , m_call_graph(std::move(call_graph))
{}

std::span<const StmtRef> Icfg::successors_of(StmtRef stmt) const
{
    return m_view->statement(stmt).successors;
}

bool Icfg::is_call_site(StmtRef stmt) const
{
    return m_view->statement(stmt).call.has_value();
}

std::span<const MethodRef> Icfg::callees_of(StmtRef stmt) const
{
    return m_call_graph.callees_of(stmt);
}

std::span<const StmtRef> Icfg::entry_statements_of(MethodRef method) const
{
    const auto& info = m_view->method(method);
    if (!info.has_body) {
        return {};
    }
    return info.entries;
}

MethodRef Icfg::owner_of(StmtRef stmt) const
{
    return m_view->statement(stmt).owner;
}

}  // namespace stuckrank::icfg
