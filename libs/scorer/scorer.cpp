/**
 * @file scorer.cpp
 * @brief Breadth-first reachability scoring with optional callee memoization
 */

#include "stuckrank/scorer.hpp"

#include <algorithm>
#include <chrono>
#include <deque>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace stuckrank::scorer {

namespace {

using Clock = std::chrono::steady_clock;

/// Statements popped between two wall-clock checks.
constexpr std::size_t kTimeCheckInterval = 256;

/// Unbudgeted BFS; callees are entered through their entry statements.
[[nodiscard]] std::vector<StmtRef> traverse(const icfg::Icfg& graph, std::span<const StmtRef> seeds)
{
    std::unordered_set<StmtRef> visited;
    std::deque<StmtRef> queue;
    std::vector<StmtRef> reached;
    auto visit = [&](StmtRef stmt) {
        if (visited.insert(stmt).second) {
            reached.push_back(stmt);
            queue.push_back(stmt);
        }
    };

    for (const auto seed : seeds) {
        visit(seed);
    }
    while (!queue.empty()) {
        const auto current = queue.front();
        queue.pop_front();
        for (const auto succ : graph.successors_of(current)) {
            visit(succ);
        }
        if (!graph.is_call_site(current)) {
            continue;
        }
        for (const auto callee : graph.callees_of(current)) {
            for (const auto entry : graph.entry_statements_of(callee)) {
                visit(entry);
            }
        }
    }
    return reached;
}

}  // namespace

std::string_view to_string(BudgetLimit limit) noexcept
{
    switch (limit) {
        case BudgetLimit::kNone:
            return "none";
        case BudgetLimit::kVisitedStatements:
            return "max_visited_statements";
        case BudgetLimit::kTime:
            return "max_time_ms";
    }
    return "none";
}

/**
 * @brief Reachable closure of each callee, computed once per method
 *
 * A closure is forward closed: everything reachable from one of its
 * statements is in it, so traversal can add it without expanding it.
 */
class ReachabilityScorer::ClosureCache
{
public:
    [[nodiscard]] std::shared_ptr<const std::vector<StmtRef>> find(MethodRef method) const
    {
        std::shared_lock lock(m_mutex);
        const auto it = m_closures.find(method);
        if (it == m_closures.end()) {
            return nullptr;
        }
        return it->second;
    }

    /// Keeps the first closure stored for a method; returns the stored one.
    std::shared_ptr<const std::vector<StmtRef>> insert(MethodRef method,
                                                       std::shared_ptr<const std::vector<StmtRef>> closure)
    {
        std::unique_lock lock(m_mutex);
        return m_closures.emplace(method, std::move(closure)).first->second;
    }

private:
    mutable std::shared_mutex m_mutex;
    std::unordered_map<MethodRef, std::shared_ptr<const std::vector<StmtRef>>> m_closures;
};

ReachabilityScorer::ReachabilityScorer(const icfg::Icfg& graph,
                                       const coverage::CoverageTable& coverage,
                                       ScorerConfig config)
    : m_graph(graph)
    , m_coverage(coverage)
    , m_config(config)
    , m_cache(std::make_unique<ClosureCache>())
{}

ReachabilityScorer::~ReachabilityScorer() = default;

std::uint64_t ReachabilityScorer::score(const coverage::StuckPoint& point) const
{
    return evaluate(point).score;
}

std::vector<StmtRef> ReachabilityScorer::seeds_of(const coverage::StuckPoint& point) const
{
    return m_graph.view().statements_at_line(point.class_fqn(), point.line());
}

std::vector<StmtRef> ReachabilityScorer::reachable_from(std::span<const StmtRef> seeds) const
{
    auto reached = traverse(m_graph, seeds);
    std::ranges::sort(reached);
    return reached;
}

bool ReachabilityScorer::is_statement_covered(StmtRef stmt) const
{
    const auto& span = m_graph.view().statement(stmt).span;
    if (!span.has_position()) {
        return false;
    }
    const auto* lines = m_coverage.lines_of(m_graph.view().class_name_of(stmt));
    if (lines == nullptr) {
        return false;
    }
    for (auto it = lines->lower_bound(span.first); it != lines->end() && it->first <= span.last;
         ++it) {
        if (it->second.is_fully_covered()) {
            return true;
        }
    }
    return false;
}

std::shared_ptr<const std::vector<StmtRef>> ReachabilityScorer::callee_closure(MethodRef method) const
{
    if (auto cached = m_cache->find(method)) {
        return cached;
    }
    auto closure = std::make_shared<const std::vector<StmtRef>>(
        traverse(m_graph, m_graph.entry_statements_of(method)));
    return m_cache->insert(method, std::move(closure));
}

ScoreOutcome ReachabilityScorer::evaluate(const coverage::StuckPoint& point) const
{
    ScoreOutcome outcome;
    const auto seeds = seeds_of(point);
    outcome.seeds = seeds.size();
    if (seeds.empty()) {
        return outcome;
    }

    const auto& budget = m_config.budget;
    const auto start = Clock::now();
    std::unordered_set<StmtRef> visited;
    std::deque<StmtRef> queue;

    // Returns false once the visited budget is exhausted.
    auto admit = [&](StmtRef stmt, bool expand) {
        if (visited.contains(stmt)) {
            return true;
        }
        if (budget.max_visited_statements && visited.size() >= *budget.max_visited_statements) {
            outcome.truncated = true;
            outcome.limit = BudgetLimit::kVisitedStatements;
            return false;
        }
        visited.insert(stmt);
        if (expand) {
            queue.push_back(stmt);
        }
        return true;
    };

    bool stopped = false;
    for (const auto seed : seeds) {
        if (!admit(seed, true)) {
            stopped = true;
            break;
        }
    }

    std::size_t popped = 0;
    while (!stopped && !queue.empty()) {
        if (budget.max_time_ms && ++popped % kTimeCheckInterval == 0) {
            const auto elapsed =
                std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
            if (static_cast<std::uint64_t>(elapsed.count()) >= *budget.max_time_ms) {
                outcome.truncated = true;
                outcome.limit = BudgetLimit::kTime;
                break;
            }
        }

        const auto current = queue.front();
        queue.pop_front();
        for (const auto succ : m_graph.successors_of(current)) {
            if (!admit(succ, true)) {
                stopped = true;
                break;
            }
        }
        if (stopped || !m_graph.is_call_site(current)) {
            continue;
        }
        for (const auto callee : m_graph.callees_of(current)) {
            if (m_config.memoize_callees) {
                const auto closure = callee_closure(callee);
                for (const auto stmt : *closure) {
                    if (!admit(stmt, false)) {
                        stopped = true;
                        break;
                    }
                }
            } else {
                for (const auto entry : m_graph.entry_statements_of(callee)) {
                    if (!admit(entry, true)) {
                        stopped = true;
                        break;
                    }
                }
            }
            if (stopped) {
                break;
            }
        }
    }

    outcome.reached = visited.size();
    outcome.score = static_cast<std::uint64_t>(
        std::ranges::count_if(visited, [this](StmtRef stmt) { return !is_statement_covered(stmt); }));
    return outcome;
}

}  // namespace stuckrank::scorer
