#pragma once

/**
 * @file scorer.hpp
 * @brief Reachability scoring of stuck points over the ICFG
 *
 * The score of a stuck point is the number of statements reachable (forward,
 * interprocedurally) from the statements on its line that are not already
 * covered. A statement counts as covered when any line of its span is
 * FULLY_COVERED.
 */

#include "stuckrank/common.hpp"
#include "stuckrank/coverage.hpp"
#include "stuckrank/icfg.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace stuckrank::scorer {

/**
 * @brief Per stuck point traversal budget
 *
 * Unset limits do not apply. With no limit set scoring explores the whole
 * reachable subgraph.
 */
struct ScoreBudget
{
    std::optional<std::size_t> max_visited_statements;
    std::optional<std::uint64_t> max_time_ms;

    [[nodiscard]] bool unlimited() const noexcept
    {
        return !max_visited_statements && !max_time_ms;
    }
};

struct ScorerConfig
{
    bool memoize_callees = true;  ///< cache the reachable closure of each callee
    ScoreBudget budget{};
};

enum class BudgetLimit {
    kNone,
    kVisitedStatements,
    kTime,
};

[[nodiscard]] std::string_view to_string(BudgetLimit limit) noexcept;

struct ScoreOutcome
{
    std::uint64_t score = 0;
    std::size_t reached = 0;  ///< statements visited, covered or not
    std::size_t seeds = 0;
    bool truncated = false;
    BudgetLimit limit = BudgetLimit::kNone;
};

/**
 * @brief Scores stuck points against one ICFG and one coverage snapshot
 *
 * Both are borrowed and must outlive the scorer. score() and evaluate() are
 * safe to call concurrently; the only shared mutable state is the callee
 * closure cache, which is internally synchronized.
 */
class ReachabilityScorer
{
public:
    ReachabilityScorer(const icfg::Icfg& graph,
                       const coverage::CoverageTable& coverage,
                       ScorerConfig config = {});
    ~ReachabilityScorer();

    ReachabilityScorer(const ReachabilityScorer&) = delete;
    ReachabilityScorer& operator=(const ReachabilityScorer&) = delete;

    /// Score only; 0 when no statement maps to the stuck point's line.
    [[nodiscard]] std::uint64_t score(const coverage::StuckPoint& point) const;

    [[nodiscard]] ScoreOutcome evaluate(const coverage::StuckPoint& point) const;

    /// Statements of the stuck point's class whose span contains its line.
    [[nodiscard]] std::vector<StmtRef> seeds_of(const coverage::StuckPoint& point) const;

    /// Every statement reachable from the seeds (seeds included), unbudgeted.
    [[nodiscard]] std::vector<StmtRef> reachable_from(std::span<const StmtRef> seeds) const;

    [[nodiscard]] bool is_statement_covered(StmtRef stmt) const;

    [[nodiscard]] const ScorerConfig& config() const noexcept { return m_config; }

private:
    class ClosureCache;

    [[nodiscard]] std::shared_ptr<const std::vector<StmtRef>> callee_closure(MethodRef method) const;

    const icfg::Icfg& m_graph;
    const coverage::CoverageTable& m_coverage;
    ScorerConfig m_config;
    std::unique_ptr<ClosureCache> m_cache;
};

}  // namespace stuckrank::scorer
