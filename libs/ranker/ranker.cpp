/**
 * @file ranker.cpp
 * @brief Deterministic ranking of scored stuck points
 */

#include "stuckrank/ranker.hpp"

#include <algorithm>

namespace stuckrank::ranker {

bool ranks_before(const ScoredStuckPoint& a, const ScoredStuckPoint& b) noexcept
{
    if (a.score != b.score) {
        return a.score > b.score;
    }
    if (a.point.class_fqn() != b.point.class_fqn()) {
        return a.point.class_fqn() < b.point.class_fqn();
    }
    return a.point.line() < b.point.line();
}

std::vector<ScoredStuckPoint> rank(std::vector<ScoredStuckPoint> scored)
{
    std::ranges::stable_sort(scored, ranks_before);
    return scored;
}

}  // namespace stuckrank::ranker
