#pragma once

/**
 * @file ranker.hpp
 * @brief Scored stuck points and their deterministic ordering
 */

#include "stuckrank/coverage.hpp"

#include <cstdint>
#include <vector>

namespace stuckrank::ranker {

struct ScoredStuckPoint
{
    coverage::StuckPoint point;
    std::uint64_t score = 0;
    bool truncated = false;  ///< score computed under an exhausted budget
};

/// Score descending, then class name ascending, then line ascending.
[[nodiscard]] bool ranks_before(const ScoredStuckPoint& a, const ScoredStuckPoint& b) noexcept;

/**
 * Order scored stuck points. The order is total over distinct
 * (class, line) keys, so identical inputs always rank identically.
 */
[[nodiscard]] std::vector<ScoredStuckPoint> rank(std::vector<ScoredStuckPoint> scored);

}  // namespace stuckrank::ranker
