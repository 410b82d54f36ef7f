#pragma once

/**
 * @file parallel.hpp
 * @brief Fixed-size worker pool over an index range
 */

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <thread>
#include <vector>

namespace stuckrank {

/// Worker count for a --jobs value; 0 selects the hardware concurrency.
[[nodiscard]] inline unsigned effective_jobs(unsigned jobs) noexcept
{
    if (jobs != 0U) {
        return jobs;
    }
    return std::max(1U, std::thread::hardware_concurrency());
}

/**
 * Invoke fn(i) for every i in [0, count) on up to `jobs` threads.
 *
 * Indices are claimed from a shared counter, so the visiting order is
 * unspecified; callers write results into a slot per index to keep output
 * independent of scheduling. fn must not throw.
 */
template <typename Fn>
void parallel_for(std::size_t count, unsigned jobs, Fn&& fn)
{
    const auto workers = std::min<std::size_t>(effective_jobs(jobs), count);
    if (workers <= 1U) {
        for (std::size_t i = 0; i < count; ++i) {
            fn(i);
        }
        return;
    }

    std::atomic<std::size_t> next{0};
    std::vector<std::jthread> threads;
    threads.reserve(workers);
    for (std::size_t w = 0; w < workers; ++w) {
        threads.emplace_back([&next, &fn, count] {
            for (auto i = next.fetch_add(1, std::memory_order_relaxed); i < count;
                 i = next.fetch_add(1, std::memory_order_relaxed)) {
                fn(i);
            }
        });
    }
    // jthread joins on destruction
}

}  // namespace stuckrank
