#pragma once

/**
 * @file coverage.hpp
 * @brief Line coverage model: per-line counters, status classification,
 *        the per-run coverage table and stuck-point selection
 */

#include "stuckrank/common.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace stuckrank::coverage {

/**
 * Execution status of one source line.
 *
 * Naming convention: kPascalCase for enum constants (Google C++ Style Guide)
 */
enum class CoverageStatus {
    kNotCovered,     ///< No instruction executed
    kPartlyCovered,  ///< Some but not all instructions executed (stuck point)
    kFullyCovered    ///< Every instruction executed
};

/**
 * Classify a line from its instruction counters.
 *
 * FULLY_COVERED iff total > 0 and covered == total; NOT_COVERED iff
 * covered == 0; PARTLY_COVERED otherwise.
 */
[[nodiscard]] constexpr CoverageStatus classify_status(std::int32_t instructions_covered,
                                                       std::int32_t instructions_total) noexcept
{
    if (instructions_total > 0 && instructions_covered == instructions_total) {
        return CoverageStatus::kFullyCovered;
    }
    if (instructions_covered == 0) {
        return CoverageStatus::kNotCovered;
    }
    return CoverageStatus::kPartlyCovered;
}

/// "NOT_COVERED", "PARTLY_COVERED" or "FULLY_COVERED"
[[nodiscard]] std::string_view to_string(CoverageStatus status) noexcept;

[[nodiscard]] Result<CoverageStatus> parse_status(std::string_view text);

/**
 * @brief Total/covered pair of one counter kind (instructions or branches)
 */
struct Counter
{
    std::int32_t total = 0;
    std::int32_t covered = 0;

    [[nodiscard]] std::int32_t missed() const noexcept { return total - covered; }

    /// covered / total, 0.0 when total is 0
    [[nodiscard]] double ratio() const noexcept
    {
        if (total == 0) {
            return 0.0;
        }
        return static_cast<double>(covered) / static_cast<double>(total);
    }
};

/**
 * @brief Raw counters of one line, as produced by a coverage reader
 */
struct LineCounters
{
    std::int32_t line = 0;
    Counter instructions;
    Counter branches;
};

/**
 * @brief Immutable coverage record of one executable source line
 *
 * Identity is (class_fqn, line). The status is derived from the instruction
 * counters and cannot be set independently.
 */
class CoverageLine
{
public:
    /**
     * Validate counters and build a line.
     * Fails with InvalidCoverageLine when a counter has covered > total or a
     * negative value, or when the line number is not positive.
     */
    [[nodiscard]] static Result<CoverageLine>
    make(std::string class_fqn, std::string file_name, const LineCounters& counters);

    [[nodiscard]] const std::string& class_fqn() const noexcept { return m_class_fqn; }
    [[nodiscard]] const std::string& file_name() const noexcept { return m_file_name; }
    [[nodiscard]] std::int32_t line() const noexcept { return m_line; }
    [[nodiscard]] CoverageStatus status() const noexcept { return m_status; }
    [[nodiscard]] const Counter& instructions() const noexcept { return m_instructions; }
    [[nodiscard]] const Counter& branches() const noexcept { return m_branches; }

    [[nodiscard]] double instruction_coverage_ratio() const noexcept
    {
        return m_instructions.ratio();
    }
    [[nodiscard]] double branch_coverage_ratio() const noexcept { return m_branches.ratio(); }

    [[nodiscard]] bool is_fully_covered() const noexcept
    {
        return m_status == CoverageStatus::kFullyCovered;
    }
    [[nodiscard]] bool is_partly_covered() const noexcept
    {
        return m_status == CoverageStatus::kPartlyCovered;
    }

private:
    CoverageLine(std::string class_fqn,
                 std::string file_name,
                 std::int32_t line,
                 Counter instructions,
                 Counter branches);

    std::string m_class_fqn;
    std::string m_file_name;
    std::int32_t m_line;
    CoverageStatus m_status;
    Counter m_instructions;
    Counter m_branches;
};

/// A PARTLY_COVERED line handed to the scorer.
using StuckPoint = CoverageLine;

/**
 * @brief class_fqn -> line -> CoverageLine for one analysis run
 *
 * Filled once by the ingestor, read-only afterwards and shared by reference
 * across all scoring tasks.
 */
class CoverageTable
{
public:
    using LineMap = std::map<std::int32_t, CoverageLine>;

    /**
     * Insert a line. Returns false and keeps the existing entry when the
     * (class_fqn, line) key is already present.
     */
    bool insert(CoverageLine line);

    [[nodiscard]] const CoverageLine* find(std::string_view class_fqn,
                                           std::int32_t line) const;

    [[nodiscard]] const LineMap* lines_of(std::string_view class_fqn) const;

    /// True when the line exists and is FULLY_COVERED.
    [[nodiscard]] bool is_fully_covered(std::string_view class_fqn, std::int32_t line) const;

    [[nodiscard]] std::size_t class_count() const noexcept { return m_classes.size(); }
    [[nodiscard]] std::size_t line_count() const noexcept { return m_line_count; }
    [[nodiscard]] bool empty() const noexcept { return m_line_count == 0; }

    [[nodiscard]] const std::map<std::string, LineMap, std::less<>>& classes() const noexcept
    {
        return m_classes;
    }

private:
    std::map<std::string, LineMap, std::less<>> m_classes;
    std::size_t m_line_count = 0;
};

/**
 * Stuck-point selector: every PARTLY_COVERED line of the table, ordered by
 * (class_fqn, line).
 */
[[nodiscard]] std::vector<StuckPoint> select_stuck_points(const CoverageTable& table);

}  // namespace stuckrank::coverage
