#pragma once

/**
 * @file report.hpp
 * @brief stuck_points.v1 report, Markdown summaries and console output
 */

#include "stuckrank/common.hpp"
#include "stuckrank/coverage.hpp"
#include "stuckrank/pipeline.hpp"
#include "stuckrank/ranker.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace stuckrank::report {

/// Lines shown on each side of a stuck point in its summary.
inline constexpr std::int32_t kContextLines = 5;

/// Rows of the console ranking table.
inline constexpr std::size_t kDefaultTopLimit = 10;

/**
 * @brief Locates source files of analyzed classes under a source root
 */
class SourceResolver
{
public:
    explicit SourceResolver(std::filesystem::path root);

    /**
     * "<root>/<package path>/<file_name>" when it exists; otherwise a
     * recursive search for file_name, preferring a path that contains the
     * package directory.
     */
    [[nodiscard]] std::optional<std::filesystem::path>
    find_source_file(std::string_view class_fqn, std::string_view file_name) const;

    /// Lines [target - radius, target + radius] clipped to the file, by line number.
    [[nodiscard]] std::map<std::int32_t, std::string>
    read_context(const std::filesystem::path& file, std::int32_t target, std::int32_t radius) const;

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return m_root; }

private:
    std::filesystem::path m_root;
};

/// "[✓]", "[~]", "[✗]", or "[ ]" for a line without coverage data.
[[nodiscard]] std::string_view coverage_flag(const coverage::CoverageLine* line) noexcept;

/**
 * Markdown summary of one stuck point: basic information, source context
 * (when the resolver finds the file), counters of the stuck line and the
 * flag legend.
 */
[[nodiscard]] std::string render_stuck_point_summary(const ranker::ScoredStuckPoint& scored,
                                                     const coverage::CoverageTable& coverage,
                                                     const SourceResolver* resolver);

struct ReportContext
{
    std::string exec_file;
    std::vector<std::string> entry_points;
    std::vector<std::string> binaries;
    std::string generated_at;  ///< ISO-8601 UTC
};

/// JSON record of a scored stuck point without its Markdown summary.
[[nodiscard]] nlohmann::json stuck_point_to_json(const ranker::ScoredStuckPoint& scored);

[[nodiscard]] nlohmann::json build_report(const pipeline::AnalysisOutput& output,
                                          const ReportContext& context,
                                          const SourceResolver* resolver = nullptr);

/**
 * Validate (when schema_dir is set) and write the report, creating parent
 * directories. Fails with SchemaInvalid or IOError.
 */
[[nodiscard]] VoidResult write_report(const nlohmann::json& report,
                                      const std::filesystem::path& path,
                                      std::string_view schema_dir);

/// Console "Top N Stuck Points" table.
[[nodiscard]] std::string format_top_table(std::span<const ranker::ScoredStuckPoint> ranked,
                                           std::size_t limit = kDefaultTopLimit);

/// Current time as "YYYY-MM-DDTHH:MM:SSZ".
[[nodiscard]] std::string current_timestamp();

}  // namespace stuckrank::report
