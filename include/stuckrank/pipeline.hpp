#pragma once

/**
 * @file pipeline.hpp
 * @brief End-to-end stuck point analysis
 *
 * ingest -> select stuck points -> load program -> call graph -> ICFG ->
 * score (worker pool) -> rank
 */

#include "stuckrank/callgraph.hpp"
#include "stuckrank/common.hpp"
#include "stuckrank/coverage.hpp"
#include "stuckrank/diagnostics.hpp"
#include "stuckrank/ingest.hpp"
#include "stuckrank/program.hpp"
#include "stuckrank/ranker.hpp"
#include "stuckrank/scorer.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace stuckrank::pipeline {

/**
 * @brief Configuration of one analyzer instance
 *
 * Passed by value; no component reads process-wide settings.
 */
struct AnalyzerConfig
{
    unsigned jobs = 1;  ///< 0: hardware concurrency
    Diagnostics diagnostics{};
    scorer::ScorerConfig scorer{};
    std::string schema_dir;  ///< empty: no schema validation
};

struct AnalysisRequest
{
    std::filesystem::path exec_data;
    std::vector<std::filesystem::path> binaries;
    std::vector<std::string> entry_points;  ///< see program::parse_method_query
};

struct AnalysisOutput
{
    std::vector<ranker::ScoredStuckPoint> ranked;
    coverage::CoverageTable coverage;
    ingest::IngestSummary ingest;
    std::optional<program::LoadSummary> program;         ///< unset when no stuck point exists
    std::optional<callgraph::CallGraphStats> call_graph;  ///< unset when no stuck point exists
    std::size_t total_coverage_lines = 0;
};

class StuckPointAnalyzer
{
public:
    StuckPointAnalyzer(AnalyzerConfig config, ingest::CoverageReader& reader);

    /**
     * Run the analysis.
     *
     * An empty ranking is a successful result. Fails with InvalidEntryPoint,
     * NoExecutionData, EntryPointNotFound or AmbiguousEntryPoint.
     */
    [[nodiscard]] Result<AnalysisOutput> analyze(const AnalysisRequest& request) const;

    [[nodiscard]] const AnalyzerConfig& config() const noexcept { return m_config; }

private:
    AnalyzerConfig m_config;
    ingest::CoverageReader& m_reader;
};

}  // namespace stuckrank::pipeline
