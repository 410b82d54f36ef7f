#pragma once

/**
 * @file ingest.hpp
 * @brief Coverage ingestion: execution data + analyzed binaries -> CoverageTable
 */

#include "stuckrank/common.hpp"
#include "stuckrank/coverage.hpp"
#include "stuckrank/diagnostics.hpp"
#include "stuckrank/program.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

namespace stuckrank::ingest {

/**
 * @brief Per-class coverage produced by a reader for one binary
 */
struct ClassCoverage
{
    std::string class_fqn;
    std::string file_name;
    std::vector<coverage::LineCounters> lines;  ///< ascending by line
};

/**
 * @brief Coverage-data collaborator
 *
 * open() is called once per run, before any analyze() call. analyze() may be
 * called concurrently for different binaries.
 */
class CoverageReader
{
public:
    virtual ~CoverageReader() = default;

    /// Load the execution data. Fails with NoExecutionData.
    [[nodiscard]] virtual VoidResult open(const std::filesystem::path& exec_data) = 0;

    /// Combine one binary's static counters with the execution data.
    [[nodiscard]] virtual Result<std::vector<ClassCoverage>>
    analyze(const std::filesystem::path& binary) const = 0;
};

/// Executed counters of one line.
struct ExecutedLine
{
    std::int32_t instructions_covered = 0;
    std::int32_t branches_covered = 0;
};

/**
 * @brief Reader for execdata.v1 documents and program.v1 binaries
 */
class JsonCoverageReader final : public CoverageReader
{
public:
    /// An empty schema_dir disables schema validation of both inputs.
    explicit JsonCoverageReader(std::string schema_dir = {});

    [[nodiscard]] VoidResult open(const std::filesystem::path& exec_data) override;
    [[nodiscard]] Result<std::vector<ClassCoverage>>
    analyze(const std::filesystem::path& binary) const override;

    [[nodiscard]] std::size_t executed_class_count() const noexcept { return m_executed.size(); }

private:
    std::string m_schema_dir;
    bool m_opened = false;
    std::unordered_map<std::string, std::map<std::int32_t, ExecutedLine>> m_executed;
};

/**
 * Combine a parsed module with executed counters.
 *
 * Static counters come from the statements, attributed to the first line of
 * each statement's span. Fails with ExecutionDataMismatch when executed
 * counts exceed the static totals.
 */
[[nodiscard]] Result<std::vector<ClassCoverage>> combine_coverage(
    const program::ProgramModule& module,
    const std::unordered_map<std::string, std::map<std::int32_t, ExecutedLine>>& executed);

struct IngestConfig
{
    unsigned jobs = 1;
    Diagnostics diagnostics{};
};

struct IngestSummary : program::BinarySummary
{
    std::size_t duplicate_lines = 0;  ///< (class, line) keys seen in more than one binary
};

struct IngestResult
{
    coverage::CoverageTable table;
    IngestSummary summary;
};

/**
 * @brief Builds the coverage table for one run
 *
 * A binary the reader fails on is recorded in the summary and skipped; only
 * a failure to open the execution data aborts ingestion.
 */
class CoverageIngestor
{
public:
    CoverageIngestor(CoverageReader& reader, IngestConfig config);

    [[nodiscard]] Result<IngestResult> ingest(const std::filesystem::path& exec_data,
                                              std::span<const std::filesystem::path> binaries) const;

private:
    CoverageReader& m_reader;
    IngestConfig m_config;
};

}  // namespace stuckrank::ingest
