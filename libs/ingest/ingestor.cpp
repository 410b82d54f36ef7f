/**
 * @file ingestor.cpp
 * @brief Per-binary coverage ingestion with failure isolation
 */

#include "stuckrank/ingest.hpp"
#include "stuckrank/parallel.hpp"

#include <utility>

namespace stuckrank::ingest {

namespace {

/// Materialize one binary's coverage; the first invalid line fails the binary.
[[nodiscard]] Result<std::vector<coverage::CoverageLine>>
materialize(const std::vector<ClassCoverage>& classes)
{
    std::vector<coverage::CoverageLine> lines;
    for (const auto& klass : classes) {
        for (const auto& counters : klass.lines) {
            if (counters.instructions.total <= 0) {
                continue;
            }
            auto line = coverage::CoverageLine::make(klass.class_fqn, klass.file_name, counters);
            if (!line) {
                return std::unexpected(line.error());
            }
            lines.push_back(std::move(*line));
        }
    }
    return lines;
}

}  // namespace

CoverageIngestor::CoverageIngestor(CoverageReader& reader, IngestConfig config)
    : m_reader(reader)
    , m_config(std::move(config))
{}

Result<IngestResult> CoverageIngestor::ingest(const std::filesystem::path& exec_data,
                                              std::span<const std::filesystem::path> binaries) const
{
    const auto& diag = m_config.diagnostics;
    if (auto opened = m_reader.open(exec_data); !opened) {
        return std::unexpected(opened.error());
    }
    diag.info("[ingest] Loaded execution data {}", exec_data.string());

    std::vector<Result<std::vector<coverage::CoverageLine>>> slots(
        binaries.size(), std::unexpected(Error::make("Internal", "not analyzed")));
    parallel_for(binaries.size(), m_config.jobs, [&](std::size_t i) {
        auto classes = m_reader.analyze(binaries[i]);
        if (!classes) {
            slots[i] = std::unexpected(classes.error());
            return;
        }
        slots[i] = materialize(*classes);
    });

    // Merge in binary order so the table does not depend on scheduling.
    IngestResult result;
    result.summary.total_binaries = binaries.size();
    for (std::size_t i = 0; i < binaries.size(); ++i) {
        if (!slots[i]) {
            diag.warn("[ingest] Failed to analyze {}: {}: {}", binaries[i].string(),
                      slots[i].error().code, slots[i].error().message);
            result.summary.failures.push_back(
                program::BinaryFailure{.binary = binaries[i].string(),
                                       .code = slots[i].error().code,
                                       .message = slots[i].error().message});
            ++result.summary.failure_count;
            continue;
        }
        ++result.summary.success_count;
        for (auto& line : *slots[i]) {
            if (!result.table.insert(std::move(line))) {
                ++result.summary.duplicate_lines;
            }
        }
        diag.debug("[ingest] {}: {} lines", binaries[i].string(), slots[i]->size());
    }

    if (result.summary.duplicate_lines > 0) {
        diag.warn("[ingest] {} coverage lines were reported by more than one binary; kept the first",
                  result.summary.duplicate_lines);
    }
    diag.info("[ingest] Coverage analysis: {} successful, {} failed out of {} binaries",
              result.summary.success_count, result.summary.failure_count,
              result.summary.total_binaries);
    diag.info("[ingest] {} coverage lines across {} classes", result.table.line_count(),
              result.table.class_count());
    return result;
}

}  // namespace stuckrank::ingest
