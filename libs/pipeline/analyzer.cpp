/**
 * @file analyzer.cpp
 * @brief Stuck point analysis orchestration
 */

#include "stuckrank/pipeline.hpp"

#include "stuckrank/icfg.hpp"
#include "stuckrank/parallel.hpp"

#include <format>
#include <utility>

namespace stuckrank::pipeline {

namespace {

[[nodiscard]] Result<std::vector<program::MethodQuery>>
parse_entry_points(const std::vector<std::string>& entry_points)
{
    if (entry_points.empty()) {
        return std::unexpected(
            Error::make("InvalidEntryPoint", "At least one entry point is required"));
    }
    std::vector<program::MethodQuery> queries;
    queries.reserve(entry_points.size());
    for (const auto& text : entry_points) {
        auto query = program::parse_method_query(text);
        if (!query) {
            return std::unexpected(query.error());
        }
        queries.push_back(std::move(*query));
    }
    return queries;
}

}  // namespace

StuckPointAnalyzer::StuckPointAnalyzer(AnalyzerConfig config, ingest::CoverageReader& reader)
    : m_config(std::move(config))
    , m_reader(reader)
{}

Result<AnalysisOutput> StuckPointAnalyzer::analyze(const AnalysisRequest& request) const
{
    const auto& diag = m_config.diagnostics;

    auto queries = parse_entry_points(request.entry_points);
    if (!queries) {
        return std::unexpected(queries.error());
    }

    ingest::CoverageIngestor ingestor(m_reader,
                                      ingest::IngestConfig{.jobs = m_config.jobs, .diagnostics = diag});
    auto ingested = ingestor.ingest(request.exec_data, request.binaries);
    if (!ingested) {
        return std::unexpected(ingested.error());
    }
    const auto& ingest_summary = ingested->summary;
    if (ingest_summary.total_binaries > 0 && ingest_summary.success_count == 0) {
        return std::unexpected(Error::make(
            "NoAnalyzableBinaries",
            std::format("None of the {} binaries could be analyzed against {}",
                        ingest_summary.total_binaries, request.exec_data.string())));
    }

    AnalysisOutput output{
        .ranked = {},
        .coverage = std::move(ingested->table),
        .ingest = std::move(ingested->summary),
        .program = std::nullopt,
        .call_graph = std::nullopt,
        .total_coverage_lines = 0,
    };
    output.total_coverage_lines = output.coverage.line_count();

    const auto stuck_points = coverage::select_stuck_points(output.coverage);
    diag.info("[select] {} stuck points (PARTLY_COVERED lines) out of {} lines", stuck_points.size(),
              output.total_coverage_lines);
    if (stuck_points.empty()) {
        diag.warn("No stuck points; entry points were not resolved against the program");
        return output;
    }

    auto loaded = program::load_program(
        request.binaries,
        program::LoadOptions{.schema_dir = m_config.schema_dir, .jobs = m_config.jobs, .diagnostics = diag});
    diag.info("[program] {} classes, {} methods, {} statements", loaded.view.class_count(),
              loaded.view.method_count(), loaded.view.statement_count());
    output.program = std::move(loaded.summary);

    auto call_graph = callgraph::build_call_graph(loaded.view, *queries, diag);
    if (!call_graph) {
        return std::unexpected(call_graph.error());
    }
    output.call_graph = call_graph->stats();

    const icfg::Icfg graph(loaded.view, std::move(*call_graph));
    const scorer::ReachabilityScorer scorer(graph, output.coverage, m_config.scorer);

    std::vector<ranker::ScoredStuckPoint> scored;
    scored.reserve(stuck_points.size());
    for (const auto& point : stuck_points) {
        scored.push_back(ranker::ScoredStuckPoint{.point = point, .score = 0, .truncated = false});
    }
    parallel_for(scored.size(), m_config.jobs, [&](std::size_t i) {
        const auto outcome = scorer.evaluate(scored[i].point);
        scored[i].score = outcome.score;
        scored[i].truncated = outcome.truncated;
        diag.debug("[score] {}:{} score={} reached={} seeds={}{}", scored[i].point.class_fqn(),
                   scored[i].point.line(), outcome.score, outcome.reached, outcome.seeds,
                   outcome.truncated ? " (truncated)" : "");
    });

    output.ranked = ranker::rank(std::move(scored));
    diag.info("[rank] Ranked {} stuck points", output.ranked.size());
    return output;
}

}  // namespace stuckrank::pipeline
