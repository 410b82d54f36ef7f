/**
 * @file report.cpp
 * @brief stuck_points.v1 report assembly and console table
 */

#include "stuckrank/report.hpp"
#include "stuckrank/schema_validate.hpp"
#include "stuckrank/version.hpp"

#include <algorithm>
#include <chrono>
#include <format>
#include <fstream>
#include <iterator>
#include <system_error>

namespace stuckrank::report {

namespace fs = std::filesystem;

namespace {

[[nodiscard]] nlohmann::json counter_to_json(const coverage::Counter& counter)
{
    return nlohmann::json{
        {  "total",   counter.total},
        {"covered", counter.covered},
        { "missed", counter.missed()},
        {  "ratio",  counter.ratio()}
    };
}

[[nodiscard]] nlohmann::json summary_to_json(const pipeline::AnalysisOutput& output)
{
    nlohmann::json summary = {
        {"totalCoverageLines", output.total_coverage_lines},
        {  "stuckPointsFound",  output.ranked.size()},
        {      "analysisType",     kAnalysisType}
    };
    if (!output.ranked.empty()) {
        const auto [min_it, max_it] = std::ranges::minmax_element(
            output.ranked, {}, [](const ranker::ScoredStuckPoint& s) { return s.score; });
        double total = 0.0;
        for (const auto& scored : output.ranked) {
            total += static_cast<double>(scored.score);
        }
        summary["highestScore"] = max_it->score;
        summary["lowestScore"] = min_it->score;
        summary["averageScore"] = total / static_cast<double>(output.ranked.size());
        summary["truncatedScores"] = std::ranges::count_if(
            output.ranked, [](const ranker::ScoredStuckPoint& s) { return s.truncated; });
    }
    return summary;
}

[[nodiscard]] nlohmann::json ingestion_to_json(const ingest::IngestSummary& summary)
{
    nlohmann::json failures = nlohmann::json::array();
    for (const auto& failure : summary.failures) {
        failures.push_back(nlohmann::json{
            { "binary", failure.binary},
            {   "code",   failure.code},
            {"message", failure.message}
        });
    }
    return nlohmann::json{
        {  "successCount",   summary.success_count},
        {  "failureCount",   summary.failure_count},
        { "totalBinaries",  summary.total_binaries},
        {"duplicateLines", summary.duplicate_lines},
        {      "failures",                failures}
    };
}

[[nodiscard]] nlohmann::json call_graph_to_json(const callgraph::CallGraphStats& stats)
{
    return nlohmann::json{
        {       "entryMethods",         stats.entry_methods},
        {   "reachableMethods",     stats.reachable_methods},
        {              "edges",                 stats.edges},
        {          "callSites",            stats.call_sites},
        {"unresolvedCallSites", stats.unresolved_call_sites},
        {   "dynamicCallSites",    stats.dynamic_call_sites}
    };
}

}  // namespace

nlohmann::json stuck_point_to_json(const ranker::ScoredStuckPoint& scored)
{
    const auto& point = scored.point;
    return nlohmann::json{
        {           "classFqn",                              point.class_fqn()},
        {           "fileName",                              point.file_name()},
        {         "lineNumber",                                   point.line()},
        {     "coverageStatus", std::string(coverage::to_string(point.status()))},
        {"instructionCoverage",          counter_to_json(point.instructions())},
        {     "branchCoverage",              counter_to_json(point.branches())},
        {    "stuckPointScore",                                   scored.score},
        {          "truncated",                               scored.truncated}
    };
}

nlohmann::json build_report(const pipeline::AnalysisOutput& output,
                            const ReportContext& context,
                            const SourceResolver* resolver)
{
    nlohmann::json stuck_points = nlohmann::json::array();
    for (const auto& scored : output.ranked) {
        auto record = stuck_point_to_json(scored);
        record["summary"] = render_stuck_point_summary(scored, output.coverage, resolver);
        stuck_points.push_back(std::move(record));
    }

    nlohmann::json report = {
        {"schema_version", kReportSchemaVersion},
        {      "metadata",
         {{"tool", kToolName},
         {"version", kVersion},
         {"generatedAt", context.generated_at},
         {"execFile", context.exec_file},
         {"entryPoints", context.entry_points},
         {"binaries", context.binaries}}     },
        {       "summary", summary_to_json(output)},
        {     "ingestion", ingestion_to_json(output.ingest)},
        {   "stuckPoints",        stuck_points}
    };
    if (output.call_graph) {
        report["callGraph"] = call_graph_to_json(*output.call_graph);
    }
    if (output.program) {
        report["program"] = nlohmann::json{
            {    "successCount",      output.program->success_count},
            {    "failureCount",      output.program->failure_count},
            {   "totalBinaries",     output.program->total_binaries},
            {"duplicateClasses", output.program->duplicate_classes}
        };
    }
    return report;
}

VoidResult write_report(const nlohmann::json& report, const fs::path& path, std::string_view schema_dir)
{
    if (auto valid = common::validate_document(report, schema_dir, kReportSchemaVersion); !valid) {
        return std::unexpected(valid.error());
    }
    const fs::path parent = path.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            return std::unexpected(Error::make(
                "IOError", "Failed to create directory: " + parent.string() + ": " + ec.message()));
        }
    }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return std::unexpected(
            Error::make("IOError", "Failed to open file for write: " + path.string()));
    }
    out << report.dump(2) << "\n";
    if (!out) {
        return std::unexpected(Error::make("IOError", "Failed to write file: " + path.string()));
    }
    return {};
}

std::string format_top_table(std::span<const ranker::ScoredStuckPoint> ranked, std::size_t limit)
{
    const auto shown = std::min(limit, ranked.size());
    std::string out;
    auto sink = std::back_inserter(out);
    std::format_to(sink, "=== Top {} Stuck Points ===\n", shown);
    out += "Rank | Score | Location\n";
    out += "-----|-------|----------\n";
    for (std::size_t i = 0; i < shown; ++i) {
        const auto& scored = ranked[i];
        std::format_to(sink, "{:4} | {:5} | {}:{}{}\n", i + 1, scored.score,
                       scored.point.class_fqn(), scored.point.line(),
                       scored.truncated ? " (truncated)" : "");
    }
    if (ranked.size() > limit) {
        std::format_to(sink, "... and {} more stuck points\n", ranked.size() - limit);
    }
    return out;
}

std::string current_timestamp()
{
    const auto now = std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
    return std::format("{:%Y-%m-%dT%H:%M:%SZ}", now);
}

}  // namespace stuckrank::report
