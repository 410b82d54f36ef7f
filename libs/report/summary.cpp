/**
 * @file summary.cpp
 * @brief Markdown summary of a stuck point
 */

#include "stuckrank/report.hpp"

#include <format>
#include <iterator>

namespace stuckrank::report {

std::string_view coverage_flag(const coverage::CoverageLine* line) noexcept
{
    if (line == nullptr) {
        return "[ ]";
    }
    switch (line->status()) {
        case coverage::CoverageStatus::kFullyCovered:
            return "[✓]";
        case coverage::CoverageStatus::kPartlyCovered:
            return "[~]";
        case coverage::CoverageStatus::kNotCovered:
            return "[✗]";
    }
    return "[ ]";
}

std::string render_stuck_point_summary(const ranker::ScoredStuckPoint& scored,
                                       const coverage::CoverageTable& coverage,
                                       const SourceResolver* resolver)
{
    const auto& point = scored.point;
    std::string out;
    auto sink = std::back_inserter(out);

    out += "## Basic Information\n\n";
    std::format_to(sink, "- **File**: {}\n", point.file_name());
    std::format_to(sink, "- **Class**: {}\n", point.class_fqn());
    std::format_to(sink, "- **Line Number**: {}\n", point.line());
    std::format_to(sink, "- **Stuck Point Score**: {}{}\n", scored.score,
                   scored.truncated ? " (truncated)" : "");
    std::format_to(sink, "- **Coverage Status**: {}\n\n", coverage::to_string(point.status()));

    out += "## Source Code Context\n\n";
    std::optional<std::filesystem::path> source;
    std::map<std::int32_t, std::string> context;
    if (resolver != nullptr) {
        source = resolver->find_source_file(point.class_fqn(), point.file_name());
        if (source) {
            context = resolver->read_context(*source, point.line(), kContextLines);
        }
    }
    if (!context.empty()) {
        out += "### Source Code with Coverage\n\n";
        std::format_to(sink, "*Source: {}*\n\n", source->generic_string());
        out += "```java\n";
        for (const auto& [number, text] : context) {
            const std::string_view marker = number == point.line() ? ">>> " : "    ";
            std::format_to(sink, "{}{}: {} {}\n", marker, number,
                           coverage_flag(coverage.find(point.class_fqn(), number)), text);
        }
        out += "```\n\n";
    } else {
        out += "*Source code could not be resolved for this file*\n";
    }

    if (const auto* line = coverage.find(point.class_fqn(), point.line())) {
        out += "### Stuck Point Details\n\n";
        std::format_to(sink, "- **Instructions**: {} covered / {} total ({:.1f}%)\n",
                       line->instructions().covered, line->instructions().total,
                       line->instruction_coverage_ratio() * 100.0);
        std::format_to(sink, "- **Branches**: {} covered / {} total ({:.1f}%)\n",
                       line->branches().covered, line->branches().total,
                       line->branch_coverage_ratio() * 100.0);
    }

    out += "\n**Legend**: [✓] Fully Covered, [~] Partially Covered (Stuck Point), "
           "[✗] Not Covered, [ ] No Executable Instructions\n";
    return out;
}

}  // namespace stuckrank::report
