/**
 * @file coverage.cpp
 * @brief Line coverage model and stuck-point selection
 */

#include "stuckrank/coverage.hpp"

#include <format>
#include <utility>

namespace stuckrank::coverage {

namespace {

[[nodiscard]] VoidResult validate_counter(const Counter& counter,
                                          std::string_view kind,
                                          std::string_view class_fqn,
                                          std::int32_t line)
{
    if (counter.covered < 0 || counter.total < 0 || counter.covered > counter.total) {
        return std::unexpected(Error::make(
            "InvalidCoverageLine",
            std::format("{}:{}: {} counter requires total >= covered >= 0 (total={}, covered={})",
                        class_fqn,
                        line,
                        kind,
                        counter.total,
                        counter.covered)));
    }
    return {};
}

}  // namespace

std::string_view to_string(CoverageStatus status) noexcept
{
    switch (status) {
        case CoverageStatus::kNotCovered:
            return "NOT_COVERED";
        case CoverageStatus::kPartlyCovered:
            return "PARTLY_COVERED";
        case CoverageStatus::kFullyCovered:
            return "FULLY_COVERED";
    }
    return "NOT_COVERED";
}

Result<CoverageStatus> parse_status(std::string_view text)
{
    if (text == "NOT_COVERED") {
        return CoverageStatus::kNotCovered;
    }
    if (text == "PARTLY_COVERED") {
        return CoverageStatus::kPartlyCovered;
    }
    if (text == "FULLY_COVERED") {
        return CoverageStatus::kFullyCovered;
    }
    return std::unexpected(
        Error::make("InvalidFieldType", std::format("Unknown coverage status: {}", text)));
}

CoverageLine::CoverageLine(std::string class_fqn,
                           std::string file_name,
                           std::int32_t line,
                           Counter instructions,
                           Counter branches)
    : m_class_fqn(std::move(class_fqn))
    , m_file_name(std::move(file_name))
    , m_line(line)
    , m_status(classify_status(instructions.covered, instructions.total))
    , m_instructions(instructions)
    , m_branches(branches)
{}

Result<CoverageLine>
CoverageLine::make(std::string class_fqn, std::string file_name, const LineCounters& counters)
{
    if (counters.line <= 0) {
        return std::unexpected(Error::make(
            "InvalidCoverageLine",
            std::format("{}: line number must be positive, got {}", class_fqn, counters.line)));
    }
    if (auto result =
            validate_counter(counters.instructions, "instruction", class_fqn, counters.line);
        !result) {
        return std::unexpected(result.error());
    }
    if (auto result = validate_counter(counters.branches, "branch", class_fqn, counters.line);
        !result) {
        return std::unexpected(result.error());
    }
    return CoverageLine(std::move(class_fqn),
                        std::move(file_name),
                        counters.line,
                        counters.instructions,
                        counters.branches);
}

bool CoverageTable::insert(CoverageLine line)
{
    auto class_it = m_classes.find(line.class_fqn());
    if (class_it == m_classes.end()) {
        class_it = m_classes.emplace(line.class_fqn(), LineMap{}).first;
    }
    const std::int32_t line_number = line.line();
    const bool inserted = class_it->second.emplace(line_number, std::move(line)).second;
    if (inserted) {
        ++m_line_count;
    }
    return inserted;
}

const CoverageLine* CoverageTable::find(std::string_view class_fqn, std::int32_t line) const
{
    const auto* lines = lines_of(class_fqn);
    if (lines == nullptr) {
        return nullptr;
    }
    auto it = lines->find(line);
    return it == lines->end() ? nullptr : &it->second;
}

const CoverageTable::LineMap* CoverageTable::lines_of(std::string_view class_fqn) const
{
    auto it = m_classes.find(class_fqn);
    return it == m_classes.end() ? nullptr : &it->second;
}

bool CoverageTable::is_fully_covered(std::string_view class_fqn, std::int32_t line) const
{
    const auto* entry = find(class_fqn, line);
    return entry != nullptr && entry->is_fully_covered();
}

std::vector<StuckPoint> select_stuck_points(const CoverageTable& table)
{
    std::vector<StuckPoint> stuck_points;
    for (const auto& [class_fqn, lines] : table.classes()) {
        for (const auto& [line_number, line] : lines) {
            if (line.is_partly_covered()) {
                stuck_points.push_back(line);
            }
        }
    }
    return stuck_points;
}

}  // namespace stuckrank::coverage
