/**
 * @file coverage_reader.cpp
 * @brief execdata.v1 reader combining executed counts with program.v1 statics
 */

#include "stuckrank/ingest.hpp"
#include "stuckrank/schema_validate.hpp"
#include "stuckrank/version.hpp"

#include "common/json_fields.hpp"

#include <algorithm>
#include <format>
#include <utility>

namespace stuckrank::ingest {

namespace {

using common::JsonFieldContext;
using ExecutedTable = std::unordered_map<std::string, std::map<std::int32_t, ExecutedLine>>;

[[nodiscard]] Error no_execution_data(const std::filesystem::path& path, const Error& cause)
{
    return Error::make("NoExecutionData",
                       std::format("Cannot read execution data {}: {}: {}", path.string(),
                                   cause.code, cause.message));
}

[[nodiscard]] Result<ExecutedLine> parse_executed_line(const nlohmann::json& obj,
                                                       const std::string& context,
                                                       std::int32_t& line)
{
    if (!obj.is_object()) {
        return std::unexpected(Error::make(
            "InvalidFieldType", std::format("Line entry must be an object in {}", context)));
    }
    auto number = common::require_int(JsonFieldContext{.obj = &obj, .key = "line", .context = context});
    if (!number) {
        return std::unexpected(number.error());
    }
    auto instructions = common::require_int(
        JsonFieldContext{.obj = &obj, .key = "instructions_covered", .context = context});
    if (!instructions) {
        return std::unexpected(instructions.error());
    }
    auto branches = common::optional_int(
        JsonFieldContext{.obj = &obj, .key = "branches_covered", .context = context});
    if (!branches) {
        return std::unexpected(branches.error());
    }
    if (*number < 1 || *instructions < 0 || branches->value_or(0) < 0) {
        return std::unexpected(Error::make(
            "InvalidFieldType", std::format("Negative or zero counter in {} line {}", context, *number)));
    }
    line = *number;
    return ExecutedLine{.instructions_covered = *instructions,
                        .branches_covered = branches->value_or(0)};
}

[[nodiscard]] Result<ExecutedTable> parse_execution_data(const nlohmann::json& doc)
{
    if (!doc.is_object()) {
        return std::unexpected(Error::make("InvalidFieldType", "Execution data must be an object"));
    }
    auto version = common::require_string(
        JsonFieldContext{.obj = &doc, .key = "schema_version", .context = "execution data"});
    if (!version) {
        return std::unexpected(version.error());
    }
    if (*version != kExecDataSchemaVersion) {
        return std::unexpected(Error::make(
            "InvalidFieldType",
            std::format("Unsupported schema_version '{}' (expected {})", *version,
                        kExecDataSchemaVersion)));
    }
    auto classes = common::require_array(
        JsonFieldContext{.obj = &doc, .key = "classes", .context = "execution data"});
    if (!classes) {
        return std::unexpected(classes.error());
    }

    ExecutedTable table;
    for (const auto& entry : **classes) {
        if (!entry.is_object()) {
            return std::unexpected(
                Error::make("InvalidFieldType", "Class entry must be an object in execution data"));
        }
        auto name = common::require_string(
            JsonFieldContext{.obj = &entry, .key = "name", .context = "execution data class"});
        if (!name) {
            return std::unexpected(name.error());
        }
        auto lines =
            common::require_array(JsonFieldContext{.obj = &entry, .key = "lines", .context = *name});
        if (!lines) {
            return std::unexpected(lines.error());
        }
        auto& executed = table[*name];
        for (const auto& line_entry : **lines) {
            std::int32_t line = 0;
            auto counts = parse_executed_line(line_entry, *name, line);
            if (!counts) {
                return std::unexpected(counts.error());
            }
            // Several sessions may report the same line; keep the widest counts.
            auto& slot = executed[line];
            slot.instructions_covered =
                std::max(slot.instructions_covered, counts->instructions_covered);
            slot.branches_covered = std::max(slot.branches_covered, counts->branches_covered);
        }
    }
    return table;
}

}  // namespace

Result<std::vector<ClassCoverage>> combine_coverage(const program::ProgramModule& module,
                                                    const ExecutedTable& executed)
{
    std::vector<ClassCoverage> result;
    result.reserve(module.classes.size());
    for (const auto& klass : module.classes) {
        std::map<std::int32_t, coverage::LineCounters> lines;
        for (const auto& method : klass.methods) {
            for (const auto& stmt : method.stmts) {
                if (!stmt.lines.has_position() || stmt.instructions <= 0) {
                    continue;
                }
                auto& counters = lines[stmt.lines.first];
                counters.line = stmt.lines.first;
                counters.instructions.total += stmt.instructions;
                counters.branches.total += stmt.branches;
            }
        }

        const auto class_it = executed.find(klass.name);
        if (class_it != executed.end()) {
            for (const auto& [line, counts] : class_it->second) {
                const auto it = lines.find(line);
                const std::int32_t instruction_total =
                    it == lines.end() ? 0 : it->second.instructions.total;
                const std::int32_t branch_total = it == lines.end() ? 0 : it->second.branches.total;
                if (counts.instructions_covered > instruction_total
                    || counts.branches_covered > branch_total) {
                    return std::unexpected(Error::make(
                        "ExecutionDataMismatch",
                        std::format("{}:{}: executed counts ({} instructions, {} branches) exceed "
                                    "static totals ({}, {}); execution data is from another build",
                                    klass.name, line, counts.instructions_covered,
                                    counts.branches_covered, instruction_total, branch_total)));
                }
                if (it == lines.end()) {
                    continue;
                }
                it->second.instructions.covered = counts.instructions_covered;
                it->second.branches.covered = counts.branches_covered;
            }
        }

        ClassCoverage class_coverage{
            .class_fqn = klass.name,
            .file_name = klass.source_file.value_or(program::default_source_file(klass.name)),
            .lines = {},
        };
        class_coverage.lines.reserve(lines.size());
        for (const auto& [line, counters] : lines) {
            class_coverage.lines.push_back(counters);
        }
        result.push_back(std::move(class_coverage));
    }
    return result;
}

JsonCoverageReader::JsonCoverageReader(std::string schema_dir)
    : m_schema_dir(std::move(schema_dir))
{}

VoidResult JsonCoverageReader::open(const std::filesystem::path& exec_data)
{
    auto doc = common::read_json_file(exec_data);
    if (!doc) {
        return std::unexpected(no_execution_data(exec_data, doc.error()));
    }
    if (auto valid = common::validate_document(*doc, m_schema_dir, kExecDataSchemaVersion); !valid) {
        return std::unexpected(no_execution_data(exec_data, valid.error()));
    }
    auto table = parse_execution_data(*doc);
    if (!table) {
        return std::unexpected(no_execution_data(exec_data, table.error()));
    }
    m_executed = std::move(*table);
    m_opened = true;
    return {};
}

Result<std::vector<ClassCoverage>> JsonCoverageReader::analyze(
    const std::filesystem::path& binary) const
{
    if (!m_opened) {
        return std::unexpected(
            Error::make("NoExecutionData", "Execution data must be opened before analysis"));
    }
    auto module = program::read_program_module(binary, m_schema_dir);
    if (!module) {
        return std::unexpected(module.error());
    }
    return combine_coverage(*module, m_executed);
}

}  // namespace stuckrank::ingest
