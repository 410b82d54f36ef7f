#pragma once

/**
 * @file program_fixtures.hpp
 * @brief Builders for synthetic programs and coverage tables used by tests
 */

#include "stuckrank/coverage.hpp"
#include "stuckrank/program.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace stuckrank::test {

class TempDir
{
public:
    explicit TempDir(const std::string& name)
        : m_path(std::filesystem::temp_directory_path() / name)
    {
        std::filesystem::remove_all(m_path);
        std::filesystem::create_directories(m_path);
    }
    ~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return m_path; }

private:
    std::filesystem::path m_path;
};

inline void write_file(const std::filesystem::path& path, const std::string& text)
{
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << text;
}

inline void write_json(const std::filesystem::path& path, const nlohmann::json& doc)
{
    write_file(path, doc.dump(2));
}

inline program::MethodSignature sig(std::string declaring_class,
                                    std::string name,
                                    std::string return_type = "void",
                                    std::vector<std::string> params = {})
{
    return program::MethodSignature{.declaring_class = std::move(declaring_class),
                                    .name = std::move(name),
                                    .return_type = std::move(return_type),
                                    .params = std::move(params)};
}

/// Statement on a single line (0: no position information).
inline program::StmtRecord stmt(std::string id, std::int32_t line, std::vector<std::string> succs = {})
{
    program::StmtRecord record;
    record.id = std::move(id);
    record.lines = line > 0 ? program::LineSpan{.first = line, .last = line} : program::kNoPosition;
    record.succs = std::move(succs);
    return record;
}

inline program::StmtRecord span_stmt(std::string id,
                                     std::int32_t first,
                                     std::int32_t last,
                                     std::vector<std::string> succs = {})
{
    auto record = stmt(std::move(id), first, std::move(succs));
    record.lines = program::LineSpan{.first = first, .last = last};
    return record;
}

inline program::StmtRecord call_stmt(std::string id,
                                     std::int32_t line,
                                     program::CallKind kind,
                                     program::MethodSignature target,
                                     std::vector<std::string> succs = {})
{
    auto record = stmt(std::move(id), line, std::move(succs));
    record.call = program::CallRecord{.kind = kind, .target = std::move(target)};
    return record;
}

inline program::MethodRecord method(std::string name,
                                    std::vector<program::StmtRecord> stmts,
                                    std::string return_type = "void",
                                    std::vector<std::string> params = {})
{
    program::MethodRecord record;
    record.name = std::move(name);
    record.return_type = std::move(return_type);
    record.params = std::move(params);
    record.stmts = std::move(stmts);
    return record;
}

/// Method without a body (abstract or native).
inline program::MethodRecord abstract_method(std::string name,
                                             std::string return_type = "void",
                                             std::vector<std::string> params = {})
{
    auto record = method(std::move(name), {}, std::move(return_type), std::move(params));
    record.is_abstract = true;
    record.has_body = false;
    return record;
}

inline program::ClassRecord klass(std::string name,
                                  std::vector<program::MethodRecord> methods,
                                  std::optional<std::string> super_class = std::nullopt,
                                  std::vector<std::string> interfaces = {})
{
    program::ClassRecord record;
    record.name = std::move(name);
    record.methods = std::move(methods);
    record.super_class = std::move(super_class);
    record.interfaces = std::move(interfaces);
    return record;
}

inline program::ClassRecord interface_class(std::string name,
                                      std::vector<program::MethodRecord> methods,
                                      std::vector<std::string> extends = {})
{
    auto record = klass(std::move(name), std::move(methods), std::nullopt, std::move(extends));
    record.is_interface = true;
    record.is_abstract = true;
    return record;
}

inline program::ProgramModule module(std::string name, std::vector<program::ClassRecord> classes)
{
    return program::ProgramModule{.schema_version = "program.v1",
                                  .module = std::move(name),
                                  .classes = std::move(classes)};
}

/// Coverage line with instruction counters and optional branch counters.
inline coverage::CoverageLine line(const std::string& class_fqn,
                                   std::int32_t number,
                                   std::int32_t covered,
                                   std::int32_t total,
                                   std::int32_t branches_covered = 0,
                                   std::int32_t branches_total = 0)
{
    return coverage::CoverageLine::make(
               class_fqn,
               program::default_source_file(class_fqn),
               coverage::LineCounters{
                   .line = number,
                   .instructions = coverage::Counter{.total = total, .covered = covered},
                   .branches = coverage::Counter{.total = branches_total, .covered = branches_covered}})
        .value();
}

/**
 * demo.A.fuzz(byte[]) calls demo.B.work() from line 11.
 *
 *   A:  s0 (9) -> s1 (10) -> {s2 (11, call B.work), s3 (12)};  s2 -> s3
 *   B:  b0 (20) -> b1 (21) -> b2 (22) -> b3 (23) -> b4 (24)
 */
inline program::ProgramModule caller_callee_module()
{
    return module(
        "demo",
        {klass("demo.A",
               {method("fuzz",
                       {stmt("s0", 9, {"s1"}),
                        stmt("s1", 10, {"s2", "s3"}),
                        call_stmt("s2", 11, program::CallKind::kStatic, sig("demo.B", "work"), {"s3"}),
                        stmt("s3", 12)},
                       "void",
                       {"byte[]"})}),
         klass("demo.B",
               {method("work",
                       {stmt("b0", 20, {"b1"}),
                        stmt("b1", 21, {"b2"}),
                        stmt("b2", 22, {"b3"}),
                        stmt("b3", 23, {"b4"}),
                        stmt("b4", 24)})})});
}

/// Coverage of caller_callee_module(): line 10 is the only stuck point.
inline coverage::CoverageTable caller_callee_coverage()
{
    coverage::CoverageTable table;
    table.insert(line("demo.A", 9, 2, 2));
    table.insert(line("demo.A", 10, 1, 3, 1, 2));
    table.insert(line("demo.A", 11, 0, 1));
    table.insert(line("demo.A", 12, 0, 1));
    for (std::int32_t number = 20; number <= 24; ++number) {
        table.insert(line("demo.B", number, 0, 1));
    }
    return table;
}

}  // namespace stuckrank::test
