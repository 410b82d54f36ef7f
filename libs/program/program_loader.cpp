/**
 * @file program_loader.cpp
 * @brief Loading program.v1 files with per-binary failure isolation
 */

#include "stuckrank/parallel.hpp"
#include "stuckrank/program.hpp"
#include "stuckrank/schema_validate.hpp"
#include "stuckrank/version.hpp"

#include "common/json_fields.hpp"

#include <utility>

namespace stuckrank::program {

Result<ProgramModule> read_program_module(const std::filesystem::path& path,
                                          std::string_view schema_dir)
{
    auto doc = common::read_json_file(path);
    if (!doc) {
        return std::unexpected(doc.error());
    }
    if (auto valid = common::validate_document(*doc, schema_dir, kProgramSchemaVersion); !valid) {
        return std::unexpected(valid.error());
    }
    return parse_program_module(*doc);
}

LoadedProgram load_program(std::span<const std::filesystem::path> binaries,
                           const LoadOptions& options)
{
    std::vector<Result<ProgramModule>> slots(binaries.size(),
                                             std::unexpected(Error::make("Internal", "not loaded")));
    parallel_for(binaries.size(), options.jobs, [&](std::size_t i) {
        slots[i] = read_program_module(binaries[i], options.schema_dir);
    });

    LoadSummary summary;
    summary.total_binaries = binaries.size();
    std::vector<ProgramModule> modules;
    modules.reserve(binaries.size());
    for (std::size_t i = 0; i < binaries.size(); ++i) {
        if (!slots[i]) {
            options.diagnostics.warn("Failed to load binary {}: {}: {}", binaries[i].string(),
                                     slots[i].error().code, slots[i].error().message);
            summary.failures.push_back(BinaryFailure{.binary = binaries[i].string(),
                                                     .code = slots[i].error().code,
                                                     .message = slots[i].error().message});
            ++summary.failure_count;
            continue;
        }
        ++summary.success_count;
        modules.push_back(std::move(*slots[i]));
    }

    auto view = ProgramView::build(modules);
    summary.duplicate_classes = view.duplicate_classes();
    for (const auto& name : summary.duplicate_classes) {
        options.diagnostics.warn("Class {} is defined by more than one binary; keeping the first",
                                 name);
    }
    options.diagnostics.info("[load] {} successful, {} failed out of {} binaries",
                             summary.success_count, summary.failure_count, summary.total_binaries);
    return LoadedProgram{.view = std::move(view), .summary = std::move(summary)};
}

}  // namespace stuckrank::program
