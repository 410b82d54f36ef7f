#pragma once

/**
 * @file version.hpp
 * @brief stuckrank version information
 *
 * Naming convention: kPascalCase for constants (Google C++ Style Guide)
 */

namespace stuckrank {

/// Tool name embedded in reports
constexpr const char* kToolName = "stuckrank";

/// stuckrank version string
constexpr const char* kVersion = "0.3.0";

/// Build identifier
constexpr const char* kBuildId = "dev";

/// Document schema versions
constexpr const char* kProgramSchemaVersion = "program.v1";
constexpr const char* kExecDataSchemaVersion = "execdata.v1";
constexpr const char* kReportSchemaVersion = "stuck_points.v1";

/// Identifies the scoring algorithm in report metadata
constexpr const char* kAnalysisType = "coverage+cha-icfg";

}  // namespace stuckrank
