#pragma once

/**
 * @file require_cpp23.hpp
 * @brief C++23 feature-test checks for stuckrank
 *
 * Include this header early in a translation unit (main.cpp does) to get a
 * clear diagnostic when the toolchain is insufficient.
 *
 * Required compiler versions:
 *   - GCC 13.0+
 *   - Clang 17.0+
 */

#include <expected>
#include <version>

// =============================================================================
// C++23 Language Standard Check
// =============================================================================

#if !defined(__cplusplus) || __cplusplus < 202'100L
    #error "stuckrank requires C++23 or later."
#endif

// =============================================================================
// std::expected (__cpp_lib_expected)
// =============================================================================
// Required for: Result<T> error propagation

#if !defined(__cpp_lib_expected) || __cpp_lib_expected < 202'202L
    #error "stuckrank requires std::expected (__cpp_lib_expected >= 202202L)."
#endif

// =============================================================================
// std::format (__cpp_lib_format)
// =============================================================================
// Required for: diagnostics and report text

#if !defined(__cpp_lib_format) || __cpp_lib_format < 201'907L
    #error "stuckrank requires std::format (__cpp_lib_format >= 201907L)."
#endif

// =============================================================================
// std::to_underlying (__cpp_lib_to_underlying)
// =============================================================================
// Required for: StmtRef / MethodRef / ClassRef arena indices

#if !defined(__cpp_lib_to_underlying) || __cpp_lib_to_underlying < 202'102L
    #error "stuckrank requires std::to_underlying (__cpp_lib_to_underlying >= 202102L)."
#endif

// =============================================================================
// std::jthread (__cpp_lib_jthread)
// =============================================================================
// Required for: scoring worker pool

#if !defined(__cpp_lib_jthread) || __cpp_lib_jthread < 201'911L
    #error "stuckrank requires std::jthread (__cpp_lib_jthread >= 201911L)."
#endif

// =============================================================================
// std::ranges (__cpp_lib_ranges)
// =============================================================================

#if !defined(__cpp_lib_ranges) || __cpp_lib_ranges < 201'911L
    #error "stuckrank requires std::ranges (__cpp_lib_ranges >= 201911L)."
#endif

#define STUCKRANK_CPP23_FEATURES_VERIFIED 1
