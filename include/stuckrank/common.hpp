#pragma once

/**
 * @file common.hpp
 * @brief Error type, Result aliases and strongly typed program identifiers
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <utility>

namespace stuckrank {

/**
 * @brief Error information for Result types
 */
struct Error
{
    std::string code;     ///< Machine-readable error code
    std::string message;  ///< Human-readable error message

    [[nodiscard]] static Error make(std::string code, std::string message)
    {
        return Error{.code = std::move(code), .message = std::move(message)};
    }
};

/**
 * @brief Result type using std::expected (C++23)
 * @tparam T Success value type
 */
template <typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Result type for void success using std::expected (C++23)
 */
using VoidResult = std::expected<void, Error>;

// ============================================================================
// Program identifiers
// ============================================================================
//
// Statements, methods and classes live in arenas owned by the ProgramView.
// The identifiers below are indices into those arenas; they are only
// meaningful together with the view that issued them.

enum class StmtRef : std::uint32_t {};
enum class MethodRef : std::uint32_t {};
enum class ClassRef : std::uint32_t {};

[[nodiscard]] constexpr std::size_t index_of(StmtRef ref) noexcept
{
    return static_cast<std::size_t>(std::to_underlying(ref));
}

[[nodiscard]] constexpr std::size_t index_of(MethodRef ref) noexcept
{
    return static_cast<std::size_t>(std::to_underlying(ref));
}

[[nodiscard]] constexpr std::size_t index_of(ClassRef ref) noexcept
{
    return static_cast<std::size_t>(std::to_underlying(ref));
}

}  // namespace stuckrank
