#pragma once

/**
 * @file diagnostics.hpp
 * @brief Explicit, copyable diagnostics sink for pipeline stages
 *
 * Errors and warnings are always written; info and debug lines only when
 * verbose. A null stream silences everything.
 */

#include <cstdio>
#include <format>
#include <string>
#include <string_view>
#include <utility>

#if __has_include(<print>)
    #include <print>
#endif

namespace stuckrank {

enum class LogLevel { kError, kWarning, kInfo, kDebug };

class Diagnostics
{
public:
    Diagnostics() = default;

    explicit Diagnostics(std::FILE* stream, bool verbose = false) noexcept
        : m_stream(stream)
        , m_verbose(verbose)
    {}

    /// A sink that drops every line.
    [[nodiscard]] static Diagnostics silent() noexcept { return Diagnostics{nullptr, false}; }

    [[nodiscard]] bool verbose() const noexcept { return m_verbose; }
    [[nodiscard]] std::FILE* stream() const noexcept { return m_stream; }

    [[nodiscard]] bool enabled(LogLevel level) const noexcept
    {
        if (m_stream == nullptr) {
            return false;
        }
        return level == LogLevel::kError || level == LogLevel::kWarning || m_verbose;
    }

    template <typename... Args>
    void error(std::format_string<Args...> fmt, Args&&... args) const
    {
        emit(LogLevel::kError, std::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    void warn(std::format_string<Args...> fmt, Args&&... args) const
    {
        emit(LogLevel::kWarning, std::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    void info(std::format_string<Args...> fmt, Args&&... args) const
    {
        if (enabled(LogLevel::kInfo)) {
            emit(LogLevel::kInfo, std::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    void debug(std::format_string<Args...> fmt, Args&&... args) const
    {
        if (enabled(LogLevel::kDebug)) {
            emit(LogLevel::kDebug, std::format(fmt, std::forward<Args>(args)...));
        }
    }

private:
    // One write per line keeps lines from concurrent workers intact.
    void emit(LogLevel level, std::string text) const
    {
        if (!enabled(level)) {
            return;
        }
        std::string_view prefix;
        if (level == LogLevel::kError) {
            prefix = "ERROR: ";
        } else if (level == LogLevel::kWarning) {
            prefix = "WARNING: ";
        }
#if __has_include(<print>)
        std::println(m_stream, "{}{}", prefix, text);
#else
        text.insert(0, prefix);
        text.push_back('\n');
        std::fwrite(text.data(), 1, text.size(), m_stream);
#endif
    }

    std::FILE* m_stream = stderr;
    bool m_verbose = false;
};

}  // namespace stuckrank
