#pragma once

#include <cstdarg>
#include <functional>
#include <string>
#include <string_view>

#if defined(__GNUC__) || defined(__clang__)
#define TYPESIZES_PRINTF(fmt_idx, args_idx) __attribute__((format(printf, fmt_idx, args_idx)))
#else
#define TYPESIZES_PRINTF(fmt_idx, args_idx)
#endif

namespace typesizes {

// ============================================================================
// Logging
// ============================================================================

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

/// Receives every formatted message (without prefix or trailing newline)
using LogSink = std::function<void(LogLevel, const std::string&)>;

/// Install a message sink. An empty sink restores the default one, which
/// writes "[typesizes] ..." lines to stderr (or discards them in test builds).
void set_log_sink(LogSink sink);

[[nodiscard]] const char* log_level_name(LogLevel level) noexcept;

/// Emit at `level` unconditionally, for callers that gate debug output themselves
void log_message(LogLevel level, const char* fmt, ...) TYPESIZES_PRINTF(2, 3);

/// Only emitted when debug mode is enabled in the configuration
void log_debug(const char* fmt, ...) TYPESIZES_PRINTF(1, 2);
void log_info(const char* fmt, ...) TYPESIZES_PRINTF(1, 2);
void log_warning(const char* fmt, ...) TYPESIZES_PRINTF(1, 2);
void log_error(const char* fmt, ...) TYPESIZES_PRINTF(1, 2);

// ============================================================================
// String Helpers
// ============================================================================

/// printf into a std::string
[[nodiscard]] std::string format_string(const char* fmt, ...) TYPESIZES_PRINTF(1, 2);
[[nodiscard]] std::string vformat_string(const char* fmt, va_list va);

/// Drop a trailing '\r' left over from CRLF input
[[nodiscard]] inline std::string_view strip_cr(std::string_view line) noexcept {
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }
    return line;
}

[[nodiscard]] inline bool starts_with(std::string_view s, std::string_view prefix) noexcept {
    return s.substr(0, prefix.size()) == prefix;
}

} // namespace typesizes
