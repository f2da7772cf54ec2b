/// @file utils.cpp
/// @brief Logging and string helpers

#include <typesizes/utils.hpp>
#include <typesizes/config.hpp>

#include <cstdio>
#include <vector>

namespace typesizes {

namespace {

    void default_sink(LogLevel level, const std::string& message) {
#ifndef TYPESIZES_TESTING
        if (level == LogLevel::Info) {
            std::fprintf(stderr, "[typesizes] %s\n", message.c_str());
        } else {
            std::fprintf(stderr, "[typesizes] %s: %s\n", log_level_name(level), message.c_str());
        }
#else
        (void)level;
        (void)message;
#endif
    }

    LogSink& current_sink() {
        static LogSink sink = default_sink;
        return sink;
    }

    void vlog(LogLevel level, const char* fmt, va_list va) {
        current_sink()(level, vformat_string(fmt, va));
    }

} // anonymous namespace

void set_log_sink(LogSink sink) {
    current_sink() = sink ? std::move(sink) : LogSink(default_sink);
}

const char* log_level_name(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug:   return "debug";
        case LogLevel::Info:    return "info";
        case LogLevel::Warning: return "warning";
        case LogLevel::Error:   return "error";
        default:                return "???";
    }
}

void log_message(LogLevel level, const char* fmt, ...) {
    va_list va;
    va_start(va, fmt);
    vlog(level, fmt, va);
    va_end(va);
}

void log_debug(const char* fmt, ...) {
    if (!Config::instance().debug_mode()) {
        return;
    }
    va_list va;
    va_start(va, fmt);
    vlog(LogLevel::Debug, fmt, va);
    va_end(va);
}

void log_info(const char* fmt, ...) {
    va_list va;
    va_start(va, fmt);
    vlog(LogLevel::Info, fmt, va);
    va_end(va);
}

void log_warning(const char* fmt, ...) {
    va_list va;
    va_start(va, fmt);
    vlog(LogLevel::Warning, fmt, va);
    va_end(va);
}

void log_error(const char* fmt, ...) {
    va_list va;
    va_start(va, fmt);
    vlog(LogLevel::Error, fmt, va);
    va_end(va);
}

std::string format_string(const char* fmt, ...) {
    va_list va;
    va_start(va, fmt);
    std::string result = vformat_string(fmt, va);
    va_end(va);
    return result;
}

std::string vformat_string(const char* fmt, va_list va) {
    va_list copy;
    va_copy(copy, va);
    const int needed = std::vsnprintf(nullptr, 0, fmt, copy);
    va_end(copy);
    if (needed <= 0) {
        return {};
    }

    std::vector<char> buf(static_cast<std::size_t>(needed) + 1);
    std::vsnprintf(buf.data(), buf.size(), fmt, va);
    return std::string(buf.data(), static_cast<std::size_t>(needed));
}

} // namespace typesizes
