/// @file log.hpp
/// @brief Levelled diagnostic logging for jsonpatch-cpp.
///
/// Messages are formatted with {fmt} and handed to a process-wide sink.
/// The default sink writes `[LEVEL] file:line message` to std::clog.
///
/// @code
/// jsonpatch_cpp::log::set_level(jsonpatch_cpp::log::Level::debug);
/// JSONPATCH_CPP_LOG_DEBUG("skipped {} at {}", op_name, path);
/// @endcode

#pragma once

#include <fmt/format.h>

#include <cstdint>
#include <functional>
#include <string_view>
#include <utility>

namespace jsonpatch_cpp::log {

/// Verbosity levels, least verbose first.
enum class Level : std::uint8_t {
    off,
    error,
    warning,
    info,
    debug,
};

/// Convert a Level to its string representation.
constexpr auto to_string_view(Level level) noexcept -> std::string_view {
    switch (level) {
        case Level::off:     return "OFF";
        case Level::error:   return "ERROR";
        case Level::warning: return "WARNING";
        case Level::info:    return "INFO";
        case Level::debug:   return "DEBUG";
    }
    return "UNKNOWN";
}

/// A log record as delivered to a sink.
struct Record {
    Level level;
    std::string_view file;  ///< Trimmed source file name.
    int line;
    std::string_view message;
};

using Sink = std::function<void(const Record&)>;

/// Set the most verbose level that is still emitted. Default: warning.
void set_level(Level level) noexcept;

/// The current level.
auto level() noexcept -> Level;

/// Check if a message at @p l would be emitted.
inline auto enabled(Level l) noexcept -> bool {
    return l != Level::off && l <= level();
}

/// Replace the sink. An empty function restores the std::clog sink.
void set_sink(Sink sink);

/// Deliver an already formatted message to the sink.
void write(Level level, const char* file, int line, std::string_view message);

template <typename... Args>
void log(Level l, const char* file, int line,
         fmt::format_string<Args...> format, Args&&... args) {
    if (!enabled(l)) return;
    write(l, file, line, fmt::format(format, std::forward<Args>(args)...));
}

}  // namespace jsonpatch_cpp::log

// The level is checked before the arguments are evaluated, so a
// disabled message costs one atomic load.
#define JSONPATCH_CPP_LOG_AT(lvl, ...)                                           \
    do {                                                                         \
        if (::jsonpatch_cpp::log::enabled(lvl)) {                                \
            ::jsonpatch_cpp::log::log(lvl, __FILE__, __LINE__, __VA_ARGS__);     \
        }                                                                        \
    } while (false)

#define JSONPATCH_CPP_LOG_ERROR(...) \
    JSONPATCH_CPP_LOG_AT(::jsonpatch_cpp::log::Level::error, __VA_ARGS__)
#define JSONPATCH_CPP_LOG_WARN(...) \
    JSONPATCH_CPP_LOG_AT(::jsonpatch_cpp::log::Level::warning, __VA_ARGS__)
#define JSONPATCH_CPP_LOG_INFO(...) \
    JSONPATCH_CPP_LOG_AT(::jsonpatch_cpp::log::Level::info, __VA_ARGS__)
#define JSONPATCH_CPP_LOG_DEBUG(...) \
    JSONPATCH_CPP_LOG_AT(::jsonpatch_cpp::log::Level::debug, __VA_ARGS__)
