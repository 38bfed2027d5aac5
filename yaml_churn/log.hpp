/**
 * @file log.hpp
 * @brief Level-filtered diagnostic logging for yaml_churn, formatted with {fmt}.
 *
 * The scanner traces tokens, the parser traces events, and the loader and input
 * layers report recoverable oddities (ignored directives, duplicate keys kept under
 * a lenient policy, repaired encodings). Nothing is formatted unless the message
 * passes the threshold.
 *
 * The threshold starts at Warning and may be overridden with the environment
 * variable `YAML_CHURN_LOG` (trace, debug, info, warning, error, none).
 */

#ifndef YAML_CHURN_LOG_HPP
#define YAML_CHURN_LOG_HPP

#include <cstdio>
#include <cstdlib>
#include <functional>
#include <string_view>
#include <utility>

#include <fmt/core.h>

namespace Churn {
namespace Log {

/** Severity of a log message. */
enum class Level {
    Trace,
    Debug,
    Info,
    Warning,
    Error,
    None     ///< Threshold only: suppresses everything.
};

/** @brief Receives every message that passes the threshold. */
using Sink = std::function<void(Level, std::string_view)>;

/** @brief Short lower-case name of a level, as accepted by `YAML_CHURN_LOG`. */
inline std::string_view LevelName(Level level) noexcept {
    switch (level) {
        case Level::Trace:   return "trace";
        case Level::Debug:   return "debug";
        case Level::Info:    return "info";
        case Level::Warning: return "warning";
        case Level::Error:   return "error";
        case Level::None:    return "none";
    }
    return "unknown";
}

/// @cond INTERNAL
namespace detail {

inline Level LevelFromEnvironment() {
    const char* env = std::getenv("YAML_CHURN_LOG");
    if (!env)
        return Level::Warning;
    std::string_view v(env);
    for (Level l : {Level::Trace, Level::Debug, Level::Info, Level::Warning, Level::Error, Level::None})
        if (v == LevelName(l))
            return l;
    return Level::Warning;
}

inline Level& Threshold() {
    static Level threshold = LevelFromEnvironment();
    return threshold;
}

inline Sink& CurrentSink() {
    static Sink sink = [](Level level, std::string_view message) {
        fmt::print(stderr, "[yaml_churn:{}] {}\n", LevelName(level), message);
    };
    return sink;
}

} // namespace detail
/// @endcond

/** @brief Change the minimum level that reaches the sink. */
inline void SetThreshold(Level level) noexcept { detail::Threshold() = level; }

/** @brief Current minimum level. */
inline Level GetThreshold() noexcept { return detail::Threshold(); }

/**
 * @brief Replace the output sink.
 * @param sink New sink; an empty function restores the stderr default.
 */
inline void SetSink(Sink sink) {
    if (!sink) {
        detail::CurrentSink() = [](Level level, std::string_view message) {
            fmt::print(stderr, "[yaml_churn:{}] {}\n", LevelName(level), message);
        };
        return;
    }
    detail::CurrentSink() = std::move(sink);
}

/** @brief Whether a message at `level` would be delivered. */
inline bool Enabled(Level level) noexcept {
    return level != Level::None && level >= detail::Threshold();
}

inline void WriteFmtArgs(Level level, fmt::string_view format, fmt::format_args args) {
    detail::CurrentSink()(level, fmt::vformat(format, args));
}

template<typename... T>
inline void Write(Level level, fmt::format_string<T...> format, T&&... args) {
    if (!Enabled(level))
        return;
    WriteFmtArgs(level, format, fmt::make_format_args(args...));
}

template<typename... T> inline void Trace(fmt::format_string<T...> f, T&&... args)   { Write(Level::Trace, f, std::forward<T>(args)...); }
template<typename... T> inline void Debug(fmt::format_string<T...> f, T&&... args)   { Write(Level::Debug, f, std::forward<T>(args)...); }
template<typename... T> inline void Info(fmt::format_string<T...> f, T&&... args)    { Write(Level::Info, f, std::forward<T>(args)...); }
template<typename... T> inline void Warning(fmt::format_string<T...> f, T&&... args) { Write(Level::Warning, f, std::forward<T>(args)...); }
template<typename... T> inline void Error(fmt::format_string<T...> f, T&&... args)   { Write(Level::Error, f, std::forward<T>(args)...); }

} // namespace Log
} // namespace Churn

#endif // YAML_CHURN_LOG_HPP
