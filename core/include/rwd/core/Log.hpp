/**
 * @file Log.hpp
 * @brief Tick-stamped logging with runtime severity filtering.
 *
 * Every record carries the simulation tick that was current when it was
 * emitted, so lines written while a rollback replays past ticks can be
 * told apart from lines of the live frame. The fixed schedule stamps the
 * tick through Log::stampTick() before running its systems.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */
#pragma once

#ifndef RWD_CORE_LOG_HPP
    #define RWD_CORE_LOG_HPP

    #include "Types.hpp"

    #include <optional>
    #include <string_view>

namespace rwd::core {

enum class LogLevel : u8 {
    kDebug = 0,
    kInfo,
    kWarn,
    kError
};

/**
 * @brief One log line as handed to a sink.
 */
struct LogRecord {
    LogLevel           level;
    std::string_view   tag;     ///< Subsystem, e.g. "rollback" or "ecs".
    std::string_view   message;
    std::optional<u16> tick;    ///< Unset before the first fixed tick.
};

/**
 * @brief Destination for log records. Must be thread-safe when systems
 *        log from pool workers.
 */
class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void write(const LogRecord &record) = 0;
};

class Log final {
public:
    Log() = delete;

    /** @brief Installs @p sink; nullptr restores the stderr sink. */
    static void setSink(ILogSink *sink);
    static void setMinLevel(LogLevel level);
    [[nodiscard]] static LogLevel minLevel();

    /** @brief Sets the tick stamped on subsequent records. */
    static void stampTick(u16 tick);
    static void clearTick();

    static void debug(std::string_view tag, std::string_view msg);
    static void info (std::string_view tag, std::string_view msg);
    static void warn (std::string_view tag, std::string_view msg);
    static void error(std::string_view tag, std::string_view msg);
};

} // namespace rwd::core

#endif // RWD_CORE_LOG_HPP
