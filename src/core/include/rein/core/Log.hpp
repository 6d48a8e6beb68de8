/**
 * @file Log.hpp
 * @brief Process-wide log façade for the rein modules.
 *
 * Every module reports through Log with a subsystem tag:
 *   - "CTRL"    composite construction, duplicate suppression, evictions
 *   - "SESSION" player connect / disconnect and unknown session ids
 *   - "ENTITY"  unrecognised character commands
 *   - "SERVER"  group links and the console front-end
 *
 * Messages below the minimum level (Info by default, set from
 * engine::Config by the Server) are dropped before reaching the sink.
 * The sink writes "[LEVEL][TAG] message" lines to stderr unless a test or
 * embedding application installs its own ILogger.
 *
 * @copyright MIT License
 */
#pragma once

#ifndef REIN_CORE_LOG_HPP
    #define REIN_CORE_LOG_HPP

    #include "Types.hpp"

    #include <string_view>

namespace rein::core {

/**
 * @brief Severity of a log entry, lowest first.
 */
enum class LogLevel : u8 {
    kDebug = 0,
    kInfo,
    kWarn,
    kError,
    kFatal
};

/**
 * @brief Destination of log entries that passed the level filter.
 *
 * Not owned by Log; an installed sink must outlive its installation.
 */
class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void write(LogLevel level, std::string_view tag, std::string_view message) = 0;
};

/**
 * @brief Static entry point; not instantiable.
 */
class Log final {
public:
    Log() = delete;

    /// Installs @p logger; nullptr restores the stderr sink.
    static void setLogger(ILogger *logger);
    static void setMinLevel(LogLevel level);
    [[nodiscard]] static LogLevel minLevel();

    static void debug(std::string_view tag, std::string_view msg);
    static void info (std::string_view tag, std::string_view msg);
    static void warn (std::string_view tag, std::string_view msg);
    static void error(std::string_view tag, std::string_view msg);
    static void fatal(std::string_view tag, std::string_view msg);

    // Untagged entries are filed under "rein".
    static void debug(std::string_view msg) { debug("rein", msg); }
    static void info (std::string_view msg) { info ("rein", msg); }
    static void warn (std::string_view msg) { warn ("rein", msg); }
    static void error(std::string_view msg) { error("rein", msg); }
    static void fatal(std::string_view msg) { fatal("rein", msg); }
};

} // namespace rein::core

#endif // REIN_CORE_LOG_HPP
