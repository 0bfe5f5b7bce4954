/**
 * @file Log.hpp
 * @brief Minimal logging façade with runtime severity filtering.
 *
 * Provides a static Log class backed by an injectable ILogger interface.
 * The default implementation writes to stderr.  A custom logger can be
 * installed via Log::setLogger() at startup (tests install a capturing
 * sink).  Call sites format their message with std::format.
 *
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */
#pragma once

#ifndef ZYPPY_CORE_LOG_HPP
    #define ZYPPY_CORE_LOG_HPP

    #include "Expected.hpp"
    #include "Types.hpp"

    #include <string_view>

namespace zyppy::core {

/**
 * @brief Severity levels for log messages.
 */
enum class LogLevel : u8 {
    kDebug = 0,
    kInfo,
    kWarn,
    kError,
    kFatal
};

/**
 * @brief Parses "debug", "info", "warn", "error" or "fatal".
 * @return The level, or kInvalidArgument for any other spelling.
 */
[[nodiscard]] Expected<LogLevel> parseLogLevel(std::string_view name);

/**
 * @brief Abstract sink for log messages.
 */
class ILogger {
public:
    virtual ~ILogger() = default;

    /**
     * @brief Write a log entry.
     * @param level   Severity.
     * @param tag     Subsystem tag (e.g. "queue", "worker", "bridge").
     * @param message Formatted message body.
     */
    virtual void write(LogLevel level, std::string_view tag, std::string_view message) = 0;
};

/**
 * @brief Static logging façade used throughout zyppy.
 *
 * All methods are thread-safe provided the installed ILogger is thread-safe.
 * The default stderr logger serializes its writes.
 */
class Log final {
public:
    Log() = delete;

    static void setLogger(ILogger *logger);
    static void setMinLevel(LogLevel level);
    [[nodiscard]] static LogLevel minLevel();

    static void debug(std::string_view tag, std::string_view msg);
    static void info (std::string_view tag, std::string_view msg);
    static void warn (std::string_view tag, std::string_view msg);
    static void error(std::string_view tag, std::string_view msg);
    static void fatal(std::string_view tag, std::string_view msg);

    static void debug(std::string_view msg) { debug("zyppy", msg); }
    static void info (std::string_view msg) { info ("zyppy", msg); }
    static void warn (std::string_view msg) { warn ("zyppy", msg); }
    static void error(std::string_view msg) { error("zyppy", msg); }
    static void fatal(std::string_view msg) { fatal("zyppy", msg); }
};

} // namespace zyppy::core

#endif // ZYPPY_CORE_LOG_HPP
