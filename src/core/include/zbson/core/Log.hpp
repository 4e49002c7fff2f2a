/**
 * @file Log.hpp
 * @brief Diagnostic output of the codec.
 *
 * The codec logs through a static Log facade backed by a replaceable
 * ILogger. Tags name the emitting module ("codec", "registry"). The default
 * sink prints to stderr; its threshold starts at kInfo and can be set from
 * the ZBSON_LOG_LEVEL environment variable (debug, info, warn, error, off).
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef ZBSON_CORE_LOG_HPP
    #define ZBSON_CORE_LOG_HPP

    #include "Types.hpp"

    #include <optional>
    #include <string_view>

namespace zbson::core {

enum class LogLevel : u8 {
    kDebug = 0,
    kInfo,
    kWarn,
    kError,
    kOff
};

/**
 * @brief Parses a level name as accepted by ZBSON_LOG_LEVEL.
 *
 * Matching is case-insensitive. Returns std::nullopt for anything else.
 */
[[nodiscard]] std::optional<LogLevel> parseLogLevel(std::string_view name) noexcept;

class ILogger {
public:
    virtual ~ILogger() = default;

    /**
     * @param level   Severity, never kOff.
     * @param tag     Emitting module.
     * @param message Message body, without trailing newline.
     */
    virtual void write(LogLevel level, std::string_view tag, std::string_view message) = 0;
};

class Log final {
public:
    Log() = delete;

    /// @brief Installs @p logger; nullptr restores the stderr sink.
    ///        The logger is not owned and must outlive its installation.
    static void setLogger(ILogger *logger);

    static void setMinLevel(LogLevel level);
    [[nodiscard]] static LogLevel minLevel();

    /// @brief True when a message at @p level would reach the sink.
    [[nodiscard]] static bool enabled(LogLevel level);

    static void debug(std::string_view tag, std::string_view msg);
    static void info (std::string_view tag, std::string_view msg);
    static void warn (std::string_view tag, std::string_view msg);
    static void error(std::string_view tag, std::string_view msg);
};

} // namespace zbson::core

#endif // ZBSON_CORE_LOG_HPP
