/**
 * @file Log.cpp
 * @brief stderr sink and level threshold of the Log facade.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#include "zbson/core/Log.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdio>
#include <cstdlib>

namespace zbson::core {

namespace {

constexpr std::array<std::string_view, 5> kLevelNames = {
    "debug", "info", "warn", "error", "off"
};

class StderrLogger final : public ILogger {
public:
    void write(LogLevel level, std::string_view tag, std::string_view message) override
    {
        std::fprintf(
            stderr,
            "zbson %-5.*s %.*s: %.*s\n",
            static_cast<int>(kLevelNames[static_cast<usize>(level)].size()),
            kLevelNames[static_cast<usize>(level)].data(),
            static_cast<int>(tag.size()), tag.data(),
            static_cast<int>(message.size()), message.data()
        );
    }
};

LogLevel initialLevel()
{
    if (const char *env = std::getenv("ZBSON_LOG_LEVEL"))
    {
        if (const auto level = parseLogLevel(env))
            return *level;
    }
    return LogLevel::kInfo;
}

StderrLogger gDefaultLogger;
ILogger     *gActiveLogger = &gDefaultLogger;
LogLevel     gMinLevel     = initialLevel();

void dispatch(LogLevel level, std::string_view tag, std::string_view msg)
{
    if (!Log::enabled(level))
        return;
    gActiveLogger->write(level, tag, msg);
}

} // anonymous namespace

std::optional<LogLevel> parseLogLevel(std::string_view name) noexcept
{
    const auto matches = [name](std::string_view candidate) {
        return std::ranges::equal(name, candidate, [](char a, char b) {
            return std::tolower(static_cast<unsigned char>(a)) == b;
        });
    };

    for (usize i = 0; i < kLevelNames.size(); ++i)
    {
        if (matches(kLevelNames[i]))
            return static_cast<LogLevel>(i);
    }
    return std::nullopt;
}

void Log::setLogger(ILogger *logger)  { gActiveLogger = logger ? logger : &gDefaultLogger; }
void Log::setMinLevel(LogLevel level) { gMinLevel = level; }
LogLevel Log::minLevel()              { return gMinLevel; }

bool Log::enabled(LogLevel level)
{
    return level != LogLevel::kOff && level >= gMinLevel;
}

void Log::debug(std::string_view tag, std::string_view msg) { dispatch(LogLevel::kDebug, tag, msg); }
void Log::info (std::string_view tag, std::string_view msg) { dispatch(LogLevel::kInfo,  tag, msg); }
void Log::warn (std::string_view tag, std::string_view msg) { dispatch(LogLevel::kWarn,  tag, msg); }
void Log::error(std::string_view tag, std::string_view msg) { dispatch(LogLevel::kError, tag, msg); }

} // namespace zbson::core
