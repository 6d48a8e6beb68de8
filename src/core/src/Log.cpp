/**
 * @file Log.cpp
 * @brief Level filter and default stderr sink behind core::Log.
 *
 * @copyright MIT License
 */
#include "rein/core/Log.hpp"

#include <array>
#include <cstdio>

namespace rein::core {

namespace {

constexpr std::array<std::string_view, 5> kLevelNames{
    "DEBUG", "INFO ", "WARN ", "ERROR", "FATAL"
};

class StderrSink final : public ILogger {
public:
    void write(LogLevel level, std::string_view tag, std::string_view message) override
    {
        const std::string_view name = kLevelNames[static_cast<usize>(level)];
        std::fprintf(stderr, "[%.*s][%.*s] %.*s\n",
                     static_cast<int>(name.size()), name.data(),
                     static_cast<int>(tag.size()), tag.data(),
                     static_cast<int>(message.size()), message.data());
    }
};

struct LogState {
    StderrSink fallback;
    ILogger   *sink     = &fallback;
    LogLevel   minLevel = LogLevel::kInfo;
};

LogState &state()
{
    static LogState instance;
    return instance;
}

void emit(LogLevel level, std::string_view tag, std::string_view msg)
{
    LogState &s = state();
    if (level >= s.minLevel)
        s.sink->write(level, tag, msg);
}

} // namespace

void Log::setLogger(ILogger *logger)
{
    LogState &s = state();
    s.sink = logger != nullptr ? logger : &s.fallback;
}

void     Log::setMinLevel(LogLevel level) { state().minLevel = level; }
LogLevel Log::minLevel()                  { return state().minLevel; }

void Log::debug(std::string_view tag, std::string_view msg) { emit(LogLevel::kDebug, tag, msg); }
void Log::info (std::string_view tag, std::string_view msg) { emit(LogLevel::kInfo,  tag, msg); }
void Log::warn (std::string_view tag, std::string_view msg) { emit(LogLevel::kWarn,  tag, msg); }
void Log::error(std::string_view tag, std::string_view msg) { emit(LogLevel::kError, tag, msg); }
void Log::fatal(std::string_view tag, std::string_view msg) { emit(LogLevel::kFatal, tag, msg); }

} // namespace rein::core
