// /////////////////////////////////////////////////////////////////////////////
/// @file Config.cpp
/// @brief Config::Builder implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <rein/engine/Config.hpp>

namespace rein::engine {

Config::Builder& Config::Builder::logLevel(core::LogLevel level) noexcept
{
    logLevel_ = level;
    return *this;
}

Config::Builder& Config::Builder::maxSessions(core::u32 n) noexcept
{
    maxSessions_ = n;
    return *this;
}

Config::Builder& Config::Builder::dedupWindowFactor(core::f64 factor) noexcept
{
    dedupWindowFactor_ = factor;
    return *this;
}

Config Config::Builder::build() const noexcept
{
    Config cfg;
    cfg.logLevel_          = logLevel_;
    cfg.maxSessions_       = maxSessions_;
    cfg.dedupWindowFactor_ = dedupWindowFactor_;
    return cfg;
}

} // namespace rein::engine
