// /////////////////////////////////////////////////////////////////////////////
/// @file Config.hpp
/// @brief Server configuration (Builder pattern).
///
/// Immutable configuration object constructed via a fluent Builder.
/// Centralises all tuneable parameters.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <rein/core/Constants.hpp>
#include <rein/core/Log.hpp>
#include <rein/core/Types.hpp>

namespace rein::engine {

/// @brief Immutable server configuration.
class Config
{
public:
    /// @brief Fluent builder for Config.
    class Builder
    {
    public:
        Builder& logLevel(core::LogLevel level) noexcept;
        Builder& maxSessions(core::u32 n) noexcept;
        Builder& dedupWindowFactor(core::f64 factor) noexcept;

        [[nodiscard]] Config build() const noexcept;

    private:
        core::LogLevel logLevel_{core::LogLevel::kInfo};
        core::u32      maxSessions_{core::kMaxSessions};
        core::f64      dedupWindowFactor_{core::kDedupWindowFactor};
    };

    [[nodiscard]] core::LogLevel logLevel()          const noexcept { return logLevel_; }
    [[nodiscard]] core::u32      maxSessions()       const noexcept { return maxSessions_; }
    [[nodiscard]] core::f64      dedupWindowFactor() const noexcept { return dedupWindowFactor_; }

private:
    friend class Builder;

    core::LogLevel logLevel_{core::LogLevel::kInfo};
    core::u32      maxSessions_{core::kMaxSessions};
    core::f64      dedupWindowFactor_{core::kDedupWindowFactor};
};

} // namespace rein::engine
