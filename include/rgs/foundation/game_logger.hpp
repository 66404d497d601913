#pragma once

/// @file game_logger.hpp
/// @brief GameLogger wrapping kcenon common_system logger interfaces.
///
/// Provides category-based filtering, structured logging with context,
/// and per-category runtime log level control.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "rgs/foundation/game_result.hpp"

namespace rgs::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally.
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Log categories, one per subsystem.
enum class LogCategory : uint8_t {
    Core       = 0, ///< Process-level events
    Registry   = 1, ///< Entity membership (add/remove/evict)
    Identity   = 2, ///< Id allocation
    Snapshot   = 3, ///< Live -> snapshot commits
    Visibility = 4, ///< Spawn/destroy/update reconciliation
    Region     = 5, ///< Region tick loop
    Config     = 6, ///< Configuration loading
    Thread     = 7  ///< Job scheduling
};

inline constexpr std::size_t kLogCategoryCount = 8;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Registry", "Identity", "Snapshot",
        "Visibility", "Region", "Config", "Thread"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Parse a level name ("trace", "DEBUG", "warning", ...), case-insensitive.
std::optional<LogLevel> parseLogLevel(std::string_view name);

/// Parse a category name ("registry", "Visibility", ...), case-insensitive.
std::optional<LogCategory> parseLogCategory(std::string_view name);

/// Structured context attached to a log entry.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.entityId = entity.id();
///   ctx.extra["block"] = "12,64,-3";
///   logger.logWithContext(LogLevel::Info, LogCategory::Registry,
///                         "block entity evicted", ctx);
/// @endcode
struct LogContext {
    std::optional<int32_t> entityId;
    std::optional<std::string> region;
    std::optional<uint64_t> tick;
    std::unordered_map<std::string, std::string> extra;
};

/// Category-aware logger forwarding to kcenon's GlobalLoggerRegistry.
///
/// Uses PIMPL so kcenon headers stay out of the public API.
///
/// Default log levels per category:
/// | Category   | Default Level |
/// |------------|---------------|
/// | Core       | Info          |
/// | Registry   | Debug         |
/// | Identity   | Info          |
/// | Snapshot   | Info          |
/// | Visibility | Info          |
/// | Region     | Info          |
/// | Config     | Info          |
/// | Thread     | Warning       |
class GameLogger {
public:
    GameLogger();
    ~GameLogger();

    GameLogger(const GameLogger&) = delete;
    GameLogger& operator=(const GameLogger&) = delete;
    GameLogger(GameLogger&&) noexcept;
    GameLogger& operator=(GameLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured context appended as key=value pairs.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush all buffered log messages.
    GameResult<void> flush();

    /// Process-wide logger used by the RGS_LOG macros.
    static GameLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace rgs::foundation

// ---------------------------------------------------------------------------
// Convenience macros (defined at global scope)
// ---------------------------------------------------------------------------

/// RGS_MIN_LOG_LEVEL can be defined before including this header to
/// eliminate logging calls below the threshold at compile time.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off

#ifndef RGS_MIN_LOG_LEVEL
    #define RGS_MIN_LOG_LEVEL 0
#endif

#define RGS_LOG(level, cat, msg)                                                 \
    do {                                                                         \
        _Pragma("GCC diagnostic push")                                           \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                      \
        if (static_cast<int>(level) >= RGS_MIN_LOG_LEVEL &&                      \
            ::rgs::foundation::GameLogger::instance().isEnabled((level), (cat)))  \
        {                                                                        \
            ::rgs::foundation::GameLogger::instance().log((level), (cat), (msg)); \
        }                                                                        \
        _Pragma("GCC diagnostic pop")                                            \
    } while (0)

#define RGS_LOG_TRACE(cat, msg) \
    RGS_LOG(::rgs::foundation::LogLevel::Trace, (cat), (msg))

#define RGS_LOG_DEBUG(cat, msg) \
    RGS_LOG(::rgs::foundation::LogLevel::Debug, (cat), (msg))

#define RGS_LOG_INFO(cat, msg) \
    RGS_LOG(::rgs::foundation::LogLevel::Info, (cat), (msg))

#define RGS_LOG_WARN(cat, msg) \
    RGS_LOG(::rgs::foundation::LogLevel::Warning, (cat), (msg))

#define RGS_LOG_ERROR(cat, msg) \
    RGS_LOG(::rgs::foundation::LogLevel::Error, (cat), (msg))

#define RGS_LOG_CRITICAL(cat, msg) \
    RGS_LOG(::rgs::foundation::LogLevel::Critical, (cat), (msg))
