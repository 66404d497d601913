/// @file game_logger.cpp
/// @brief GameLogger implementation forwarding to kcenon common_system.

#include "rgs/foundation/game_logger.hpp"

// kcenon logger headers (hidden behind PIMPL)
#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <sstream>
#include <string>

namespace rgs::foundation {

namespace kci = kcenon::common::interfaces;

// ---------------------------------------------------------------------------
// Level mapping: RGS -> kcenon
// ---------------------------------------------------------------------------
static kci::log_level mapLevel(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return kci::log_level::trace;
        case LogLevel::Debug:    return kci::log_level::debug;
        case LogLevel::Info:     return kci::log_level::info;
        case LogLevel::Warning:  return kci::log_level::warning;
        case LogLevel::Error:    return kci::log_level::error;
        case LogLevel::Critical: return kci::log_level::critical;
        case LogLevel::Off:      return kci::log_level::off;
    }
    return kci::log_level::info;
}

static constexpr std::array<LogLevel, kLogCategoryCount> kDefaultCategoryLevels = {
    LogLevel::Info,    // Core
    LogLevel::Debug,   // Registry
    LogLevel::Info,    // Identity
    LogLevel::Info,    // Snapshot
    LogLevel::Info,    // Visibility
    LogLevel::Info,    // Region
    LogLevel::Info,    // Config
    LogLevel::Warning  // Thread
};

static std::string toLower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

std::optional<LogLevel> parseLogLevel(std::string_view name) {
    const auto lowered = toLower(name);
    for (uint8_t i = 0; i <= static_cast<uint8_t>(LogLevel::Off); ++i) {
        auto level = static_cast<LogLevel>(i);
        if (toLower(logLevelName(level)) == lowered) {
            return level;
        }
    }
    if (lowered == "warn") {
        return LogLevel::Warning;
    }
    return std::nullopt;
}

std::optional<LogCategory> parseLogCategory(std::string_view name) {
    const auto lowered = toLower(name);
    for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
        auto cat = static_cast<LogCategory>(i);
        if (toLower(logCategoryName(cat)) == lowered) {
            return cat;
        }
    }
    return std::nullopt;
}

static std::string formatContext(const LogContext& ctx) {
    std::ostringstream oss;
    bool first = true;

    auto append = [&](std::string_view key, std::string_view val) {
        if (!first) {
            oss << ", ";
        }
        oss << key << '=' << val;
        first = false;
    };

    if (ctx.entityId) {
        append("entity_id", std::to_string(*ctx.entityId));
    }
    if (ctx.region && !ctx.region->empty()) {
        append("region", *ctx.region);
    }
    if (ctx.tick) {
        append("tick", std::to_string(*ctx.tick));
    }
    for (const auto& [key, val] : ctx.extra) {
        append(key, val);
    }

    return oss.str();
}

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct GameLogger::Impl {
    // Atomic for lock-free reads on the hot path.
    std::array<std::atomic<LogLevel>, kLogCategoryCount> categoryLevels;

    // Named loggers looked up in GlobalLoggerRegistry, one per category.
    std::array<std::string, kLogCategoryCount> loggerNames;

    Impl() {
        for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
            categoryLevels[i].store(kDefaultCategoryLevels[i],
                                    std::memory_order_relaxed);
            loggerNames[i] = std::string("rgs.") +
                std::string(logCategoryName(static_cast<LogCategory>(i)));
        }
    }

    std::shared_ptr<kci::ILogger> getLogger(LogCategory cat) const {
        auto idx = static_cast<std::size_t>(cat);
        auto& registry = kci::GlobalLoggerRegistry::instance();
        if (idx >= kLogCategoryCount) {
            return kci::GlobalLoggerRegistry::null_logger();
        }
        // A category-specific logger wins; otherwise use the default logger.
        auto named = registry.get_logger(loggerNames[idx]);
        if (named && named != kci::GlobalLoggerRegistry::null_logger()) {
            return named;
        }
        return registry.get_default_logger();
    }

    void emit(LogLevel level, LogCategory cat, std::string_view msg,
              std::string_view ctx) const {
        std::string formatted;
        formatted.reserve(msg.size() + ctx.size() + 20);
        formatted += '[';
        formatted += logCategoryName(cat);
        formatted += "] ";
        formatted += msg;
        if (!ctx.empty()) {
            formatted += " {";
            formatted += ctx;
            formatted += '}';
        }
        // A failing sink must not take the tick down with it.
        (void)getLogger(cat)->log(mapLevel(level), formatted);
    }
};

GameLogger::GameLogger() : impl_(std::make_unique<Impl>()) {}

GameLogger::~GameLogger() = default;

GameLogger::GameLogger(GameLogger&&) noexcept = default;
GameLogger& GameLogger::operator=(GameLogger&&) noexcept = default;

void GameLogger::log(LogLevel level, LogCategory cat, std::string_view msg) {
    if (!isEnabled(level, cat)) {
        return;
    }
    impl_->emit(level, cat, msg, {});
}

void GameLogger::logWithContext(LogLevel level, LogCategory cat,
                                std::string_view msg, const LogContext& ctx) {
    if (!isEnabled(level, cat)) {
        return;
    }
    impl_->emit(level, cat, msg, formatContext(ctx));
}

void GameLogger::setCategoryLevel(LogCategory cat, LogLevel minLevel) {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        impl_->categoryLevels[idx].store(minLevel, std::memory_order_release);
    }
}

LogLevel GameLogger::getCategoryLevel(LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        return impl_->categoryLevels[idx].load(std::memory_order_acquire);
    }
    return LogLevel::Off;
}

bool GameLogger::isEnabled(LogLevel level, LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx >= kLogCategoryCount || level == LogLevel::Off) {
        return false;
    }
    auto minLevel = impl_->categoryLevels[idx].load(std::memory_order_acquire);
    return static_cast<uint8_t>(level) >= static_cast<uint8_t>(minLevel);
}

GameResult<void> GameLogger::flush() {
    auto& registry = kci::GlobalLoggerRegistry::instance();
    auto result = registry.get_default_logger()->flush();
    if (result.is_err()) {
        return GameResult<void>::err(
            GameError(ErrorCode::LoggerFlushFailed, "failed to flush logger"));
    }
    return GameResult<void>::ok();
}

GameLogger& GameLogger::instance() {
    static GameLogger inst;
    return inst;
}

} // namespace rgs::foundation
