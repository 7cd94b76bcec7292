/// @file game_logger.cpp
/// @brief GameLogger implementation over kcenon common_system interfaces.

#include "tbe/foundation/game_logger.hpp"

#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <sstream>
#include <string>

namespace tbe::foundation {

namespace kci = kcenon::common::interfaces;

// ---------------------------------------------------------------------------
// Level mapping: TBE -> kcenon
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
    LogLevel::Info,   // Core
    LogLevel::Info,   // Config
    LogLevel::Debug,  // Battle
    LogLevel::Debug,  // Action
    LogLevel::Debug,  // Status
    LogLevel::Info,   // Progression
    LogLevel::Info    // Content
};

GameResult<LogLevel> parseLogLevel(std::string_view name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (uint8_t i = 0; i <= static_cast<uint8_t>(LogLevel::Off); ++i) {
        auto level = static_cast<LogLevel>(i);
        std::string candidate(logLevelName(level));
        std::transform(candidate.begin(), candidate.end(), candidate.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (candidate == lowered) {
            return GameResult<LogLevel>::ok(level);
        }
    }
    if (lowered == "warn") {
        return GameResult<LogLevel>::ok(LogLevel::Warning);
    }
    return GameResult<LogLevel>::err(
        GameError(ErrorCode::InvalidArgument, "unknown log level: " + std::string(name)));
}

// ---------------------------------------------------------------------------
// Context serialization
// ---------------------------------------------------------------------------
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

    if (ctx.character && !ctx.character->empty()) {
        append("character", *ctx.character);
    }
    if (ctx.round) {
        append("round", std::to_string(*ctx.round));
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
    std::array<std::atomic<LogLevel>, kLogCategoryCount> categoryLevels;

    // Named loggers ("tbe.Battle", ...) looked up in the registry first.
    std::array<std::string, kLogCategoryCount> loggerNames;

    Impl() {
        for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
            categoryLevels[i].store(kDefaultCategoryLevels[i],
                                    std::memory_order_relaxed);
            loggerNames[i] = std::string("tbe.") +
                std::string(logCategoryName(static_cast<LogCategory>(i)));
        }
    }

    std::shared_ptr<kci::ILogger> getLogger(LogCategory cat) const {
        auto idx = static_cast<std::size_t>(cat);
        if (idx >= kLogCategoryCount) {
            return kci::GlobalLoggerRegistry::null_logger();
        }
        auto& registry = kci::GlobalLoggerRegistry::instance();
        auto logger = registry.get_logger(loggerNames[idx]);
        if (logger == kci::GlobalLoggerRegistry::null_logger()) {
            return registry.get_default_logger();
        }
        return logger;
    }

    void emit(LogLevel level, LogCategory cat, std::string_view msg,
              std::string_view ctxStr) const {
        // Format: [Category] message {key=val, ...}
        std::string formatted;
        formatted.reserve(msg.size() + ctxStr.size() + 20);
        formatted += '[';
        formatted += logCategoryName(cat);
        formatted += "] ";
        formatted += msg;
        if (!ctxStr.empty()) {
            formatted += " {";
            formatted += ctxStr;
            formatted += '}';
        }
        // Write failures are dropped.
        static_cast<void>(getLogger(cat)->log(mapLevel(level), formatted));
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
    auto logger = kci::GlobalLoggerRegistry::instance().get_default_logger();
    auto result = logger->flush();
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

} // namespace tbe::foundation
