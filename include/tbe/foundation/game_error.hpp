#pragma once

/// @file game_error.hpp
/// @brief Failure reported by the simulator's fallible collaborators.
///
/// Configuration, content loading, character persistence and log-level
/// parsing return GameResult<T>; on failure they hand back a GameError. The
/// battle engine itself never produces one.

#include <any>
#include <string>
#include <string_view>
#include <utility>

#include "tbe/foundation/error_code.hpp"

namespace tbe::foundation {

class GameError {
public:
    GameError() = default;

    explicit GameError(ErrorCode code) : code_(code) {}

    GameError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    /// @p context is the value that could not be resolved, e.g. the requested
    /// species name for SpeciesNotFound.
    GameError(ErrorCode code, std::string message, std::any context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// "Config", "Content", "Persistence", ... derived from the code range.
    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    template <typename T>
    [[nodiscard]] const T* context() const noexcept {
        return std::any_cast<T>(&context_);
    }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

    /// One-line form for console output: "[Content] <message>".
    [[nodiscard]] std::string describe() const {
        std::string text = "[";
        text += subsystem();
        text += "] ";
        text += message_;
        return text;
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::any context_;
};

} // namespace tbe::foundation
