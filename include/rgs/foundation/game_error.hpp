#pragma once

/// @file game_error.hpp
/// @brief Error type carried by GameResult<T>.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "rgs/foundation/error_code.hpp"

namespace rgs::foundation {

/// Error carrying a categorized code, a human-readable message and,
/// when the failure concerns one entity, that entity's id.
class GameError {
public:
    GameError() = default;

    explicit GameError(ErrorCode code)
        : code_(code) {}

    GameError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    GameError(ErrorCode code, std::string message, int32_t entityId)
        : code_(code), message_(std::move(message)), entityId_(entityId) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// The subsystem that produced this error.
    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    /// Id of the entity the error refers to, if any.
    [[nodiscard]] std::optional<int32_t> entityId() const noexcept { return entityId_; }

    /// True for resource-exhaustion conditions that must not be retried.
    [[nodiscard]] bool isFatal() const noexcept { return foundation::isFatal(code_); }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::optional<int32_t> entityId_;
};

} // namespace rgs::foundation
