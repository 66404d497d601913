#pragma once

/// @file game_result.hpp
/// @brief GameResult<T>: explicit error propagation without exceptions.

#include <utility>
#include <variant>

#include "rgs/foundation/game_error.hpp"

namespace rgs::foundation {

/// Result of an operation that can fail with a GameError.
///
/// Every registry, configuration and scheduling operation that can fail
/// returns GameResult<T> instead of throwing.
///
/// Example:
/// @code
///   auto id = allocator.allocate();
///   if (!id) {
///       RGS_LOG_ERROR(LogCategory::Identity, std::string(id.error().message()));
///       return GameResult<void>::err(id.error());
///   }
///   entity.setId(id.value());
/// @endcode
template <typename T>
class GameResult {
public:
    static GameResult ok(T value) { return GameResult(std::move(value)); }

    static GameResult err(GameError error) { return GameResult(std::move(error)); }

    [[nodiscard]] bool hasValue() const noexcept { return std::holds_alternative<T>(data_); }

    [[nodiscard]] bool hasError() const noexcept { return std::holds_alternative<GameError>(data_); }

    explicit operator bool() const noexcept { return hasValue(); }

    /// Access the success value (undefined behavior if error).
    [[nodiscard]] const T& value() const& { return std::get<T>(data_); }
    [[nodiscard]] T& value() & { return std::get<T>(data_); }
    [[nodiscard]] T&& value() && { return std::get<T>(std::move(data_)); }

    /// Access the error (undefined behavior if success).
    [[nodiscard]] const GameError& error() const& { return std::get<GameError>(data_); }

    [[nodiscard]] T valueOr(T defaultValue) const& {
        return hasValue() ? value() : std::move(defaultValue);
    }

private:
    explicit GameResult(T value) : data_(std::move(value)) {}
    explicit GameResult(GameError error) : data_(std::move(error)) {}

    std::variant<T, GameError> data_;
};

/// Specialization for operations with no success payload.
template <>
class GameResult<void> {
public:
    static GameResult ok() { return GameResult(); }
    static GameResult err(GameError error) { return GameResult(std::move(error)); }

    [[nodiscard]] bool hasValue() const noexcept { return success_; }
    [[nodiscard]] bool hasError() const noexcept { return !success_; }
    explicit operator bool() const noexcept { return success_; }

    [[nodiscard]] const GameError& error() const& { return error_; }

private:
    GameResult() : success_(true) {}
    explicit GameResult(GameError error) : success_(false), error_(std::move(error)) {}

    bool success_ = false;
    GameError error_;
};

} // namespace rgs::foundation
