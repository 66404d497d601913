/// @file identity_allocator.cpp
/// @brief AtomicIdentityAllocator implementation.

#include "rgs/ecs/identity_allocator.hpp"

#include "rgs/foundation/game_logger.hpp"

#include <algorithm>
#include <string>

namespace rgs::ecs {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;
using foundation::LogLevel;

AtomicIdentityAllocator::AtomicIdentityAllocator(int32_t firstId, int32_t maxId)
    : next_(static_cast<uint64_t>(std::max(firstId, 0))),
      first_(static_cast<uint64_t>(std::max(firstId, 0))),
      maxId_(std::clamp(maxId, 0, kMaxEntityId)) {}

GameResult<int32_t> AtomicIdentityAllocator::allocate() {
    const auto id = next_.fetch_add(1, std::memory_order_relaxed);
    if (id > static_cast<uint64_t>(maxId_)) {
        // Log only the first failure; every later caller fails the same way.
        if (id == std::max(first_, static_cast<uint64_t>(maxId_) + 1)) {
            foundation::LogContext ctx;
            ctx.extra["max_id"] = std::to_string(maxId_);
            foundation::GameLogger::instance().logWithContext(
                LogLevel::Critical, LogCategory::Identity,
                "entity id space exhausted", ctx);
        }
        return GameResult<int32_t>::err(
            GameError(ErrorCode::IdentitySpaceExhausted, "no new entity ids left"));
    }
    return GameResult<int32_t>::ok(static_cast<int32_t>(id));
}

uint64_t AtomicIdentityAllocator::issuedCount() const noexcept {
    const auto next = next_.load(std::memory_order_relaxed);
    const auto ceiling = static_cast<uint64_t>(maxId_) + 1;
    return std::min(next, ceiling) - std::min(first_, ceiling);
}

bool AtomicIdentityAllocator::exhausted() const noexcept {
    const auto firstFailure = std::max(first_, static_cast<uint64_t>(maxId_) + 1);
    return next_.load(std::memory_order_relaxed) > firstFailure;
}

}  // namespace rgs::ecs
