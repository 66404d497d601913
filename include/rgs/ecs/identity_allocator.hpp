#pragma once

/// @file identity_allocator.hpp
/// @brief Process-wide monotonic entity id allocation.
///
/// One allocator instance is shared by every registry that must never
/// hand out colliding ids (normally: every region of a world).  It is
/// injected into each EntityRegistry instead of living in a global.

#include "rgs/foundation/game_result.hpp"

#include <atomic>
#include <cstdint>
#include <limits>

namespace rgs::ecs {

/// Id value of an entity that is not currently spawned.
inline constexpr int32_t kNotSpawnedId = -1;

/// First id handed out by a default-constructed allocator.
inline constexpr int32_t kFirstEntityId = 1;

/// Largest id an allocator may hand out.  Everything above it would wrap
/// into the negative range reserved for sentinels.
inline constexpr int32_t kMaxEntityId = std::numeric_limits<int32_t>::max();

/// Source of unique, non-negative entity ids.
class IIdentityAllocator {
public:
    virtual ~IIdentityAllocator() = default;

    /// Issue the next unused id.
    ///
    /// @return The id, or IdentitySpaceExhausted.  Exhaustion is fatal:
    ///         callers must not retry and must not continue the tick.
    [[nodiscard]] virtual foundation::GameResult<int32_t> allocate() = 0;
};

/// Lock-free allocator backed by a single atomic counter.
///
/// Safe to call concurrently from any number of region threads.  Ids are
/// never reused; once the ceiling is passed every later call fails.
class AtomicIdentityAllocator final : public IIdentityAllocator {
public:
    /// @param firstId  First id to issue (clamped to >= 0).
    /// @param maxId    Largest id to issue (clamped to kMaxEntityId).
    explicit AtomicIdentityAllocator(int32_t firstId = kFirstEntityId,
                                     int32_t maxId = kMaxEntityId);

    AtomicIdentityAllocator(const AtomicIdentityAllocator&) = delete;
    AtomicIdentityAllocator& operator=(const AtomicIdentityAllocator&) = delete;

    [[nodiscard]] foundation::GameResult<int32_t> allocate() override;

    /// Number of ids successfully issued.
    [[nodiscard]] uint64_t issuedCount() const noexcept;

    /// True once an allocate() call has failed.
    [[nodiscard]] bool exhausted() const noexcept;

    [[nodiscard]] int32_t maxId() const noexcept { return maxId_; }

private:
    // 64-bit so the counter itself can never wrap back into valid ids.
    std::atomic<uint64_t> next_;
    const uint64_t first_;
    const int32_t maxId_;
};

}  // namespace rgs::ecs
