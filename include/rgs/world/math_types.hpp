#pragma once

/// @file math_types.hpp
/// @brief Position types for the world layer.
///
/// Vector3 is the continuous entity position; BlockPos is the integer
/// block cell containing it, used to key singleton-per-cell entities.

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <functional>

namespace rgs::world {

/// Three-component floating-point vector.
struct Vector3 {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;

    constexpr Vector3() = default;
    constexpr Vector3(float x, float y, float z) : x(x), y(y), z(z) {}

    constexpr Vector3 operator+(const Vector3& rhs) const noexcept {
        return {x + rhs.x, y + rhs.y, z + rhs.z};
    }
    constexpr Vector3 operator-(const Vector3& rhs) const noexcept {
        return {x - rhs.x, y - rhs.y, z - rhs.z};
    }

    /// Squared magnitude (avoids sqrt).
    [[nodiscard]] constexpr float LengthSquared() const noexcept {
        return x * x + y * y + z * z;
    }

    constexpr auto operator<=>(const Vector3&) const = default;
};

/// Integer block coordinate.
struct BlockPos {
    int32_t x = 0;
    int32_t y = 0;
    int32_t z = 0;

    /// The block containing @p position (component-wise floor).
    [[nodiscard]] static BlockPos Containing(const Vector3& position) noexcept {
        return {static_cast<int32_t>(std::floor(position.x)),
                static_cast<int32_t>(std::floor(position.y)),
                static_cast<int32_t>(std::floor(position.z))};
    }

    constexpr auto operator<=>(const BlockPos&) const = default;
};

} // namespace rgs::world

template <>
struct std::hash<rgs::world::BlockPos> {
    std::size_t operator()(const rgs::world::BlockPos& p) const noexcept {
        auto h = std::hash<int32_t>{}(p.x);
        h ^= std::hash<int32_t>{}(p.y) * 2654435761u;
        h ^= std::hash<int32_t>{}(p.z) * 40503u;
        return h;
    }
};
