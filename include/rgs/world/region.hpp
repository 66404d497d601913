#pragma once

/// @file region.hpp
/// @brief Region collaborator interface.

#include <string_view>
#include <thread>

namespace rgs::world {

/// The region a registry manages.  Supplies the execution context that
/// owns live mutations of its entities.
class IRegion {
public:
    virtual ~IRegion() = default;

    /// Handle of the execution context entities of this region are
    /// pinned to.
    [[nodiscard]] virtual std::thread::id executionAffinity() const = 0;

    [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace rgs::world
