#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the region server.

#include <cstdint>
#include <string_view>

namespace rgs::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), making it possible
/// to determine the error source from the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    AlreadyExists = 0x0004,

    // Identity (0x0100 - 0x01FF)
    IdentitySpaceExhausted = 0x0100,
    EntityNotSpawned = 0x0101,

    // Registry (0x0200 - 0x02FF)
    EntityNotFound = 0x0200,
    RegionUnavailable = 0x0201,

    // Snapshot (0x0300 - 0x03FF)
    CommitBeforeSync = 0x0300,
    SnapshotFailed = 0x0301,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,
    ConfigValueOutOfRange = 0x0603,

    // Thread (0x0700 - 0x07FF)
    ThreadError = 0x0700,
    JobScheduleFailed = 0x0701,
    JobNotFound = 0x0702,

    // Logger (0x0800 - 0x08FF)
    LoggerError = 0x0800,
    LoggerFlushFailed = 0x0802,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0100: return "Identity";
        case 0x0200: return "Registry";
        case 0x0300: return "Snapshot";
        case 0x0600: return "Config";
        case 0x0700: return "Thread";
        case 0x0800: return "Logger";
        default: return "Unknown";
    }
}

/// Return true when the code denotes a condition the process must not
/// continue past (no retry, no fallback).
constexpr bool isFatal(ErrorCode code) {
    return code == ErrorCode::IdentitySpaceExhausted;
}

} // namespace rgs::foundation
