#pragma once

/// @file service_runner.hpp
/// @brief Process plumbing for the region server entry point.
///
/// Shutdown signal handling, config path resolution and config loading.

#include <atomic>
#include <chrono>
#include <signal.h>
#include <filesystem>

#include "rgs/foundation/config_manager.hpp"
#include "rgs/foundation/game_result.hpp"
#include "rgs/service/region_server_config.hpp"

namespace rgs::service {

/// Environment variable that names the config file.
inline constexpr const char* kConfigPathEnv = "RGS_CONFIG_PATH";

/// Catches SIGINT and SIGTERM for the lifetime of the object.
///
/// Only one instance should exist per process.  The previous signal
/// actions are restored on destruction, so a signal arriving after the
/// server started shutting down gets the default behaviour.
class ShutdownSignal {
public:
    ShutdownSignal();
    ~ShutdownSignal();

    ShutdownSignal(const ShutdownSignal&) = delete;
    ShutdownSignal& operator=(const ShutdownSignal&) = delete;

    [[nodiscard]] bool requested() const noexcept;

    /// The signal that requested shutdown, or 0.
    [[nodiscard]] int signalNumber() const noexcept;

    /// Block until a shutdown signal arrives, checking every @p poll.
    void wait(std::chrono::milliseconds poll = std::chrono::milliseconds(100)) const;

private:
    static void onSignal(int signal);

    static std::atomic<int> received_;

    struct sigaction previousInt_ {};
    struct sigaction previousTerm_ {};
};

/// Pick the config file: `--config <path>`, then $RGS_CONFIG_PATH, then
/// @p fallback.
[[nodiscard]] std::filesystem::path resolveConfigPath(int argc, char* argv[],
                                                      const std::filesystem::path& fallback);

/// Load @p path into @p config and read the region server settings.
///
/// @return ConfigLoadFailed for an unreadable file, otherwise whatever
///         RegionServerConfig::fromConfig reports.
[[nodiscard]] foundation::GameResult<RegionServerConfig>
loadServerConfig(foundation::ConfigManager& config, const std::filesystem::path& path);

} // namespace rgs::service
