/// @file service_runner.cpp
/// @brief ShutdownSignal and config loading for the region server.

#include "rgs/service/service_runner.hpp"

#include "rgs/foundation/game_logger.hpp"

#include <cstdlib>
#include <string>
#include <string_view>
#include <thread>

namespace rgs::service {

using foundation::LogCategory;

std::atomic<int> ShutdownSignal::received_{0};

void ShutdownSignal::onSignal(int signal) {
    // Lock-free atomic store only; nothing else is async-signal-safe here.
    received_.store(signal, std::memory_order_relaxed);
}

ShutdownSignal::ShutdownSignal() {
    received_.store(0, std::memory_order_relaxed);

    struct sigaction action {};
    action.sa_handler = &ShutdownSignal::onSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESTART;
    sigaction(SIGINT, &action, &previousInt_);
    sigaction(SIGTERM, &action, &previousTerm_);
}

ShutdownSignal::~ShutdownSignal() {
    sigaction(SIGINT, &previousInt_, nullptr);
    sigaction(SIGTERM, &previousTerm_, nullptr);
}

bool ShutdownSignal::requested() const noexcept {
    return received_.load(std::memory_order_relaxed) != 0;
}

int ShutdownSignal::signalNumber() const noexcept {
    return received_.load(std::memory_order_relaxed);
}

void ShutdownSignal::wait(std::chrono::milliseconds poll) const {
    while (!requested()) {
        std::this_thread::sleep_for(poll);
    }
    RGS_LOG_INFO(LogCategory::Core,
                 "shutdown requested by signal " + std::to_string(signalNumber()));
}

std::filesystem::path resolveConfigPath(int argc, char* argv[],
                                        const std::filesystem::path& fallback) {
    for (int i = 1; i + 1 < argc; ++i) {
        if (std::string_view(argv[i]) == "--config") {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            return argv[i + 1];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        }
    }
    if (const char* env = std::getenv(kConfigPathEnv); env != nullptr && *env != '\0') {
        return env;
    }
    return fallback;
}

foundation::GameResult<RegionServerConfig>
loadServerConfig(foundation::ConfigManager& config, const std::filesystem::path& path) {
    auto loaded = config.load(path);
    if (!loaded) {
        return foundation::GameResult<RegionServerConfig>::err(loaded.error());
    }
    RGS_LOG_INFO(LogCategory::Config, "loaded " + path.string());
    return RegionServerConfig::fromConfig(config);
}

} // namespace rgs::service
