/// @file visibility_sync_benchmark_test.cpp
/// @brief Tick latency of one region under a dense observer load.
///
/// Spawns kPlayers players and kEntities simulated entities spread over
/// kChunks chunks, has every player observe every chunk, moves a slice of
/// the entities each tick, and measures the full registry tick
/// (finalizeRun, syncEntities, preSnapshotRun, copyAllSnapshots).
///
/// Acceptance criteria:
///   - p99 tick latency <= 50ms (20 Hz budget)
///   - Every commit succeeds

#include <gtest/gtest.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <memory>
#include <numeric>
#include <vector>

#include "rgs/ecs/identity_allocator.hpp"
#include "rgs/world/entity_registry.hpp"
#include "support/world_fakes.hpp"

using namespace rgs::world;
using namespace std::chrono;

namespace {

constexpr int kPlayers = 40;
constexpr int kEntities = 500;
constexpr int kChunks = 16;
constexpr int kMovesPerTick = 50;
constexpr int kWarmupTicks = 5;
constexpr int kMeasuredTicks = 50;
constexpr double kMaxTickLatencyMs = 50.0;

/// Channel that only counts, so the run does not grow a message log.
class CountingSynchronizer : public INetworkSynchronizer {
public:
    void spawnEntity(const Entity&) override { spawns.fetch_add(1, std::memory_order_relaxed); }
    void destroyEntity(const Entity&) override { destroys.fetch_add(1, std::memory_order_relaxed); }
    void syncEntity(const Entity&) override { updates.fetch_add(1, std::memory_order_relaxed); }
    void finalizeTick() override {}
    void preSnapshot() override {}

    std::atomic<uint64_t> spawns{0};
    std::atomic<uint64_t> destroys{0};
    std::atomic<uint64_t> updates{0};
};

double percentile(const std::vector<double>& sorted, double p) {
    if (sorted.empty()) {
        return 0.0;
    }
    auto idx = static_cast<std::size_t>(p / 100.0 * static_cast<double>(sorted.size() - 1));
    return sorted[idx];
}

} // anonymous namespace

class VisibilitySyncBenchmark : public ::testing::Test {
protected:
    void SetUp() override {
        for (int i = 0; i < kPlayers; ++i) {
            auto player = std::make_shared<Entity>(ControllerCategory::Player);
            auto channel = std::make_shared<CountingSynchronizer>();
            player->setNetworkSynchronizer(channel);
            player->setOnline(true);
            ASSERT_TRUE(registry_.addEntity(player, region_).hasValue());
            registry_.moveEntity(player, Vector3{static_cast<float>(i), 0.0f, 0.0f},
                                 &chunks_[static_cast<std::size_t>(i % kChunks)]);
            for (int c = 0; c < kChunks; ++c) {
                registry_.setObserverDistance(player, &chunks_[static_cast<std::size_t>(c)],
                                              (c * 7 + i) % 96);
            }
            channels_.push_back(channel);
        }
        for (int i = 0; i < kEntities; ++i) {
            auto e = std::make_shared<Entity>(ControllerCategory::Generic);
            ASSERT_TRUE(registry_.addEntity(e, region_).hasValue());
            registry_.moveEntity(e, Vector3{static_cast<float>(i), 0.0f, 1.0f},
                                 &chunks_[static_cast<std::size_t>(i % kChunks)]);
            entities_.push_back(e);
        }
    }

    double tickOnce(int tickNumber) {
        for (int m = 0; m < kMovesPerTick; ++m) {
            auto idx = static_cast<std::size_t>((tickNumber * kMovesPerTick + m) % kEntities);
            auto& e = entities_[idx];
            auto chunk = static_cast<std::size_t>((idx + static_cast<std::size_t>(tickNumber)) % kChunks);
            registry_.moveEntity(e, e->positionLive(), &chunks_[chunk]);
        }

        const auto start = steady_clock::now();
        registry_.finalizeRun();
        registry_.syncEntities();
        registry_.preSnapshotRun();
        auto committed = registry_.copyAllSnapshots();
        const auto end = steady_clock::now();

        EXPECT_TRUE(committed.hasValue());
        return static_cast<double>(duration_cast<microseconds>(end - start).count()) / 1000.0;
    }

    EntityRegistry registry_{std::make_shared<rgs::ecs::AtomicIdentityAllocator>(), "bench"};
    rgs::testing::FakeRegion region_{"bench"};
    std::array<rgs::testing::FakeChunk, kChunks> chunks_;
    std::vector<std::shared_ptr<CountingSynchronizer>> channels_;
    std::vector<std::shared_ptr<Entity>> entities_;
};

TEST_F(VisibilitySyncBenchmark, TickLatencyUnderObserverLoad) {
    std::cout << "\n=== Visibility Sync Tick Latency ===" << std::endl;
    std::cout << "Players: " << kPlayers << ", entities: " << kEntities
              << ", chunks: " << kChunks << "\n" << std::endl;

    for (int t = 0; t < kWarmupTicks; ++t) {
        (void)tickOnce(t);
    }

    std::vector<double> latencies;
    latencies.reserve(kMeasuredTicks);
    for (int t = 0; t < kMeasuredTicks; ++t) {
        latencies.push_back(tickOnce(kWarmupTicks + t));
    }
    std::sort(latencies.begin(), latencies.end());

    const double mean =
        std::accumulate(latencies.begin(), latencies.end(), 0.0) / static_cast<double>(latencies.size());
    const double p50 = percentile(latencies, 50.0);
    const double p99 = percentile(latencies, 99.0);

    uint64_t spawns = 0;
    uint64_t updates = 0;
    for (const auto& ch : channels_) {
        spawns += ch->spawns.load();
        updates += ch->updates.load();
    }

    std::cout << std::fixed << std::setprecision(3);
    std::cout << "  Mean:    " << mean << " ms\n";
    std::cout << "  p50:     " << p50 << " ms\n";
    std::cout << "  p99:     " << p99 << " ms\n";
    std::cout << "  Spawns:  " << spawns << "\n";
    std::cout << "  Updates: " << updates << "\n";

    EXPECT_GT(spawns, 0u);
    EXPECT_LE(p99, kMaxTickLatencyMs)
        << "p99 tick latency exceeds the 20 Hz budget";
}
