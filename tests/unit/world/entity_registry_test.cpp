/// @file entity_registry_test.cpp
/// @brief Unit tests for EntityRegistry lifecycle and tick phases.

#include <gtest/gtest.h>

#include <memory>
#include <set>
#include <thread>
#include <vector>

#include "rgs/ecs/identity_allocator.hpp"
#include "rgs/foundation/error_code.hpp"
#include "rgs/world/entity_registry.hpp"
#include "support/world_fakes.hpp"

using namespace rgs::world;
using rgs::ecs::AtomicIdentityAllocator;
using rgs::ecs::TickPhase;
using rgs::foundation::ErrorCode;
using rgs::testing::FakeChunk;
using rgs::testing::FakeRegion;
using rgs::testing::makePlayer;
using rgs::testing::MessageKind;

class EntityRegistryTest : public ::testing::Test {
protected:
    void runTick() {
        registry_.finalizeRun();
        registry_.syncEntities();
        registry_.preSnapshotRun();
        ASSERT_TRUE(registry_.copyAllSnapshots().hasValue());
    }

    std::shared_ptr<AtomicIdentityAllocator> allocator_ =
        std::make_shared<AtomicIdentityAllocator>();
    EntityRegistry registry_{allocator_, "unit"};
    FakeRegion region_;
};

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

TEST_F(EntityRegistryTest, AddedEntityRetrievableAfterCommit) {
    auto e = std::make_shared<Entity>(ControllerCategory::Generic);
    ASSERT_TRUE(registry_.isSpawnable(*e));

    ASSERT_TRUE(registry_.addEntity(e, region_).hasValue());
    EXPECT_FALSE(registry_.isSpawnable(*e));
    EXPECT_TRUE(e->justSpawned());
    EXPECT_EQ(registry_.getEntity(e->id()), nullptr);
    EXPECT_EQ(registry_.getAllLive().size(), 1u);
    EXPECT_EQ(registry_.entityCount(), 1u);

    runTick();
    EXPECT_EQ(registry_.getEntity(e->id()), e);
    EXPECT_FALSE(e->justSpawned());
    ASSERT_EQ(registry_.getAll().size(), 1u);
    ASSERT_EQ(registry_.getAll(ControllerCategory::Generic).size(), 1u);
    EXPECT_TRUE(registry_.getAll(ControllerCategory::BlockBound).empty());
}

TEST_F(EntityRegistryTest, AddBindsExecutionAffinity) {
    FakeRegion elsewhere("elsewhere", std::thread::id{});
    auto e = std::make_shared<Entity>(ControllerCategory::Generic);
    e->setOwningThread(std::this_thread::get_id());

    ASSERT_TRUE(registry_.addEntity(e, elsewhere).hasValue());
    EXPECT_EQ(e->owningThread(), std::thread::id{});
}

TEST_F(EntityRegistryTest, AddNullEntityIsRejected) {
    auto result = registry_.addEntity(nullptr, region_);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument);
}

TEST_F(EntityRegistryTest, ReAddingSpawnedEntityIsNoop) {
    auto e = std::make_shared<Entity>(ControllerCategory::Generic);
    ASSERT_TRUE(registry_.addEntity(e, region_).hasValue());
    const auto id = e->id();

    ASSERT_TRUE(registry_.addEntity(e, region_).hasValue());
    EXPECT_EQ(e->id(), id);
    EXPECT_EQ(registry_.entityCount(), 1u);
    EXPECT_EQ(allocator_->issuedCount(), 1u);
}

TEST_F(EntityRegistryTest, AllocateKeepsExistingId) {
    auto e = std::make_shared<Entity>();
    auto first = registry_.allocate(e, region_);
    ASSERT_TRUE(first);
    auto second = registry_.allocate(e, region_);
    ASSERT_TRUE(second);
    EXPECT_EQ(first.value(), second.value());
    EXPECT_EQ(allocator_->issuedCount(), 1u);
}

TEST_F(EntityRegistryTest, RemovedNonPlayerCanBeAddedAgain) {
    auto e = std::make_shared<Entity>(ControllerCategory::Generic);
    ASSERT_TRUE(registry_.addEntity(e, region_).hasValue());
    runTick();
    const auto id = e->id();

    ASSERT_TRUE(registry_.removeEntity(e));
    runTick();
    EXPECT_EQ(registry_.getEntity(id), nullptr);

    ASSERT_TRUE(registry_.addEntity(e, region_).hasValue());
    EXPECT_EQ(e->id(), id);
    EXPECT_EQ(registry_.entityCount(), 1u);
    runTick();
    EXPECT_EQ(registry_.getEntity(id), e);
    EXPECT_EQ(registry_.getAll(ControllerCategory::Generic).size(), 1u);
    EXPECT_EQ(allocator_->issuedCount(), 1u);

    ASSERT_TRUE(registry_.removeEntity(e));
    runTick();
    EXPECT_TRUE(registry_.getAll().empty());
    EXPECT_TRUE(registry_.getAll(ControllerCategory::Generic).empty());
}

TEST_F(EntityRegistryTest, EntityTransfersBetweenRegistries) {
    EntityRegistry destination(allocator_, "destination");
    FakeRegion elsewhere("elsewhere", std::thread::id{});
    auto e = std::make_shared<Entity>(ControllerCategory::Generic);
    e->setOwningThread(std::this_thread::get_id());
    ASSERT_TRUE(registry_.addEntity(e, region_).hasValue());
    runTick();
    const auto id = e->id();

    ASSERT_TRUE(registry_.removeEntity(e));
    runTick();
    ASSERT_TRUE(destination.addEntity(e, elsewhere).hasValue());
    EXPECT_EQ(e->id(), id);
    EXPECT_EQ(e->owningThread(), std::thread::id{});
    destination.finalizeRun();
    destination.syncEntities();
    ASSERT_TRUE(destination.copyAllSnapshots().hasValue());

    EXPECT_EQ(destination.getEntity(id), e);
    EXPECT_EQ(destination.getAll().size(), 1u);
    EXPECT_EQ(destination.getAll(ControllerCategory::Generic).size(), 1u);
    EXPECT_EQ(registry_.getEntity(id), nullptr);

    ASSERT_TRUE(destination.removeEntity(e));
    destination.finalizeRun();
    destination.syncEntities();
    ASSERT_TRUE(destination.copyAllSnapshots().hasValue());
    EXPECT_TRUE(destination.getAll().empty());
    EXPECT_TRUE(destination.getAll(ControllerCategory::Generic).empty());
}

TEST_F(EntityRegistryTest, SimultaneousEntitiesHaveDistinctIds) {
    std::set<int32_t> ids;
    for (int i = 0; i < 50; ++i) {
        auto e = std::make_shared<Entity>(ControllerCategory::Generic);
        ASSERT_TRUE(registry_.addEntity(e, region_).hasValue());
        ids.insert(e->id());
    }
    EXPECT_EQ(ids.size(), 50u);
}

TEST_F(EntityRegistryTest, RegistriesSharingAllocatorNeverCollide) {
    EntityRegistry other(allocator_, "other");
    auto a = std::make_shared<Entity>(ControllerCategory::Generic);
    auto b = std::make_shared<Entity>(ControllerCategory::Generic);
    ASSERT_TRUE(registry_.addEntity(a, region_).hasValue());
    ASSERT_TRUE(other.addEntity(b, region_).hasValue());
    EXPECT_NE(a->id(), b->id());
}

TEST_F(EntityRegistryTest, ExhaustedIdSpaceFailsAdd) {
    EntityRegistry tiny(std::make_shared<AtomicIdentityAllocator>(1, 1), "tiny");
    auto a = std::make_shared<Entity>(ControllerCategory::Generic);
    auto b = std::make_shared<Entity>(ControllerCategory::Generic);

    ASSERT_TRUE(tiny.addEntity(a, region_).hasValue());
    auto failed = tiny.addEntity(b, region_);
    ASSERT_TRUE(failed.hasError());
    EXPECT_EQ(failed.error().code(), ErrorCode::IdentitySpaceExhausted);
    EXPECT_TRUE(failed.error().isFatal());
    EXPECT_TRUE(tiny.isSpawnable(*b));
    EXPECT_EQ(tiny.entityCount(), 1u);
    EXPECT_FALSE(b->justSpawned());
}

TEST_F(EntityRegistryTest, RemovedPlayerKeepsObjectWithSentinelId) {
    auto player = makePlayer();
    ASSERT_TRUE(registry_.addEntity(player.entity, region_).hasValue());
    runTick();
    const auto firstId = player.entity->id();
    ASSERT_EQ(registry_.getPlayers().size(), 1u);

    ASSERT_TRUE(registry_.removeEntity(player.entity));
    EXPECT_EQ(player.entity->id(), kNotSpawnedId);
    EXPECT_TRUE(registry_.isSpawnable(*player.entity));
    // Committed readers still see the player until the commit.
    EXPECT_EQ(registry_.getPlayers().size(), 1u);
    runTick();
    EXPECT_TRUE(registry_.getPlayers().empty());
    EXPECT_EQ(registry_.getEntity(firstId), nullptr);

    ASSERT_TRUE(registry_.addEntity(player.entity, region_).hasValue());
    EXPECT_NE(player.entity->id(), firstId);
    runTick();
    EXPECT_EQ(registry_.getPlayers().size(), 1u);
}

TEST_F(EntityRegistryTest, RemovedNonPlayerKeepsId) {
    auto e = std::make_shared<Entity>(ControllerCategory::Generic);
    ASSERT_TRUE(registry_.addEntity(e, region_).hasValue());
    const auto id = e->id();
    ASSERT_TRUE(registry_.removeEntity(e));
    EXPECT_EQ(e->id(), id);
}

TEST_F(EntityRegistryTest, RemoveUnknownEntityIsNoop) {
    auto e = std::make_shared<Entity>(ControllerCategory::Generic);
    EXPECT_FALSE(registry_.removeEntity(e));
    EXPECT_FALSE(registry_.removeEntity(nullptr));
    EXPECT_EQ(registry_.phase(), TickPhase::Reconciled);
}

TEST_F(EntityRegistryTest, DeallocateDetachesFromLoadedChunksOnly) {
    FakeChunk loaded(true);
    FakeChunk unloaded(false);

    auto a = std::make_shared<Entity>(ControllerCategory::Generic);
    ASSERT_TRUE(registry_.addEntity(a, region_).hasValue());
    registry_.moveEntity(a, Vector3{}, &loaded);
    runTick();
    registry_.moveEntity(a, Vector3{}, &unloaded);

    registry_.deallocate(a);
    ASSERT_EQ(loaded.removed.size(), 1u);
    EXPECT_EQ(loaded.removed[0], a.get());
    EXPECT_TRUE(unloaded.removed.empty());
    EXPECT_EQ(a->chunkLive(), nullptr);
}

TEST_F(EntityRegistryTest, UncontrolledEntityOnlyInTableAndTypeIndex) {
    auto e = std::make_shared<Entity>(ControllerCategory::None);
    ASSERT_TRUE(registry_.addEntity(e, region_).hasValue());
    runTick();
    EXPECT_EQ(registry_.getAll(ControllerCategory::None).size(), 1u);
    EXPECT_TRUE(registry_.getPlayers().empty());
    EXPECT_TRUE(registry_.getBlockEntities().empty());
}

// ---------------------------------------------------------------------------
// Block entities
// ---------------------------------------------------------------------------

TEST_F(EntityRegistryTest, SecondBlockEntityEvictsFirst) {
    auto first = std::make_shared<Entity>(ControllerCategory::BlockBound, Vector3{3.5f, 10.2f, -1.5f});
    auto second = std::make_shared<Entity>(ControllerCategory::BlockBound, Vector3{3.1f, 10.9f, -1.9f});

    ASSERT_TRUE(registry_.addEntity(first, region_).hasValue());
    runTick();
    ASSERT_EQ(registry_.getBlockEntities().size(), 1u);

    ASSERT_TRUE(registry_.addEntity(second, region_).hasValue());
    EXPECT_TRUE(first->isDead());
    runTick();

    const auto& blocks = registry_.getBlockEntities();
    ASSERT_EQ(blocks.size(), 1u);
    EXPECT_EQ(blocks.at(BlockPos{3, 10, -2}), second);

    // The evicted entity was swept by finalizeRun.
    EXPECT_EQ(registry_.getEntity(first->id()), nullptr);
    EXPECT_EQ(registry_.getEntity(second->id()), second);
    EXPECT_EQ(registry_.getBlockEntities().at(BlockPos{3, 10, -2}), second);
}

TEST_F(EntityRegistryTest, RemovingBlockEntityFreesCell) {
    auto e = std::make_shared<Entity>(ControllerCategory::BlockBound, Vector3{0.5f, 0.5f, 0.5f});
    ASSERT_TRUE(registry_.addEntity(e, region_).hasValue());
    runTick();
    ASSERT_TRUE(registry_.removeEntity(e));
    runTick();
    EXPECT_TRUE(registry_.getBlockEntities().empty());
}

// ---------------------------------------------------------------------------
// Tick phases
// ---------------------------------------------------------------------------

TEST_F(EntityRegistryTest, FinalizeRunSweepsDeadAndRunsHooks) {
    auto dead = std::make_shared<Entity>(ControllerCategory::Generic);
    auto alive = std::make_shared<Entity>(ControllerCategory::Generic);
    int hookCalls = 0;
    alive->setTickHook([&](Entity&) { ++hookCalls; });
    dead->setTickHook([&](Entity&) { ADD_FAILURE() << "dead entities are not ticked"; });

    ASSERT_TRUE(registry_.addEntity(dead, region_).hasValue());
    ASSERT_TRUE(registry_.addEntity(alive, region_).hasValue());
    runTick();
    // Only committed entities are finalized.
    EXPECT_EQ(hookCalls, 0);

    dead->kill();
    registry_.finalizeRun();
    EXPECT_EQ(hookCalls, 1);
    EXPECT_EQ(registry_.entityCount(), 1u);
    registry_.syncEntities();
    ASSERT_TRUE(registry_.copyAllSnapshots().hasValue());
    EXPECT_EQ(registry_.getAll().size(), 1u);
}

TEST_F(EntityRegistryTest, PlayerChannelsFlushedOnlyWhenOnline) {
    auto online = makePlayer();
    auto offline = makePlayer();
    offline.entity->setOnline(false);
    ASSERT_TRUE(registry_.addEntity(online.entity, region_).hasValue());
    ASSERT_TRUE(registry_.addEntity(offline.entity, region_).hasValue());
    runTick();

    runTick();
    EXPECT_EQ(online.channel->finalizeTicks, 1);
    EXPECT_EQ(online.channel->preSnapshots, 1);
    EXPECT_EQ(offline.channel->finalizeTicks, 0);
    EXPECT_EQ(offline.channel->preSnapshots, 0);
}

TEST_F(EntityRegistryTest, CategoryChangeMovesRosterMembership) {
    auto e = std::make_shared<Entity>(ControllerCategory::Generic);
    ASSERT_TRUE(registry_.addEntity(e, region_).hasValue());
    runTick();

    e->setController(ControllerCategory::Player);
    runTick();
    EXPECT_TRUE(registry_.getAll(ControllerCategory::Generic).empty());
    EXPECT_EQ(registry_.getAll(ControllerCategory::Player).size(), 1u);
    EXPECT_EQ(registry_.getPlayers().size(), 1u);
}

TEST_F(EntityRegistryTest, CategoryChangeOfFreshEntityIndexedBeforeCommit) {
    auto e = std::make_shared<Entity>(ControllerCategory::Generic);
    ASSERT_TRUE(registry_.addEntity(e, region_).hasValue());
    e->setController(ControllerCategory::Player);
    runTick();

    EXPECT_TRUE(registry_.getAll(ControllerCategory::Generic).empty());
    EXPECT_EQ(registry_.getAll(ControllerCategory::Player).size(), 1u);
    EXPECT_EQ(registry_.getPlayers().size(), 1u);
}

TEST_F(EntityRegistryTest, EntityStateChangeRequiresSyncBeforeCommit) {
    auto e = std::make_shared<Entity>(ControllerCategory::Generic);
    ASSERT_TRUE(registry_.addEntity(e, region_).hasValue());
    runTick();
    EXPECT_EQ(registry_.phase(), TickPhase::Reconciled);

    e->setViewDistance(e->viewDistance() + 1);
    auto refused = registry_.copyAllSnapshots();
    ASSERT_TRUE(refused.hasError());
    EXPECT_EQ(refused.error().code(), ErrorCode::CommitBeforeSync);
    EXPECT_EQ(registry_.phase(), TickPhase::Live);
    EXPECT_NE(e->previousViewDistance(), e->viewDistance());

    registry_.syncEntities();
    ASSERT_TRUE(registry_.copyAllSnapshots().hasValue());
    EXPECT_EQ(e->previousViewDistance(), e->viewDistance());
    // Nothing pending: committing again is allowed.
    EXPECT_TRUE(registry_.copyAllSnapshots().hasValue());
}

TEST_F(EntityRegistryTest, AbortedTickRefusesCommitsUntilResync) {
    auto e = std::make_shared<Entity>(ControllerCategory::Generic);
    ASSERT_TRUE(registry_.addEntity(e, region_).hasValue());
    const auto commits = registry_.commitCount();

    registry_.abortTick("simulation failed");
    EXPECT_TRUE(registry_.aborted());
    registry_.finalizeRun();
    registry_.syncEntities();
    auto refused = registry_.copyAllSnapshots();
    ASSERT_TRUE(refused.hasError());
    EXPECT_EQ(refused.error().code(), ErrorCode::SnapshotFailed);
    EXPECT_EQ(registry_.commitCount(), commits);
    EXPECT_EQ(registry_.getEntity(e->id()), nullptr);

    registry_.resync();
    EXPECT_FALSE(registry_.aborted());
    ASSERT_TRUE(registry_.copyAllSnapshots().hasValue());
    EXPECT_EQ(registry_.getEntity(e->id()), e);
}

TEST_F(EntityRegistryTest, CommitAfterUnsyncedMutationIsRefused) {
    auto e = std::make_shared<Entity>(ControllerCategory::Generic);
    ASSERT_TRUE(registry_.addEntity(e, region_).hasValue());
    EXPECT_EQ(registry_.phase(), TickPhase::Live);

    auto refused = registry_.copyAllSnapshots();
    ASSERT_TRUE(refused.hasError());
    EXPECT_EQ(refused.error().code(), ErrorCode::CommitBeforeSync);
    EXPECT_EQ(registry_.getEntity(e->id()), nullptr);
    EXPECT_TRUE(e->justSpawned());

    registry_.syncEntities();
    EXPECT_EQ(registry_.phase(), TickPhase::Reconciled);

    auto late = std::make_shared<Entity>(ControllerCategory::Generic);
    ASSERT_TRUE(registry_.addEntity(late, region_).hasValue());
    EXPECT_TRUE(registry_.copyAllSnapshots().hasError());

    registry_.syncEntities();
    ASSERT_TRUE(registry_.copyAllSnapshots().hasValue());
    EXPECT_EQ(registry_.getEntity(e->id()), e);
    EXPECT_EQ(registry_.getEntity(late->id()), late);
}

TEST_F(EntityRegistryTest, CopyAllSnapshotsIsIdempotent) {
    FakeChunk chunk;
    auto e = std::make_shared<Entity>(ControllerCategory::Generic, Vector3{1.0f, 2.0f, 3.0f});
    ASSERT_TRUE(registry_.addEntity(e, region_).hasValue());
    registry_.moveEntity(e, Vector3{4.0f, 5.0f, 6.0f}, &chunk);
    runTick();

    const auto all = registry_.getAll();
    const auto position = e->position();
    const auto commits = registry_.commitCount();

    ASSERT_TRUE(registry_.copyAllSnapshots().hasValue());
    EXPECT_EQ(registry_.getAll(), all);
    EXPECT_EQ(e->position(), position);
    EXPECT_EQ(e->chunk(), &chunk);
    EXPECT_EQ(registry_.getEntity(e->id()), e);
    EXPECT_EQ(registry_.commitCount(), commits + 1);
}

TEST_F(EntityRegistryTest, UnloadAllRemovesEverything) {
    auto player = makePlayer();
    ASSERT_TRUE(registry_.addEntity(player.entity, region_).hasValue());
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(registry_.addEntity(std::make_shared<Entity>(ControllerCategory::Generic),
                                        region_).hasValue());
    }
    runTick();

    EXPECT_EQ(registry_.unloadAll(), 4u);
    EXPECT_EQ(registry_.entityCount(), 0u);
    runTick();
    EXPECT_TRUE(registry_.getAll().empty());
    EXPECT_TRUE(registry_.getPlayers().empty());
    EXPECT_EQ(player.entity->id(), kNotSpawnedId);
}

TEST_F(EntityRegistryTest, RemovedPlayerIsToldToDropWhatItSaw) {
    FakeChunk home;
    FakeChunk chunk;
    auto player = makePlayer();
    ASSERT_TRUE(registry_.addEntity(player.entity, region_).hasValue());
    registry_.moveEntity(player.entity, Vector3{}, &home);
    auto e = std::make_shared<Entity>(ControllerCategory::Generic);
    ASSERT_TRUE(registry_.addEntity(e, region_).hasValue());
    registry_.moveEntity(e, Vector3{}, &chunk);
    registry_.setObserverDistance(player.entity, &chunk, 2);
    runTick();
    player.channel->clear();

    ASSERT_TRUE(registry_.removeEntity(player.entity));
    runTick();
    EXPECT_EQ(player.channel->kindsFor(*e), std::vector<MessageKind>{MessageKind::Destroy});
}
