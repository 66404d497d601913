/// @file player_roster_test.cpp
/// @brief Unit tests for PlayerRoster.

#include <gtest/gtest.h>

#include <memory>

#include "rgs/world/player_roster.hpp"

using namespace rgs::world;
using rgs::ecs::SnapshotManager;

class PlayerRosterTest : public ::testing::Test {
protected:
    void commit() {
        manager_.markReconciled();
        ASSERT_TRUE(manager_.copyAllSnapshots().hasValue());
    }

    SnapshotManager manager_;
    PlayerRoster roster_{manager_};
};

TEST_F(PlayerRosterTest, OnlyPlayersAreAccepted) {
    auto npc = std::make_shared<Entity>(ControllerCategory::Generic);
    auto player = std::make_shared<Entity>(ControllerCategory::Player);

    EXPECT_FALSE(roster_.add(npc));
    EXPECT_FALSE(roster_.add(nullptr));
    EXPECT_TRUE(roster_.add(player));
    EXPECT_FALSE(roster_.add(player));
    EXPECT_TRUE(roster_.contains(player));
    EXPECT_EQ(roster_.liveSize(), 1u);
}

TEST_F(PlayerRosterTest, SnapshotLagsLiveByOneCommit) {
    auto player = std::make_shared<Entity>(ControllerCategory::Player);
    roster_.add(player);
    EXPECT_TRUE(roster_.snapshot().empty());
    EXPECT_EQ(roster_.live().size(), 1u);

    commit();
    ASSERT_EQ(roster_.snapshot().size(), 1u);

    EXPECT_TRUE(roster_.remove(player));
    EXPECT_FALSE(roster_.contains(player));
    EXPECT_EQ(roster_.snapshot().size(), 1u);

    commit();
    EXPECT_TRUE(roster_.snapshot().empty());
}

TEST_F(PlayerRosterTest, RemoveUnknownPlayerFails) {
    auto player = std::make_shared<Entity>(ControllerCategory::Player);
    EXPECT_FALSE(roster_.remove(player));
}
