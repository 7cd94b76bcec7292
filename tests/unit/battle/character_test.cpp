#include <gtest/gtest.h>

#include "tbe/battle/character.hpp"

using namespace tbe::battle;

namespace {

Species rockSpecies() {
    return Species{"Rock Pawn", 400, StatRatios{0.3, 0.3, 0.25, 0.15}, Alignment::Rock};
}

}  // namespace

TEST(CharacterTest, FromSpeciesStartsEmpty) {
    auto character = Character::fromSpecies(rockSpecies());
    EXPECT_EQ(character.name, "Rock Pawn");
    EXPECT_EQ(character.attributes.level, 0u);
    EXPECT_EQ(character.attributes.experience, 0u);
    EXPECT_TRUE(character.attributes.stats.isZero());
    EXPECT_TRUE(character.attributes.actions.empty());
    EXPECT_EQ(character.state.health, 0);
    EXPECT_EQ(character.state.alignment, Alignment::Rock);
    EXPECT_TRUE(character.state.statuses.empty());
}

TEST(CharacterTest, FromSpeciesWithActions) {
    auto character = Character::fromSpecies(rockSpecies(), {0, 3, 3});
    EXPECT_EQ(character.attributes.actions, (std::vector<ActionId>{0, 3, 3}));
}

TEST(CharacterTest, RefreshRestoresBattleState) {
    auto character = Character::fromSpecies(rockSpecies());
    character.attributes.stats = RealizedStats{40, 10, 10, 10};
    character.state.health = 3;
    character.state.alignment = Alignment::Paper;
    character.state.statuses.add(Status::Bleed, 4);

    character.refresh();

    EXPECT_EQ(character.state.health, 40);
    EXPECT_EQ(character.state.alignment, Alignment::Rock);
    EXPECT_TRUE(character.state.statuses.empty());
}

TEST(CharacterTest, DealDamageClampsAtZero) {
    auto character = Character::fromSpecies(rockSpecies());
    character.state.health = 10;

    character.dealDamage(4);
    EXPECT_EQ(character.state.health, 6);
    EXPECT_FALSE(character.isDefeated());

    character.dealDamage(100);
    EXPECT_EQ(character.state.health, 0);
    EXPECT_TRUE(character.isDefeated());

    character.dealDamage(1);
    EXPECT_EQ(character.state.health, 0);
}

TEST(CharacterTest, PriorityIsSpeed) {
    auto character = Character::fromSpecies(rockSpecies());
    character.attributes.stats.speed = 17;
    EXPECT_EQ(character.priority(), 17);
}

// --- StatusSet ---

TEST(StatusSetTest, AddStacksIntensity) {
    StatusSet statuses;
    EXPECT_EQ(statuses.add(Status::Stun, 1), 1u);
    EXPECT_EQ(statuses.add(Status::Stun, 1), 2u);
    EXPECT_EQ(statuses.intensity(Status::Stun), 2u);
    EXPECT_TRUE(statuses.has(Status::Stun));
    EXPECT_FALSE(statuses.has(Status::Bleed));
    EXPECT_EQ(statuses.intensity(Status::Bleed), 0u);
}

TEST(StatusSetTest, EnsureKeepsExistingIntensity) {
    StatusSet statuses;
    statuses.ensure(Status::Defend);
    EXPECT_TRUE(statuses.has(Status::Defend));
    EXPECT_EQ(statuses.intensity(Status::Defend), 0u);

    statuses.add(Status::Defend, 3);
    statuses.ensure(Status::Defend);
    EXPECT_EQ(statuses.intensity(Status::Defend), 3u);
}

TEST(StatusSetTest, RemoveAndClear) {
    StatusSet statuses;
    statuses.add(Status::Bleed, 2);
    statuses.ensure(Status::Defend);

    statuses.remove(Status::Defend);
    EXPECT_FALSE(statuses.has(Status::Defend));
    EXPECT_TRUE(statuses.has(Status::Bleed));

    statuses.remove(Status::Stun);
    statuses.clear();
    EXPECT_TRUE(statuses.empty());
}
