#include <gtest/gtest.h>

#include <string>

#include "tbe/battle/action.hpp"
#include "tbe/battle/character.hpp"

using namespace tbe::battle;

namespace {

Character makeCharacter(const std::string& name, Alignment alignment, uint32_t level,
                        RealizedStats stats) {
    Species species{name, 400, StatRatios{0.25, 0.25, 0.25, 0.25}, alignment};
    auto character = Character::fromSpecies(species);
    character.attributes.level = level;
    character.attributes.stats = stats;
    character.refresh();
    return character;
}

}  // namespace

// --- Damage formula ---

TEST(DamageTest, WorkedExample) {
    DamageParams params;
    params.userLevel = 19;
    params.power = 11;
    params.attack = 17;
    params.defense = 13;
    params.sameAlignment = false;
    params.effectiveness = Effectiveness::NotVeryEffective;
    // 9 * 11 * 1 * 10 * 5 / 5000 + 2
    EXPECT_EQ(computeDamage(params), 2u);
}

TEST(DamageTest, StabAndEffectivenessMultiply) {
    DamageParams params;
    params.userLevel = 50;
    params.power = 40;
    params.attack = 60;
    params.defense = 20;
    params.sameAlignment = true;
    params.effectiveness = Effectiveness::SuperEffective;
    // 22 * 40 * 3 * 15 * 20 / 5000 + 2
    EXPECT_EQ(computeDamage(params), 160u);

    params.sameAlignment = false;
    params.effectiveness = Effectiveness::Neutral;
    // 22 * 40 * 3 * 10 * 10 / 5000 + 2
    EXPECT_EQ(computeDamage(params), 54u);
}

TEST(DamageTest, StatRatioTruncatesBeforeMultiplying) {
    DamageParams params;
    params.userLevel = 100;
    params.power = 100;
    params.attack = 10;
    params.defense = 11;
    EXPECT_EQ(computeDamage(params), 2u);
}

TEST(DamageTest, ZeroDefenseIsTreatedAsOne) {
    DamageParams params;
    params.userLevel = 5;
    params.power = 50;
    params.attack = 10;
    params.defense = 0;
    // 4 * 50 * 10 * 10 * 10 / 5000 + 2
    EXPECT_EQ(computeDamage(params), 42u);
}

TEST(DamageTest, MinimumDamageIsTwo) {
    DamageParams params;
    EXPECT_EQ(computeDamage(params), 2u);
}

// --- Attack ---

TEST(AttackTest, NotVeryEffectiveHitOnRockTarget) {
    auto user = makeCharacter("Kite", Alignment::Paper, 19, RealizedStats{100, 17, 10, 10});
    auto target = makeCharacter("Pawn", Alignment::Rock, 19, RealizedStats{100, 10, 13, 10});
    Action slash = Attack{"Slash", 11, Alignment::Scissors, 0};

    auto log = slash.apply(user, target);

    EXPECT_EQ(target.state.health, 98);
    ASSERT_EQ(log.size(), 2u);
    EXPECT_EQ(log[0], "Kite used Slash.");
    EXPECT_EQ(log[1], "It's not very effective.");
}

TEST(AttackTest, SuperEffectiveLogLine) {
    auto user = makeCharacter("Fang", Alignment::Scissors, 5, RealizedStats{30, 12, 12, 12});
    auto target = makeCharacter("Kite", Alignment::Paper, 5, RealizedStats{30, 12, 12, 12});
    Action snip = Attack{"Snip", 30, Alignment::Scissors, 0};

    auto log = snip.apply(user, target);

    ASSERT_EQ(log.size(), 2u);
    EXPECT_EQ(log[1], "It's very effective.");
    // 4 * 30 * 1 * 15 * 20 / 5000 + 2
    EXPECT_EQ(target.state.health, 30 - 9);
}

TEST(AttackTest, NeutralHitHasNoEffectivenessLine) {
    auto user = makeCharacter("A", Alignment::Rock, 5, RealizedStats{30, 12, 12, 12});
    auto target = makeCharacter("B", Alignment::Rock, 5, RealizedStats{30, 12, 12, 12});
    Action tackle = Attack{"Tackle", 30, Alignment::Paper, 0};

    auto log = tackle.apply(user, target);
    ASSERT_EQ(log.size(), 2u);
    EXPECT_EQ(log[1], "It's very effective.");

    Action bump = Attack{"Bump", 30, Alignment::Rock, 0};
    log = bump.apply(user, target);
    ASSERT_EQ(log.size(), 1u);
    EXPECT_EQ(log[0], "A used Bump.");
}

TEST(AttackTest, DefendBlocksAllDamage) {
    auto user = makeCharacter("A", Alignment::Rock, 50, RealizedStats{30, 90, 12, 12});
    auto target = makeCharacter("B", Alignment::Scissors, 5, RealizedStats{30, 12, 12, 12});
    target.state.statuses.ensure(Status::Defend);
    Action smash = Attack{"Smash", 90, Alignment::Rock, 0};

    auto log = smash.apply(user, target);

    EXPECT_EQ(target.state.health, 30);
    ASSERT_EQ(log.size(), 2u);
    EXPECT_EQ(log[0], "A used Smash.");
    EXPECT_EQ(log[1], "B blocked A's Smash.");
}

// --- FixedAttack ---

TEST(FixedAttackTest, ExactDamageClampsAtZero) {
    auto user = makeCharacter("A", Alignment::Rock, 1, RealizedStats{10, 1, 1, 1});
    auto target = makeCharacter("B", Alignment::Rock, 1, RealizedStats{10, 1, 1, 1});
    Action poke = FixedAttack{"Poke", 5};

    poke.apply(user, target);
    EXPECT_EQ(target.state.health, 5);
    poke.apply(user, target);
    EXPECT_EQ(target.state.health, 0);
    poke.apply(user, target);
    EXPECT_EQ(target.state.health, 0);
}

TEST(FixedAttackTest, DefendBlocks) {
    auto user = makeCharacter("A", Alignment::Rock, 1, RealizedStats{10, 1, 1, 1});
    auto target = makeCharacter("B", Alignment::Rock, 1, RealizedStats{10, 1, 1, 1});
    target.state.statuses.ensure(Status::Defend);
    Action poke = FixedAttack{"Poke", 5};

    auto log = poke.apply(user, target);
    EXPECT_EQ(target.state.health, 10);
    ASSERT_EQ(log.size(), 2u);
    EXPECT_EQ(log[1], "B blocked A's attack.");
}

// --- Defend ---

TEST(DefendTest, AddsDefendToUser) {
    auto user = makeCharacter("A", Alignment::Rock, 1, RealizedStats{10, 1, 1, 1});
    auto target = makeCharacter("B", Alignment::Rock, 1, RealizedStats{10, 1, 1, 1});
    Action brace = Defend{"Brace"};

    auto log = brace.apply(user, target);
    EXPECT_TRUE(user.state.statuses.has(Status::Defend));
    EXPECT_FALSE(target.state.statuses.has(Status::Defend));
    ASSERT_EQ(log.size(), 1u);
    EXPECT_EQ(log[0], "A is defending.");

    brace.apply(user, target);
    EXPECT_EQ(user.state.statuses.entries.size(), 1u);
}

// --- Stun / Bleed ---

TEST(StunTest, IntensityStacks) {
    auto user = makeCharacter("A", Alignment::Rock, 1, RealizedStats{10, 1, 1, 1});
    auto target = makeCharacter("B", Alignment::Rock, 1, RealizedStats{10, 1, 1, 1});
    Action daze = Stun{"Daze"};

    auto log = daze.apply(user, target);
    EXPECT_EQ(target.state.statuses.intensity(Status::Stun), 1u);
    ASSERT_EQ(log.size(), 2u);
    EXPECT_EQ(log[0], "A used Daze.");
    EXPECT_EQ(log[1], "B is stunned.");

    daze.apply(user, target);
    EXPECT_EQ(target.state.statuses.intensity(Status::Stun), 2u);
}

TEST(StunTest, FailsOnBleedingTarget) {
    auto user = makeCharacter("A", Alignment::Rock, 1, RealizedStats{10, 1, 1, 1});
    auto target = makeCharacter("B", Alignment::Rock, 1, RealizedStats{10, 1, 1, 1});
    target.state.statuses.add(Status::Bleed, 2);
    Action daze = Stun{"Daze"};

    auto log = daze.apply(user, target);
    EXPECT_FALSE(target.state.statuses.has(Status::Stun));
    ASSERT_EQ(log.size(), 2u);
    EXPECT_EQ(log[1], "But B is bleeding.");
}

TEST(BleedTest, IntensityAccumulates) {
    auto user = makeCharacter("A", Alignment::Rock, 1, RealizedStats{10, 1, 1, 1});
    auto target = makeCharacter("B", Alignment::Rock, 1, RealizedStats{10, 1, 1, 1});
    Action cut = Bleed{"Cut", 3};

    auto log = cut.apply(user, target);
    ASSERT_EQ(log.size(), 2u);
    EXPECT_EQ(log[1], "B gained 3 bleeding.");
    cut.apply(user, target);
    EXPECT_EQ(target.state.statuses.intensity(Status::Bleed), 6u);
    EXPECT_EQ(target.state.health, 10);
}

TEST(BleedTest, FailsOnStunnedTarget) {
    auto user = makeCharacter("A", Alignment::Rock, 1, RealizedStats{10, 1, 1, 1});
    auto target = makeCharacter("B", Alignment::Rock, 1, RealizedStats{10, 1, 1, 1});
    target.state.statuses.add(Status::Stun, 1);
    Action cut = Bleed{"Cut", 3};

    auto log = cut.apply(user, target);
    EXPECT_FALSE(target.state.statuses.has(Status::Bleed));
    ASSERT_EQ(log.size(), 2u);
    EXPECT_EQ(log[1], "But B is stunned.");
}

// --- Skip ---

TEST(SkipTest, OnlyLogs) {
    auto user = makeCharacter("A", Alignment::Rock, 1, RealizedStats{10, 1, 1, 1});
    auto target = makeCharacter("B", Alignment::Rock, 1, RealizedStats{10, 1, 1, 1});
    auto before = target;
    Action skip;

    auto log = skip.apply(user, target);
    EXPECT_EQ(target, before);
    ASSERT_EQ(log.size(), 1u);
    EXPECT_EQ(log[0], "A used Skip.");
}

// --- Metadata ---

TEST(ActionMetadataTest, KindsAndNames) {
    EXPECT_EQ(Action{}.kind(), ActionKind::Skip);
    EXPECT_EQ(Action{}.name(), "Skip");
    Action attack = Attack{"Rock Slam", 40, Alignment::Rock, 0};
    EXPECT_EQ(attack.kind(), ActionKind::Attack);
    EXPECT_EQ(attack.name(), "Rock Slam");
    ASSERT_NE(attack.as<Attack>(), nullptr);
    EXPECT_EQ(attack.as<Attack>()->power, 40u);
    EXPECT_EQ(attack.as<Defend>(), nullptr);
    EXPECT_EQ(actionKindName(ActionKind::FixedAttack), "fixed_attack");
}

TEST(ActionMetadataTest, Priorities) {
    EXPECT_EQ(Action(Attack{"Jab", 10, Alignment::Rock, 1}).priority(), 1);
    EXPECT_EQ(Action(Attack{"Slam", 10, Alignment::Rock, 0}).priority(), 0);
    EXPECT_EQ(Action(Defend{"Brace"}).priority(), kDefendPriority);
    EXPECT_EQ(Action(Stun{"Daze"}).priority(), 0);
    EXPECT_EQ(Action(Bleed{"Cut", 1}).priority(), 0);
    EXPECT_EQ(Action(FixedAttack{"Poke", 1}).priority(), 0);
    EXPECT_EQ(Action{}.priority(), 0);
}

TEST(ActionMetadataTest, Descriptions) {
    EXPECT_EQ(Action(Attack{"Slam", 40, Alignment::Rock, 0}).description(),
              "Rock-aligned Attack with 40 power.");
    EXPECT_EQ(Action(Attack{"Jab", 20, Alignment::Scissors, 1}).description(),
              "Scissors-aligned Attack with 20 power.\nHas priority.");
    EXPECT_EQ(Action(FixedAttack{"Poke", 5}).description(), "Attack for exactly 5 damage.");
    EXPECT_EQ(Action(Defend{"Brace"}).description(), "Defend against attacks.");
    EXPECT_EQ(Action(Bleed{"Cut", 2}).description(), "Applies 2 bleeding to the enemy.");
    EXPECT_EQ(Action(Stun{"Daze"}).description(), "Stuns the enemy.");
    EXPECT_EQ(Action{}.description(), "User skips their next turn.");
}
