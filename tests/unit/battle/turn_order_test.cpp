#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

#include "scripted_random.hpp"
#include "tbe/battle/turn_order.hpp"

using namespace tbe::battle;
using tbe::test::ScriptedRandom;

namespace {

Character makeCharacter(const std::string& name, uint32_t speed,
                        std::vector<ActionId> actions = {}) {
    Species species{name, 400, StatRatios{0.25, 0.25, 0.25, 0.25}, Alignment::Rock};
    auto character = Character::fromSpecies(species, std::move(actions));
    character.attributes.level = 5;
    character.attributes.stats = RealizedStats{20, 10, 10, speed};
    character.refresh();
    return character;
}

const Action kSlam = Attack{"Slam", 40, Alignment::Rock, 0};
const Action kJab = Attack{"Jab", 10, Alignment::Rock, 1};
const Action kBrace = Defend{"Brace"};

}  // namespace

TEST(FirstMoverTest, HigherActionPriorityWins) {
    auto fast = makeCharacter("Fast", 50);
    auto slow = makeCharacter("Slow", 5);
    ScriptedRandom rng;

    EXPECT_EQ(firstMover(kSlam, fast, kJab, slow, rng), Side::Enemy);
    EXPECT_EQ(firstMover(kBrace, slow, kJab, fast, rng), Side::Player);
    EXPECT_EQ(rng.coinDraws, 0u);
}

TEST(FirstMoverTest, SpeedBreaksPriorityTie) {
    auto fast = makeCharacter("Fast", 50);
    auto slow = makeCharacter("Slow", 5);
    ScriptedRandom rng;

    EXPECT_EQ(firstMover(kSlam, fast, kSlam, slow, rng), Side::Player);
    EXPECT_EQ(firstMover(kSlam, slow, kSlam, fast, rng), Side::Enemy);
    EXPECT_EQ(rng.coinDraws, 0u);
}

TEST(FirstMoverTest, CoinDecidesFullTie) {
    auto a = makeCharacter("A", 10);
    auto b = makeCharacter("B", 10);
    ScriptedRandom rng;
    rng.pushCoin(true).pushCoin(false);

    EXPECT_EQ(firstMover(kSlam, a, kSlam, b, rng), Side::Player);
    EXPECT_EQ(firstMover(kSlam, a, kSlam, b, rng), Side::Enemy);
    EXPECT_EQ(rng.coinDraws, 2u);
}

TEST(ChooseActionTest, PicksFromKnownActions) {
    ActionPool pool(std::vector<Action>{kSlam, kJab, kBrace});
    auto character = makeCharacter("A", 10, {2, 0});
    ScriptedRandom rng;
    rng.pushIndex(0).pushIndex(1);

    EXPECT_EQ(chooseAction(character, pool, rng).name(), "Brace");
    EXPECT_EQ(chooseAction(character, pool, rng).name(), "Slam");
}

TEST(ChooseActionTest, SkipWhenNothingKnown) {
    ActionPool pool(std::vector<Action>{kSlam});
    auto character = makeCharacter("A", 10);
    ScriptedRandom rng;

    EXPECT_EQ(chooseAction(character, pool, rng).kind(), ActionKind::Skip);
    EXPECT_EQ(rng.indexDraws, 0u);
}

TEST(ChooseActionTest, PaddedIdResolvesToSkip) {
    ActionPool pool(std::vector<Action>{kSlam}, 2);
    auto character = makeCharacter("A", 10, {2});
    ScriptedRandom rng;

    EXPECT_EQ(chooseAction(character, pool, rng).kind(), ActionKind::Skip);
}

TEST(PlayRoundTest, FasterSideActsFirst) {
    Battle battle(makeCharacter("Hero", 30), makeCharacter("Brute", 5));
    ScriptedRandom rng;

    auto outcome = playRound(battle, FixedAttack{"Poke", 3}, FixedAttack{"Shove", 4}, rng);

    EXPECT_EQ(outcome.status, BattleStatus::InProgress);
    ASSERT_EQ(outcome.log.size(), 2u);
    EXPECT_EQ(outcome.log[0], "Hero used Poke.");
    EXPECT_EQ(outcome.log[1], "Brute used Shove.");
    EXPECT_EQ(battle.round(), 1u);
}

TEST(PlayRoundTest, DefendPriorityBlocksSameRoundAttack) {
    Battle battle(makeCharacter("Hero", 30), makeCharacter("Brute", 5));
    ScriptedRandom rng;

    auto outcome = playRound(battle, FixedAttack{"Poke", 3}, kBrace, rng);

    ASSERT_EQ(outcome.log.size(), 3u);
    EXPECT_EQ(outcome.log[0], "Brute is defending.");
    EXPECT_EQ(outcome.log[2], "Brute blocked Hero's attack.");
    EXPECT_EQ(battle.enemy().state.health, 20);
    EXPECT_FALSE(battle.enemy().state.statuses.has(Status::Defend));
}

TEST(PlayRoundTest, KnockoutSkipsSecondTurnAndEndsBattle) {
    Battle battle(makeCharacter("Hero", 30), makeCharacter("Brute", 5));
    ScriptedRandom rng;

    auto outcome = playRound(battle, FixedAttack{"Finisher", 50}, FixedAttack{"Shove", 4}, rng);

    EXPECT_EQ(outcome.status, BattleStatus::Victory);
    ASSERT_GE(outcome.log.size(), 3u);
    EXPECT_EQ(outcome.log[0], "Hero used Finisher.");
    EXPECT_EQ(outcome.log[1], "Defeated Brute!");
    EXPECT_EQ(battle.player().state.health, 20);
}
