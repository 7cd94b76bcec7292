#include <gtest/gtest.h>

#include <string>

#include "scripted_random.hpp"
#include "tbe/battle/experience.hpp"
#include "tbe/content/character_codec.hpp"

using namespace tbe::content;
using namespace tbe::battle;
using tbe::foundation::ErrorCode;
using tbe::test::ScriptedRandom;

namespace {

Character veteran() {
    Species species{"Scissors Fang", 420, StatRatios{0.1, 0.2, 0.3, 0.4}, Alignment::Scissors};
    ScriptedRandom rng;
    auto character = characterAtLevel(species, 7, {0, 4, 9}, rng);
    character.name = "Fang the Second";
    character.attributes.experience = 63;
    character.state.health -= 11;
    character.state.alignment = Alignment::Paper;
    character.state.statuses.add(Status::Bleed, 3);
    character.state.statuses.ensure(Status::Defend);
    return character;
}

}  // namespace

TEST(CharacterCodecTest, RoundTripPreservesEveryField) {
    auto saved = veteran();

    auto encoded = encodeCharacter(saved);
    ASSERT_TRUE(encoded.hasValue()) << encoded.error().message();

    auto decoded = decodeCharacter(encoded.value());
    ASSERT_TRUE(decoded.hasValue()) << decoded.error().message();
    EXPECT_EQ(decoded.value(), saved);
}

TEST(CharacterCodecTest, FreshCharacterRoundTrips) {
    Species species{"Rock Pawn", 400, StatRatios{0.3, 0.3, 0.25, 0.15}, Alignment::Rock};
    auto saved = Character::fromSpecies(species);

    auto encoded = encodeCharacter(saved);
    ASSERT_TRUE(encoded.hasValue());
    auto decoded = decodeCharacter(encoded.value());
    ASSERT_TRUE(decoded.hasValue()) << decoded.error().message();
    EXPECT_EQ(decoded.value(), saved);
}

TEST(CharacterCodecTest, DocumentIsReadable) {
    auto encoded = encodeCharacter(veteran());
    ASSERT_TRUE(encoded.hasValue());
    const auto& text = encoded.value();
    EXPECT_NE(text.find("name: Fang the Second"), std::string::npos);
    EXPECT_NE(text.find("alignment: Paper"), std::string::npos);
    EXPECT_NE(text.find("Bleed: 3"), std::string::npos);
}

TEST(CharacterCodecTest, MalformedDocumentFails) {
    auto decoded = decodeCharacter("name: [unterminated\n");
    ASSERT_TRUE(decoded.hasError());
    EXPECT_EQ(decoded.error().code(), ErrorCode::DecodeFailed);
}

TEST(CharacterCodecTest, MissingSectionFails) {
    auto decoded = decodeCharacter("name: Nobody\n");
    ASSERT_TRUE(decoded.hasError());
    EXPECT_EQ(decoded.error().code(), ErrorCode::DecodeFailed);
}

TEST(CharacterCodecTest, HealthAboveMaximumFails) {
    auto character = veteran();
    character.state.health = static_cast<int32_t>(character.attributes.stats.health) + 1;
    auto encoded = encodeCharacter(character);
    ASSERT_TRUE(encoded.hasValue());

    auto decoded = decodeCharacter(encoded.value());
    ASSERT_TRUE(decoded.hasError());
    EXPECT_EQ(decoded.error().code(), ErrorCode::DecodeFailed);
}

TEST(CharacterCodecTest, ExperienceAtLevelThresholdFails) {
    auto character = veteran();
    character.attributes.experience = kExperienceToLevel;
    auto encoded = encodeCharacter(character);
    ASSERT_TRUE(encoded.hasValue());

    auto decoded = decodeCharacter(encoded.value());
    ASSERT_TRUE(decoded.hasError());
    EXPECT_EQ(decoded.error().code(), ErrorCode::DecodeFailed);

    ProgressionRules slower;
    slower.experienceToLevel = 250;
    auto relaxed = decodeCharacter(encoded.value(), slower);
    ASSERT_TRUE(relaxed.hasValue());
    EXPECT_EQ(relaxed.value().attributes.experience, kExperienceToLevel);
}

TEST(CharacterCodecTest, UnknownStatusFails) {
    auto encoded = encodeCharacter(veteran());
    ASSERT_TRUE(encoded.hasValue());
    auto text = encoded.value();
    auto pos = text.find("Bleed: 3");
    ASSERT_NE(pos, std::string::npos);
    text.replace(pos, 5, "Burnt");

    auto decoded = decodeCharacter(text);
    ASSERT_TRUE(decoded.hasError());
    EXPECT_EQ(decoded.error().code(), ErrorCode::DecodeFailed);
}
