/// @file character_codec.cpp
/// @brief Character <-> YAML document.

#include "tbe/content/character_codec.hpp"

#include <optional>
#include <string>
#include <utility>

#include <yaml-cpp/yaml.h>

#include "tbe/foundation/game_logger.hpp"
#include "yaml_fields.hpp"

namespace tbe::content {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;

namespace {

// Enough digits for doubles to parse back bit-identical.
constexpr int kRatioPrecision = 17;

std::optional<battle::Status> parseStatus(const std::string& name) {
    for (std::size_t i = 0; i < battle::kStatusCount; ++i) {
        auto status = static_cast<battle::Status>(i);
        if (name == battle::statusName(status)) {
            return status;
        }
    }
    return std::nullopt;
}

}  // namespace

GameResult<std::string> encodeCharacter(const battle::Character& character) {
    YAML::Emitter out;
    out.SetDoublePrecision(kRatioPrecision);

    out << YAML::BeginMap;
    out << YAML::Key << "name" << YAML::Value << character.name;

    out << YAML::Key << "species" << YAML::Value;
    detail::writeSpecies(out, character.species);

    const auto& attrs = character.attributes;
    out << YAML::Key << "attributes" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "level" << YAML::Value << attrs.level;
    out << YAML::Key << "experience" << YAML::Value << attrs.experience;
    out << YAML::Key << "stats" << YAML::Value;
    detail::writeStats(out, attrs.stats);
    out << YAML::Key << "actions" << YAML::Value << YAML::Flow << YAML::BeginSeq;
    for (auto id : attrs.actions) {
        out << static_cast<unsigned long long>(id);
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;

    const auto& state = character.state;
    out << YAML::Key << "state" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "alignment" << YAML::Value
        << std::string(battle::alignmentName(state.alignment));
    out << YAML::Key << "health" << YAML::Value << state.health;
    out << YAML::Key << "statuses" << YAML::Value << YAML::BeginMap;
    for (const auto& [status, intensity] : state.statuses.entries) {
        out << YAML::Key << std::string(battle::statusName(status))
            << YAML::Value << intensity;
    }
    out << YAML::EndMap;
    out << YAML::EndMap;

    out << YAML::EndMap;

    if (!out.good()) {
        return GameResult<std::string>::err(
            GameError(ErrorCode::EncodeFailed,
                      "failed to encode " + character.name + ": " + out.GetLastError()));
    }
    return GameResult<std::string>::ok(std::string(out.c_str()));
}

GameResult<battle::Character> decodeCharacter(std::string_view document,
                                               const battle::ProgressionRules& rules) {
    try {
        auto root = YAML::Load(std::string(document));

        battle::Character character;
        character.name = detail::require(root, "name").as<std::string>();
        character.species = detail::readSpecies(detail::require(root, "species"));

        auto attrs = detail::require(root, "attributes");
        character.attributes.level = detail::require(attrs, "level").as<uint32_t>();
        character.attributes.experience = detail::require(attrs, "experience").as<uint32_t>();
        character.attributes.stats =
            detail::readStats<uint32_t>(detail::require(attrs, "stats"));
        for (const auto& id : detail::require(attrs, "actions")) {
            character.attributes.actions.push_back(
                static_cast<battle::ActionId>(id.as<unsigned long long>()));
        }

        auto state = detail::require(root, "state");
        character.state.alignment = detail::readAlignment(detail::require(state, "alignment"));
        character.state.health = detail::require(state, "health").as<int32_t>();
        if (character.state.health < 0) {
            throw detail::ContentError("negative health");
        }
        if (static_cast<uint32_t>(character.state.health) > character.attributes.stats.health) {
            throw detail::ContentError("health " + std::to_string(character.state.health) +
                                       " exceeds maximum " +
                                       std::to_string(character.attributes.stats.health));
        }
        if (character.attributes.experience >= rules.experienceToLevel) {
            throw detail::ContentError("experience " +
                                       std::to_string(character.attributes.experience) +
                                       " is not below " + std::to_string(rules.experienceToLevel));
        }
        for (const auto& entry : detail::require(state, "statuses")) {
            auto key = entry.first.as<std::string>();
            auto status = parseStatus(key);
            if (!status) {
                throw detail::ContentError("unknown status '" + key + "'");
            }
            character.state.statuses.entries[*status] = entry.second.as<uint32_t>();
        }

        TBE_LOG_DEBUG(foundation::LogCategory::Content, "decoded character " + character.name);
        return GameResult<battle::Character>::ok(std::move(character));
    } catch (const detail::ContentError& e) {
        return GameResult<battle::Character>::err(
            GameError(ErrorCode::DecodeFailed, e.what()));
    } catch (const YAML::Exception& e) {
        return GameResult<battle::Character>::err(
            GameError(ErrorCode::DecodeFailed, e.what()));
    }
}

}  // namespace tbe::content
