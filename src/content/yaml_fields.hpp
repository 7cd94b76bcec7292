#pragma once

/// @file yaml_fields.hpp
/// @brief Shared YAML field readers for content and persistence.
///
/// Readers throw YAML::Exception on malformed input and ContentError on
/// semantically invalid values; callers translate both into GameError.

#include <cmath>
#include <stdexcept>
#include <string>

#include <yaml-cpp/yaml.h>

#include "tbe/battle/alignment.hpp"
#include "tbe/battle/character.hpp"
#include "tbe/battle/stat_vector.hpp"

namespace tbe::content::detail {

/// Invalid value in an otherwise well-formed document.
class ContentError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

inline YAML::Node require(const YAML::Node& node, const char* key) {
    auto child = node[key];
    if (!child) {
        throw ContentError(std::string("missing field '") + key + "'");
    }
    return child;
}

inline battle::Alignment readAlignment(const YAML::Node& node) {
    auto text = node.as<std::string>();
    auto alignment = battle::parseAlignment(text);
    if (!alignment) {
        throw ContentError("unknown alignment '" + text + "'");
    }
    return *alignment;
}

template <typename T>
battle::StatVector<T> readStats(const YAML::Node& node) {
    battle::StatVector<T> stats;
    stats.health = require(node, "health").as<T>();
    stats.attack = require(node, "attack").as<T>();
    stats.defense = require(node, "defense").as<T>();
    stats.speed = require(node, "speed").as<T>();
    return stats;
}

template <typename T>
void writeStats(YAML::Emitter& out, const battle::StatVector<T>& stats) {
    out << YAML::BeginMap;
    out << YAML::Key << "health" << YAML::Value << stats.health;
    out << YAML::Key << "attack" << YAML::Value << stats.attack;
    out << YAML::Key << "defense" << YAML::Value << stats.defense;
    out << YAML::Key << "speed" << YAML::Value << stats.speed;
    out << YAML::EndMap;
}

inline battle::Species readSpecies(const YAML::Node& node) {
    battle::Species species;
    species.name = require(node, "name").as<std::string>();
    species.bst = require(node, "bst").as<uint32_t>();
    species.alignment = readAlignment(require(node, "alignment"));
    species.baseStats = readStats<double>(require(node, "base_stats"));
    for (std::size_t i = 0; i < battle::StatRatios::kComponentCount; ++i) {
        auto ratio = species.baseStats.at(i);
        if (!std::isfinite(ratio) || ratio < 0.0) {
            throw ContentError("species '" + species.name +
                               "' has an invalid base stat ratio " + std::to_string(ratio));
        }
    }
    return species;
}

inline void writeSpecies(YAML::Emitter& out, const battle::Species& species) {
    out << YAML::BeginMap;
    out << YAML::Key << "name" << YAML::Value << species.name;
    out << YAML::Key << "bst" << YAML::Value << species.bst;
    out << YAML::Key << "alignment" << YAML::Value
        << std::string(battle::alignmentName(species.alignment));
    out << YAML::Key << "base_stats" << YAML::Value;
    writeStats(out, species.baseStats);
    out << YAML::EndMap;
}

}  // namespace tbe::content::detail
