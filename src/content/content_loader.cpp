/// @file content_loader.cpp
/// @brief YAML species/action content loading.

#include "tbe/content/content_loader.hpp"

#include <string>
#include <utility>

#include <yaml-cpp/yaml.h>

#include "tbe/foundation/game_logger.hpp"
#include "yaml_fields.hpp"

namespace tbe::content {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;

namespace {

battle::Action readAction(const YAML::Node& node) {
    auto kind = detail::require(node, "kind").as<std::string>();
    auto name = detail::require(node, "name").as<std::string>();

    if (kind == battle::actionKindName(battle::ActionKind::Attack)) {
        battle::Attack attack;
        attack.name = std::move(name);
        attack.power = detail::require(node, "power").as<uint32_t>();
        attack.alignment = detail::readAlignment(detail::require(node, "alignment"));
        attack.priority = node["priority"] ? node["priority"].as<int32_t>() : 0;
        return attack;
    }
    if (kind == battle::actionKindName(battle::ActionKind::FixedAttack)) {
        return battle::FixedAttack{std::move(name),
                                   detail::require(node, "power").as<uint32_t>()};
    }
    if (kind == battle::actionKindName(battle::ActionKind::Defend)) {
        return battle::Defend{std::move(name)};
    }
    if (kind == battle::actionKindName(battle::ActionKind::Bleed)) {
        return battle::Bleed{std::move(name),
                             detail::require(node, "power").as<uint32_t>()};
    }
    if (kind == battle::actionKindName(battle::ActionKind::Stun)) {
        return battle::Stun{std::move(name)};
    }
    throw detail::ContentError("unknown action kind '" + kind + "' for '" + name + "'");
}

Content readContent(const YAML::Node& root) {
    Content content;

    if (auto species = root["species"]) {
        for (const auto& entry : species) {
            content.species.push_back(detail::readSpecies(entry));
        }
    }
    if (auto actions = root["actions"]) {
        for (const auto& entry : actions) {
            content.actions.add(readAction(entry));
        }
    }
    if (auto padding = root["action_padding"]) {
        content.actions.setPadding(padding.as<std::size_t>());
    }
    return content;
}

GameResult<Content> build(const YAML::Node& root, const std::string& origin) {
    try {
        auto content = readContent(root);
        TBE_LOG_INFO(LogCategory::Content,
                     "loaded " + std::to_string(content.species.size()) + " species and " +
                     std::to_string(content.actions.size()) + " actions from " + origin);
        return GameResult<Content>::ok(std::move(content));
    } catch (const detail::ContentError& e) {
        return GameResult<Content>::err(
            GameError(ErrorCode::ContentInvalid, origin + ": " + e.what()));
    } catch (const YAML::Exception& e) {
        return GameResult<Content>::err(
            GameError(ErrorCode::ContentInvalid, origin + ": " + e.what()));
    }
}

}  // namespace

GameResult<Content> loadContentFile(const std::filesystem::path& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::BadFile&) {
        return GameResult<Content>::err(
            GameError(ErrorCode::ContentLoadFailed, "failed to open content file: " + path.string()));
    } catch (const YAML::ParserException& e) {
        return GameResult<Content>::err(
            GameError(ErrorCode::ContentLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
    return build(root, path.string());
}

GameResult<Content> loadContent(std::string_view document) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(document));
    } catch (const YAML::ParserException& e) {
        return GameResult<Content>::err(
            GameError(ErrorCode::ContentLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
    return build(root, "<inline>");
}

GameResult<battle::Species> findSpecies(const Content& content, std::string_view name) {
    for (const auto& species : content.species) {
        if (species.name == name) {
            return GameResult<battle::Species>::ok(species);
        }
    }
    return GameResult<battle::Species>::err(
        GameError(ErrorCode::SpeciesNotFound,
                  "species not found: " + std::string(name), std::string(name)));
}

}  // namespace tbe::content
