/// @file main.cpp
/// @brief Battle simulator entry point.
///
/// Loads configuration and content, spawns a player at the configured level,
/// and sends it against freshly spawned enemies. Each battle plays randomly
/// chosen actions until one side falls or the round limit is reached; a
/// victorious player is refreshed and carries its experience into the next.

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <cctype>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

#include "tbe/battle/battle.hpp"
#include "tbe/battle/experience.hpp"
#include "tbe/battle/turn_order.hpp"
#include "tbe/content/content_loader.hpp"
#include "tbe/foundation/config_manager.hpp"
#include "tbe/foundation/game_logger.hpp"
#include "tbe/foundation/random_source.hpp"

namespace {

namespace kci = kcenon::common::interfaces;

constexpr std::string_view kDefaultConfigPath = "config/battle_sim.yaml";
constexpr std::size_t kMovesPerCharacter = 4;

/// Writes diagnostics to stderr so stdout carries only the battle log.
class ConsoleLogger : public kci::ILogger {
public:
    kcenon::common::VoidResult log(kci::log_level level,
                                   const std::string& message) override {
        if (!is_enabled(level)) {
            return kcenon::common::VoidResult::ok(std::monostate{});
        }
        std::lock_guard lock(mutex_);
        std::cerr << levelTag(level) << ' ' << message << '\n';
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    kcenon::common::VoidResult log(kci::log_level level, std::string_view message,
                                   const kci::source_location& /*loc*/) override {
        return log(level, std::string(message));
    }

    kcenon::common::VoidResult log(const kci::log_entry& entry) override {
        return log(entry.level, entry.message);
    }

    bool is_enabled(kci::log_level level) const override {
        return level >= minLevel_;
    }

    kcenon::common::VoidResult set_level(kci::log_level level) override {
        minLevel_ = level;
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    kci::log_level get_level() const override { return minLevel_; }

    kcenon::common::VoidResult flush() override {
        std::lock_guard lock(mutex_);
        std::cerr.flush();
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

private:
    static std::string_view levelTag(kci::log_level level) {
        switch (level) {
            case kci::log_level::trace:    return "[trace]";
            case kci::log_level::debug:    return "[debug]";
            case kci::log_level::info:     return "[info]";
            case kci::log_level::warning:  return "[warn]";
            case kci::log_level::error:    return "[error]";
            case kci::log_level::critical: return "[critical]";
            default:                       return "[log]";
        }
    }

    std::mutex mutex_;
    kci::log_level minLevel_ = kci::log_level::trace;
};

struct SimulatorConfig {
    std::filesystem::path contentFile = "config/content.yaml";
    uint32_t playerLevel = 5;
    uint32_t enemyLevel = 5;
    uint32_t maxRounds = 100;
    uint32_t battles = 1;
    std::optional<uint32_t> seed;
};

std::filesystem::path parseConfigArg(int argc, char* argv[]) {
    for (int i = 1; i < argc - 1; ++i) {
        if (std::string_view(argv[i]) == "--config") {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            return argv[i + 1];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        }
    }
    return {};
}

tbe::foundation::GameResult<void> loadConfig(tbe::foundation::ConfigManager& config,
                                             const std::filesystem::path& defaultPath) {
    std::filesystem::path configPath = defaultPath;

    const char* envPath = std::getenv("TBE_CONFIG_PATH");
    if (envPath != nullptr) {
        configPath = envPath;
    }

    return config.load(configPath);
}

SimulatorConfig buildSimulatorConfig(const tbe::foundation::ConfigManager& config) {
    SimulatorConfig cfg;

    auto content = config.get<std::string>("simulator.content_file");
    if (content) {
        cfg.contentFile = content.value();
    }

    cfg.playerLevel = config.getOr<uint32_t>("simulator.player_level", cfg.playerLevel);
    cfg.enemyLevel = config.getOr<uint32_t>("simulator.enemy_level", cfg.enemyLevel);
    cfg.maxRounds = config.getOr<uint32_t>("simulator.max_rounds", cfg.maxRounds);
    cfg.battles = config.getOr<uint32_t>("simulator.battles", cfg.battles);

    auto seed = config.get<uint32_t>("simulator.seed");
    if (seed) {
        cfg.seed = seed.value();
    }
    return cfg;
}

/// Apply "logging.<category>" level names. Unknown names are reported and skipped.
void applyLogLevels(const tbe::foundation::ConfigManager& config) {
    using tbe::foundation::LogCategory;
    auto& logger = tbe::foundation::GameLogger::instance();
    for (std::size_t i = 0; i < tbe::foundation::kLogCategoryCount; ++i) {
        auto cat = static_cast<LogCategory>(i);
        std::string name(tbe::foundation::logCategoryName(cat));
        for (auto& c : name) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        auto value = config.get<std::string>("logging." + name);
        if (!value) {
            continue;
        }
        auto level = tbe::foundation::parseLogLevel(value.value());
        if (!level) {
            TBE_LOG_WARN(LogCategory::Config, level.error().message());
            continue;
        }
        logger.setCategoryLevel(cat, level.value());
    }
}

void printLog(const tbe::battle::BattleLog& log) {
    for (const auto& line : log) {
        std::cout << line << "\n";
    }
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace tbe;

    kci::GlobalLoggerRegistry::instance().set_default_logger(
        std::make_shared<ConsoleLogger>());

    auto configPath = parseConfigArg(argc, argv);
    if (configPath.empty()) {
        configPath = kDefaultConfigPath;
    }

    foundation::ConfigManager config;
    auto loadResult = loadConfig(config, configPath);
    if (!loadResult) {
        std::cerr << "Failed to load config: "
                  << loadResult.error().describe() << "\n";
        return EXIT_FAILURE;
    }
    applyLogLevels(config);

    auto rules = battle::ProgressionRules::fromConfig(config);
    if (!rules) {
        std::cerr << "Invalid progression rules: " << rules.error().describe() << "\n";
        return EXIT_FAILURE;
    }

    auto simCfg = buildSimulatorConfig(config);
    auto loaded = content::loadContentFile(simCfg.contentFile);
    if (!loaded) {
        std::cerr << "Failed to load content: " << loaded.error().describe() << "\n";
        return EXIT_FAILURE;
    }
    if (loaded.value().species.empty()) {
        std::cerr << "Content file " << simCfg.contentFile << " defines no species\n";
        return EXIT_FAILURE;
    }

    auto rng = simCfg.seed ? foundation::RandomSource(*simCfg.seed)
                           : foundation::RandomSource();
    TBE_LOG_INFO(foundation::LogCategory::Core,
                 "simulator seed " + std::to_string(rng.seed()));

    const auto& roster = loaded.value().species;
    const auto& pool = loaded.value().actions;

    auto spawn = [&](uint32_t level) {
        const auto& species = roster[rng.uniformIndex(roster.size())];
        return battle::characterAtLevel(species, level,
                                        pool.sampleIds(kMovesPerCharacter, rng),
                                        rng, rules.value());
    };
    auto player = spawn(simCfg.playerLevel);
    for (uint32_t number = 1; number <= simCfg.battles; ++number) {
        auto enemy = spawn(simCfg.enemyLevel);
        std::cout << "== Battle " << number << ": " << player.name << " (level "
                  << player.attributes.level << ", "
                  << battle::alignmentName(player.state.alignment) << ") vs "
                  << enemy.name << " (level " << enemy.attributes.level << ", "
                  << battle::alignmentName(enemy.state.alignment) << ") ==\n";

        battle::Battle fight(std::move(player), std::move(enemy), rules.value());
        auto status = fight.status();
        while (status == battle::BattleStatus::InProgress &&
               fight.round() < simCfg.maxRounds) {
            const auto& playerAction = battle::chooseAction(fight.player(), pool, rng);
            const auto& enemyAction = battle::chooseAction(fight.enemy(), pool, rng);
            auto outcome = battle::playRound(fight, playerAction, enemyAction, rng);
            std::cout << "-- Round " << fight.round() << " --\n";
            printLog(outcome.log);
            status = outcome.status;
        }

        if (status != battle::BattleStatus::Victory) {
            if (status == battle::BattleStatus::InProgress) {
                std::cout << "No winner after " << fight.round() << " rounds.\n";
            } else {
                std::cout << "Result: " << battle::battleStatusName(status) << "\n";
            }
            break;
        }
        std::cout << "Result: " << battle::battleStatusName(status) << "\n";

        player = fight.player();
        player.refresh();
    }

    auto flushResult = foundation::GameLogger::instance().flush();
    if (!flushResult) {
        std::cerr << "Failed to flush logger: " << flushResult.error().message() << "\n";
    }
    return EXIT_SUCCESS;
}
