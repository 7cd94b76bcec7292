/// @file action_pool.cpp
/// @brief ActionPool implementation.

#include "tbe/battle/action_pool.hpp"

#include <utility>

#include "tbe/foundation/game_logger.hpp"

namespace tbe::battle {

ActionPool::ActionPool(std::vector<Action> actions, std::size_t padding)
    : actions_(std::move(actions)), padding_(padding) {}

ActionId ActionPool::add(Action action) {
    actions_.push_back(std::move(action));
    return actions_.size() - 1;
}

const Action& ActionPool::resolve(ActionId id) const {
    if (id < actions_.size()) {
        return actions_[id];
    }
    TBE_LOG_DEBUG(foundation::LogCategory::Action,
                  "action id " + std::to_string(id) + " resolved to Skip");
    return skipAction();
}

std::vector<ActionId> ActionPool::sampleIds(std::size_t count,
                                            foundation::IRandomSource& rng) const {
    std::vector<ActionId> ids;
    if (idSpace() == 0) {
        return ids;
    }
    ids.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        ids.push_back(rng.uniformIndex(idSpace()));
    }
    return ids;
}

const Action& ActionPool::skipAction() noexcept {
    static const Action skip{Skip{}};
    return skip;
}

}  // namespace tbe::battle
