#pragma once

/// @file action_pool.hpp
/// @brief ActionPool: caller-owned arena of actions addressed by ActionId.

#include <cstddef>
#include <vector>

#include "tbe/battle/action.hpp"
#include "tbe/battle/battle_types.hpp"
#include "tbe/foundation/random_source.hpp"

namespace tbe::battle {

/// Flat, append-only sequence of actions.
///
/// Characters store ActionIds only. Resolving an id never fails: anything
/// out of range resolves to the shared Skip action. The pool is built once by
/// content code and read-only afterwards.
///
/// Padding reserves ids past the end of the pool that are legal to hand out
/// (e.g. when rolling a random move set) but resolve to Skip.
class ActionPool {
public:
    ActionPool() = default;

    explicit ActionPool(std::vector<Action> actions, std::size_t padding = 0);

    /// Append an action and return its id.
    ActionId add(Action action);

    /// The action for @p id, or skipAction() when @p id is not in the pool.
    [[nodiscard]] const Action& resolve(ActionId id) const;

    [[nodiscard]] const Action& operator[](ActionId id) const { return resolve(id); }

    [[nodiscard]] bool contains(ActionId id) const noexcept { return id < actions_.size(); }

    /// Number of real actions.
    [[nodiscard]] std::size_t size() const noexcept { return actions_.size(); }

    [[nodiscard]] bool empty() const noexcept { return actions_.empty(); }

    [[nodiscard]] std::size_t padding() const noexcept { return padding_; }

    void setPadding(std::size_t padding) noexcept { padding_ = padding; }

    /// size() + padding(): the range random move sets are drawn from.
    [[nodiscard]] std::size_t idSpace() const noexcept { return actions_.size() + padding_; }

    /// Draw @p count ids uniformly from [0, idSpace()), with repetition.
    [[nodiscard]] std::vector<ActionId> sampleIds(std::size_t count,
                                                  foundation::IRandomSource& rng) const;

    /// Shared Skip instance returned for unresolvable ids.
    [[nodiscard]] static const Action& skipAction() noexcept;

private:
    std::vector<Action> actions_;
    std::size_t padding_ = 0;
};

}  // namespace tbe::battle
