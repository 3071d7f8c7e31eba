#pragma once

#include "Types.hpp"
#include "Index.hpp"
#include "Items.hpp"
#include "StaticField.hpp"
#include "MovingField.hpp"
#include "ControlledCapsule.hpp"
#include "Tick.hpp"
#include "FieldConfig.hpp"

#include <array>
#include <deque>
#include <optional>
#include <random>
#include <utility>
#include <vector>

namespace pillfall::core {

// One player's field: the settled and the moving elements plus the capsule
// currently under the player's control.
//
// PlayerField does not keep time and does not decide when a round ends; the
// caller drives tick() at its own pace and checks isDefeated().
class PlayerField {
public:
    using SingleCapsules = std::vector<std::pair<ColumnIndex, Colour>>;

    explicit PlayerField(FieldConfig config = {});

    const FieldConfig& config() const noexcept { return config_; }
    const StaticField& staticField() const noexcept { return static_; }
    const MovingField& movingField() const noexcept { return moving_; }
    const std::optional<ControlledCapsule>& capsule() const noexcept { return capsule_; }
    const std::array<Colour, 2>& nextColours() const noexcept { return nextColours_; }

    // Lowest row holding moving elements, std::nullopt if nothing is moving
    std::optional<RowIndex> lowestUnsettledRow() const noexcept { return lowest_; }

    // Rows eliminated during the last tick()
    const Eliminated& lastEliminated() const noexcept { return lastEliminated_; }

    bool isDefeated() const noexcept { return static_.isDefeated(); }
    int virusCount() const noexcept { return static_.virusCount(); }

    // Clear the field and place viruses according to the config.
    // Returns the updates for the placed viruses.
    std::vector<Update> prepare();

    // Advance the field by one tick: settle, eliminate, unsettle, apply
    // gravity and, once nothing is moving, release queued single capsules or
    // spawn the next player capsule.
    std::vector<Update> tick();

    // Move or rotate the controlled capsule. Returns std::nullopt if there is
    // no capsule or the movement is blocked.
    std::optional<ControlledCapsule::MoveUpdates> applyMovement(Movement movement);

    // Single capsules to drop into the top row once nothing else is moving
    void queueSingleCapsules(SingleCapsules capsules);

private:
    FieldConfig config_;
    std::mt19937 rng_;

    StaticField static_;
    MovingField moving_;
    std::optional<ControlledCapsule> capsule_;
    std::optional<RowIndex> lowest_;
    std::array<Colour, 2> nextColours_;
    Eliminated lastEliminated_;
    std::deque<SingleCapsules> pendingSingles_;

    std::array<Colour, 2> drawColours();
    void spawn(std::vector<Update>& updates);
};

} // namespace pillfall::core
