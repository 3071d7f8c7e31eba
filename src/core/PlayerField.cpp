#include "core/PlayerField.hpp"

#include "core/Preparation.hpp"

#include <algorithm>
#include <stdexcept>

namespace pillfall::core {

namespace {

std::mt19937 makeRng(std::uint32_t seed) {
    if (seed == 0) {
        return std::mt19937{std::random_device{}()};
    }
    return std::mt19937{seed};
}

std::optional<RowIndex> lower(std::optional<RowIndex> a, std::optional<RowIndex> b) {
    if (!a) return b;
    if (!b) return a;
    return std::max(*a, *b);
}

} // namespace

PlayerField::PlayerField(FieldConfig config)
    : config_{config}
    , rng_{makeRng(config.seed)}
    , static_{}
    , moving_{}
    , capsule_{}
    , lowest_{}
    , nextColours_{}
    , lastEliminated_{}
    , pendingSingles_{}
{
    config_.validate();
    nextColours_ = drawColours();
}

std::vector<Update> PlayerField::prepare() {
    moving_ = MovingField{};
    capsule_.reset();
    lowest_.reset();
    lastEliminated_ = Eliminated{};
    pendingSingles_.clear();

    const VirusPlacement viruses = prepareField(rng_, RowIndex{config_.firstVirusRow}, config_.virusCount);
    static_ = StaticField::withViruses(viruses);

    std::vector<Update> updates;
    updates.reserve(viruses.size());
    for (const auto& [pos, colour] : viruses) {
        updates.push_back(Update{pos, colour});
    }
    return updates;
}

std::vector<Update> PlayerField::tick() {
    std::vector<Update> updates;
    lastEliminated_ = Eliminated{};

    if (lowest_) {
        // The capsule is gone from the moving field once it has settled.
        std::optional<Position> capsulePos;
        if (capsule_) {
            capsulePos = capsule_->positions(moving_).first;
        }

        auto [settled, lowest] = settleElements(moving_, static_, *lowest_);
        if (capsulePos && !moving_[*capsulePos]) {
            capsule_.reset();
        }

        lastEliminated_ = eliminateElements(static_, settled);
        for (const Position& pos : lastEliminated_.positions()) {
            updates.push_back(Update{pos, std::nullopt});
        }

        lowest_ = lower(lowest, unsettleElements(moving_, static_, lastEliminated_));
    }

    if (lowest_) {
        const std::vector<Update> gravity = moving_.tick();
        updates.insert(updates.end(), gravity.begin(), gravity.end());

        // Elements in the bottom row always settle, so there is a next row.
        const auto next = lowest_->forward();
        if (!next) {
            throw std::logic_error("PlayerField: moving element below the bottom row");
        }
        lowest_ = next;
    }

    if (!capsule_ && !lowest_ && !isDefeated()) {
        spawn(updates);
    }

    return updates;
}

std::optional<ControlledCapsule::MoveUpdates> PlayerField::applyMovement(Movement movement) {
    if (!capsule_) {
        return std::nullopt;
    }
    auto moved = capsule_->apply(moving_, static_, movement);
    if (moved) {
        // A capsule turned upright reaches one row further down
        const auto [a, b] = capsule_->positions(moving_);
        lowest_ = lower(lowest_, std::max(a.row, b.row));
    }
    return moved;
}

void PlayerField::queueSingleCapsules(SingleCapsules capsules) {
    if (capsules.empty()) {
        return;
    }
    pendingSingles_.push_back(std::move(capsules));
}

std::array<Colour, 2> PlayerField::drawColours() {
    return {randomColour(rng_), randomColour(rng_)};
}

void PlayerField::spawn(std::vector<Update>& updates) {
    if (!pendingSingles_.empty()) {
        const std::vector<Update> spawned = moving_.spawnSingleCapsules(pendingSingles_.front());
        pendingSingles_.pop_front();
        updates.insert(updates.end(), spawned.begin(), spawned.end());
        lowest_ = RowIndex::first();
        return;
    }

    auto [capsule, spawned] = ControlledCapsule::spawn(moving_, nextColours_);
    capsule_ = capsule;
    updates.insert(updates.end(), spawned.begin(), spawned.end());
    nextColours_ = drawColours();
    lowest_ = RowIndex::first();
}

} // namespace pillfall::core
