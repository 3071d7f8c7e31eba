#include "core/MovingField.hpp"

#include <stdexcept>

namespace pillfall::core {

std::vector<Update> MovingField::tick() {
    offset_ = (offset_ == 0) ? slots_.size() - 1 : offset_ - 1;

    std::vector<Update> updates;
    for (RowIndex row : allRows().reversed()) {
        for (const Position& pos : completeRow(row)) {
            if (const auto colour = colourOf((*this)[pos])) {
                updates.push_back(Update{pos, colour});
                continue;
            }
            // An element just left this tile for the one below
            const auto below = pos + Direction::Below;
            if (below && (*this)[*below].has_value()) {
                updates.push_back(Update{pos, std::nullopt});
            }
        }
    }
    return updates;
}

std::vector<Update> MovingField::spawnSingleCapsules(
    const std::vector<std::pair<ColumnIndex, Colour>>& capsules)
{
    std::vector<Update> updates;
    updates.reserve(capsules.size());
    for (const auto& [col, colour] : capsules) {
        const Position pos{RowIndex::first(), col};
        (*this)[pos] = CapsuleElement::single(colour);
        updates.push_back(Update{pos, colour});
    }
    return updates;
}

RowIndex MovingField::rowIndexFromMoving(MovingRowIndex index) const {
    const std::size_t rows = slots_.size();
    const auto row = RowIndex::tryFrom(static_cast<int>((index.slot_ + rows - offset_) % rows));
    if (!row) {
        throw std::logic_error("MovingField: moving row index does not map to a row");
    }
    return *row;
}

bool MovingField::isEmpty() const noexcept {
    for (const auto& slot : slots_) {
        for (ColumnIndex col : allColumns()) {
            if (slot[col].has_value()) {
                return false;
            }
        }
    }
    return true;
}

} // namespace pillfall::core
