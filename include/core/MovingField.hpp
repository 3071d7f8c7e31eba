#pragma once

#include "Types.hpp"
#include "Index.hpp"
#include "Items.hpp"
#include "Row.hpp"

#include <array>
#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

namespace pillfall::core {

class MovingField;

// Index of a row in the field of moving elements which is tracked across
// MovingField::tick(), i.e. it moves down the field together with its row.
class MovingRowIndex {
public:
    friend bool operator==(MovingRowIndex a, MovingRowIndex b) noexcept { return a.slot_ == b.slot_; }
    friend bool operator!=(MovingRowIndex a, MovingRowIndex b) noexcept { return a.slot_ != b.slot_; }

private:
    friend class MovingField;

    explicit MovingRowIndex(std::size_t slot) noexcept : slot_{slot} {}

    std::size_t slot_;
};

// Field of unsettled/moving capsule elements.
//
// Gravity is applied to all rows at once by rotating the mapping between
// logical rows and storage slots; no element is copied on a tick.
class MovingField {
public:
    using Cell = std::optional<CapsuleElement>;

    MovingField() = default;

    Cell& operator[](Position pos) noexcept { return slots_[slotOf(pos.row)][pos.col]; }
    const Cell& operator[](Position pos) const noexcept { return slots_[slotOf(pos.row)][pos.col]; }

    // Move all elements down one row. The bottom row wraps around and becomes
    // the new top row, so it must be empty when calling this.
    //
    // Returns the updates for the whole field, bottom row first.
    std::vector<Update> tick();

    // Place unbound elements of the given colours in the current top row
    std::vector<Update> spawnSingleCapsules(const std::vector<std::pair<ColumnIndex, Colour>>& capsules);

    MovingRowIndex movingRowIndex(RowIndex row) const noexcept { return MovingRowIndex{slotOf(row)}; }

    // Throws std::logic_error if the result is not a valid row
    RowIndex rowIndexFromMoving(MovingRowIndex index) const;

    bool isEmpty() const noexcept;

private:
    std::array<Row<Cell>, FieldHeight> slots_{};
    std::size_t offset_{0};

    std::size_t slotOf(RowIndex row) const noexcept {
        return (static_cast<std::size_t>(row.value()) + offset_) % slots_.size();
    }
};

} // namespace pillfall::core
