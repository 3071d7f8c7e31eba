#pragma once

#include "Types.hpp"
#include "Index.hpp"
#include "Items.hpp"
#include "MovingField.hpp"
#include "StaticField.hpp"

#include <array>
#include <optional>
#include <utility>

namespace pillfall::core {

// Handle for a player controlled capsule.
//
// The capsule's elements live in the field of moving elements; the handle
// only remembers where the reference element is. Its row is a
// MovingRowIndex, so the handle stays valid across MovingField::tick(). The
// other element is always found through the reference element's partner.
class ControlledCapsule {
public:
    static constexpr std::size_t UpdateCount = 4;
    using MoveUpdates = std::array<Update, UpdateCount>;

    // Place a new horizontal capsule in the (current) top row of `field`,
    // centred. colours[0] goes left, colours[1] right.
    static std::pair<ControlledCapsule, std::array<Update, 2>>
    spawn(MovingField& field, const std::array<Colour, 2>& colours);

    // Each operation returns std::nullopt and leaves everything untouched if
    // a target tile is outside the field or occupied in `settled`. On
    // success it returns, in order: clear old A, clear old B, set new A,
    // set new B.
    std::optional<MoveUpdates> moveLeft(MovingField& moving, const StaticField& settled);
    std::optional<MoveUpdates> moveRight(MovingField& moving, const StaticField& settled);
    std::optional<MoveUpdates> rotateCw(MovingField& moving, const StaticField& settled);
    std::optional<MoveUpdates> rotateCcw(MovingField& moving, const StaticField& settled);

    std::optional<MoveUpdates> apply(MovingField& moving, const StaticField& settled, Movement movement);

    // Column of the reference element (the left one of a horizontal capsule)
    ColumnIndex column() const noexcept { return column_; }

    // Current positions of the reference element and its partner
    std::pair<Position, Position> positions(const MovingField& moving) const;

private:
    ControlledCapsule(MovingRowIndex row, ColumnIndex column) noexcept
        : row_{row}, column_{column}
    {
    }

    enum class Transform : std::uint8_t {
        ShiftLeft,
        ShiftRight,
        RotateCw,
        RotateCcw
    };

    std::optional<MoveUpdates> transform(MovingField& moving, const StaticField& settled, Transform how);

    MovingRowIndex row_;
    ColumnIndex column_;
};

} // namespace pillfall::core
