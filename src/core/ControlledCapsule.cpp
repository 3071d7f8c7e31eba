#include "core/ControlledCapsule.hpp"

#include <algorithm>
#include <stdexcept>

namespace pillfall::core {

std::pair<ControlledCapsule, std::array<Update, 2>>
ControlledCapsule::spawn(MovingField& field, const std::array<Colour, 2>& colours)
{
    const Position left{RowIndex::first(), ColumnIndex{FieldWidth / 2 - 1}};
    const Position right{RowIndex::first(), ColumnIndex{FieldWidth / 2}};

    field[left]  = CapsuleElement{colours[0], Direction::Right};
    field[right] = CapsuleElement{colours[1], Direction::Left};

    return {
        ControlledCapsule{field.movingRowIndex(RowIndex::first()), left.col},
        {{Update{left, colours[0]}, Update{right, colours[1]}}}
    };
}

std::optional<ControlledCapsule::MoveUpdates>
ControlledCapsule::moveLeft(MovingField& moving, const StaticField& settled) {
    return transform(moving, settled, Transform::ShiftLeft);
}

std::optional<ControlledCapsule::MoveUpdates>
ControlledCapsule::moveRight(MovingField& moving, const StaticField& settled) {
    return transform(moving, settled, Transform::ShiftRight);
}

std::optional<ControlledCapsule::MoveUpdates>
ControlledCapsule::rotateCw(MovingField& moving, const StaticField& settled) {
    return transform(moving, settled, Transform::RotateCw);
}

std::optional<ControlledCapsule::MoveUpdates>
ControlledCapsule::rotateCcw(MovingField& moving, const StaticField& settled) {
    return transform(moving, settled, Transform::RotateCcw);
}

std::optional<ControlledCapsule::MoveUpdates>
ControlledCapsule::apply(MovingField& moving, const StaticField& settled, Movement movement) {
    switch (movement) {
    case Movement::Left:
        return moveLeft(moving, settled);
    case Movement::Right:
        return moveRight(moving, settled);
    case Movement::RotateCW:
        return rotateCw(moving, settled);
    case Movement::RotateCCW:
        return rotateCcw(moving, settled);
    }
    return std::nullopt;
}

std::pair<Position, Position> ControlledCapsule::positions(const MovingField& moving) const {
    const Position self{moving.rowIndexFromMoving(row_), column_};

    const auto& element = moving[self];
    if (!element) {
        throw std::logic_error("ControlledCapsule: reference element is missing");
    }
    if (!element->partner()) {
        throw std::logic_error("ControlledCapsule: reference element is unbound");
    }
    const auto partner = self + *element->partner();
    if (!partner) {
        throw std::logic_error("ControlledCapsule: partner points outside the field");
    }
    return {self, *partner};
}

std::optional<ControlledCapsule::MoveUpdates>
ControlledCapsule::transform(MovingField& moving, const StaticField& settled, Transform how) {
    const auto [a, b] = positions(moving);
    CapsuleElement elementA = *moving[a];
    CapsuleElement elementB = *moving[b];

    std::optional<Position> targetA;
    std::optional<Position> targetB;
    std::optional<Direction> rotated;

    switch (how) {
    case Transform::ShiftLeft:
        targetA = a + Direction::Left;
        targetB = b + Direction::Left;
        break;
    case Transform::ShiftRight:
        targetA = a + Direction::Right;
        targetB = b + Direction::Right;
        break;
    case Transform::RotateCw:
    case Transform::RotateCcw: {
        const Direction current = *elementA.partner();
        rotated = (how == Transform::RotateCw) ? rotatedCw(current) : rotatedCcw(current);

        // Rotation pivots on the top-left tile of the capsule
        const Position pivot{std::min(a.row, b.row), std::min(a.col, b.col)};
        const auto other = pivot + (isHorizontal(*rotated) ? Direction::Right : Direction::Below);
        if (!other) {
            return std::nullopt;
        }
        if (*rotated == Direction::Right || *rotated == Direction::Below) {
            targetA = pivot;
            targetB = other;
        } else {
            targetA = other;
            targetB = pivot;
        }
        break;
    }
    }

    if (!targetA || !targetB) {
        return std::nullopt;
    }
    if (settled[*targetA].isOccupied() || settled[*targetB].isOccupied()) {
        return std::nullopt;
    }

    moving[a].reset();
    moving[b].reset();

    if (rotated) {
        elementA.setPartner(*rotated);
        elementB.setPartner(opposite(*rotated));
    }
    moving[*targetA] = elementA;
    moving[*targetB] = elementB;

    // The reference element is the left (or upper) one, in the tracked row.
    const RowIndex tracked = a.row;
    if (targetA->row != tracked && targetB->row != tracked) {
        throw std::logic_error("ControlledCapsule: capsule left its tracked row");
    }
    column_ = std::min(targetA->col, targetB->col);

    return MoveUpdates{{
        Update{a, std::nullopt},
        Update{b, std::nullopt},
        Update{*targetA, elementA.colour()},
        Update{*targetB, elementB.colour()}
    }};
}

} // namespace pillfall::core
