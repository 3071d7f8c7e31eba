#pragma once

#include "Types.hpp"
#include "Index.hpp"
#include "Items.hpp"
#include "MovingField.hpp"
#include "StaticField.hpp"

#include <cstddef>
#include <optional>
#include <set>
#include <utility>
#include <vector>

namespace pillfall::core {

// Positions of elements moved into the field of settled elements
using Settled = std::vector<Position>;

// Settle elements.
//
// Moves every capsule element from the moving to the static field that would
// be moved onto an occupied tile (or through the floor) by the next tick,
// together with its partner. Only rows from the top row down to `lowest`,
// inclusive, are considered.
//
// Rows are processed bottom-most first, so that an element resting on
// another element settled during the same call is settled as well.
//
// Returns the settled elements' positions and the new lowest row holding
// unsettled elements, or std::nullopt if there are none left.
std::pair<Settled, std::optional<RowIndex>>
settleElements(MovingField& moving, StaticField& settled, RowIndex lowest);

// Rows of four removed from a field, plus the positions of elements whose
// partner was removed with them.
class Eliminated {
public:
    using Row = std::pair<Colour, RowOfFour>;

    Eliminated() = default;
    explicit Eliminated(std::set<Row> rows, std::set<Position> exposed = {})
        : rows_{std::move(rows)}, exposed_{std::move(exposed)}
    {
    }

    const std::set<Row>& rowsOfFour() const noexcept { return rows_; }
    std::size_t rowCount() const noexcept { return rows_.size(); }
    bool empty() const noexcept { return rows_.empty(); }

    // Positions of all eliminated tiles. A tile shared by two rows is listed
    // once.
    std::vector<Position> positions() const;

    // Surviving elements whose partner got eliminated (now unbound)
    const std::set<Position>& exposed() const noexcept { return exposed_; }

private:
    // Ordered set: the same row found from two hints is registered once.
    std::set<Row> rows_;
    std::set<Position> exposed_;
};

// Eliminate elements.
//
// Looks for rows of four through each of the `hints` (typically the output of
// settleElements()) and removes them from `field`. Partners of removed
// elements are unbound in the same step.
Eliminated eliminateElements(StaticField& field, const Settled& hints);

// Unsettle elements.
//
// Moves elements which lost their support due to `eliminated` back into the
// moving field, cascading upwards. Returns the lowest row an element was
// moved from, or std::nullopt if nothing moved.
std::optional<RowIndex>
unsettleElements(MovingField& moving, StaticField& settled, const Eliminated& eliminated);

} // namespace pillfall::core
