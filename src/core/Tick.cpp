#include "core/Tick.hpp"

#include <algorithm>
#include <queue>
#include <stdexcept>

namespace pillfall::core {

namespace {

Position partnerOf(Position pos, Direction dir) {
    const auto partner = pos + dir;
    if (!partner) {
        throw std::logic_error("capsule element partner points outside the field");
    }
    return *partner;
}

bool rowHasMovingElements(const MovingField& moving, RowIndex row) {
    for (const Position& pos : completeRow(row)) {
        if (moving[pos].has_value()) {
            return true;
        }
    }
    return false;
}

} // namespace

std::pair<Settled, std::optional<RowIndex>>
settleElements(MovingField& moving, StaticField& settled, RowIndex lowest)
{
    const RowRange rows{RowIndex::first(), lowest};

    Settled positions;
    for (RowIndex row : rows.reversed()) {
        for (const Position& pos : completeRow(row)) {
            auto& cell = moving[pos];
            if (!cell || !settled.isSupportedBy(pos + Direction::Below)) {
                continue;
            }

            const CapsuleElement element = *cell;
            cell.reset();
            positions.push_back(pos);
            settled[pos] = element;

            if (const auto dir = element.partner()) {
                const Position partnerPos = partnerOf(pos, *dir);
                auto& partner = moving[partnerPos];
                if (!partner) {
                    throw std::logic_error("settleElements: partner is not in the moving field");
                }
                positions.push_back(partnerPos);
                settled[partnerPos] = *partner;
                partner.reset();
            }
        }
    }

    // Scan upwards from the old bound for rows still holding moving elements
    for (RowIndex row : rows.reversed()) {
        if (rowHasMovingElements(moving, row)) {
            return {positions, row};
        }
    }
    return {positions, std::nullopt};
}

std::vector<Position> Eliminated::positions() const {
    std::set<Position> unique;
    for (const auto& row : rows_) {
        for (const Position& pos : row.second.positions()) {
            unique.insert(pos);
        }
    }
    return {unique.begin(), unique.end()};
}

Eliminated eliminateElements(StaticField& field, const Settled& hints) {
    std::set<Eliminated::Row> rows;
    for (const Position& hint : hints) {
        if (auto row = rowOfFour(field, hint)) {
            rows.insert(*row);
        }
    }

    std::set<Position> exposed;
    for (const Position& pos : Eliminated{rows}.positions()) {
        TileContents tile = field[pos].take();
        const CapsuleElement* element = tile.asElement();
        if (!element || !element->partner()) {
            continue;
        }
        const Position partnerPos = partnerOf(pos, *element->partner());
        if (auto* partner = field[partnerPos].asElement()) {
            partner->unbind();
            exposed.insert(partnerPos);
        }
    }

    // Partners eliminated later in the loop are not exposed
    for (auto it = exposed.begin(); it != exposed.end();) {
        if (field[*it].isOccupied()) {
            ++it;
        } else {
            it = exposed.erase(it);
        }
    }

    return Eliminated{std::move(rows), std::move(exposed)};
}

std::optional<RowIndex>
unsettleElements(MovingField& moving, StaticField& settled, const Eliminated& eliminated)
{
    // Bottom-most row first, rightmost column first within a row
    std::priority_queue<Position> pending;

    for (const Position& pos : eliminated.exposed()) {
        if (!settled.isSupportedBy(pos + Direction::Below)) {
            pending.push(pos);
        }
    }
    for (const Position& pos : eliminated.positions()) {
        if (const auto above = pos + Direction::Above) {
            pending.push(*above);
        }
    }

    std::optional<RowIndex> lowest;
    auto unsettle = [&](Position pos) {
        auto element = settled[pos].takeElement();
        if (!element) {
            throw std::logic_error("unsettleElements: tile does not hold a capsule element");
        }
        moving[pos] = *element;
        lowest = lowest ? std::max(*lowest, pos.row) : pos.row;
        if (const auto above = pos + Direction::Above) {
            pending.push(*above);
        }
    };

    while (!pending.empty()) {
        const Position pos = pending.top();
        pending.pop();

        const CapsuleElement* element = settled[pos].asElement();
        if (!element || settled.isSupportedBy(pos + Direction::Below)) {
            continue;
        }

        const auto dir = element->partner();
        if (!dir) {
            unsettle(pos);
            continue;
        }

        // The partner keeps both halves in place if it rests on anything
        // other than the tile we're looking at.
        const Position partnerPos = partnerOf(pos, *dir);
        const auto belowPartner = partnerPos + Direction::Below;
        const bool partnerSupported = !belowPartner ||
            (*belowPartner != pos && settled[*belowPartner].isOccupied());
        if (partnerSupported) {
            continue;
        }

        unsettle(pos);
        unsettle(partnerPos);
    }

    return lowest;
}

} // namespace pillfall::core
