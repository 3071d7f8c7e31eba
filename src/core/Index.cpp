#include "core/Index.hpp"

namespace pillfall::core {

std::optional<Position> operator+(const Position& pos, Direction dir) noexcept {
    switch (dir) {
    case Direction::Above:
        if (auto row = pos.row.backward()) return Position{*row, pos.col};
        break;
    case Direction::Below:
        if (auto row = pos.row.forward()) return Position{*row, pos.col};
        break;
    case Direction::Left:
        if (auto col = pos.col.backward()) return Position{pos.row, *col};
        break;
    case Direction::Right:
        if (auto col = pos.col.forward()) return Position{pos.row, *col};
        break;
    }
    return std::nullopt;
}

RowRange allRows() noexcept {
    return RowRange{RowIndex::first(), RowIndex::last()};
}

ColumnRange allColumns() noexcept {
    return ColumnRange{ColumnIndex::first(), ColumnIndex::last()};
}

std::array<Position, FieldWidth> completeRow(RowIndex row) noexcept {
    std::array<Position, FieldWidth> positions{};
    std::size_t i = 0;
    for (ColumnIndex col : allColumns()) {
        positions[i++] = Position{row, col};
    }
    return positions;
}

} // namespace pillfall::core
