#pragma once

#include "Types.hpp"
#include "Index.hpp"

#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

namespace pillfall::core {

// A virus. Viruses never move; they only disappear through elimination.
class Virus {
public:
    explicit Virus(Colour colour) noexcept : colour_{colour} {}

    Colour colour() const noexcept { return colour_; }

private:
    Colour colour_;
};

inline bool operator==(const Virus& a, const Virus& b) noexcept {
    return a.colour() == b.colour();
}

// One half of a capsule, or a single element whose partner was eliminated.
// `partner` points at the tile holding the other half of the same capsule.
class CapsuleElement {
public:
    explicit CapsuleElement(Colour colour, std::optional<Direction> partner = std::nullopt) noexcept
        : colour_{colour}, partner_{partner}
    {
    }

    // Create an unbound element
    static CapsuleElement single(Colour colour) noexcept { return CapsuleElement{colour}; }

    Colour colour() const noexcept { return colour_; }

    std::optional<Direction> partner() const noexcept { return partner_; }
    void setPartner(std::optional<Direction> partner) noexcept { partner_ = partner; }
    void unbind() noexcept { partner_.reset(); }

private:
    Colour colour_;
    std::optional<Direction> partner_;
};

inline bool operator==(const CapsuleElement& a, const CapsuleElement& b) noexcept {
    return a.colour() == b.colour() && a.partner() == b.partner();
}
inline bool operator!=(const CapsuleElement& a, const CapsuleElement& b) noexcept {
    return !(a == b);
}

// Drawing instruction for a renderer: set `colour` at `position`, or clear the
// tile if there is no colour. Lists of updates must be applied in order.
struct Update {
    Position position;
    std::optional<Colour> colour;
};

inline bool operator==(const Update& a, const Update& b) noexcept {
    return a.position == b.position && a.colour == b.colour;
}
inline bool operator!=(const Update& a, const Update& b) noexcept {
    return !(a == b);
}

// Colour shown by a tile, if any. Fields usable with rowOfFour() provide an
// overload for their cell type.
inline std::optional<Colour> colourOf(const std::optional<Colour>& colour) noexcept {
    return colour;
}

inline std::optional<Colour> colourOf(const std::optional<CapsuleElement>& element) noexcept {
    if (!element) return std::nullopt;
    return element->colour();
}

constexpr std::size_t RowOfFourLength = 4;

// A horizontal or vertical line of adjacent tiles
class RowOfFour {
public:
    enum class Orientation : std::uint8_t {
        Horizontal,
        Vertical
    };

    static RowOfFour horizontal(RowIndex row, ColumnRange columns) noexcept {
        return RowOfFour{Orientation::Horizontal, RowRange{row, row}, columns};
    }

    static RowOfFour vertical(ColumnIndex col, RowRange rows) noexcept {
        return RowOfFour{Orientation::Vertical, rows, ColumnRange{col, col}};
    }

    Orientation orientation() const noexcept { return orientation_; }
    const RowRange& rows() const noexcept { return rows_; }
    const ColumnRange& columns() const noexcept { return columns_; }

    std::size_t length() const noexcept { return rows_.size() * columns_.size(); }

    // Positions covered, top to bottom and left to right
    std::vector<Position> positions() const {
        std::vector<Position> result;
        result.reserve(length());
        for (RowIndex row : rows_) {
            for (ColumnIndex col : columns_) {
                result.push_back(Position{row, col});
            }
        }
        return result;
    }

    friend bool operator==(const RowOfFour& a, const RowOfFour& b) noexcept {
        return a.orientation_ == b.orientation_ && a.rows_ == b.rows_ && a.columns_ == b.columns_;
    }
    friend bool operator!=(const RowOfFour& a, const RowOfFour& b) noexcept {
        return !(a == b);
    }
    friend bool operator<(const RowOfFour& a, const RowOfFour& b) noexcept {
        if (a.orientation_ != b.orientation_) return a.orientation_ < b.orientation_;
        if (!(a.rows_ == b.rows_)) return a.rows_ < b.rows_;
        return a.columns_ < b.columns_;
    }

private:
    RowOfFour(Orientation orientation, RowRange rows, ColumnRange columns) noexcept
        : orientation_{orientation}, rows_{rows}, columns_{columns}
    {
    }

    Orientation orientation_;
    RowRange rows_;
    ColumnRange columns_;
};

// Find a row of four or more tiles of the same colour including `hint`.
//
// The horizontal line through `hint` is checked first, then the vertical one.
// Returns std::nullopt if `hint` shows no colour or neither line is long
// enough.
template <typename Field>
std::optional<std::pair<Colour, RowOfFour>> rowOfFour(const Field& field, Position hint) {
    const std::optional<Colour> colour = colourOf(field[hint]);
    if (!colour) {
        return std::nullopt;
    }

    // Last position reached from `hint` in `dir` while the colour matches
    auto extent = [&](Direction dir) {
        Position last = hint;
        for (auto next = hint + dir; next && colourOf(field[*next]) == colour; next = *next + dir) {
            last = *next;
        }
        return last;
    };

    const Position left  = extent(Direction::Left);
    const Position right = extent(Direction::Right);
    const ColumnRange columns{left.col, right.col};
    if (columns.size() >= RowOfFourLength) {
        return std::make_pair(*colour, RowOfFour::horizontal(hint.row, columns));
    }

    const Position top    = extent(Direction::Above);
    const Position bottom = extent(Direction::Below);
    const RowRange rows{top.row, bottom.row};
    if (rows.size() >= RowOfFourLength) {
        return std::make_pair(*colour, RowOfFour::vertical(hint.col, rows));
    }

    return std::nullopt;
}

} // namespace pillfall::core
