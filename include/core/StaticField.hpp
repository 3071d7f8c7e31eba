#pragma once

#include "Types.hpp"
#include "Index.hpp"
#include "Items.hpp"
#include "Row.hpp"

#include <array>
#include <cstddef>
#include <optional>
#include <utility>
#include <variant>
#include <vector>

namespace pillfall::core {

// Contents of a tile in the field of settled elements
class TileContents {
public:
    TileContents() noexcept = default;
    TileContents(CapsuleElement element) noexcept : data_{element} {}
    TileContents(Virus virus) noexcept : data_{virus} {}

    bool isOccupied() const noexcept { return !std::holds_alternative<std::monostate>(data_); }

    // Capsule element held by the tile, nullptr otherwise
    const CapsuleElement* asElement() const noexcept { return std::get_if<CapsuleElement>(&data_); }
    CapsuleElement* asElement() noexcept { return std::get_if<CapsuleElement>(&data_); }

    // Virus held by the tile, nullptr otherwise
    const Virus* asVirus() const noexcept { return std::get_if<Virus>(&data_); }

    std::optional<Colour> colour() const noexcept;

    // Take the tile's contents, leaving it unoccupied
    TileContents take() noexcept {
        TileContents taken = *this;
        data_ = std::monostate{};
        return taken;
    }

    // Take a capsule element, leaving the tile unoccupied. Viruses stay put.
    std::optional<CapsuleElement> takeElement() noexcept;

private:
    std::variant<std::monostate, CapsuleElement, Virus> data_;
};

inline std::optional<Colour> colourOf(const TileContents& tile) noexcept {
    return tile.colour();
}

// Field of settled (non-moving) elements
class StaticField {
public:
    StaticField() = default;

    // Field holding a virus of the given colour at each listed position
    static StaticField withViruses(const std::vector<std::pair<Position, Colour>>& viruses);

    TileContents& operator[](Position pos) noexcept { return rows_[rowSlot(pos.row)][pos.col]; }
    const TileContents& operator[](Position pos) const noexcept { return rows_[rowSlot(pos.row)][pos.col]; }

    // True if the tile `below` is occupied. No position at all (below the
    // bottom row) counts as the floor.
    bool isSupportedBy(std::optional<Position> below) const noexcept {
        return !below || (*this)[*below].isOccupied();
    }

    // True if any tile in the top row is occupied
    bool isDefeated() const noexcept;

    int virusCount() const noexcept;

private:
    std::array<Row<TileContents>, FieldHeight> rows_{};

    static std::size_t rowSlot(RowIndex row) noexcept { return static_cast<std::size_t>(row.value()); }
};

} // namespace pillfall::core
