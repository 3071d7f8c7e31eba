#include "core/StaticField.hpp"

namespace pillfall::core {

std::optional<Colour> TileContents::colour() const noexcept {
    if (const auto* element = asElement()) {
        return element->colour();
    }
    if (const auto* virus = asVirus()) {
        return virus->colour();
    }
    return std::nullopt;
}

std::optional<CapsuleElement> TileContents::takeElement() noexcept {
    const auto* element = asElement();
    if (!element) {
        return std::nullopt;
    }
    CapsuleElement taken = *element;
    data_ = std::monostate{};
    return taken;
}

StaticField StaticField::withViruses(const std::vector<std::pair<Position, Colour>>& viruses) {
    StaticField field;
    for (const auto& [pos, colour] : viruses) {
        field[pos] = Virus{colour};
    }
    return field;
}

bool StaticField::isDefeated() const noexcept {
    // Anything settled in row 0 means the player has topped out.
    for (const Position& pos : completeRow(RowIndex::first())) {
        if ((*this)[pos].isOccupied()) {
            return true;
        }
    }
    return false;
}

int StaticField::virusCount() const noexcept {
    int count = 0;
    for (RowIndex row : allRows()) {
        for (const Position& pos : completeRow(row)) {
            if ((*this)[pos].asVirus()) {
                ++count;
            }
        }
    }
    return count;
}

} // namespace pillfall::core
