#include "core/Preparation.hpp"

#include "core/Items.hpp"
#include "core/Row.hpp"

#include <array>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>

namespace pillfall::core {

namespace {

// Scratch field only tracking colours
class PreparationField {
public:
    std::optional<Colour>& operator[](Position pos) noexcept {
        return rows_[static_cast<std::size_t>(pos.row.value())][pos.col];
    }
    const std::optional<Colour>& operator[](Position pos) const noexcept {
        return rows_[static_cast<std::size_t>(pos.row.value())][pos.col];
    }

private:
    std::array<Row<std::optional<Colour>>, FieldHeight> rows_{};
};

} // namespace

VirusPlacement prepareField(std::mt19937& rng, RowIndex topRow, int virusCount) {
    const RowRange rows{topRow, RowIndex::last()};
    const int area = static_cast<int>(rows.size()) * FieldWidth;
    if (virusCount < 0 || virusCount > area) {
        throw std::invalid_argument("prepareField: cannot place " + std::to_string(virusCount)
                                    + " viruses in " + std::to_string(area) + " tiles");
    }

    PreparationField field;
    std::vector<Position> free;
    free.reserve(static_cast<std::size_t>(area));
    for (RowIndex row : rows) {
        for (const Position& pos : completeRow(row)) {
            free.push_back(pos);
        }
    }

    // Direction in which colours are rotated on conflicts, fixed per call
    const bool forward = std::bernoulli_distribution{0.5}(rng);

    VirusPlacement placed;
    placed.reserve(static_cast<std::size_t>(virusCount));

    for (int i = 0; i < virusCount; ++i) {
        // Tiles where all colours would complete a row; only retried for
        // the next virus.
        std::vector<Position> rejected;
        std::optional<std::pair<Position, Colour>> placement;

        while (!placement && !free.empty()) {
            std::uniform_int_distribution<std::size_t> pick(0, free.size() - 1);
            const std::size_t index = pick(rng);
            const Position pos = free[index];
            free.erase(free.begin() + static_cast<std::ptrdiff_t>(index));

            // With three colours and two dimensions at most two colours are
            // usually ruled out. Two runs of three meeting at `pos` can rule
            // out the third, too.
            Colour colour = randomColour(rng);
            for (int attempt = 0; attempt < ColourCount; ++attempt) {
                field[pos] = colour;
                if (!rowOfFour(field, pos)) {
                    placement = std::make_pair(pos, colour);
                    break;
                }
                colour = rotate(colour, forward);
            }
            if (!placement) {
                field[pos].reset();
                rejected.push_back(pos);
            }
        }

        free.insert(free.end(), rejected.begin(), rejected.end());
        if (!placement) {
            break;
        }
        placed.push_back(*placement);
    }

    return placed;
}

} // namespace pillfall::core
