#pragma once

#include "Types.hpp"
#include "Index.hpp"

#include <random>
#include <utility>
#include <vector>

namespace pillfall::core {

using VirusPlacement = std::vector<std::pair<Position, Colour>>;

// Prepare a random distribution of viruses.
//
// Returns up to `virusCount` positions and colours, in placement order, all
// within the rows from `topRow` to the bottom row. No placement contains a
// horizontal or vertical line of four or more tiles of the same colour.
//
// Throws std::invalid_argument if `virusCount` exceeds the number of tiles
// available.
VirusPlacement prepareField(std::mt19937& rng, RowIndex topRow, int virusCount);

} // namespace pillfall::core
