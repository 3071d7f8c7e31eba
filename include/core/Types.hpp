#pragma once // Include guard

#include <cstdint> // For fixed-width integer types
#include <random> // For std::mt19937

// Namespace for pillfall core types
namespace pillfall::core {

// Dimensions of a playing field
constexpr std::uint8_t FieldWidth  = 8;
constexpr std::uint8_t FieldHeight = 16;

// Colour of a capsule element or a virus
enum class Colour : std::uint8_t {
    Red    = 0,
    Yellow = 1,
    Blue   = 2
};

constexpr int ColourCount = 3;

// Cycle through all colours. Three rotations in the same direction yield the
// original colour.
inline Colour rotate(Colour c, bool forward) {
    const unsigned step = forward ? 1U : 2U;
    return static_cast<Colour>((static_cast<std::uint8_t>(c) + step) % ColourCount);
}

// Pick a colour uniformly at random
inline Colour randomColour(std::mt19937& rng) {
    std::uniform_int_distribution<int> dist(0, ColourCount - 1);
    return static_cast<Colour>(dist(rng));
}

// Direction of a neighbouring tile, in clockwise order
enum class Direction : std::uint8_t {
    Above = 0,
    Right = 1,
    Below = 2,
    Left  = 3
};

// Function to get the next direction in a clockwise sense
inline Direction rotatedCw(Direction d) {
    return static_cast<Direction>((static_cast<std::uint8_t>(d) + 1U) % 4U);
}

inline Direction rotatedCcw(Direction d) {
    // 3 clockwise rotations = 1 counter-clockwise
    return static_cast<Direction>((static_cast<std::uint8_t>(d) + 3U) % 4U);
}

inline Direction opposite(Direction d) {
    return static_cast<Direction>((static_cast<std::uint8_t>(d) + 2U) % 4U);
}

inline bool isHorizontal(Direction d) {
    return d == Direction::Left || d == Direction::Right;
}

// Player input applied to a controlled capsule
enum class Movement : std::uint8_t {
    Left,
    Right,
    RotateCW,
    RotateCCW
};

} // namespace pillfall::core
