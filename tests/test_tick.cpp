#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <optional>
#include <random>
#include <set>
#include <stdexcept>
#include <vector>

#include "core/ControlledCapsule.hpp"
#include "core/MovingField.hpp"
#include "core/Preparation.hpp"
#include "core/StaticField.hpp"
#include "core/Tick.hpp"
#include "FieldHelpers.hpp"

using namespace pillfall::core;
using testing::at;

TEST_CASE("settleElements: capsule on the floor settles", "[tick][settle]") {
    MovingField moving;
    StaticField settled;
    testing::placeCapsule(moving, at(15, 3), Direction::Right, Colour::Red, Colour::Yellow);

    const auto [positions, lowest] = settleElements(moving, settled, RowIndex{15});

    CHECK(positions == Settled{at(15, 3), at(15, 4)});
    CHECK_FALSE(lowest.has_value());
    CHECK(moving.isEmpty());
    CHECK(settled[at(15, 3)].asElement()->partner() == Direction::Right);
    CHECK(settled[at(15, 4)].colour() == Colour::Yellow);
    CHECK(testing::partnershipConsistent(settled));
}

TEST_CASE("settleElements: stacked elements settle in one call", "[tick][settle]") {
    MovingField moving;
    StaticField settled;
    settled[at(14, 2)] = Virus{Colour::Red};
    settled[at(11, 6)] = Virus{Colour::Blue};

    testing::placeSingle(moving, at(15, 0), Colour::Blue);
    testing::placeSingle(moving, at(14, 0), Colour::Red);
    testing::placeCapsule(moving, at(12, 2), Direction::Below, Colour::Yellow, Colour::Blue);
    // Resting on a single half is enough for a horizontal capsule
    testing::placeCapsule(moving, at(10, 5), Direction::Right, Colour::Red, Colour::Red);
    testing::placeSingle(moving, at(5, 6), Colour::Yellow);

    const auto [positions, lowest] = settleElements(moving, settled, RowIndex{15});

    CHECK(positions == Settled{
        at(15, 0), at(14, 0), at(13, 2), at(12, 2), at(10, 6), at(10, 5)
    });
    REQUIRE(lowest.has_value());
    CHECK(*lowest == RowIndex{5});

    CHECK(testing::elementCount(moving) == 1);
    CHECK(testing::elementCount(settled) == 6);
    CHECK(testing::noOverlaps(settled, moving));
    CHECK(testing::partnershipConsistent(settled));

    SECTION("settling again is a no-op") {
        const auto [again, lowestAgain] = settleElements(moving, settled, *lowest);
        CHECK(again.empty());
        CHECK(lowestAgain == lowest);
    }
}

TEST_CASE("settleElements: rows below the bound are not considered", "[tick][settle]") {
    MovingField moving;
    StaticField settled;
    testing::placeSingle(moving, at(15, 1), Colour::Red);

    const auto [positions, lowest] = settleElements(moving, settled, RowIndex{10});

    CHECK(positions.empty());
    CHECK_FALSE(lowest.has_value());
    CHECK(moving[at(15, 1)].has_value());
}

TEST_CASE("settleElements: missing partner is an error", "[tick][settle]") {
    MovingField moving;
    StaticField settled;
    moving[at(15, 1)] = CapsuleElement{Colour::Red, Direction::Right};

    CHECK_THROWS_AS(settleElements(moving, settled, RowIndex{15}), std::logic_error);
}

TEST_CASE("settleElements: capsule dropped from the top settles on the floor", "[tick][settle]") {
    MovingField moving;
    StaticField settled;
    auto [capsule, spawned] = ControlledCapsule::spawn(moving, {Colour::Red, Colour::Yellow});
    (void)capsule;
    (void)spawned;

    for (int row = 0; row < 15; ++row) {
        const auto [positions, lowest] = settleElements(moving, settled, RowIndex{row});
        REQUIRE(positions.empty());
        REQUIRE(lowest == RowIndex{row});
        moving.tick();
    }

    const auto [positions, lowest] = settleElements(moving, settled, RowIndex{15});
    CHECK(positions == Settled{at(15, 3), at(15, 4)});
    CHECK_FALSE(lowest.has_value());
    CHECK(settled[at(15, 3)].colour() == Colour::Red);
    CHECK(settled[at(15, 4)].colour() == Colour::Yellow);
}

TEST_CASE("eliminateElements removes exactly the row", "[tick][eliminate]") {
    StaticField field;
    field[at(15, 2)] = Virus{Colour::Red};
    field[at(15, 3)] = Virus{Colour::Red};
    field[at(15, 4)] = Virus{Colour::Red};
    testing::placeCapsule(field, at(15, 5), Direction::Right, Colour::Red, Colour::Blue);
    field[at(15, 1)] = Virus{Colour::Yellow};
    field[at(14, 3)] = Virus{Colour::Red};

    const Eliminated eliminated = eliminateElements(field, {at(15, 5), at(15, 6)});

    REQUIRE(eliminated.rowCount() == 1);
    CHECK(eliminated.positions() == std::vector<Position>{at(15, 2), at(15, 3), at(15, 4), at(15, 5)});
    for (int col = 2; col <= 5; ++col) {
        CHECK_FALSE(field[at(15, col)].isOccupied());
    }
    CHECK(field[at(15, 1)].isOccupied());
    CHECK(field[at(14, 3)].isOccupied());

    // The surviving half is unbound and reported
    REQUIRE(testing::elementAt(field, at(15, 6)) != nullptr);
    CHECK_FALSE(testing::elementAt(field, at(15, 6))->partner().has_value());
    CHECK(eliminated.exposed() == std::set<Position>{at(15, 6)});
    CHECK(testing::partnershipConsistent(field));
    CHECK(field.virusCount() == 2);
}

TEST_CASE("eliminateElements: a row found from several hints is removed once", "[tick][eliminate]") {
    StaticField field;
    for (int i = 0; i < 4; ++i) {
        field[at(10, i)] = Virus{Colour::Blue};     // row 10, columns 0..3
        field[at(7 + i, 3)] = Virus{Colour::Blue};  // column 3, rows 7..10
    }

    const Eliminated eliminated = eliminateElements(field, {at(10, 0), at(10, 3), at(7, 3), at(9, 3)});

    CHECK(eliminated.rowCount() == 2);
    CHECK(eliminated.positions().size() == 7);
    CHECK(eliminated.exposed().empty());
    CHECK(field.virusCount() == 0);
}

TEST_CASE("eliminateElements: a capsule eliminated whole exposes nothing", "[tick][eliminate]") {
    StaticField field;
    field[at(12, 2)] = Virus{Colour::Red};
    field[at(12, 3)] = Virus{Colour::Red};
    testing::placeCapsule(field, at(12, 4), Direction::Right, Colour::Red, Colour::Red);

    const Eliminated eliminated = eliminateElements(field, {at(12, 4), at(12, 5)});

    REQUIRE(eliminated.rowCount() == 1);
    CHECK(eliminated.rowsOfFour().begin()->second.length() == 4);
    CHECK(eliminated.exposed().empty());
}

TEST_CASE("eliminateElements: no rows, no changes", "[tick][eliminate]") {
    StaticField field;
    testing::placeCapsule(field, at(15, 0), Direction::Right, Colour::Red, Colour::Red);
    field[at(15, 2)] = Virus{Colour::Red};

    const Eliminated eliminated = eliminateElements(field, {at(15, 0), at(15, 1)});

    CHECK(eliminated.empty());
    CHECK(eliminated.positions().empty());
    CHECK(testing::elementCount(field) == 2);
}

TEST_CASE("unsettleElements drops what lost its support", "[tick][unsettle]") {
    MovingField moving;
    StaticField settled;

    settled[at(15, 0)] = Virus{Colour::Red};
    settled[at(15, 1)] = Virus{Colour::Red};
    settled[at(15, 2)] = Virus{Colour::Red};
    settled[at(14, 4)] = Virus{Colour::Blue};
    testing::placeCapsule(settled, at(15, 3), Direction::Above, Colour::Red, Colour::Yellow);
    testing::placeCapsule(settled, at(14, 0), Direction::Right, Colour::Blue, Colour::Yellow);
    testing::placeCapsule(settled, at(13, 3), Direction::Right, Colour::Blue, Colour::Red);
    testing::placeSingle(settled, at(13, 0), Colour::Yellow);

    const Eliminated eliminated = eliminateElements(settled, {at(15, 3)});
    REQUIRE(eliminated.rowCount() == 1);
    REQUIRE(eliminated.exposed() == std::set<Position>{at(14, 3)});
    const int massBefore = testing::elementCount(settled) + testing::elementCount(moving);

    const auto lowest = unsettleElements(moving, settled, eliminated);

    REQUIRE(lowest.has_value());
    CHECK(*lowest == RowIndex{14});
    CHECK(testing::elementCount(settled) + testing::elementCount(moving) == massBefore);
    CHECK(testing::noOverlaps(settled, moving));
    CHECK(testing::partnershipConsistent(settled));
    CHECK(testing::partnershipConsistent(moving));

    // The exposed half, the unsupported capsule and what rested on it
    CHECK(moving[at(14, 3)] == CapsuleElement::single(Colour::Yellow));
    CHECK(moving[at(14, 0)] == CapsuleElement{Colour::Blue, Direction::Right});
    CHECK(moving[at(14, 1)] == CapsuleElement{Colour::Yellow, Direction::Left});
    CHECK(moving[at(13, 0)] == CapsuleElement::single(Colour::Yellow));

    // Held up by the virus under its right half
    CHECK(testing::elementAt(settled, at(13, 3)) != nullptr);
    CHECK(testing::elementAt(settled, at(13, 4)) != nullptr);
    CHECK(settled.virusCount() == 1);
}

TEST_CASE("unsettleElements: viruses never move", "[tick][unsettle]") {
    MovingField moving;
    StaticField settled;
    for (int col = 0; col < 4; ++col) {
        settled[at(15, col)] = Virus{Colour::Yellow};
    }
    settled[at(14, 1)] = Virus{Colour::Blue};

    const Eliminated eliminated = eliminateElements(settled, {at(15, 0)});
    const auto lowest = unsettleElements(moving, settled, eliminated);

    CHECK_FALSE(lowest.has_value());
    CHECK(moving.isEmpty());
    CHECK(settled[at(14, 1)].asVirus() != nullptr);
}

TEST_CASE("unsettleElements: nothing eliminated, nothing moves", "[tick][unsettle]") {
    MovingField moving;
    StaticField settled;
    testing::placeSingle(settled, at(15, 2), Colour::Red);

    CHECK_FALSE(unsettleElements(moving, settled, Eliminated{}).has_value());
    CHECK(moving.isEmpty());
}

TEST_CASE("unsettleElements: an upright capsule falls as a whole", "[tick][unsettle]") {
    MovingField moving;
    StaticField settled;
    for (int col = 0; col < 4; ++col) {
        settled[at(15, col)] = Virus{Colour::Red};
    }
    // The upper half rests on the lower one only
    testing::placeCapsule(settled, at(14, 3), Direction::Above, Colour::Yellow, Colour::Blue);

    const Eliminated eliminated = eliminateElements(settled, {at(15, 0)});
    REQUIRE(eliminated.rowCount() == 1);
    REQUIRE(eliminated.exposed().empty());

    const auto lowest = unsettleElements(moving, settled, eliminated);

    REQUIRE(lowest.has_value());
    CHECK(*lowest == RowIndex{14});
    CHECK(moving[at(14, 3)] == CapsuleElement{Colour::Yellow, Direction::Above});
    CHECK(moving[at(13, 3)] == CapsuleElement{Colour::Blue, Direction::Below});
    CHECK(testing::elementCount(settled) == 0);
    CHECK(testing::partnershipConsistent(moving));
}

TEST_CASE("Tick cascade keeps mass and partnerships on random fields", "[tick][cascade]") {
    for (std::uint32_t seed = 1; seed <= 40; ++seed) {
        std::mt19937 rng{seed};
        MovingField moving;
        StaticField settled = StaticField::withViruses(prepareField(rng, RowIndex{8}, 30));
        std::optional<RowIndex> lowest;

        auto mass = [&] {
            return testing::elementCount(settled) + testing::elementCount(moving);
        };
        auto consistent = [&] {
            return testing::noOverlaps(settled, moving)
                && testing::partnershipConsistent(settled)
                && testing::partnershipConsistent(moving);
        };

        std::uniform_int_distribution<int> pickColumn(0, FieldWidth - 2);
        std::bernoulli_distribution upright{0.4};

        for (int step = 0; step < 300; ++step) {
            if (!lowest) {
                // Drop a new capsule into the top row(s)
                const Position first = at(0, pickColumn(rng));
                const Direction dir = upright(rng) ? Direction::Below : Direction::Right;
                const Position second = *(first + dir);
                if (settled[first].isOccupied() || settled[second].isOccupied()) {
                    break;
                }
                testing::placeCapsule(moving, first, dir, randomColour(rng), randomColour(rng));
                lowest = second.row;
            }

            const int before = mass();
            const auto [positions, settleLowest] = settleElements(moving, settled, *lowest);
            REQUIRE(mass() == before);
            REQUIRE(consistent());

            const int virusesBefore = settled.virusCount();
            const Eliminated eliminated = eliminateElements(settled, positions);
            const int virusesRemoved = virusesBefore - settled.virusCount();
            REQUIRE(mass() == before - (static_cast<int>(eliminated.positions().size()) - virusesRemoved));
            REQUIRE(consistent());

            const int afterElimination = mass();
            const auto unsettleLowest = unsettleElements(moving, settled, eliminated);
            REQUIRE(mass() == afterElimination);
            REQUIRE(consistent());

            lowest = settleLowest;
            if (unsettleLowest && (!lowest || *lowest < *unsettleLowest)) {
                lowest = unsettleLowest;
            }
            if (lowest) {
                moving.tick();
                lowest = lowest->forward();
                REQUIRE(lowest.has_value());
            }
        }
    }
}
