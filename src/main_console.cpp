#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/PlayerField.hpp"
#include "core/FieldConfig.hpp"
#include "core/StaticField.hpp"
#include "core/MovingField.hpp"
#include "core/Types.hpp"
#include "controller/FieldController.hpp"

using namespace pillfall::core;

namespace {

char colourChar(Colour colour, bool upper) {
    switch (colour) {
    case Colour::Red:    return upper ? 'R' : 'r';
    case Colour::Yellow: return upper ? 'Y' : 'y';
    case Colour::Blue:   return upper ? 'B' : 'b';
    }
    return '?';
}

// Helper: render both grids as ASCII.
// Viruses are lower case, capsule elements upper case.
void printField(const PlayerField& field) {
    const StaticField& settled = field.staticField();
    const MovingField& moving = field.movingField();

    std::cout << "\n==== PILLFALL CONSOLE VIEW ====\n";
    std::cout << "Viruses: " << field.virusCount()
              << " | Next: " << colourChar(field.nextColours()[0], true)
              << colourChar(field.nextColours()[1], true)
              << " | Status: " << (field.isDefeated() ? "Defeated" : "Playing") << '\n';

    std::cout << '+' << std::string(FieldWidth, '-') << "+\n";
    for (RowIndex row : allRows()) {
        std::cout << '|';
        for (const Position& pos : completeRow(row)) {
            const TileContents& tile = settled[pos];
            if (const Virus* virus = tile.asVirus()) {
                std::cout << colourChar(virus->colour(), false);
            } else if (const CapsuleElement* element = tile.asElement()) {
                std::cout << colourChar(element->colour(), true);
            } else if (const auto& falling = moving[pos]) {
                std::cout << colourChar(falling->colour(), true);
            } else {
                std::cout << '.';
            }
        }
        std::cout << "|\n";
    }
    std::cout << '+' << std::string(FieldWidth, '-') << "+\n";

    std::cout << "Commands:\n"
              << "  a = left, d = right, w = rotate CW, s = rotate CCW\n"
              << "  g = gravity tick, r = new field, q = quit\n";
}

FieldConfig parseArgs(int argc, char** argv) {
    FieldConfig config;
    if (argc > 1) {
        config.virusCount = std::stoi(argv[1]);
    }
    if (argc > 2) {
        config.seed = static_cast<std::uint32_t>(std::stoul(argv[2]));
    }
    config.validate();
    return config;
}

} // namespace

int main(int argc, char** argv) {
    FieldConfig config;
    try {
        config = parseArgs(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Invalid arguments: " << e.what() << '\n'
                  << "Usage: " << argv[0] << " [virus_count] [seed]\n";
        return 1;
    }

    PlayerField field{config};
    pillfall::controller::FieldController controller{field};

    field.prepare();
    field.tick(); // spawns the first capsule

    std::string cmd;
    printField(field);

    while (true) {
        std::cout << "\nEnter command: ";
        if (!std::getline(std::cin, cmd)) {
            break; // EOF
        }
        if (cmd.empty()) {
            continue;
        }

        char c = cmd[0];
        if (c == 'q' || c == 'Q') {
            std::cout << "Quitting.\n";
            break;
        }

        switch (c) {
        case 'a': case 'A':
            if (controller.handleMovement(Movement::Left).empty()) std::cout << "Blocked.\n";
            break;
        case 'd': case 'D':
            if (controller.handleMovement(Movement::Right).empty()) std::cout << "Blocked.\n";
            break;
        case 'w': case 'W':
            if (controller.handleMovement(Movement::RotateCW).empty()) std::cout << "Blocked.\n";
            break;
        case 's': case 'S':
            if (controller.handleMovement(Movement::RotateCCW).empty()) std::cout << "Blocked.\n";
            break;
        case 'g': case 'G':
            controller.update(controller.tickInterval());
            if (field.lastEliminated().rowCount() > 0) {
                std::cout << "Eliminated " << field.lastEliminated().rowCount() << " row(s).\n";
            }
            break;
        case 'r': case 'R':
            field.prepare();
            field.tick();
            controller.resetTiming();
            break;
        default:
            std::cout << "Unknown command: " << c << '\n';
            break;
        }

        printField(field);

        if (field.isDefeated()) {
            std::cout << "DEFEATED. Press 'r' to restart or 'q' to quit.\n";
        } else if (field.virusCount() == 0) {
            std::cout << "All viruses cleared. Press 'r' for a new field or 'q' to quit.\n";
        }
    }

    return 0;
}
