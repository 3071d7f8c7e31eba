#pragma once

#include "Types.hpp"

#include <cstdint>
#include <stdexcept>

namespace pillfall::core {

struct FieldConfig {
    int virusCount{16};            // viruses placed by PlayerField::prepare()
    int firstVirusRow{6};          // viruses go from this row down to the bottom
    int tickIntervalMs{400};       // gravity interval used by the controller
    std::uint32_t seed{0};         // 0 = seed from std::random_device

    // Throws std::invalid_argument if the values can't be used for a round
    void validate() const {
        if (firstVirusRow < 1 || firstVirusRow >= FieldHeight) {
            // Row 0 must stay clear, otherwise the field starts defeated.
            throw std::invalid_argument("FieldConfig: firstVirusRow must be within 1..15");
        }
        const int area = (FieldHeight - firstVirusRow) * FieldWidth;
        if (virusCount < 0 || virusCount > area) {
            throw std::invalid_argument("FieldConfig: virusCount does not fit below firstVirusRow");
        }
        if (tickIntervalMs <= 0) {
            throw std::invalid_argument("FieldConfig: tickIntervalMs must be positive");
        }
    }
};

} // namespace pillfall::core
