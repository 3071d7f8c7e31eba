#pragma once

#include "core/PlayerField.hpp"
#include "core/Types.hpp"
#include "core/Items.hpp"
#include <chrono>
#include <cstdint>
#include <vector>

namespace pillfall::controller {

class FieldController {
public:
    using Duration = std::chrono::milliseconds;

    /// Controller does not own the PlayerField; caller keeps it alive.
    /// The tick interval is taken from the field's config.
    explicit FieldController(pillfall::core::PlayerField& field);

    /// Handle a single player movement (e.g. key press).
    /// Returns the updates to draw, empty if the movement was rejected.
    std::vector<pillfall::core::Update> handleMovement(pillfall::core::Movement movement);

    // Called periodically with elapsed time since last call.
    // It accumulates time and runs field ticks whenever the accumulated
    // time exceeds the tick interval. Updates of all ticks are returned in
    // order.
    std::vector<pillfall::core::Update> update(Duration elapsed);

    // Reset timing accumulator (e.g. when the field is prepared again)
    void resetTiming();

    Duration tickInterval() const noexcept { return interval_; }
    std::uint64_t ticks() const noexcept { return ticks_; }

private:
    pillfall::core::PlayerField& field_;
    Duration interval_;
    Duration accumulated_{0};
    std::uint64_t ticks_{0};
};

} // namespace pillfall::controller
