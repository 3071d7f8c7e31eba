#include "controller/FieldController.hpp"

namespace pillfall::controller {

FieldController::FieldController(pillfall::core::PlayerField& field)
    : field_{field}
    , interval_{field.config().tickIntervalMs}
{
}

std::vector<pillfall::core::Update> FieldController::handleMovement(pillfall::core::Movement movement) {
    // A defeated field no longer reacts to input; the caller decides what
    // happens next.
    if (field_.isDefeated()) {
        return {};
    }

    auto moved = field_.applyMovement(movement);
    if (!moved) {
        return {};
    }
    return {moved->begin(), moved->end()};
}

std::vector<pillfall::core::Update> FieldController::update(Duration elapsed) {
    std::vector<pillfall::core::Update> updates;
    if (field_.isDefeated()) {
        return updates;
    }

    accumulated_ += elapsed;

    // If a lot of time passed (lag), we might need several ticks
    while (accumulated_ >= interval_ && !field_.isDefeated()) {
        auto tickUpdates = field_.tick();
        updates.insert(updates.end(), tickUpdates.begin(), tickUpdates.end());
        accumulated_ -= interval_;
        ++ticks_;
    }
    return updates;
}

void FieldController::resetTiming() {
    accumulated_ = Duration{0};
}

} // namespace pillfall::controller
