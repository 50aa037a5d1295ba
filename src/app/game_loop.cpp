#include "app/game_loop.h"

#include <thread>

namespace duelnet::app {

GameLoop::GameLoop(std::chrono::milliseconds frame_period)
    : frame_period_(frame_period) {}

std::uint64_t GameLoop::Run(
    const PumpEventsFn& pump_events,
    const UpdateFn& update,
    const RenderFn& render) {
    std::uint64_t frame_count = 0;
    while (pump_events()) {
        const auto frame_start = Clock::now();
        update(frame_start);
        render();
        ++frame_count;

        // Tick cadences are checked against the clock inside update, the loop
        // only has to wake often enough to honor the shortest one.
        std::this_thread::sleep_until(frame_start + frame_period_);
    }
    return frame_count;
}

}  // namespace duelnet::app
