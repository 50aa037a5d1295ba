#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace duelnet::app {

class GameLoop final {
public:
    using Clock = std::chrono::steady_clock;
    using PumpEventsFn = std::function<bool()>;
    using UpdateFn = std::function<void(Clock::time_point)>;
    using RenderFn = std::function<void()>;

    explicit GameLoop(std::chrono::milliseconds frame_period = std::chrono::milliseconds(8));

    // Returns the number of frames run.
    std::uint64_t Run(const PumpEventsFn& pump_events, const UpdateFn& update, const RenderFn& render);

private:
    std::chrono::milliseconds frame_period_;
};

}  // namespace duelnet::app
