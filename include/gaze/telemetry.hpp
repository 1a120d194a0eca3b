#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "gaze/controller.hpp"
#include "gaze/track.hpp"

namespace gaze {

struct TelemetryCounters {
    std::uint64_t ticks = 0;
    std::uint64_t no_frame = 0;
    std::uint64_t stale_frames = 0;
    std::uint64_t detector_runs = 0;
    std::uint64_t detector_failures = 0;
    std::uint64_t detector_timeouts = 0;
    std::uint64_t stale_results = 0;
    std::uint64_t clamps = 0;
    std::uint64_t commands = 0;
    std::uint64_t dispatch_failures = 0;
    std::uint64_t overruns = 0;
};

struct TelemetrySnapshot {
    std::string target_label;
    ControllerState state = ControllerState::Idle;
    std::optional<TrackTarget> target;
    std::optional<GazeCommand> last_command;
    TelemetryCounters counters;
    TimePoint taken_at{};
};

Json toJson(const TelemetryCounters& counters);
Json toJson(const TelemetrySnapshot& snapshot);

}  // namespace gaze
