#include "gaze/telemetry.hpp"

namespace gaze {

Json toJson(const TelemetryCounters& counters)
{
    Json value = Json::object();
    value["ticks"] = counters.ticks;
    value["no_frame"] = counters.no_frame;
    value["stale_frames"] = counters.stale_frames;
    value["detector_runs"] = counters.detector_runs;
    value["detector_failures"] = counters.detector_failures;
    value["detector_timeouts"] = counters.detector_timeouts;
    value["stale_results"] = counters.stale_results;
    value["clamps"] = counters.clamps;
    value["commands"] = counters.commands;
    value["dispatch_failures"] = counters.dispatch_failures;
    value["overruns"] = counters.overruns;
    return value;
}

Json toJson(const TelemetrySnapshot& snapshot)
{
    Json value = Json::object();
    value["type"] = "telemetry";
    value["target_label"] = snapshot.target_label;
    value["state"] = toString(snapshot.state);
    value["target"] = snapshot.target ? toJson(*snapshot.target, snapshot.taken_at) : Json();
    value["last_command"] = snapshot.last_command ? toJson(*snapshot.last_command) : Json();
    value["counters"] = toJson(snapshot.counters);
    return value;
}

}  // namespace gaze
