#pragma once

#include <cstdint>
#include <optional>

#include "gaze/common.hpp"
#include "gaze/config.hpp"
#include "gaze/track.hpp"

namespace gaze {

enum class ControllerState { Idle, Tracking, Returning };

enum class ControllerEvent { TargetLive, TargetLost, NeutralReached, Stop };

const char* toString(ControllerState state);

// Pure transition table. Pairings without an edge leave the state unchanged.
ControllerState transition(ControllerState state, ControllerEvent event);

struct GazeCommand {
    double pan_deg = 0.0;   // positive toward image right
    double tilt_deg = 0.0;  // positive toward image top
    double duration_s = 0.0;
    std::optional<double> look_u;
    std::optional<double> look_v;
    bool clamped = false;
    ControllerState state = ControllerState::Idle;
};

// Clamps pan/tilt into the bounds, replacing non-finite values with neutral.
// Returns true when anything was changed.
bool clamp_command(GazeCommand& command, const SafetyBounds& bounds);

// Angle off the optical axis for a pixel offset from the image center, for a
// pinhole camera whose full field of view spans 2 * half_extent_px pixels.
double pixelOffsetToDegrees(double offset_px, double half_extent_px, double fov_deg);

Json toJson(const GazeCommand& command);

class GazeController {
public:
    explicit GazeController(GazeConfig config);

    std::optional<GazeCommand> step(const std::optional<TrackTarget>& target,
                                    int frame_width, int frame_height, TimePoint now);

    void stop();
    void begin_session();

    ControllerState state() const { return state_; }
    double pan() const { return pan_; }
    double tilt() const { return tilt_; }
    std::uint64_t clamp_count() const { return clamp_count_; }

private:
    void apply(ControllerEvent event, TimePoint now);
    GazeCommand trackingCommand(const TrackTarget& target, int frame_width, int frame_height);
    GazeCommand returningCommand(TimePoint now, bool& reached);
    std::optional<GazeCommand> scanCommand(TimePoint now);
    GazeCommand finish(GazeCommand command);

    GazeConfig config_;
    ControllerState state_ = ControllerState::Idle;

    double pan_ = 0.0;
    double tilt_ = 0.0;
    double look_u_ = 0.0;
    double look_v_ = 0.0;
    bool look_valid_ = false;
    TimePoint integrated_seen_{};

    double return_pan_ = 0.0;
    double return_tilt_ = 0.0;
    TimePoint return_start_{};
    TimePoint idle_since_{};
    bool idle_since_valid_ = false;

    bool clamping_ = false;
    std::uint64_t clamp_count_ = 0;
};

}  // namespace gaze
