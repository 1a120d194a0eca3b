#include "gaze/controller.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <utility>

namespace gaze {

namespace {

constexpr double kPi = 3.14159265358979323846;

double cosineEase(double p)
{
    return 0.5 * (1.0 - std::cos(kPi * p));
}

bool clampAxis(double& value, double limit)
{
    if (!std::isfinite(value)) {
        value = 0.0;
        return true;
    }
    limit = std::fabs(limit);
    if (value > limit) {
        value = limit;
        return true;
    }
    if (value < -limit) {
        value = -limit;
        return true;
    }
    return false;
}

double applyDeadband(double error, double deadband)
{
    return std::fabs(error) < deadband ? 0.0 : error;
}

}  // namespace

double pixelOffsetToDegrees(double offset_px, double half_extent_px, double fov_deg)
{
    const double focal_px = half_extent_px / std::tan(fov_deg * 0.5 * kPi / 180.0);
    return std::atan(offset_px / focal_px) * 180.0 / kPi;
}

const char* toString(ControllerState state)
{
    switch (state) {
    case ControllerState::Idle: return "idle";
    case ControllerState::Tracking: return "tracking";
    case ControllerState::Returning: return "returning";
    }
    return "unknown";
}

ControllerState transition(ControllerState state, ControllerEvent event)
{
    if (event == ControllerEvent::Stop) {
        return ControllerState::Idle;
    }
    switch (state) {
    case ControllerState::Idle:
        if (event == ControllerEvent::TargetLive) return ControllerState::Tracking;
        break;
    case ControllerState::Tracking:
        if (event == ControllerEvent::TargetLost) return ControllerState::Returning;
        break;
    case ControllerState::Returning:
        if (event == ControllerEvent::TargetLive) return ControllerState::Tracking;
        if (event == ControllerEvent::NeutralReached) return ControllerState::Idle;
        break;
    }
    return state;
}

bool clamp_command(GazeCommand& command, const SafetyBounds& bounds)
{
    const bool pan_changed = clampAxis(command.pan_deg, bounds.max_pan_deg);
    const bool tilt_changed = clampAxis(command.tilt_deg, bounds.max_tilt_deg);
    const bool changed = pan_changed || tilt_changed;
    if (changed) {
        command.clamped = true;
    }
    return changed;
}

Json toJson(const GazeCommand& command)
{
    Json value = Json::object();
    value["pan_deg"] = command.pan_deg;
    value["tilt_deg"] = command.tilt_deg;
    value["duration_s"] = command.duration_s;
    if (command.look_u && command.look_v) {
        value["look_u"] = *command.look_u;
        value["look_v"] = *command.look_v;
    }
    value["clamped"] = command.clamped;
    value["state"] = toString(command.state);
    return value;
}

GazeController::GazeController(GazeConfig config) : config_(std::move(config)) {}

void GazeController::begin_session()
{
    state_ = ControllerState::Idle;
    pan_ = 0.0;
    tilt_ = 0.0;
    look_valid_ = false;
    integrated_seen_ = TimePoint{};
    idle_since_valid_ = false;
    clamping_ = false;
}

void GazeController::stop()
{
    if (state_ != ControllerState::Idle) {
        std::cout << "[Controller] " << toString(state_) << " -> idle (stop)" << std::endl;
    }
    state_ = transition(state_, ControllerEvent::Stop);
    idle_since_valid_ = false;
}

void GazeController::apply(ControllerEvent event, TimePoint now)
{
    const ControllerState next = transition(state_, event);
    if (next == state_) {
        return;
    }

    std::cout << "[Controller] " << toString(state_) << " -> " << toString(next) << std::endl;
    if (next == ControllerState::Returning) {
        return_pan_ = pan_;
        return_tilt_ = tilt_;
        return_start_ = now;
    } else if (next == ControllerState::Idle) {
        idle_since_ = now;
        idle_since_valid_ = true;
    }
    state_ = next;
}

std::optional<GazeCommand> GazeController::step(const std::optional<TrackTarget>& target,
                                                int frame_width, int frame_height, TimePoint now)
{
    if (target) {
        apply(ControllerEvent::TargetLive, now);
        return finish(trackingCommand(*target, frame_width, frame_height));
    }

    if (state_ == ControllerState::Tracking) {
        apply(ControllerEvent::TargetLost, now);
    }

    if (state_ == ControllerState::Returning) {
        bool reached = false;
        GazeCommand command = finish(returningCommand(now, reached));
        if (reached) {
            apply(ControllerEvent::NeutralReached, now);
        }
        return command;
    }

    return scanCommand(now);
}

GazeCommand GazeController::trackingCommand(const TrackTarget& target, int frame_width, int frame_height)
{
    const bool valid_frame = frame_width > 0 && frame_height > 0;
    if (valid_frame && !look_valid_) {
        look_u_ = frame_width * 0.5;
        look_v_ = frame_height * 0.5;
        look_valid_ = true;
    }

    // Coasting or cached results repeat an observation already folded in.
    if (valid_frame && target.last_seen != integrated_seen_) {
        const double half_w = frame_width * 0.5;
        const double half_h = frame_height * 0.5;
        const double err_u = applyDeadband(target.region.u - half_w, config_.deadband_px);
        const double err_v = applyDeadband(target.region.v - half_h, config_.deadband_px);

        const double pan_error = pixelOffsetToDegrees(err_u, half_w, config_.fov_h_deg);
        const double tilt_error = -pixelOffsetToDegrees(err_v, half_h, config_.fov_v_deg);

        const double alpha = config_.smoothing;
        pan_ += (1.0 - alpha) * pan_error;
        tilt_ += (1.0 - alpha) * tilt_error;
        look_u_ = alpha * look_u_ + (1.0 - alpha) * target.region.u;
        look_v_ = alpha * look_v_ + (1.0 - alpha) * target.region.v;
        integrated_seen_ = target.last_seen;
    }

    GazeCommand command;
    command.pan_deg = pan_;
    command.tilt_deg = tilt_;
    command.duration_s = config_.command_duration_s;
    if (look_valid_) {
        command.look_u = look_u_;
        command.look_v = look_v_;
    }
    command.state = ControllerState::Tracking;
    return command;
}

GazeCommand GazeController::returningCommand(TimePoint now, bool& reached)
{
    const double elapsed = toSeconds(now - return_start_);
    const double p = config_.return_duration_s > 0.0 ? elapsed / config_.return_duration_s : 1.0;

    GazeCommand command;
    command.duration_s = config_.command_duration_s;
    command.state = ControllerState::Returning;

    reached = p >= 1.0;
    if (!reached) {
        const double remaining = 1.0 - cosineEase(std::max(0.0, p));
        command.pan_deg = return_pan_ * remaining;
        command.tilt_deg = return_tilt_ * remaining;
        reached = std::fabs(command.pan_deg) <= config_.neutral_epsilon_deg &&
                  std::fabs(command.tilt_deg) <= config_.neutral_epsilon_deg;
    }
    if (reached) {
        command.pan_deg = 0.0;
        command.tilt_deg = 0.0;
        look_valid_ = false;
    }
    return command;
}

std::optional<GazeCommand> GazeController::scanCommand(TimePoint now)
{
    if (config_.scan_amplitude_deg <= 0.0 || config_.scan_period_s <= 0.0) {
        return std::nullopt;
    }
    if (!idle_since_valid_) {
        idle_since_ = now;
        idle_since_valid_ = true;
    }

    const double phase = 2.0 * kPi * toSeconds(now - idle_since_) / config_.scan_period_s;
    GazeCommand command;
    command.pan_deg = config_.scan_amplitude_deg * std::sin(phase);
    command.tilt_deg = 0.0;
    command.duration_s = config_.command_duration_s;
    command.state = ControllerState::Idle;
    return finish(command);
}

GazeCommand GazeController::finish(GazeCommand command)
{
    if (clamp_command(command, config_.bounds)) {
        ++clamp_count_;
        if (!clamping_) {
            std::cerr << "[Controller] Command clamped to safety bounds (pan "
                      << command.pan_deg << ", tilt " << command.tilt_deg << ")" << std::endl;
        }
        clamping_ = true;
    } else {
        clamping_ = false;
    }
    pan_ = command.pan_deg;
    tilt_ = command.tilt_deg;
    return command;
}

}  // namespace gaze
