#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include "gaze/config.hpp"
#include "gaze/controller.hpp"
#include "gaze/detector.hpp"
#include "gaze/frame_source.hpp"
#include "gaze/motion.hpp"
#include "gaze/selector.hpp"
#include "gaze/telemetry.hpp"
#include "gaze/track.hpp"

namespace gaze {

struct TickReport {
    enum class Status { Inactive, NoFrame, StaleFrame, Ran };

    Status status = Status::Inactive;
    DetectStatus detect_status = DetectStatus::Pending;
    TrackEvent track_event = TrackEvent::Empty;
    ControllerState state = ControllerState::Idle;
    std::optional<GazeCommand> command;
    bool dispatched = false;
    std::string error;
};

const char* toString(TickReport::Status status);

// Remote session control, e.g. {"action": "target", "label": "cat", "confidence": 0.6}.
struct ControlRequest {
    enum class Action { Start, Stop, Target };

    Action action = Action::Start;
    std::string label;
    std::optional<double> confidence;
};

// Throws std::runtime_error on an unknown action or a malformed target.
ControlRequest parseControlRequest(const Json& message);

// Fixed-rate control loop: frame -> detect -> select -> track -> control ->
// dispatch. Selector, track state and controller belong to the loop thread;
// only stop(), the session requests and telemetry() are safe from elsewhere.
class ControlScheduler {
public:
    using TelemetrySink = std::function<void(const TelemetrySnapshot&)>;

    ControlScheduler(const AppConfig& config, FrameSource& frames, DetectorAdapter& detector,
                     MotionInterface& motion);

    ControlScheduler(const ControlScheduler&) = delete;
    ControlScheduler& operator=(const ControlScheduler&) = delete;

    // Blocks until stop(). Rethrows a permanent MotionError after driving the
    // controller to idle.
    void run();
    void stop();
    bool stopped() const { return stop_requested_.load(); }

    TickReport tick(TimePoint now);

    // Session control, applied at the start of the next tick.
    void request_start();
    void request_pause();
    // An absent threshold keeps the current one.
    void request_target(const std::string& label, std::optional<double> confidence_threshold);
    bool active() const { return active_.load(); }

    void set_telemetry_sink(TelemetrySink sink, int every_ticks);

    TelemetrySnapshot telemetry() const;

    ControllerState state() const { return controller_.state(); }
    const TrackState& track() const { return track_; }
    Clock::duration period() const { return period_; }

    void handle(const ControlRequest& request);

private:
    void applyRequests();
    void dispatch(TickReport& report);
    void publishTelemetry(TimePoint now);

    TrackingConfig tracking_;
    Clock::duration period_;
    Clock::duration frame_max_age_;

    FrameSource& frames_;
    DetectorAdapter& detector_;
    MotionInterface& motion_;

    TargetSelector selector_;
    TrackState track_;
    GazeController controller_;

    std::atomic<bool> stop_requested_{false};
    std::atomic<bool> active_{true};
    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
    std::mutex dispatch_mutex_;

    std::mutex request_mutex_;
    bool start_requested_ = false;
    bool pause_requested_ = false;
    std::optional<ControlRequest> target_request_;

    TelemetrySink sink_;
    int sink_every_ = 0;

    TelemetryCounters counters_;
    std::optional<GazeCommand> last_command_;
    mutable std::mutex telemetry_mutex_;
    TelemetrySnapshot snapshot_;
};

}  // namespace gaze
