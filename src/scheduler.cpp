#include "gaze/scheduler.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace gaze {

const char* toString(TickReport::Status status)
{
    switch (status) {
    case TickReport::Status::Inactive: return "inactive";
    case TickReport::Status::NoFrame: return "no_frame";
    case TickReport::Status::StaleFrame: return "stale_frame";
    case TickReport::Status::Ran: return "ran";
    }
    return "unknown";
}

ControlRequest parseControlRequest(const Json& message)
{
    if (!message.is_object()) {
        throw std::runtime_error("Control message must be a JSON object");
    }

    const std::string action = toLower(message.get_string("action"));
    ControlRequest request;
    if (action == "start") {
        request.action = ControlRequest::Action::Start;
    } else if (action == "stop") {
        request.action = ControlRequest::Action::Stop;
    } else if (action == "target") {
        request.action = ControlRequest::Action::Target;
        request.label = message.get_string("label");
        if (request.label.empty()) {
            throw std::runtime_error("Control 'target' requires a label");
        }
        if (message.contains("confidence")) {
            const double confidence = message.get_number("confidence");
            if (!(confidence >= 0.0 && confidence <= 1.0)) {
                throw std::runtime_error("Control 'confidence' must be in [0, 1]");
            }
            request.confidence = confidence;
        }
    } else {
        throw std::runtime_error("Unknown control action: '" + action + "'");
    }
    return request;
}

ControlScheduler::ControlScheduler(const AppConfig& config, FrameSource& frames,
                                   DetectorAdapter& detector, MotionInterface& motion)
    : tracking_(config.tracking),
      period_(fromSeconds(1.0 / config.tracking.control_hz)),
      frame_max_age_(fromSeconds(config.camera.frame_max_age_ms / 1000.0)),
      frames_(frames),
      detector_(detector),
      motion_(motion),
      selector_(config.tracking.continuity_px),
      track_(fromSeconds(config.tracking.miss_timeout_s)),
      controller_(config.gaze)
{
    snapshot_.target_label = tracking_.target_label;
}

void ControlScheduler::request_start()
{
    std::lock_guard<std::mutex> lock(request_mutex_);
    start_requested_ = true;
    pause_requested_ = false;
}

void ControlScheduler::request_pause()
{
    {
        std::lock_guard<std::mutex> lock(dispatch_mutex_);
        active_.store(false);
    }
    std::lock_guard<std::mutex> lock(request_mutex_);
    pause_requested_ = true;
    start_requested_ = false;
}

void ControlScheduler::request_target(const std::string& label, std::optional<double> confidence_threshold)
{
    ControlRequest request;
    request.action = ControlRequest::Action::Target;
    request.label = label;
    request.confidence = confidence_threshold;
    std::lock_guard<std::mutex> lock(request_mutex_);
    target_request_ = request;
}

void ControlScheduler::handle(const ControlRequest& request)
{
    switch (request.action) {
    case ControlRequest::Action::Start:
        request_start();
        break;
    case ControlRequest::Action::Stop:
        request_pause();
        break;
    case ControlRequest::Action::Target:
        request_target(request.label, request.confidence);
        break;
    }
}

void ControlScheduler::set_telemetry_sink(TelemetrySink sink, int every_ticks)
{
    sink_ = std::move(sink);
    sink_every_ = every_ticks;
}

void ControlScheduler::applyRequests()
{
    bool start = false;
    bool pause = false;
    std::optional<ControlRequest> target;
    {
        std::lock_guard<std::mutex> lock(request_mutex_);
        std::swap(start, start_requested_);
        std::swap(pause, pause_requested_);
        std::swap(target, target_request_);
    }

    if (target) {
        tracking_.target_label = target->label;
        if (target->confidence) {
            tracking_.confidence_threshold = *target->confidence;
        }
        std::cout << "[Scheduler] Target set to '" << tracking_.target_label << "' (confidence >= "
                  << tracking_.confidence_threshold << ")" << std::endl;
        track_.reset();
    }
    if (pause) {
        std::cout << "[Scheduler] Session paused" << std::endl;
        controller_.stop();
        track_.reset();
    }
    if (start) {
        std::cout << "[Scheduler] Session started" << std::endl;
        controller_.begin_session();
        track_.reset();
        detector_.reset();
        active_.store(true);
    }
}

TickReport ControlScheduler::tick(TimePoint now)
{
    applyRequests();

    TickReport report;
    ++counters_.ticks;

    if (!active_.load()) {
        report.state = controller_.state();
        publishTelemetry(now);
        return report;
    }

    FrameSource::FramePtr frame = frames_.latest();
    if (!frame) {
        ++counters_.no_frame;
        report.status = TickReport::Status::NoFrame;
        report.state = controller_.state();
        publishTelemetry(now);
        return report;
    }

    DetectionOutcome outcome;
    if (now - frame->timestamp > frame_max_age_) {
        ++counters_.stale_frames;
        report.status = TickReport::Status::StaleFrame;
        outcome.status = DetectStatus::Stale;
    } else {
        report.status = TickReport::Status::Ran;
        outcome = detector_.detect(frame, tracking_.target_label, tracking_.confidence_threshold, now);
        if (outcome.status == DetectStatus::Stale) {
            ++counters_.stale_results;
        }
    }
    report.detect_status = outcome.status;
    report.error = outcome.error;

    std::optional<Detection> selected = selector_.select(outcome.detections, track_.target());
    report.track_event = track_.update(selected, now);
    if (report.track_event == TrackEvent::Acquired || report.track_event == TrackEvent::Lost) {
        std::cout << "[Scheduler] Target " << toString(report.track_event) << std::endl;
    }

    report.command = controller_.step(track_.target(), frame->width, frame->height, now);
    report.state = controller_.state();
    if (report.command) {
        dispatch(report);
    }

    publishTelemetry(now);
    return report;
}

void ControlScheduler::dispatch(TickReport& report)
{
    std::lock_guard<std::mutex> lock(dispatch_mutex_);
    if (stop_requested_.load() || !active_.load()) {
        return;
    }
    try {
        motion_.send_gaze(*report.command);
        report.dispatched = true;
        ++counters_.commands;
        last_command_ = report.command;
    } catch (const MotionError& ex) {
        ++counters_.dispatch_failures;
        report.error = ex.what();
        std::cerr << "[Scheduler] Motion dispatch failed: " << ex.what() << std::endl;
        if (ex.permanent()) {
            throw;
        }
    }
}

void ControlScheduler::publishTelemetry(TimePoint now)
{
    counters_.detector_runs = detector_.invocations();
    counters_.detector_failures = detector_.failures();
    counters_.detector_timeouts = detector_.timeouts();
    counters_.clamps = controller_.clamp_count();

    std::lock_guard<std::mutex> lock(telemetry_mutex_);
    snapshot_.target_label = tracking_.target_label;
    snapshot_.state = controller_.state();
    snapshot_.target = track_.target();
    snapshot_.last_command = last_command_;
    snapshot_.counters = counters_;
    snapshot_.taken_at = now;
}

TelemetrySnapshot ControlScheduler::telemetry() const
{
    std::lock_guard<std::mutex> lock(telemetry_mutex_);
    return snapshot_;
}

void ControlScheduler::stop()
{
    {
        std::lock_guard<std::mutex> lock(dispatch_mutex_);
        stop_requested_.store(true);
    }
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
    }
    wait_cv_.notify_all();
}

void ControlScheduler::run()
{
    std::cout << "[Scheduler] Control loop started at " << tracking_.control_hz << " Hz, target '"
              << tracking_.target_label << "'" << std::endl;

    TimePoint next = Clock::now();
    while (!stop_requested_.load()) {
        try {
            tick(Clock::now());
        } catch (const MotionError& ex) {
            std::cerr << "[Scheduler] Motion interface unavailable, ending loop: " << ex.what() << std::endl;
            controller_.stop();
            publishTelemetry(Clock::now());
            throw;
        }

        if (sink_ && sink_every_ > 0 && counters_.ticks % static_cast<std::uint64_t>(sink_every_) == 0) {
            try {
                sink_(telemetry());
            } catch (const std::exception& ex) {
                std::cerr << "[Scheduler] Telemetry sink failed: " << ex.what() << std::endl;
            }
        }

        next += period_;
        const TimePoint now = Clock::now();
        if (now >= next) {
            // Overrun: start the next tick right away and re-base the schedule.
            ++counters_.overruns;
            next = now;
            continue;
        }
        std::unique_lock<std::mutex> lock(wait_mutex_);
        wait_cv_.wait_until(lock, next, [this] { return stop_requested_.load(); });
    }

    controller_.stop();
    track_.reset();
    publishTelemetry(Clock::now());
    std::cout << "[Scheduler] Control loop stopped after " << counters_.ticks << " ticks" << std::endl;
}

}  // namespace gaze
