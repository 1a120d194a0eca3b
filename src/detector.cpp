#include "gaze/detector.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace gaze {

const char* toString(DetectStatus status)
{
    switch (status) {
    case DetectStatus::Fresh: return "fresh";
    case DetectStatus::Cached: return "cached";
    case DetectStatus::Pending: return "pending";
    case DetectStatus::TimedOut: return "timed_out";
    case DetectStatus::Failed: return "failed";
    case DetectStatus::Stale: return "stale";
    }
    return "unknown";
}

DetectionSet filterDetections(const DetectionSet& raw, const std::string& label_filter,
                              double confidence_threshold)
{
    DetectionSet filtered;
    for (const auto& det : raw) {
        if (labelMatches(det.label, label_filter) && det.confidence >= confidence_threshold) {
            filtered.push_back(det);
        }
    }
    return filtered;
}

DetectorAdapter::DetectorAdapter(std::shared_ptr<Model> model, DetectorOptions options)
    : model_(std::move(model)), options_(options)
{
    if (!model_) {
        throw std::invalid_argument("DetectorAdapter requires a model");
    }
}

DetectorAdapter::~DetectorAdapter() = default;

bool DetectorAdapter::dueForSubmit(const CapturedFrame& frame, TimePoint now) const
{
    if (pending_.valid()) {
        return false;
    }
    if (!submitted_) {
        return true;
    }
    if (frame.sequence == last_sequence_ && frame.timestamp == last_frame_time_) {
        return false;
    }
    if (options_.cadence_hz <= 0.0) {
        return true;
    }
    return now - last_submit_ >= fromSeconds(1.0 / options_.cadence_hz);
}

void DetectorAdapter::submit(const FrameSource::FramePtr& frame, TimePoint now)
{
    std::shared_ptr<Model> model = model_;
    pending_ = pool_.enqueue([model, frame]() { return model->infer(*frame); });
    pending_frame_time_ = frame->timestamp;
    submitted_ = true;
    last_submit_ = now;
    last_sequence_ = frame->sequence;
    last_frame_time_ = frame->timestamp;
    ++invocations_;
}

// Moves a finished inference into the cache. A failed inference caches an
// empty result for its frame so later ticks do not resurrect older boxes.
bool DetectorAdapter::collect(std::string& error)
{
    std::future<DetectionSet> done = std::move(pending_);
    has_result_ = true;
    result_frame_time_ = pending_frame_time_;
    try {
        result_ = done.get();
        return true;
    } catch (const std::exception& ex) {
        error = ex.what();
    }
    result_.clear();
    ++failures_;
    std::cerr << "[Detector] Inference failed: " << error << std::endl;
    return false;
}

DetectionOutcome DetectorAdapter::detect(const FrameSource::FramePtr& frame,
                                         const std::string& label_filter,
                                         double confidence_threshold,
                                         TimePoint now)
{
    DetectionOutcome outcome;
    bool collected = false;

    if (pending_.valid() &&
        pending_.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
        collected = true;
        if (!collect(outcome.error)) {
            outcome.status = DetectStatus::Failed;
            return outcome;
        }
    }

    if (frame && dueForSubmit(*frame, now)) {
        if (!model_->isLoaded()) {
            ++failures_;
            outcome.status = DetectStatus::Failed;
            outcome.error = "model not loaded";
            return outcome;
        }

        submit(frame, now);
        if (pending_.wait_for(options_.timeout) != std::future_status::ready) {
            ++timeouts_;
            // The new job stays in flight; a fresh cached result still serves this tick.
            if (is_result_fresh(options_.max_result_age, now)) {
                outcome.status = collected ? DetectStatus::Fresh : DetectStatus::Cached;
                outcome.detections = filterDetections(result_, label_filter, confidence_threshold);
                return outcome;
            }
            std::cerr << "[Detector] Inference exceeded " << options_.timeout.count()
                      << " ms, continuing without detections" << std::endl;
            outcome.status = DetectStatus::TimedOut;
            return outcome;
        }
        collected = true;
        if (!collect(outcome.error)) {
            outcome.status = DetectStatus::Failed;
            return outcome;
        }
    }

    if (!has_result_) {
        outcome.status = DetectStatus::Pending;
        return outcome;
    }
    if (!is_result_fresh(options_.max_result_age, now)) {
        outcome.status = DetectStatus::Stale;
        return outcome;
    }

    outcome.status = collected ? DetectStatus::Fresh : DetectStatus::Cached;
    outcome.detections = filterDetections(result_, label_filter, confidence_threshold);
    return outcome;
}

bool DetectorAdapter::is_result_fresh(Clock::duration max_age, TimePoint now) const
{
    return has_result_ && now - result_frame_time_ <= max_age;
}

void DetectorAdapter::reset()
{
    has_result_ = false;
    result_.clear();
    result_frame_time_ = TimePoint{};
    submitted_ = false;
}

void DetectorAdapter::drain()
{
    if (pending_.valid()) {
        pending_.wait();
    }
}

}  // namespace gaze
