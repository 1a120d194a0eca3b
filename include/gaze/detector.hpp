#pragma once

#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <string>

#include "gaze/common.hpp"
#include "gaze/frame_source.hpp"
#include "gaze/model.hpp"
#include "gaze/thread_pool.hpp"

namespace gaze {

enum class DetectStatus {
    Fresh,     // model result collected this tick
    Cached,    // previous result reused (cadence not elapsed or still inferring)
    Pending,   // inference in flight, nothing cached yet
    TimedOut,  // submitted this tick, not ready within the timeout, no fresh cache
    Failed,    // model raised or is not loaded
    Stale      // cached result older than the allowed age
};

const char* toString(DetectStatus status);

struct DetectionOutcome {
    DetectionSet detections;
    DetectStatus status = DetectStatus::Pending;
    std::string error;
};

struct DetectorOptions {
    double cadence_hz = 5.0;
    std::chrono::milliseconds timeout{250};
    Clock::duration max_result_age = std::chrono::seconds(1);
};

// Runs a Model on its own worker thread at a cadence independent of the
// caller, caching the last raw result and filtering it per call.
class DetectorAdapter {
public:
    DetectorAdapter(std::shared_ptr<Model> model, DetectorOptions options);
    ~DetectorAdapter();

    DetectorAdapter(const DetectorAdapter&) = delete;
    DetectorAdapter& operator=(const DetectorAdapter&) = delete;

    DetectionOutcome detect(const FrameSource::FramePtr& frame,
                            const std::string& label_filter,
                            double confidence_threshold,
                            TimePoint now);

    bool is_result_fresh(Clock::duration max_age, TimePoint now) const;

    void reset();

    // Blocks until an in-flight inference has finished. Call before
    // releasing the model. The result is still collected by the next detect().
    void drain();

    bool busy() const { return pool_.outstanding() > 0; }
    std::uint64_t invocations() const { return invocations_; }
    std::uint64_t failures() const { return failures_; }
    std::uint64_t timeouts() const { return timeouts_; }

    const DetectorOptions& options() const { return options_; }

private:
    bool dueForSubmit(const CapturedFrame& frame, TimePoint now) const;
    void submit(const FrameSource::FramePtr& frame, TimePoint now);
    bool collect(std::string& error);

    std::shared_ptr<Model> model_;
    DetectorOptions options_;

    std::future<DetectionSet> pending_;
    TimePoint pending_frame_time_{};

    bool has_result_ = false;
    DetectionSet result_;
    TimePoint result_frame_time_{};

    bool submitted_ = false;
    TimePoint last_submit_{};
    std::uint64_t last_sequence_ = 0;
    TimePoint last_frame_time_{};

    std::uint64_t invocations_ = 0;
    std::uint64_t failures_ = 0;
    std::uint64_t timeouts_ = 0;

    // Declared last: joined before the state above goes away.
    ThreadPool pool_{1};
};

DetectionSet filterDetections(const DetectionSet& raw, const std::string& label_filter,
                              double confidence_threshold);

}  // namespace gaze
