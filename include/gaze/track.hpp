#pragma once

#include <optional>
#include <string>

#include "gaze/common.hpp"

namespace gaze {

struct TrackTarget {
    std::string label;
    Region region;
    double confidence = 0.0;
    TimePoint first_seen{};
    TimePoint last_seen{};
    int consecutive_misses = 0;
};

enum class TrackEvent {
    Acquired,
    Refreshed,
    Coasting,  // missed, still within the miss timeout
    Lost,      // miss timeout reached, target discarded
    Empty
};

const char* toString(TrackEvent event);

// Holds at most one live target. Owned by the control loop thread.
class TrackState {
public:
    explicit TrackState(Clock::duration miss_timeout);

    TrackEvent update(const std::optional<Detection>& selected, TimePoint now);

    const std::optional<TrackTarget>& target() const { return target_; }
    bool live() const { return target_.has_value(); }

    void reset() { target_.reset(); }

private:
    Clock::duration miss_timeout_;
    std::optional<TrackTarget> target_;
};

Json toJson(const TrackTarget& target, TimePoint now);

}  // namespace gaze
