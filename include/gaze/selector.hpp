#pragma once

#include <optional>

#include "gaze/common.hpp"
#include "gaze/track.hpp"

namespace gaze {

// Picks at most one detection. With a previous target, the closest center
// within continuity_px wins; otherwise the highest confidence, then the larger
// area. Remaining ties go to the earliest element.
class TargetSelector {
public:
    explicit TargetSelector(double continuity_px = 80.0) : continuity_px_(continuity_px) {}

    std::optional<Detection> select(const DetectionSet& detections,
                                    const std::optional<TrackTarget>& previous) const;

private:
    double continuity_px_;
};

}  // namespace gaze
