#include "gaze/selector.hpp"

#include <cstddef>

namespace gaze {

std::optional<Detection> TargetSelector::select(const DetectionSet& detections,
                                                const std::optional<TrackTarget>& previous) const
{
    if (detections.empty()) {
        return std::nullopt;
    }

    if (previous) {
        std::size_t nearest = detections.size();
        double nearest_distance = 0.0;
        for (std::size_t i = 0; i < detections.size(); ++i) {
            const double d = detections[i].region.distance_to(previous->region);
            if (nearest == detections.size() || d < nearest_distance) {
                nearest = i;
                nearest_distance = d;
            }
        }
        if (nearest_distance < continuity_px_) {
            return detections[nearest];
        }
    }

    std::size_t best = 0;
    for (std::size_t i = 1; i < detections.size(); ++i) {
        const Detection& c = detections[i];
        const Detection& b = detections[best];
        if (c.confidence > b.confidence ||
            (c.confidence == b.confidence && c.region.area() > b.region.area())) {
            best = i;
        }
    }
    return detections[best];
}

}  // namespace gaze
