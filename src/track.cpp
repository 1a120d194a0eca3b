#include "gaze/track.hpp"

namespace gaze {

const char* toString(TrackEvent event)
{
    switch (event) {
    case TrackEvent::Acquired: return "acquired";
    case TrackEvent::Refreshed: return "refreshed";
    case TrackEvent::Coasting: return "coasting";
    case TrackEvent::Lost: return "lost";
    case TrackEvent::Empty: return "empty";
    }
    return "unknown";
}

TrackState::TrackState(Clock::duration miss_timeout) : miss_timeout_(miss_timeout) {}

TrackEvent TrackState::update(const std::optional<Detection>& selected, TimePoint now)
{
    if (selected) {
        const TimePoint seen = selected->frame_time == TimePoint{} ? now : selected->frame_time;
        const bool acquired = !target_.has_value();
        if (acquired) {
            target_.emplace();
            target_->first_seen = seen;
        }
        target_->label = selected->label;
        target_->region = selected->region;
        target_->confidence = selected->confidence;
        target_->last_seen = seen;
        target_->consecutive_misses = 0;
        return acquired ? TrackEvent::Acquired : TrackEvent::Refreshed;
    }

    if (!target_) {
        return TrackEvent::Empty;
    }

    ++target_->consecutive_misses;
    if (now - target_->last_seen >= miss_timeout_) {
        target_.reset();
        return TrackEvent::Lost;
    }
    return TrackEvent::Coasting;
}

Json toJson(const TrackTarget& target, TimePoint now)
{
    Json value = Json::object();
    value["label"] = target.label;
    value["confidence"] = target.confidence;
    value["region"] = toJson(target.region);
    value["age_s"] = toSeconds(now - target.first_seen);
    value["since_seen_s"] = toSeconds(now - target.last_seen);
    value["misses"] = target.consecutive_misses;
    return value;
}

}  // namespace gaze
