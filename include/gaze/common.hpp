#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "gaze/json.hpp"

namespace gaze {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

inline double toSeconds(Clock::duration d) {
    return std::chrono::duration<double>(d).count();
}

inline Clock::duration fromSeconds(double seconds) {
    return std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(seconds));
}

// Center-anchored box in pixel coordinates.
struct Region {
    double u = 0.0;
    double v = 0.0;
    double width = 0.0;
    double height = 0.0;

    double area() const { return width * height; }
    double distance_to(const Region& other) const;

    static Region fromCorners(double x1, double y1, double x2, double y2);

    bool operator==(const Region& other) const {
        return u == other.u && v == other.v && width == other.width && height == other.height;
    }
};

struct Detection {
    std::string label;
    double confidence = 0.0;
    Region region;
    TimePoint frame_time{};
};

using DetectionSet = std::vector<Detection>;

struct CapturedFrame {
    std::vector<std::uint8_t> data;
    std::string format;  // "jpeg", "png" or "bgr"
    int width = 0;
    int height = 0;
    int stride = 0;
    std::uint64_t sequence = 0;
    TimePoint timestamp{};
};

std::string toLower(std::string text);
bool labelMatches(const std::string& label, const std::string& filter);

// Parses a whole command-line number; false on trailing text or a bad value.
bool parseNumber(const std::string& text, double& value);

Json toJson(const Region& region);
Json toJson(const Detection& detection);

}  // namespace gaze
