#include "gaze/common.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace gaze {

double Region::distance_to(const Region& other) const
{
    return std::hypot(u - other.u, v - other.v);
}

Region Region::fromCorners(double x1, double y1, double x2, double y2)
{
    Region region;
    region.u = (x1 + x2) * 0.5;
    region.v = (y1 + y2) * 0.5;
    region.width = std::fabs(x2 - x1);
    region.height = std::fabs(y2 - y1);
    return region;
}

std::string toLower(std::string text)
{
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return text;
}

bool labelMatches(const std::string& label, const std::string& filter)
{
    if (label.empty()) {
        return false;
    }
    return toLower(label) == toLower(filter);
}

bool parseNumber(const std::string& text, double& value)
{
    try {
        std::size_t used = 0;
        value = std::stod(text, &used);
        return used == text.size();
    } catch (const std::exception&) {
        return false;
    }
}

Json toJson(const Region& region)
{
    Json value = Json::object();
    value["u"] = region.u;
    value["v"] = region.v;
    value["width"] = region.width;
    value["height"] = region.height;
    return value;
}

Json toJson(const Detection& detection)
{
    Json value = Json::object();
    value["label"] = detection.label;
    value["confidence"] = detection.confidence;
    value["region"] = toJson(detection.region);
    return value;
}

}  // namespace gaze
