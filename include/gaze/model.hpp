#pragma once

#include <string>

#include "gaze/common.hpp"

namespace gaze {

// Black-box object detection capability. infer() returns every labelled box
// the network produced for the frame, stamped with the frame's capture time;
// label and confidence filtering is the caller's business.
class Model {
public:
    virtual ~Model() = default;

    virtual bool load() = 0;
    virtual bool release() = 0;
    virtual bool isLoaded() const = 0;
    virtual std::string model_type() const = 0;

    // May throw on inference failure.
    virtual DetectionSet infer(const CapturedFrame& frame) const = 0;
};

}  // namespace gaze
