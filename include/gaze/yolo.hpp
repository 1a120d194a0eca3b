#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "gaze/config.hpp"
#include "gaze/model.hpp"
#include "gaze/vision.hpp"

namespace gaze {

class YoloModel : public Model {
public:
    YoloModel(DetectorConfig config, std::vector<std::string> class_names);
    ~YoloModel() override;

    bool load() override;
    bool release() override;
    bool isLoaded() const override { return loaded_; }
    std::string model_type() const override { return "yolo"; }

    DetectionSet infer(const CapturedFrame& frame) const override;

private:
    struct Impl;

    DetectorConfig config_;
    std::vector<std::string> class_names_;
    std::atomic<bool> loaded_{false};
    std::unique_ptr<Impl> impl_;
    mutable std::mutex run_mutex_;
};

// Reads the `names` entry of an Ultralytics data YAML (list or index map).
std::vector<std::string> loadClassNames(const std::string& yaml_path);

// Decodes a YOLOv8-style [1, 4 + classes, boxes] head into detections in the
// original image space.
DetectionSet decodeYoloOutput(const float* data, int channels, int boxes,
                              const PreprocessInfo& prep, cv::Size image,
                              const std::vector<std::string>& class_names,
                              float score_floor, float nms_iou, TimePoint frame_time);

std::unique_ptr<Model> create_model(const DetectorConfig& config);

}  // namespace gaze
