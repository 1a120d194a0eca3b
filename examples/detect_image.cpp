#include <algorithm>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include "gaze/detector.hpp"
#include "gaze/selector.hpp"
#include "gaze/yolo.hpp"

// Runs the detector on one image, prints the detections that pass the label and
// confidence filter, marks the one the tracker would select and saves result.jpg.
int main(int argc, char** argv) {
    if (argc < 4) {
        std::cerr << "Usage: " << argv[0] << " <model.onnx> <data.yaml> <image> [label] [confidence]\n";
        return 1;
    }
    gaze::DetectorConfig config;
    config.model_path = argv[1];
    config.labels_path = argv[2];
    const std::string image_path = argv[3];
    const std::string label = argc > 4 ? argv[4] : "person";
    double threshold = 0.5;
    if (argc > 5 && !gaze::parseNumber(argv[5], threshold)) {
        std::cerr << "Invalid confidence: " << argv[5] << "\n";
        return 1;
    }

    std::ifstream file(image_path, std::ios::binary);
    if (!file) {
        std::cerr << "Failed to open image: " << image_path << "\n";
        return 1;
    }

    gaze::CapturedFrame frame;
    frame.data.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    frame.format = "jpeg";
    frame.timestamp = gaze::Clock::now();

    try {
        std::unique_ptr<gaze::Model> model = gaze::create_model(config);
        model->load();

        gaze::DetectionSet raw = model->infer(frame);
        gaze::DetectionSet filtered = gaze::filterDetections(raw, label, threshold);
        std::cout << "[INFO] Raw detections: " << raw.size() << ", '" << label << "' >= " << threshold
                  << ": " << filtered.size() << "\n";

        gaze::TargetSelector selector;
        std::optional<gaze::Detection> selected = selector.select(filtered, std::nullopt);

        cv::Mat vis = gaze::decodeFrameToMat(frame);
        for (const auto& det : raw) {
            const bool passed = gaze::labelMatches(det.label, label) && det.confidence >= threshold;
            const bool chosen = selected && det.region == selected->region;
            std::cout << (chosen ? " * " : "   ") << gaze::toJson(det).dump() << "\n";

            const cv::Rect box(cv::Point(static_cast<int>(det.region.u - det.region.width / 2),
                                         static_cast<int>(det.region.v - det.region.height / 2)),
                               cv::Size(static_cast<int>(det.region.width), static_cast<int>(det.region.height)));
            const cv::Scalar color = chosen ? cv::Scalar(0, 0, 255)
                                            : (passed ? cv::Scalar(0, 255, 0) : cv::Scalar(160, 160, 160));
            cv::rectangle(vis, box, color, chosen ? 3 : 1);

            char buf[128];
            std::snprintf(buf, sizeof(buf), "%s %.2f", det.label.c_str(), det.confidence);
            cv::putText(vis, buf, cv::Point(box.x + 3, std::max(12, box.y - 3)), cv::FONT_HERSHEY_SIMPLEX, 0.5,
                        color, 1, cv::LINE_AA);
        }

        cv::imwrite("result.jpg", vis);
        std::cout << "[INFO] Saved to result.jpg\n";
        model->release();
    } catch (const std::exception& ex) {
        std::cerr << "[ERROR] " << ex.what() << "\n";
        return 1;
    }
    return 0;
}
