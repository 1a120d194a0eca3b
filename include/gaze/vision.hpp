#pragma once

#include <vector>

#include <opencv2/core.hpp>

#include "gaze/common.hpp"

namespace gaze {

struct PreprocessInfo {
    std::vector<float> input_tensor;  // NCHW, RGB, 0..1
    float scale = 1.0f;
    int pad_x = 0;
    int pad_y = 0;
};

PreprocessInfo preprocess_letterbox(const cv::Mat& img, int input_w, int input_h);

cv::Mat decodeFrameToMat(const CapturedFrame& frame);

std::vector<int> NMS(const std::vector<cv::Rect2f>& boxes,
                     const std::vector<float>& scores,
                     float iouThreshold = 0.45f);
float IoU(const cv::Rect2f& a, const cv::Rect2f& b);

}  // namespace gaze
