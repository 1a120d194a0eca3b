#include "gaze/vision.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace gaze {

PreprocessInfo preprocess_letterbox(const cv::Mat& img, int input_w, int input_h)
{
    if (img.empty() || input_w <= 0 || input_h <= 0) {
        throw std::invalid_argument("letterbox needs a non-empty image and a positive input size");
    }

    const int img_w = img.cols;
    const int img_h = img.rows;
    const float scale = std::min(static_cast<float>(input_w) / img_w,
                                 static_cast<float>(input_h) / img_h);

    const int new_w = std::max(1, static_cast<int>(std::round(img_w * scale)));
    const int new_h = std::max(1, static_cast<int>(std::round(img_h * scale)));

    cv::Mat resized;
    cv::resize(img, resized, cv::Size(new_w, new_h), 0, 0, cv::INTER_LINEAR);

    const int pad_x = (input_w - new_w) / 2;
    const int pad_y = (input_h - new_h) / 2;

    cv::Mat letterbox(input_h, input_w, img.type(), cv::Scalar(114, 114, 114));
    resized.copyTo(letterbox(cv::Rect(pad_x, pad_y, new_w, new_h)));

    cv::Mat float_img;
    letterbox.convertTo(float_img, CV_32F, 1.0 / 255.0);
    cv::cvtColor(float_img, float_img, cv::COLOR_BGR2RGB);

    std::vector<cv::Mat> chw(3);
    cv::split(float_img, chw);

    PreprocessInfo info;
    info.scale = scale;
    info.pad_x = pad_x;
    info.pad_y = pad_y;
    info.input_tensor.reserve(static_cast<std::size_t>(input_w) * input_h * 3);
    for (int c = 0; c < 3; ++c) {
        const float* begin = reinterpret_cast<const float*>(chw[c].datastart);
        const float* end = reinterpret_cast<const float*>(chw[c].dataend);
        info.input_tensor.insert(info.input_tensor.end(), begin, end);
    }
    return info;
}

cv::Mat decodeFrameToMat(const CapturedFrame& frame)
{
    if (frame.data.empty()) {
        throw std::runtime_error("Captured frame has no data");
    }

    std::string format = toLower(frame.format);
    if (format.empty()) {
        format = "jpeg";
    }

    if (format == "jpeg" || format == "jpg" || format == "png") {
        cv::Mat encoded(1, static_cast<int>(frame.data.size()), CV_8UC1,
                        const_cast<std::uint8_t*>(frame.data.data()));
        cv::Mat image = cv::imdecode(encoded, cv::IMREAD_COLOR);
        if (image.empty()) {
            throw std::runtime_error("Failed to decode encoded frame");
        }
        return image;
    }

    if (format == "bgr" || format == "bgr24") {
        if (frame.width <= 0 || frame.height <= 0) {
            throw std::runtime_error("Captured BGR frame missing dimensions");
        }
        const int stride = frame.stride > 0 ? frame.stride : frame.width * 3;
        const std::size_t expected = static_cast<std::size_t>(stride) * frame.height;
        if (frame.data.size() < expected) {
            throw std::runtime_error("Captured BGR frame data too small");
        }
        cv::Mat image(frame.height, frame.width, CV_8UC3,
                      const_cast<std::uint8_t*>(frame.data.data()), static_cast<std::size_t>(stride));
        return image.clone();
    }

    throw std::runtime_error("Unsupported frame format: " + frame.format);
}

std::vector<int> NMS(const std::vector<cv::Rect2f>& boxes,
                     const std::vector<float>& scores,
                     float iouThreshold)
{
    std::vector<int> indices;
    std::vector<int> order(boxes.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
                     [&](int i, int j) { return scores[i] > scores[j]; });

    std::vector<bool> suppressed(boxes.size(), false);
    for (std::size_t i = 0; i < order.size(); i++) {
        int idx = order[i];
        if (suppressed[idx]) continue;
        indices.push_back(idx);
        for (std::size_t j = i + 1; j < order.size(); j++) {
            int idx2 = order[j];
            if (IoU(boxes[idx], boxes[idx2]) > iouThreshold)
                suppressed[idx2] = true;
        }
    }
    return indices;
}

float IoU(const cv::Rect2f& a, const cv::Rect2f& b)
{
    float interArea = (a & b).area();
    float unionArea = a.area() + b.area() - interArea;
    if (unionArea <= 0.0f) {
        return 0.0f;
    }
    return interArea / unionArea;
}

}  // namespace gaze
