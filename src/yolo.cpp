#include <algorithm>
#include <array>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <opencv2/dnn.hpp>
#include <yaml-cpp/yaml.h>

#include "gaze/yolo.hpp"

#ifdef GAZE_HAS_ONNXRUNTIME
#include <onnxruntime_cxx_api.h>
#endif

namespace gaze {

struct YoloModel::Impl {
#if defined(GAZE_HAS_ONNXRUNTIME)
    Impl() : env(ORT_LOGGING_LEVEL_WARNING, "GazeTracker") {
        session_options.SetIntraOpNumThreads(1);
        session_options.SetGraphOptimizationLevel(ORT_ENABLE_EXTENDED);
    }
    Ort::Env env;
    Ort::SessionOptions session_options;
    std::unique_ptr<Ort::Session> session;
    std::vector<std::string> input_names;
    std::vector<const char*> input_name_ptrs;
    std::vector<std::string> output_names;
    std::vector<const char*> output_name_ptrs;
#endif
    cv::dnn::Net net;
    bool use_ort = false;
    std::vector<int64_t> input_shape{1, 3, 640, 640};
    bool ready = false;
};

namespace {

std::string resolveModelPath(const std::string& path)
{
    if (path.empty() || path[0] == '/') {
        return path;
    }
    return (std::filesystem::current_path() / path).string();
}

std::string classNameFor(const std::vector<std::string>& names, int cls)
{
    if (cls >= 0 && cls < static_cast<int>(names.size())) {
        return names[cls];
    }
    return "class_" + std::to_string(std::max(0, cls));
}

}  // namespace

YoloModel::YoloModel(DetectorConfig config, std::vector<std::string> class_names)
    : config_(std::move(config)), class_names_(std::move(class_names))
{
}

YoloModel::~YoloModel() = default;

bool YoloModel::load()
{
    const std::string model_path = resolveModelPath(config_.model_path);
    if (!std::filesystem::exists(model_path)) {
        throw std::runtime_error("YOLO model file not found: " + model_path);
    }

    auto impl = std::make_unique<Impl>();
    impl->input_shape = {1, 3, config_.input_height, config_.input_width};

#if defined(GAZE_HAS_ONNXRUNTIME)
    if (config_.backend == "onnxruntime") {
        try {
            impl->session = std::make_unique<Ort::Session>(impl->env, model_path.c_str(), impl->session_options);

            impl->input_names = impl->session->GetInputNames();
            for (const auto& name : impl->input_names) {
                impl->input_name_ptrs.push_back(name.c_str());
            }
            impl->output_names = impl->session->GetOutputNames();
            for (const auto& name : impl->output_names) {
                impl->output_name_ptrs.push_back(name.c_str());
            }

            if (impl->session->GetInputCount() > 0) {
                Ort::TypeInfo type_info = impl->session->GetInputTypeInfo(0);
                auto shape = type_info.GetTensorTypeAndShapeInfo().GetShape();
                if (shape.size() == 4) {
                    // Dynamic axes keep the configured input size.
                    for (std::size_t i = 0; i < shape.size(); ++i) {
                        if (shape[i] > 0) {
                            impl->input_shape[i] = shape[i];
                        }
                    }
                }
            }
            impl->use_ort = true;
        } catch (const Ort::Exception& ex) {
            std::cerr << "[YoloModel] ONNX Runtime load failed, falling back to OpenCV DNN: "
                      << ex.what() << std::endl;
            impl->session.reset();
            impl->input_names.clear();
            impl->input_name_ptrs.clear();
            impl->output_names.clear();
            impl->output_name_ptrs.clear();
        }
    }
#endif

    if (!impl->use_ort) {
        impl->net = cv::dnn::readNetFromONNX(model_path);
        if (impl->net.empty()) {
            throw std::runtime_error("OpenCV DNN could not load model: " + model_path);
        }
    }

    impl->ready = true;
    std::cout << "[YoloModel] Loaded " << model_path << " ("
              << (impl->use_ort ? "onnxruntime" : "opencv") << ", input "
              << impl->input_shape[3] << "x" << impl->input_shape[2] << ", "
              << class_names_.size() << " classes)" << std::endl;

    std::lock_guard<std::mutex> lock(run_mutex_);
    impl_ = std::move(impl);
    loaded_ = true;
    return true;
}

bool YoloModel::release()
{
    // Waits for an inference in progress before tearing the backend down.
    std::lock_guard<std::mutex> lock(run_mutex_);
    if (impl_) {
#if defined(GAZE_HAS_ONNXRUNTIME)
        impl_->input_name_ptrs.clear();
        impl_->output_name_ptrs.clear();
        impl_->input_names.clear();
        impl_->output_names.clear();
        impl_->session.reset();
#endif
        impl_->net = cv::dnn::Net();
        impl_->ready = false;
    }
    loaded_ = false;
    std::cout << "[YoloModel] Released " << config_.model_path << std::endl;
    return false;
}

DetectionSet YoloModel::infer(const CapturedFrame& frame) const
{
    std::lock_guard<std::mutex> lock(run_mutex_);
    if (!loaded_ || !impl_ || !impl_->ready) {
        throw std::runtime_error("YOLO model is not loaded");
    }

    cv::Mat image = decodeFrameToMat(frame);
    const int input_h = static_cast<int>(impl_->input_shape[2]);
    const int input_w = static_cast<int>(impl_->input_shape[3]);
    PreprocessInfo prep = preprocess_letterbox(image, input_w, input_h);

#if defined(GAZE_HAS_ONNXRUNTIME)
    if (impl_->use_ort) {
        std::array<int64_t, 4> input_shape{1, 3, input_h, input_w};
        Ort::MemoryInfo mem_info = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeCPU);
        Ort::Value input_tensor = Ort::Value::CreateTensor<float>(
            mem_info, prep.input_tensor.data(), prep.input_tensor.size(),
            input_shape.data(), input_shape.size());

        std::vector<Ort::Value> outputs;
        try {
            outputs = impl_->session->Run(
                Ort::RunOptions{},
                impl_->input_name_ptrs.data(), &input_tensor, 1,
                impl_->output_name_ptrs.data(), impl_->output_name_ptrs.size());
        } catch (const Ort::Exception& ex) {
            throw std::runtime_error(std::string("ONNX Runtime inference failed: ") + ex.what());
        }

        if (outputs.empty() || !outputs.front().IsTensor()) {
            throw std::runtime_error("YOLO model produced no tensor output");
        }
        auto shape = outputs.front().GetTensorTypeAndShapeInfo().GetShape();
        if (shape.size() != 3 || shape[0] != 1) {
            throw std::runtime_error("Unexpected YOLO output rank");
        }
        return decodeYoloOutput(outputs.front().GetTensorData<float>(),
                                static_cast<int>(shape[1]), static_cast<int>(shape[2]),
                                prep, image.size(), class_names_,
                                static_cast<float>(config_.score_floor),
                                static_cast<float>(config_.nms_iou), frame.timestamp);
    }
#endif

    const int dims[4] = {1, 3, input_h, input_w};
    cv::Mat blob(4, dims, CV_32F, prep.input_tensor.data());
    impl_->net.setInput(blob);
    cv::Mat output = impl_->net.forward();
    if (output.dims != 3 || output.size[0] != 1) {
        throw std::runtime_error("Unexpected YOLO output rank");
    }
    if (!output.isContinuous()) {
        output = output.clone();
    }
    return decodeYoloOutput(output.ptr<float>(), output.size[1], output.size[2],
                            prep, image.size(), class_names_,
                            static_cast<float>(config_.score_floor),
                            static_cast<float>(config_.nms_iou), frame.timestamp);
}

DetectionSet decodeYoloOutput(const float* data, int channels, int boxes,
                              const PreprocessInfo& prep, cv::Size image,
                              const std::vector<std::string>& class_names,
                              float score_floor, float nms_iou, TimePoint frame_time)
{
    DetectionSet detections;
    const int num_classes = channels - 4;
    if (data == nullptr || num_classes <= 0 || boxes <= 0 || prep.scale <= 0.0f) {
        return detections;
    }

    auto get_at = [&](int attr_idx, int i_box) -> float {
        return data[attr_idx * boxes + i_box];
    };

    std::vector<cv::Rect2f> rects;
    std::vector<float> scores;
    std::vector<int> classes;

    for (int i = 0; i < boxes; ++i) {
        int best_cls = -1;
        float best_score = -1.0f;
        for (int c = 0; c < num_classes; ++c) {
            float p = get_at(4 + c, i);
            if (p > best_score) {
                best_score = p;
                best_cls = c;
            }
        }
        if (best_score < score_floor) {
            continue;
        }

        const float cx = get_at(0, i);
        const float cy = get_at(1, i);
        const float w = get_at(2, i);
        const float h = get_at(3, i);

        float x1 = (cx - w * 0.5f - prep.pad_x) / prep.scale;
        float y1 = (cy - h * 0.5f - prep.pad_y) / prep.scale;
        float x2 = (cx + w * 0.5f - prep.pad_x) / prep.scale;
        float y2 = (cy + h * 0.5f - prep.pad_y) / prep.scale;

        x1 = std::clamp(x1, 0.f, static_cast<float>(image.width - 1));
        y1 = std::clamp(y1, 0.f, static_cast<float>(image.height - 1));
        x2 = std::clamp(x2, 0.f, static_cast<float>(image.width - 1));
        y2 = std::clamp(y2, 0.f, static_cast<float>(image.height - 1));
        if (x2 <= x1 || y2 <= y1) {
            continue;
        }

        rects.emplace_back(x1, y1, x2 - x1, y2 - y1);
        scores.push_back(best_score);
        classes.push_back(best_cls);
    }

    for (int idx : NMS(rects, scores, nms_iou)) {
        const cv::Rect2f& r = rects[idx];
        Detection det;
        det.label = classNameFor(class_names, classes[idx]);
        det.confidence = scores[idx];
        det.region = Region::fromCorners(r.x, r.y, r.x + r.width, r.y + r.height);
        det.frame_time = frame_time;
        detections.push_back(std::move(det));
    }
    return detections;
}

std::vector<std::string> loadClassNames(const std::string& yaml_path)
{
    YAML::Node root;
    try {
        root = YAML::LoadFile(yaml_path);
    } catch (const YAML::Exception& ex) {
        throw std::runtime_error("Failed to read class names from " + yaml_path + ": " + ex.what());
    }

    YAML::Node names = root["names"];
    if (!names) {
        throw std::runtime_error("Class name file has no 'names' entry: " + yaml_path);
    }

    std::vector<std::string> result;
    if (names.IsSequence()) {
        for (const auto& item : names) {
            result.push_back(item.as<std::string>());
        }
    } else if (names.IsMap()) {
        for (const auto& item : names) {
            const int index = item.first.as<int>();
            if (index < 0) {
                throw std::runtime_error("Negative class index in " + yaml_path);
            }
            if (static_cast<std::size_t>(index) >= result.size()) {
                result.resize(static_cast<std::size_t>(index) + 1);
            }
            result[index] = item.second.as<std::string>();
        }
    } else {
        throw std::runtime_error("'names' must be a list or a map in " + yaml_path);
    }
    return result;
}

std::unique_ptr<Model> create_model(const DetectorConfig& config)
{
    std::vector<std::string> names;
    if (!config.labels_path.empty()) {
        names = loadClassNames(config.labels_path);
    }
    return std::make_unique<YoloModel>(config, std::move(names));
}

}  // namespace gaze
