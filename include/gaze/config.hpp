#pragma once

#include <string>

#include "gaze/json.hpp"

namespace gaze {

struct ServiceInfo {
    std::string name{"gaze-tracker"};
    std::string description;
};

struct RtspConfig {
    std::string host;
    int port = 0;
    std::string path;
    int timeout_ms = 5000;  // ffmpeg read timeout; bounds a blocked capture()
};

struct CameraConfig {
    std::string source{"device"};  // "device" or "rtsp"
    int device_index = 0;
    int width = 640;
    int height = 480;
    double frame_rate = 30.0;
    RtspConfig rtsp;
    double frame_max_age_ms = 500.0;
};

struct DetectorConfig {
    std::string model_path{"models/yolov8n.onnx"};
    std::string labels_path{"config/coco.yaml"};
    std::string backend{"onnxruntime"};  // "onnxruntime" or "opencv"
    int input_width = 640;
    int input_height = 640;
    double score_floor = 0.25;
    double nms_iou = 0.45;
    double cadence_hz = 5.0;
    double timeout_ms = 40.0;  // must stay below one control period
    double max_result_age_ms = 1000.0;
};

struct TrackingConfig {
    std::string target_label{"person"};
    double confidence_threshold = 0.7;
    double control_hz = 15.0;
    double miss_timeout_s = 1.0;
    double continuity_px = 80.0;
    int telemetry_every = 15;
};

struct SafetyBounds {
    double max_pan_deg = 55.0;
    double max_tilt_deg = 25.0;
};

struct GazeConfig {
    double smoothing = 0.85;
    double deadband_px = 18.0;
    double fov_h_deg = 65.0;
    double fov_v_deg = 50.0;
    SafetyBounds bounds;
    double return_duration_s = 1.0;
    double neutral_epsilon_deg = 0.5;
    double command_duration_s = 0.1;
    double scan_amplitude_deg = 0.0;
    double scan_period_s = 6.0;
};

struct MqttConfig {
    std::string server;
    int port = 1883;
    std::string client_id{"gaze-tracker"};
    std::string username;
    std::string password;
    std::string motion_topic{"robot/head/command"};
    std::string telemetry_topic{"gaze/telemetry"};
    std::string control_topic{"gaze/control"};
    std::string heartbeat_topic{"gaze/heartbeat"};
    int heartbeat_time = 10;
};

struct AppConfig {
    std::string version;
    std::string source_path;

    ServiceInfo service;
    CameraConfig camera;
    DetectorConfig detector;
    TrackingConfig tracking;
    GazeConfig gaze;
    MqttConfig mqtt;
};

AppConfig parseConfig(const Json& root);
AppConfig loadConfig(const std::string& path);

// Throws std::runtime_error naming the first offending key.
void validateConfig(const AppConfig& config);

}  // namespace gaze
