#include "gaze/config.hpp"

#include <cmath>
#include <filesystem>
#include <stdexcept>

namespace gaze {
namespace {

const Json* section(const Json& root, const std::string& key)
{
    if (!root.contains(key)) {
        return nullptr;
    }
    const Json& node = root[key];
    if (!node.is_object()) {
        throw std::runtime_error("Configuration section '" + key + "' must be an object");
    }
    return &node;
}

std::string resolvePath(const std::filesystem::path& base, const std::string& path)
{
    if (path.empty()) {
        return path;
    }
    std::filesystem::path p(path);
    if (p.is_absolute()) {
        return p.string();
    }
    return (base / p).lexically_normal().string();
}

RtspConfig parseRtsp(const Json& node)
{
    RtspConfig rtsp;
    rtsp.host = node.get_string("host");
    rtsp.port = static_cast<int>(node.get_number("port", 0));
    rtsp.path = node.get_string("path");
    rtsp.timeout_ms = static_cast<int>(node.get_number("timeout_ms", rtsp.timeout_ms));
    return rtsp;
}

CameraConfig parseCamera(const Json& node)
{
    CameraConfig camera;
    camera.source = node.get_string("source", camera.source);
    camera.device_index = static_cast<int>(node.get_number("device_index", camera.device_index));
    camera.width = static_cast<int>(node.get_number("width", camera.width));
    camera.height = static_cast<int>(node.get_number("height", camera.height));
    camera.frame_rate = node.get_number("frame_rate", camera.frame_rate);
    camera.frame_max_age_ms = node.get_number("frame_max_age_ms", camera.frame_max_age_ms);
    if (node.contains("rtsp")) {
        camera.rtsp = parseRtsp(node["rtsp"]);
    }
    return camera;
}

DetectorConfig parseDetector(const Json& node)
{
    DetectorConfig detector;
    detector.model_path = node.get_string("model_path", detector.model_path);
    detector.labels_path = node.get_string("labels_path", detector.labels_path);
    detector.backend = node.get_string("backend", detector.backend);
    detector.input_width = static_cast<int>(node.get_number("input_width", detector.input_width));
    detector.input_height = static_cast<int>(node.get_number("input_height", detector.input_height));
    detector.score_floor = node.get_number("score_floor", detector.score_floor);
    detector.nms_iou = node.get_number("nms_iou", detector.nms_iou);
    detector.cadence_hz = node.get_number("cadence_hz", detector.cadence_hz);
    detector.timeout_ms = node.get_number("timeout_ms", detector.timeout_ms);
    detector.max_result_age_ms = node.get_number("max_result_age_ms", detector.max_result_age_ms);
    return detector;
}

TrackingConfig parseTracking(const Json& node)
{
    TrackingConfig tracking;
    tracking.target_label = node.get_string("target_label", tracking.target_label);
    tracking.confidence_threshold = node.get_number("confidence_threshold", tracking.confidence_threshold);
    tracking.control_hz = node.get_number("control_hz", tracking.control_hz);
    tracking.miss_timeout_s = node.get_number("miss_timeout_s", tracking.miss_timeout_s);
    tracking.continuity_px = node.get_number("continuity_px", tracking.continuity_px);
    tracking.telemetry_every = static_cast<int>(node.get_number("telemetry_every", tracking.telemetry_every));
    return tracking;
}

GazeConfig parseGaze(const Json& node)
{
    GazeConfig gaze;
    gaze.smoothing = node.get_number("smoothing", gaze.smoothing);
    gaze.deadband_px = node.get_number("deadband_px", gaze.deadband_px);
    gaze.fov_h_deg = node.get_number("fov_h_deg", gaze.fov_h_deg);
    gaze.fov_v_deg = node.get_number("fov_v_deg", gaze.fov_v_deg);
    gaze.bounds.max_pan_deg = node.get_number("max_pan_deg", gaze.bounds.max_pan_deg);
    gaze.bounds.max_tilt_deg = node.get_number("max_tilt_deg", gaze.bounds.max_tilt_deg);
    gaze.return_duration_s = node.get_number("return_duration_s", gaze.return_duration_s);
    gaze.neutral_epsilon_deg = node.get_number("neutral_epsilon_deg", gaze.neutral_epsilon_deg);
    gaze.command_duration_s = node.get_number("command_duration_s", gaze.command_duration_s);
    gaze.scan_amplitude_deg = node.get_number("scan_amplitude_deg", gaze.scan_amplitude_deg);
    gaze.scan_period_s = node.get_number("scan_period_s", gaze.scan_period_s);
    return gaze;
}

MqttConfig parseMqtt(const Json& node)
{
    MqttConfig mqtt;
    mqtt.server = node.get_string("server");
    mqtt.port = static_cast<int>(node.get_number("port", mqtt.port));
    mqtt.client_id = node.get_string("client_id", mqtt.client_id);
    mqtt.username = node.get_string("username");
    mqtt.password = node.get_string("password");
    mqtt.motion_topic = node.get_string("motion_topic", mqtt.motion_topic);
    mqtt.telemetry_topic = node.get_string("telemetry_topic", mqtt.telemetry_topic);
    mqtt.control_topic = node.get_string("control_topic", mqtt.control_topic);
    mqtt.heartbeat_topic = node.get_string("heartbeat_topic", mqtt.heartbeat_topic);
    mqtt.heartbeat_time = static_cast<int>(node.get_number("heartbeat_time", mqtt.heartbeat_time));
    return mqtt;
}

void require(bool condition, const std::string& key, const std::string& what)
{
    if (!condition) {
        throw std::runtime_error("Invalid configuration '" + key + "': " + what);
    }
}

bool positive(double value)
{
    return std::isfinite(value) && value > 0.0;
}

}  // namespace

AppConfig parseConfig(const Json& root)
{
    if (!root.is_object()) {
        throw std::runtime_error("Configuration root must be a JSON object");
    }

    AppConfig config;
    config.version = root.get_string("version");

    if (const Json* service = section(root, "service")) {
        config.service.name = service->get_string("name", config.service.name);
        config.service.description = service->get_string("description");
    }
    if (const Json* camera = section(root, "camera")) {
        config.camera = parseCamera(*camera);
    }
    if (const Json* detector = section(root, "detector")) {
        config.detector = parseDetector(*detector);
    }
    if (const Json* tracking = section(root, "tracking")) {
        config.tracking = parseTracking(*tracking);
    }
    if (const Json* gaze = section(root, "gaze")) {
        config.gaze = parseGaze(*gaze);
    }
    if (const Json* mqtt = section(root, "mqtt")) {
        config.mqtt = parseMqtt(*mqtt);
    }

    validateConfig(config);
    return config;
}

AppConfig loadConfig(const std::string& path)
{
    Json root = Json::parse_file(path);
    AppConfig config = parseConfig(root);

    std::filesystem::path absolute = std::filesystem::absolute(path).lexically_normal();
    std::filesystem::path baseDir = absolute.has_parent_path() ? absolute.parent_path()
                                                               : std::filesystem::path(".");
    config.source_path = absolute.generic_string();
    config.detector.model_path = resolvePath(baseDir, config.detector.model_path);
    config.detector.labels_path = resolvePath(baseDir, config.detector.labels_path);
    return config;
}

void validateConfig(const AppConfig& config)
{
    const auto& camera = config.camera;
    require(camera.source == "device" || camera.source == "rtsp", "camera.source",
            "must be \"device\" or \"rtsp\"");
    require(camera.source != "rtsp" || !camera.rtsp.host.empty(), "camera.rtsp.host",
            "required when camera.source is \"rtsp\"");
    require(camera.rtsp.timeout_ms > 0, "camera.rtsp.timeout_ms", "must be positive");
    require(positive(camera.frame_rate), "camera.frame_rate", "must be positive");
    require(positive(camera.frame_max_age_ms), "camera.frame_max_age_ms", "must be positive");

    const auto& detector = config.detector;
    require(detector.backend == "onnxruntime" || detector.backend == "opencv", "detector.backend",
            "must be \"onnxruntime\" or \"opencv\"");
    require(detector.input_width > 0 && detector.input_height > 0, "detector.input_width/input_height",
            "must be positive");
    require(detector.cadence_hz >= 0.0, "detector.cadence_hz", "must not be negative");
    require(positive(detector.timeout_ms), "detector.timeout_ms", "must be positive");
    require(positive(detector.max_result_age_ms), "detector.max_result_age_ms", "must be positive");
    require(detector.nms_iou > 0.0 && detector.nms_iou <= 1.0, "detector.nms_iou", "must be in (0, 1]");

    const auto& tracking = config.tracking;
    require(!tracking.target_label.empty(), "tracking.target_label", "must not be empty");
    require(tracking.confidence_threshold >= 0.0 && tracking.confidence_threshold <= 1.0,
            "tracking.confidence_threshold", "must be in [0, 1]");
    require(positive(tracking.control_hz), "tracking.control_hz", "must be positive");
    require(detector.timeout_ms < 1000.0 / tracking.control_hz, "detector.timeout_ms",
            "must be shorter than one control period");
    require(positive(tracking.miss_timeout_s), "tracking.miss_timeout_s", "must be positive");
    require(tracking.continuity_px >= 0.0, "tracking.continuity_px", "must not be negative");
    require(tracking.telemetry_every >= 0, "tracking.telemetry_every", "must not be negative");

    const auto& gaze = config.gaze;
    require(gaze.smoothing >= 0.0 && gaze.smoothing < 1.0, "gaze.smoothing", "must be in [0, 1)");
    require(gaze.deadband_px >= 0.0, "gaze.deadband_px", "must not be negative");
    require(positive(gaze.fov_h_deg) && positive(gaze.fov_v_deg), "gaze.fov_h_deg/fov_v_deg",
            "must be positive");
    require(positive(gaze.bounds.max_pan_deg), "gaze.max_pan_deg", "must be positive");
    require(positive(gaze.bounds.max_tilt_deg), "gaze.max_tilt_deg", "must be positive");
    require(positive(gaze.return_duration_s), "gaze.return_duration_s", "must be positive");
    require(positive(gaze.neutral_epsilon_deg), "gaze.neutral_epsilon_deg", "must be positive");
    require(gaze.command_duration_s >= 0.0, "gaze.command_duration_s", "must not be negative");
    require(gaze.scan_amplitude_deg >= 0.0, "gaze.scan_amplitude_deg", "must not be negative");
    require(positive(gaze.scan_period_s), "gaze.scan_period_s", "must be positive");
}

}  // namespace gaze
