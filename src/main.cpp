#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <future>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

#include "gaze/config.hpp"
#include "gaze/detector.hpp"
#include "gaze/frame_source.hpp"
#include "gaze/grabber.hpp"
#include "gaze/motion.hpp"
#include "gaze/mqtt.hpp"
#include "gaze/scheduler.hpp"
#include "gaze/yolo.hpp"

namespace {

volatile std::sig_atomic_t gSignalStatus = 0;

void signalHandler(int signal) {
    gSignalStatus = signal;
}

void printUsage(const char* executable) {
    std::cout << "Usage: " << executable
              << " [--config <path>] [--target <label>] [--conf <threshold>] [--hz <rate>] [--dry-run]\n"
              << "Tracks the configured target in the camera feed and steers the robot head toward it.\n"
              << "  --config <path>     configuration file (default: config/gaze.config.json)\n"
              << "  --target <label>    detection label to follow (overrides tracking.target_label)\n"
              << "  --conf <threshold>  minimum detection confidence in [0, 1]\n"
              << "  --hz <rate>         control loop frequency\n"
              << "  --dry-run           log gaze commands instead of sending them to the robot" << std::endl;
}

gaze::CameraModel cameraModel(const gaze::AppConfig& config) {
    gaze::CameraModel camera;
    camera.width = config.camera.width;
    camera.height = config.camera.height;
    camera.fov_h_deg = config.gaze.fov_h_deg;
    camera.fov_v_deg = config.gaze.fov_v_deg;
    return camera;
}

gaze::DetectorOptions detectorOptions(const gaze::DetectorConfig& config) {
    gaze::DetectorOptions options;
    options.cadence_hz = config.cadence_hz;
    options.timeout = std::chrono::milliseconds(static_cast<long long>(config.timeout_ms));
    options.max_result_age = gaze::fromSeconds(config.max_result_age_ms / 1000.0);
    return options;
}

}  // namespace

int main(int argc, char* argv[]) {
    std::string configPath = "config/gaze.config.json";
    std::string targetOverride;
    double confOverride = -1.0;
    double hzOverride = -1.0;
    bool dryRun = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--target" && i + 1 < argc) {
            targetOverride = argv[++i];
        } else if (arg == "--conf" && i + 1 < argc) {
            if (!gaze::parseNumber(argv[++i], confOverride)) {
                std::cerr << "Invalid --conf value: " << argv[i] << "\n";
                return 1;
            }
        } else if (arg == "--hz" && i + 1 < argc) {
            if (!gaze::parseNumber(argv[++i], hzOverride)) {
                std::cerr << "Invalid --hz value: " << argv[i] << "\n";
                return 1;
            }
        } else if (arg == "--dry-run") {
            dryRun = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            printUsage(argv[0]);
            return 1;
        }
    }

    try {
        gaze::AppConfig config = gaze::loadConfig(configPath);
        if (!targetOverride.empty()) {
            config.tracking.target_label = targetOverride;
        }
        if (confOverride >= 0.0) {
            config.tracking.confidence_threshold = confOverride;
        }
        if (hzOverride >= 0.0) {
            config.tracking.control_hz = hzOverride;
        }
        gaze::validateConfig(config);

        std::cout << "[Main] " << config.service.name << " " << config.version << " using "
                  << config.source_path << std::endl;

        std::shared_ptr<gaze::Model> model = gaze::create_model(config.detector);
        model->load();
        std::cout << "[Main] Detector model: " << model->model_type() << std::endl;

        gaze::DetectorAdapter detector(model, detectorOptions(config.detector));
        gaze::FrameSource frames;
        std::unique_ptr<gaze::FrameGrabber> grabber = gaze::create_grabber(config.camera);
        gaze::CaptureWorker capture(*grabber, frames);

        // Set once the scheduler exists; MQTT callbacks may fire before that.
        std::atomic<gaze::ControlScheduler*> schedulerRef{nullptr};

        std::unique_ptr<gaze::MqttService> service;
        if (!config.mqtt.server.empty()) {
            auto processor = [&schedulerRef](const gaze::Json& message) {
                gaze::ControlRequest request = gaze::parseControlRequest(message);
                gaze::ControlScheduler* scheduler = schedulerRef.load();
                if (!scheduler) {
                    throw std::runtime_error("Control loop not running yet");
                }
                scheduler->handle(request);
            };
            auto statusBuilder = [&schedulerRef]() {
                gaze::Json status = gaze::Json::object();
                if (gaze::ControlScheduler* scheduler = schedulerRef.load()) {
                    gaze::TelemetrySnapshot snapshot = scheduler->telemetry();
                    status["state"] = gaze::toString(snapshot.state);
                    status["target_label"] = snapshot.target_label;
                    status["active"] = scheduler->active();
                }
                return status;
            };
            service = std::make_unique<gaze::MqttService>(config, processor, statusBuilder);
        } else if (!dryRun) {
            throw std::runtime_error("mqtt.server is required unless --dry-run is given");
        }

        std::unique_ptr<gaze::MotionInterface> motion;
        if (dryRun) {
            motion = std::make_unique<gaze::DryRunMotion>(cameraModel(config));
        } else {
            motion = std::make_unique<gaze::MqttMotion>(*service, config.mqtt.motion_topic, cameraModel(config));
        }

        gaze::ControlScheduler scheduler(config, frames, detector, *motion);
        schedulerRef.store(&scheduler);

        const std::string telemetryTopic = config.mqtt.telemetry_topic;
        gaze::MqttService* servicePtr = service.get();
        scheduler.set_telemetry_sink([servicePtr, telemetryTopic](const gaze::TelemetrySnapshot& snapshot) {
            if (servicePtr) {
                servicePtr->publish(gaze::toJson(snapshot), telemetryTopic);
            } else {
                std::cout << "[Telemetry] " << gaze::toJson(snapshot).dump() << std::endl;
            }
        }, config.tracking.telemetry_every);

        std::promise<void> mqttPromise;
        std::future<void> mqttFuture = mqttPromise.get_future();
        std::thread mqttWorker;
        if (service) {
            mqttWorker = std::thread([&service, &mqttPromise]() {
                try {
                    service->run();
                    mqttPromise.set_value();
                } catch (...) {
                    mqttPromise.set_exception(std::current_exception());
                }
            });
        } else {
            mqttPromise.set_value();
        }

        capture.start();

        std::promise<void> loopPromise;
        std::future<void> loopFuture = loopPromise.get_future();
        std::thread loopWorker([&scheduler, &loopPromise]() {
            try {
                scheduler.run();
                loopPromise.set_value();
            } catch (...) {
                loopPromise.set_exception(std::current_exception());
            }
        });

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        int exitCode = 0;
        while (loopFuture.wait_for(std::chrono::milliseconds(200)) == std::future_status::timeout) {
            if (gSignalStatus != 0) {
                std::cout << "[Main] Signal " << gSignalStatus << " received, shutting down" << std::endl;
                scheduler.stop();
            } else if (service && mqttFuture.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
                std::cerr << "[Main] MQTT service exited, stopping control loop" << std::endl;
                exitCode = 1;
                scheduler.stop();
            }
        }
        loopWorker.join();

        capture.stop();
        if (service) {
            service->stop();
        }
        if (mqttWorker.joinable()) {
            mqttWorker.join();
        }
        schedulerRef.store(nullptr);

        try {
            mqttFuture.get();
        } catch (const std::exception& ex) {
            std::cerr << "[MQTT] " << ex.what() << std::endl;
            exitCode = 1;
        }
        loopFuture.get();

        detector.drain();
        model->release();
        return exitCode;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        return 1;
    }
}
