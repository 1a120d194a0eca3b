#pragma once

#include <functional>
#include <memory>
#include <string>

#include "gaze/config.hpp"
#include "gaze/json.hpp"
#include "gaze/motion.hpp"

namespace gaze {

// Broker connection: subscribes to the control topic, publishes a periodic
// heartbeat and arbitrary JSON payloads.
class MqttService {
public:
    using Processor = std::function<void(const Json& message)>;
    using StatusBuilder = std::function<Json()>;

    MqttService(AppConfig config, Processor processor, StatusBuilder status_builder = {});
    ~MqttService();

    MqttService(const MqttService&) = delete;
    MqttService& operator=(const MqttService&) = delete;

    // Connects and services the network until stop(). Throws on a failed
    // initial connection.
    void run();
    void stop();

    bool publish(const Json& value, const std::string& topic);

    bool connected() const;
    bool stopped() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// Forwards gaze and look-at requests to the robot daemon's motion topic.
class MqttMotion : public MotionInterface {
public:
    MqttMotion(MqttService& service, std::string topic, CameraModel camera);

    HeadPose look_at_image(double u, double v, double duration_s, bool perform_movement) override;
    HeadPose look_at_world(double x, double y, double z, double duration_s) override;
    void send_gaze(const GazeCommand& command) override;

private:
    void send(const Json& payload);

    MqttService& service_;
    std::string topic_;
    CameraModel camera_;
    HeadPose pose_;
};

}  // namespace gaze
