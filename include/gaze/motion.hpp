#pragma once

#include <cstdint>
#include <mutex>
#include <stdexcept>
#include <string>

#include "gaze/controller.hpp"

namespace gaze {

struct HeadPose {
    double pan_deg = 0.0;
    double tilt_deg = 0.0;
};

// Raised by a MotionInterface when a request could not be delivered. A
// permanent error means the endpoint is gone for good and the control loop
// should end.
class MotionError : public std::runtime_error {
public:
    explicit MotionError(const std::string& message, bool permanent = false)
        : std::runtime_error(message), permanent_(permanent) {}

    bool permanent() const noexcept { return permanent_; }

private:
    bool permanent_;
};

class MotionInterface {
public:
    virtual ~MotionInterface() = default;

    // Pose that centers image pixel (u, v); moves the head only when
    // perform_movement is set.
    virtual HeadPose look_at_image(double u, double v, double duration_s, bool perform_movement) = 0;

    // Robot frame: x forward, y left, z up, in meters.
    virtual HeadPose look_at_world(double x, double y, double z, double duration_s) = 0;

    virtual void send_gaze(const GazeCommand& command) = 0;
};

struct CameraModel {
    int width = 640;
    int height = 480;
    double fov_h_deg = 65.0;
    double fov_v_deg = 50.0;
};

HeadPose poseForImagePoint(const HeadPose& current, double u, double v, const CameraModel& camera);
HeadPose poseForWorldPoint(double x, double y, double z);

Json gazePayload(const GazeCommand& command);
Json lookAtImagePayload(double u, double v, double duration_s, const HeadPose& pose);
Json lookAtWorldPayload(double x, double y, double z, double duration_s, const HeadPose& pose);

// Logs every request and tracks the pose it would have produced.
class DryRunMotion : public MotionInterface {
public:
    explicit DryRunMotion(CameraModel camera, bool verbose = true);

    HeadPose look_at_image(double u, double v, double duration_s, bool perform_movement) override;
    HeadPose look_at_world(double x, double y, double z, double duration_s) override;
    void send_gaze(const GazeCommand& command) override;

    HeadPose pose() const;
    std::uint64_t commands() const;

private:
    CameraModel camera_;
    bool verbose_;
    mutable std::mutex mutex_;
    HeadPose pose_;
    std::uint64_t commands_ = 0;
};

}  // namespace gaze
