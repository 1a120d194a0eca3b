#include "gaze/motion.hpp"

#include <cmath>
#include <iostream>

namespace gaze {

namespace {

constexpr double kPi = 3.14159265358979323846;

double toDegrees(double rad) { return rad * 180.0 / kPi; }

}  // namespace

HeadPose poseForImagePoint(const HeadPose& current, double u, double v, const CameraModel& camera)
{
    if (camera.width <= 0 || camera.height <= 0 ||
        camera.fov_h_deg <= 0.0 || camera.fov_v_deg <= 0.0) {
        throw MotionError("Camera model has no valid size or field of view");
    }
    if (!std::isfinite(u) || !std::isfinite(v)) {
        throw MotionError("Look-at pixel is not finite");
    }

    const double half_w = camera.width * 0.5;
    const double half_h = camera.height * 0.5;

    HeadPose pose;
    pose.pan_deg = current.pan_deg + pixelOffsetToDegrees(u - half_w, half_w, camera.fov_h_deg);
    pose.tilt_deg = current.tilt_deg - pixelOffsetToDegrees(v - half_h, half_h, camera.fov_v_deg);
    return pose;
}

HeadPose poseForWorldPoint(double x, double y, double z)
{
    if (!std::isfinite(x) || !std::isfinite(y) || !std::isfinite(z)) {
        throw MotionError("World point is not finite");
    }
    const double ground = std::hypot(x, y);
    if (ground == 0.0 && z == 0.0) {
        throw MotionError("World point coincides with the head origin");
    }

    HeadPose pose;
    pose.pan_deg = ground == 0.0 ? 0.0 : -toDegrees(std::atan2(y, x));
    pose.tilt_deg = toDegrees(std::atan2(z, ground));
    return pose;
}

Json gazePayload(const GazeCommand& command)
{
    Json payload = toJson(command);
    payload["type"] = "gaze";
    return payload;
}

Json lookAtImagePayload(double u, double v, double duration_s, const HeadPose& pose)
{
    Json payload = Json::object();
    payload["type"] = "look_at_image";
    payload["u"] = u;
    payload["v"] = v;
    payload["duration_s"] = duration_s;
    payload["pan_deg"] = pose.pan_deg;
    payload["tilt_deg"] = pose.tilt_deg;
    return payload;
}

Json lookAtWorldPayload(double x, double y, double z, double duration_s, const HeadPose& pose)
{
    Json payload = Json::object();
    payload["type"] = "look_at_world";
    payload["x"] = x;
    payload["y"] = y;
    payload["z"] = z;
    payload["duration_s"] = duration_s;
    payload["pan_deg"] = pose.pan_deg;
    payload["tilt_deg"] = pose.tilt_deg;
    return payload;
}

DryRunMotion::DryRunMotion(CameraModel camera, bool verbose) : camera_(camera), verbose_(verbose) {}

HeadPose DryRunMotion::look_at_image(double u, double v, double duration_s, bool perform_movement)
{
    std::lock_guard<std::mutex> lock(mutex_);
    HeadPose target = poseForImagePoint(pose_, u, v, camera_);
    if (perform_movement) {
        pose_ = target;
        ++commands_;
        if (verbose_) {
            std::cout << "[Motion] " << lookAtImagePayload(u, v, duration_s, target).dump() << std::endl;
        }
    }
    return target;
}

HeadPose DryRunMotion::look_at_world(double x, double y, double z, double duration_s)
{
    std::lock_guard<std::mutex> lock(mutex_);
    pose_ = poseForWorldPoint(x, y, z);
    ++commands_;
    if (verbose_) {
        std::cout << "[Motion] " << lookAtWorldPayload(x, y, z, duration_s, pose_).dump() << std::endl;
    }
    return pose_;
}

void DryRunMotion::send_gaze(const GazeCommand& command)
{
    std::lock_guard<std::mutex> lock(mutex_);
    pose_.pan_deg = command.pan_deg;
    pose_.tilt_deg = command.tilt_deg;
    ++commands_;
    if (verbose_) {
        std::cout << "[Motion] " << gazePayload(command).dump() << std::endl;
    }
}

HeadPose DryRunMotion::pose() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return pose_;
}

std::uint64_t DryRunMotion::commands() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return commands_;
}

}  // namespace gaze
