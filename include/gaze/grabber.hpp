#pragma once

#include <cstdio>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <opencv2/videoio.hpp>

#include "gaze/config.hpp"
#include "gaze/frame_source.hpp"

namespace gaze {

// Pulls an RTSP stream through an ffmpeg child process re-encoding to MJPEG,
// scaled to the configured size and rate, and splits it into JPEG frames.
class RtspFrameGrabber : public FrameGrabber {
public:
    explicit RtspFrameGrabber(CameraConfig config);
    ~RtspFrameGrabber() override;

    bool open() override;
    void close() override;
    bool isOpen() const override { return static_cast<bool>(pipe_); }

    std::optional<CapturedFrame> capture() override;

    std::string buildRtspUrl() const;
    std::string buildCommand() const;

private:
    struct PipeCloser {
        void operator()(FILE* f) const noexcept;
    };

    CameraConfig config_;
    std::unique_ptr<FILE, PipeCloser> pipe_;
    std::vector<std::uint8_t> pending_;
};

// Local camera through OpenCV's VideoCapture; frames are packed BGR.
class CameraFrameGrabber : public FrameGrabber {
public:
    explicit CameraFrameGrabber(CameraConfig config);

    bool open() override;
    void close() override;
    bool isOpen() const override { return capture_.isOpened(); }

    std::optional<CapturedFrame> capture() override;

private:
    CameraConfig config_;
    cv::VideoCapture capture_;
};

std::unique_ptr<FrameGrabber> create_grabber(const CameraConfig& config);

// Extracts complete JPEG images (SOI..EOI) from the front of `buffer`,
// leaving any trailing partial image in place.
std::vector<std::vector<std::uint8_t>> splitJpegStream(std::vector<std::uint8_t>& buffer);

}  // namespace gaze
