#include "gaze/grabber.hpp"

#include <array>
#include <cstring>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <opencv2/core.hpp>

namespace gaze {

void RtspFrameGrabber::PipeCloser::operator()(FILE* f) const noexcept
{
    if (f) {
        pclose(f);
    }
}

RtspFrameGrabber::RtspFrameGrabber(CameraConfig config) : config_(std::move(config)) {}

RtspFrameGrabber::~RtspFrameGrabber()
{
    close();
}

std::string RtspFrameGrabber::buildRtspUrl() const
{
    std::ostringstream url;
    url << "rtsp://" << config_.rtsp.host;
    if (config_.rtsp.port > 0) {
        url << ':' << config_.rtsp.port;
    }
    if (!config_.rtsp.path.empty()) {
        if (config_.rtsp.path.front() != '/') {
            url << '/';
        }
        url << config_.rtsp.path;
    }
    return url.str();
}

std::string RtspFrameGrabber::buildCommand() const
{
    std::ostringstream command;
    command << "ffmpeg -nostdin -hide_banner -loglevel error "
            << "-rtsp_transport tcp "
            << "-rw_timeout " << static_cast<long long>(config_.rtsp.timeout_ms) * 1000 << ' '
            << "-i '" << buildRtspUrl() << "' "
            << "-an "
            << "-vf \"fps=" << config_.frame_rate
            << ",scale=" << config_.width << ':' << config_.height << "\" "
            << "-vcodec mjpeg -q:v 5 -f image2pipe - 2>/dev/null";
    return command.str();
}

bool RtspFrameGrabber::open()
{
    close();
    pipe_.reset(popen(buildCommand().c_str(), "r"));
    if (!pipe_) {
        std::cerr << "[Capture] Failed to execute ffmpeg for " << buildRtspUrl() << std::endl;
        return false;
    }
    std::cout << "[Capture] RTSP stream opened: " << buildRtspUrl() << std::endl;
    return true;
}

void RtspFrameGrabber::close()
{
    pipe_.reset();
    pending_.clear();
}

std::optional<CapturedFrame> RtspFrameGrabber::capture()
{
    if (!pipe_) {
        return std::nullopt;
    }

    std::array<std::uint8_t, 4096> buffer{};
    while (true) {
        auto images = splitJpegStream(pending_);
        if (!images.empty()) {
            // Freshest wins: anything older that arrived in the same read is dropped.
            CapturedFrame frame;
            frame.data = std::move(images.back());
            frame.format = "jpeg";
            frame.width = config_.width;
            frame.height = config_.height;
            frame.timestamp = Clock::now();
            return frame;
        }

        std::size_t bytesRead = std::fread(buffer.data(), 1, buffer.size(), pipe_.get());
        if (bytesRead == 0) {
            std::cerr << "[Capture] RTSP stream ended" << std::endl;
            close();
            return std::nullopt;
        }
        pending_.insert(pending_.end(), buffer.begin(), buffer.begin() + bytesRead);
    }
}

std::vector<std::vector<std::uint8_t>> splitJpegStream(std::vector<std::uint8_t>& buffer)
{
    std::vector<std::vector<std::uint8_t>> images;
    std::size_t consumed = 0;
    std::size_t start = std::string::npos;

    for (std::size_t i = 1; i < buffer.size(); ++i) {
        if (start == std::string::npos) {
            if (buffer[i - 1] == 0xFF && buffer[i] == 0xD8) {
                start = i - 1;
            }
            continue;
        }
        if (buffer[i - 1] == 0xFF && buffer[i] == 0xD9) {
            images.emplace_back(buffer.begin() + start, buffer.begin() + i + 1);
            consumed = i + 1;
            start = std::string::npos;
        }
    }

    if (start != std::string::npos) {
        consumed = start;
    } else if (consumed == 0 && buffer.size() > 1) {
        // No image start seen at all; keep the last byte in case it is 0xFF.
        consumed = buffer.size() - 1;
    }
    buffer.erase(buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(consumed));
    return images;
}

CameraFrameGrabber::CameraFrameGrabber(CameraConfig config) : config_(std::move(config)) {}

bool CameraFrameGrabber::open()
{
    if (capture_.isOpened()) {
        return true;
    }
    if (!capture_.open(config_.device_index)) {
        std::cerr << "[Capture] Failed to open camera device " << config_.device_index << std::endl;
        return false;
    }
    capture_.set(cv::CAP_PROP_FRAME_WIDTH, config_.width);
    capture_.set(cv::CAP_PROP_FRAME_HEIGHT, config_.height);
    capture_.set(cv::CAP_PROP_FPS, config_.frame_rate);
    std::cout << "[Capture] Camera " << config_.device_index << " opened at "
              << capture_.get(cv::CAP_PROP_FRAME_WIDTH) << "x"
              << capture_.get(cv::CAP_PROP_FRAME_HEIGHT) << std::endl;
    return true;
}

void CameraFrameGrabber::close()
{
    if (capture_.isOpened()) {
        capture_.release();
    }
}

std::optional<CapturedFrame> CameraFrameGrabber::capture()
{
    cv::Mat image;
    if (!capture_.read(image) || image.empty()) {
        return std::nullopt;
    }
    if (image.type() != CV_8UC3) {
        std::cerr << "[Capture] Unexpected camera pixel type " << image.type() << std::endl;
        return std::nullopt;
    }
    if (!image.isContinuous()) {
        image = image.clone();
    }

    CapturedFrame frame;
    frame.timestamp = Clock::now();
    frame.format = "bgr";
    frame.width = image.cols;
    frame.height = image.rows;
    frame.stride = image.cols * 3;
    frame.data.assign(image.data, image.data + image.total() * image.elemSize());
    return frame;
}

std::unique_ptr<FrameGrabber> create_grabber(const CameraConfig& config)
{
    if (config.source == "rtsp") {
        return std::make_unique<RtspFrameGrabber>(config);
    }
    if (config.source == "device") {
        return std::make_unique<CameraFrameGrabber>(config);
    }
    throw std::runtime_error("Unsupported camera source: " + config.source);
}

}  // namespace gaze
