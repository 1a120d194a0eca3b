#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

#include "gaze/common.hpp"

namespace gaze {

// Single-slot, freshest-wins frame buffer shared between the capture thread
// and the control loop. A published frame is immutable; readers hold their
// own reference, so a reader never observes a frame mid-write.
class FrameSource {
public:
    using FramePtr = std::shared_ptr<const CapturedFrame>;

    void publish(CapturedFrame frame);

    FramePtr latest() const;

    std::uint64_t published() const { return published_.load(std::memory_order_relaxed); }

    void clear();

private:
    mutable std::mutex slot_mutex_;
    FramePtr slot_;
    std::atomic<std::uint64_t> published_{0};
};

class FrameGrabber {
public:
    virtual ~FrameGrabber() = default;

    virtual bool open() = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;

    // Blocks until the next frame is available (hardware-paced). Returns
    // nullopt on a grab failure; the caller decides whether to reopen.
    virtual std::optional<CapturedFrame> capture() = 0;
};

class CaptureWorker {
public:
    CaptureWorker(FrameGrabber& grabber, FrameSource& source,
                  std::chrono::milliseconds retry_delay = std::chrono::milliseconds(200));
    ~CaptureWorker();

    CaptureWorker(const CaptureWorker&) = delete;
    CaptureWorker& operator=(const CaptureWorker&) = delete;

    void start();
    void stop();

    bool running() const { return running_.load(); }
    std::uint64_t failures() const { return failures_.load(std::memory_order_relaxed); }

private:
    void loop();
    void backoff();

    FrameGrabber& grabber_;
    FrameSource& source_;
    std::chrono::milliseconds retry_delay_;
    std::atomic<bool> running_{false};
    std::atomic<std::uint64_t> failures_{0};
    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
    std::thread thread_;
};

}  // namespace gaze
