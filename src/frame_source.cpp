#include "gaze/frame_source.hpp"

#include <exception>
#include <iostream>
#include <utility>

namespace gaze {

void FrameSource::publish(CapturedFrame frame)
{
    frame.sequence = published_.load(std::memory_order_relaxed) + 1;
    if (frame.timestamp == TimePoint{}) {
        frame.timestamp = Clock::now();
    }
    auto next = std::make_shared<const CapturedFrame>(std::move(frame));
    {
        std::lock_guard<std::mutex> lock(slot_mutex_);
        slot_.swap(next);
    }
    published_.fetch_add(1, std::memory_order_relaxed);
    // The previous frame, if any, is released here outside the lock.
}

FrameSource::FramePtr FrameSource::latest() const
{
    std::lock_guard<std::mutex> lock(slot_mutex_);
    return slot_;
}

void FrameSource::clear()
{
    FramePtr dropped;
    std::lock_guard<std::mutex> lock(slot_mutex_);
    slot_.swap(dropped);
}

CaptureWorker::CaptureWorker(FrameGrabber& grabber, FrameSource& source,
                             std::chrono::milliseconds retry_delay)
    : grabber_(grabber), source_(source), retry_delay_(retry_delay)
{
}

CaptureWorker::~CaptureWorker()
{
    stop();
}

void CaptureWorker::start()
{
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return;
    }
    thread_ = std::thread(&CaptureWorker::loop, this);
    std::cout << "[Capture] started" << std::endl;
}

void CaptureWorker::stop()
{
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        running_.store(false);
    }
    wait_cv_.notify_all();
    if (!thread_.joinable()) {
        return;
    }
    // capture() is hardware-paced or bounded by the grabber's read timeout,
    // so the join waits for at most one frame or one timeout.
    thread_.join();
    grabber_.close();
    std::cout << "[Capture] stopped after " << source_.published() << " frames" << std::endl;
}

void CaptureWorker::backoff()
{
    std::unique_lock<std::mutex> lock(wait_mutex_);
    wait_cv_.wait_for(lock, retry_delay_, [this] { return !running_.load(); });
}

void CaptureWorker::loop()
{
    while (running_.load()) {
        try {
            if (!grabber_.isOpen() && !grabber_.open()) {
                failures_.fetch_add(1, std::memory_order_relaxed);
                std::cerr << "[Capture] Warning: frame grabber failed to open, retrying" << std::endl;
                backoff();
                continue;
            }

            std::optional<CapturedFrame> frame = grabber_.capture();
            if (!frame) {
                failures_.fetch_add(1, std::memory_order_relaxed);
                backoff();
                continue;
            }
            source_.publish(std::move(*frame));
        } catch (const std::exception& ex) {
            failures_.fetch_add(1, std::memory_order_relaxed);
            std::cerr << "[Capture] Grab failed: " << ex.what() << std::endl;
            grabber_.close();
            backoff();
        }
    }
}

}  // namespace gaze
