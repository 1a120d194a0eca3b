/**
 * @file test_scheduler.cpp
 * @brief Control loop: tick pipeline, session control, dispatch failures and timing
 */

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <exception>
#include <memory>
#include <optional>
#include <stdexcept>
#include <thread>

#include "fakes.hpp"
#include "gaze/scheduler.hpp"

using namespace gaze;
using namespace gaze::fakes;
using namespace std::chrono_literals;

namespace {

CapturedFrame frameAt(TimePoint timestamp)
{
    CapturedFrame frame;
    frame.format = "bgr";
    frame.width = 640;
    frame.height = 480;
    frame.timestamp = timestamp;
    return frame;
}

// Publishes a fresh frame every few milliseconds, like a camera would.
class FramePump {
public:
    explicit FramePump(FrameSource& source) : source_(source)
    {
        thread_ = std::thread([this] {
            while (running_.load()) {
                source_.publish(frameAt(Clock::now()));
                std::this_thread::sleep_for(10ms);
            }
        });
    }

    ~FramePump()
    {
        running_ = false;
        thread_.join();
    }

private:
    FrameSource& source_;
    std::atomic<bool> running_{true};
    std::thread thread_;
};

}  // namespace

class ControlSchedulerTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        model = std::make_shared<FakeModel>();
        model->setDetections({makeDetection("person", 0.9, 100, 100)});
    }

    void TearDown() override
    {
        model->releaseAll();
    }

    void build(std::chrono::milliseconds detector_timeout = 200ms)
    {
        DetectorOptions options;
        options.cadence_hz = 0.0;
        options.timeout = detector_timeout;
        options.max_result_age = 1s;
        detector = std::make_unique<DetectorAdapter>(model, options);
        scheduler = std::make_unique<ControlScheduler>(config, frames, *detector, motion);
    }

    // Publishes a frame stamped `now` and runs one tick at `now`.
    TickReport tickWithFrame(TimePoint now)
    {
        frames.publish(frameAt(now));
        return scheduler->tick(now);
    }

    AppConfig config;
    FrameSource frames;
    std::shared_ptr<FakeModel> model;
    RecordingMotion motion;
    std::unique_ptr<DetectorAdapter> detector;
    std::unique_ptr<ControlScheduler> scheduler;

    TimePoint t0 = Clock::now();
    Clock::duration tick = std::chrono::duration_cast<Clock::duration>(1s) / 15;
};

TEST_F(ControlSchedulerTest, NoFrameIsANoOp)
{
    build();
    TickReport report = scheduler->tick(t0);
    EXPECT_EQ(report.status, TickReport::Status::NoFrame);
    EXPECT_FALSE(report.command.has_value());
    EXPECT_EQ(scheduler->state(), ControllerState::Idle);
    EXPECT_EQ(model->calls(), 0);
    EXPECT_EQ(scheduler->telemetry().counters.no_frame, 1u);
}

TEST_F(ControlSchedulerTest, PersonInUpperLeftIsTracked)
{
    build();
    TickReport report = tickWithFrame(t0);

    EXPECT_EQ(report.status, TickReport::Status::Ran);
    EXPECT_EQ(report.detect_status, DetectStatus::Fresh);
    EXPECT_EQ(report.track_event, TrackEvent::Acquired);
    EXPECT_EQ(report.state, ControllerState::Tracking);
    ASSERT_TRUE(report.command.has_value());
    EXPECT_TRUE(report.dispatched);

    auto sent = motion.commands();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_LT(sent[0].pan_deg, 0.0);
    EXPECT_GT(sent[0].tilt_deg, 0.0);

    TelemetrySnapshot snapshot = scheduler->telemetry();
    EXPECT_EQ(snapshot.state, ControllerState::Tracking);
    ASSERT_TRUE(snapshot.target.has_value());
    EXPECT_EQ(snapshot.target->label, "person");
    EXPECT_EQ(snapshot.counters.commands, 1u);
}

TEST_F(ControlSchedulerTest, OtherLabelsAndWeakDetectionsAreIgnored)
{
    model->setDetections({
        makeDetection("cat", 0.99, 100, 100),
        makeDetection("person", 0.4, 500, 100),
    });
    build();
    TickReport report = tickWithFrame(t0);
    EXPECT_EQ(report.track_event, TrackEvent::Empty);
    EXPECT_EQ(report.state, ControllerState::Idle);
    EXPECT_FALSE(report.command.has_value());
    EXPECT_TRUE(motion.commands().empty());
}

TEST_F(ControlSchedulerTest, StaleFrameCountsAsNoDetections)
{
    build();
    frames.publish(frameAt(t0 - 2s));
    TickReport report = scheduler->tick(t0);
    EXPECT_EQ(report.status, TickReport::Status::StaleFrame);
    EXPECT_EQ(report.detect_status, DetectStatus::Stale);
    EXPECT_EQ(model->calls(), 0);
    EXPECT_FALSE(report.command.has_value());
    EXPECT_EQ(scheduler->telemetry().counters.stale_frames, 1u);
}

TEST_F(ControlSchedulerTest, LostTargetReturnsToNeutralThenIdles)
{
    build();
    TimePoint now = t0;
    tickWithFrame(now);
    model->setDetections({});

    // Coasting until the miss timeout, then returning.
    TickReport report;
    do {
        now += tick;
        report = tickWithFrame(now);
        if (report.track_event == TrackEvent::Coasting) {
            EXPECT_EQ(report.state, ControllerState::Tracking);
        }
    } while (report.track_event != TrackEvent::Lost && now - t0 < 3s);
    ASSERT_EQ(report.track_event, TrackEvent::Lost);
    EXPECT_GE(now - t0, fromSeconds(config.tracking.miss_timeout_s));
    EXPECT_EQ(report.state, ControllerState::Returning);

    const TimePoint lost_at = now;
    while (scheduler->state() != ControllerState::Idle && now - lost_at < 3s) {
        now += tick;
        report = tickWithFrame(now);
    }
    EXPECT_EQ(scheduler->state(), ControllerState::Idle);
    EXPECT_LE(toSeconds(now - lost_at), config.gaze.return_duration_s + toSeconds(tick) + 1e-6);

    auto sent = motion.commands();
    ASSERT_FALSE(sent.empty());
    EXPECT_DOUBLE_EQ(sent.back().pan_deg, 0.0);
    EXPECT_DOUBLE_EQ(sent.back().tilt_deg, 0.0);

    // Idle without scan: nothing further is sent.
    const auto count = sent.size();
    tickWithFrame(now + tick);
    EXPECT_EQ(motion.commands().size(), count);
}

TEST_F(ControlSchedulerTest, RetargetingAppliesOnNextTick)
{
    model->setDetections({makeDetection("cat", 0.6, 500, 100)});
    build();
    EXPECT_FALSE(tickWithFrame(t0).command.has_value());

    scheduler->handle(parseControlRequest(Json::parse(R"({"action": "target", "label": "Cat", "confidence": 0.5})")));
    TickReport report = tickWithFrame(t0 + tick);
    EXPECT_EQ(report.track_event, TrackEvent::Acquired);
    ASSERT_TRUE(report.command.has_value());
    EXPECT_GT(report.command->pan_deg, 0.0);
    EXPECT_EQ(scheduler->telemetry().target_label, "Cat");
}

TEST_F(ControlSchedulerTest, RetargetWithoutThresholdKeepsCurrentOne)
{
    model->setDetections({makeDetection("cat", 0.6, 500, 100), makeDetection("dog", 0.8, 100, 100)});
    build();

    scheduler->request_target("cat", std::nullopt);
    EXPECT_FALSE(tickWithFrame(t0).command.has_value());

    scheduler->request_target("dog", std::nullopt);
    TickReport report = tickWithFrame(t0 + tick);
    EXPECT_EQ(report.track_event, TrackEvent::Acquired);
    ASSERT_TRUE(report.command.has_value());
    EXPECT_LT(report.command->pan_deg, 0.0);
}

TEST_F(ControlSchedulerTest, PauseStopsDispatchUntilStarted)
{
    build();
    tickWithFrame(t0);
    ASSERT_EQ(motion.commands().size(), 1u);

    scheduler->request_pause();
    EXPECT_FALSE(scheduler->active());
    TickReport report = tickWithFrame(t0 + tick);
    EXPECT_EQ(report.status, TickReport::Status::Inactive);
    EXPECT_EQ(scheduler->state(), ControllerState::Idle);
    EXPECT_EQ(motion.commands().size(), 1u);

    scheduler->request_start();
    report = tickWithFrame(t0 + 2 * tick);
    EXPECT_TRUE(scheduler->active());
    EXPECT_EQ(report.track_event, TrackEvent::Acquired);
    EXPECT_TRUE(report.dispatched);
    EXPECT_EQ(motion.commands().size(), 2u);
}

TEST_F(ControlSchedulerTest, TransientDispatchFailureIsCountedAndLoopContinues)
{
    build();
    motion.failNext(1);
    TickReport report = tickWithFrame(t0);
    EXPECT_FALSE(report.dispatched);
    EXPECT_NE(report.error.find("busy"), std::string::npos);
    EXPECT_EQ(scheduler->telemetry().counters.dispatch_failures, 1u);

    report = tickWithFrame(t0 + tick);
    EXPECT_TRUE(report.dispatched);
    EXPECT_EQ(motion.commands().size(), 1u);
}

TEST_F(ControlSchedulerTest, PermanentDispatchFailureEscapesTick)
{
    build();
    motion.failPermanently();
    EXPECT_THROW(tickWithFrame(t0), MotionError);
}

TEST(ControlRequestTest, ParsesActions)
{
    EXPECT_EQ(parseControlRequest(Json::parse(R"({"action": "START"})")).action,
              ControlRequest::Action::Start);
    EXPECT_EQ(parseControlRequest(Json::parse(R"({"action": "stop"})")).action,
              ControlRequest::Action::Stop);

    ControlRequest target = parseControlRequest(Json::parse(R"({"action": "target", "label": "dog"})"));
    EXPECT_EQ(target.action, ControlRequest::Action::Target);
    EXPECT_EQ(target.label, "dog");
    EXPECT_FALSE(target.confidence.has_value());
}

TEST(ControlRequestTest, RejectsMalformedMessages)
{
    EXPECT_THROW(parseControlRequest(Json::parse(R"({"action": "dance"})")), std::runtime_error);
    EXPECT_THROW(parseControlRequest(Json::parse(R"({"action": "target"})")), std::runtime_error);
    EXPECT_THROW(parseControlRequest(Json::parse(R"({"action": "target", "label": "dog", "confidence": 2})")),
                 std::runtime_error);
    EXPECT_THROW(parseControlRequest(Json::parse("[1]")), std::runtime_error);
}

TEST_F(ControlSchedulerTest, HoldsRateWhileDetectorStalls)
{
    model->setDelay(10000ms);
    build(20ms);
    FramePump pump(frames);

    std::thread loop([this] { scheduler->run(); });
    std::this_thread::sleep_for(2s);
    scheduler->stop();
    loop.join();

    // 15 Hz for 2 s: about 31 ticks.
    const auto counters = scheduler->telemetry().counters;
    EXPECT_GE(counters.ticks, 28u);
    EXPECT_LE(counters.ticks, 32u);
    EXPECT_EQ(counters.detector_runs, 1u);
    EXPECT_EQ(counters.detector_timeouts, 1u);
    EXPECT_TRUE(motion.commands().empty());
}

TEST_F(ControlSchedulerTest, TracksWhenInferenceOutlastsTimeout)
{
    model->setDelay(50ms);
    build(40ms);
    FramePump pump(frames);

    std::thread loop([this] { scheduler->run(); });
    std::this_thread::sleep_for(2s);
    scheduler->stop();
    loop.join();

    const auto counters = scheduler->telemetry().counters;
    EXPECT_GE(counters.detector_timeouts, 20u);
    EXPECT_GE(motion.commands().size(), 20u);
    EXPECT_LT(motion.commands().front().pan_deg, 0.0);
}

TEST_F(ControlSchedulerTest, StopEndsLoopWithinOnePeriodAndSilencesDispatch)
{
    build();
    FramePump pump(frames);

    std::thread loop([this] { scheduler->run(); });
    std::this_thread::sleep_for(300ms);

    const auto requested = Clock::now();
    scheduler->stop();
    const auto sent_at_stop = motion.commands().size();
    loop.join();
    const auto latency = Clock::now() - requested;

    EXPECT_LT(latency, scheduler->period() + 50ms);
    EXPECT_GT(sent_at_stop, 0u);
    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(motion.commands().size(), sent_at_stop);
    EXPECT_EQ(scheduler->state(), ControllerState::Idle);
    EXPECT_TRUE(scheduler->stopped());
}

TEST_F(ControlSchedulerTest, PermanentFailureEndsRunAfterGoingIdle)
{
    build();
    motion.failPermanently();
    FramePump pump(frames);

    std::exception_ptr error;
    std::thread loop([this, &error] {
        try {
            scheduler->run();
        } catch (...) {
            error = std::current_exception();
        }
    });
    loop.join();

    ASSERT_TRUE(error);
    EXPECT_THROW(std::rethrow_exception(error), MotionError);
    EXPECT_EQ(scheduler->state(), ControllerState::Idle);
    EXPECT_GE(scheduler->telemetry().counters.dispatch_failures, 1u);
}

TEST_F(ControlSchedulerTest, TelemetrySinkCalledEveryNTicks)
{
    build();
    FramePump pump(frames);
    std::atomic<int> calls{0};
    scheduler->set_telemetry_sink([&calls](const TelemetrySnapshot& snapshot) {
        EXPECT_EQ(snapshot.counters.ticks % 3, 0u);
        calls.fetch_add(1);
    }, 3);

    std::thread loop([this] { scheduler->run(); });
    std::this_thread::sleep_for(700ms);
    scheduler->stop();
    loop.join();

    const auto ticks = scheduler->telemetry().counters.ticks;
    EXPECT_GE(calls.load(), 2);
    EXPECT_LE(static_cast<std::uint64_t>(calls.load()), ticks / 3);
}
