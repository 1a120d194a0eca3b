/**
 * @file test_detector.cpp
 * @brief Detector adapter: filtering, cadence, caching, timeouts and failures
 */

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <thread>

#include "fakes.hpp"
#include "gaze/detector.hpp"

using namespace gaze;
using namespace gaze::fakes;
using namespace std::chrono_literals;

class DetectorAdapterTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        model = std::make_shared<FakeModel>();
        model->setDetections({
            makeDetection("person", 0.92, 320, 240),
            makeDetection("Person", 0.55, 100, 100),
            makeDetection("cat", 0.99, 500, 300),
        });
        options.cadence_hz = 5.0;
        options.timeout = 200ms;
        options.max_result_age = 1s;
    }

    void TearDown() override
    {
        model->releaseAll();
    }

    std::shared_ptr<FakeModel> model;
    DetectorOptions options;
    TimePoint t0 = Clock::now();
};

TEST(FilterDetectionsTest, MatchesLabelCaseInsensitivelyAndThreshold)
{
    DetectionSet raw = {
        makeDetection("person", 0.9, 0, 0),
        makeDetection("PERSON", 0.7, 0, 0),
        makeDetection("person", 0.69, 0, 0),
        makeDetection("dog", 0.95, 0, 0),
    };
    DetectionSet out = filterDetections(raw, "Person", 0.7);
    ASSERT_EQ(out.size(), 2u);
    EXPECT_DOUBLE_EQ(out[0].confidence, 0.9);
    EXPECT_DOUBLE_EQ(out[1].confidence, 0.7);
}

TEST(FilterDetectionsTest, EmptyInputGivesEmptyOutput)
{
    EXPECT_TRUE(filterDetections({}, "person", 0.5).empty());
}

TEST_F(DetectorAdapterTest, FirstCallRunsModelAndFilters)
{
    DetectorAdapter detector(model, options);
    DetectionOutcome out = detector.detect(makeFrame(t0, 1), "person", 0.7, t0);

    EXPECT_EQ(out.status, DetectStatus::Fresh);
    ASSERT_EQ(out.detections.size(), 1u);
    EXPECT_DOUBLE_EQ(out.detections[0].confidence, 0.92);
    EXPECT_EQ(out.detections[0].frame_time, t0);
    EXPECT_EQ(detector.invocations(), 1u);
}

TEST_F(DetectorAdapterTest, ReusesResultBetweenCadenceTicks)
{
    DetectorAdapter detector(model, options);
    detector.detect(makeFrame(t0, 1), "person", 0.5, t0);

    // 5 Hz cadence: a new frame 66 ms later must not trigger inference.
    DetectionOutcome out = detector.detect(makeFrame(t0 + 66ms, 2), "person", 0.5, t0 + 66ms);
    EXPECT_EQ(out.status, DetectStatus::Cached);
    EXPECT_EQ(out.detections.size(), 2u);
    EXPECT_EQ(model->calls(), 1);

    out = detector.detect(makeFrame(t0 + 250ms, 3), "person", 0.5, t0 + 250ms);
    EXPECT_EQ(out.status, DetectStatus::Fresh);
    EXPECT_EQ(model->calls(), 2);
}

TEST_F(DetectorAdapterTest, SameFrameIsNotInferredTwice)
{
    options.cadence_hz = 0.0;
    DetectorAdapter detector(model, options);
    FrameSource::FramePtr frame = makeFrame(t0, 1);
    detector.detect(frame, "person", 0.5, t0);
    DetectionOutcome out = detector.detect(frame, "person", 0.5, t0 + 66ms);
    EXPECT_EQ(out.status, DetectStatus::Cached);
    EXPECT_EQ(model->calls(), 1);
}

TEST_F(DetectorAdapterTest, FilterAppliesPerCallToCachedResult)
{
    DetectorAdapter detector(model, options);
    detector.detect(makeFrame(t0, 1), "person", 0.5, t0);
    DetectionOutcome cats = detector.detect(makeFrame(t0 + 10ms, 2), "cat", 0.5, t0 + 10ms);
    ASSERT_EQ(cats.detections.size(), 1u);
    EXPECT_EQ(cats.detections[0].label, "cat");
}

TEST_F(DetectorAdapterTest, SlowInferenceTimesOutWithoutBlockingPastTimeout)
{
    options.timeout = 20ms;
    model->setDelay(2000ms);
    DetectorAdapter detector(model, options);

    const auto started = Clock::now();
    DetectionOutcome out = detector.detect(makeFrame(t0, 1), "person", 0.5, t0);
    const auto waited = Clock::now() - started;

    EXPECT_EQ(out.status, DetectStatus::TimedOut);
    EXPECT_TRUE(out.detections.empty());
    EXPECT_LT(waited, 500ms);
    EXPECT_EQ(detector.timeouts(), 1u);
    EXPECT_TRUE(detector.busy());

    // While the job is in flight nothing new is submitted.
    out = detector.detect(makeFrame(t0 + 1s, 2), "person", 0.5, t0 + 1s);
    EXPECT_EQ(out.status, DetectStatus::Pending);
    EXPECT_EQ(model->calls(), 1);

    model->releaseAll();
}

TEST_F(DetectorAdapterTest, LateResultIsPickedUpOnLaterTick)
{
    options.timeout = 5ms;
    model->setDelay(50ms);
    DetectorAdapter detector(model, options);

    EXPECT_EQ(detector.detect(makeFrame(t0, 1), "person", 0.5, t0).status, DetectStatus::TimedOut);
    model->releaseAll();
    std::this_thread::sleep_for(100ms);

    DetectionOutcome out = detector.detect(makeFrame(t0, 1), "person", 0.5, t0 + 66ms);
    EXPECT_EQ(out.status, DetectStatus::Fresh);
    EXPECT_EQ(out.detections.size(), 2u);
    EXPECT_FALSE(detector.busy());
}

TEST_F(DetectorAdapterTest, ModelSlowerThanTimeoutStillFeedsEveryTick)
{
    // 50 ms inference, 40 ms timeout, new frame every 67 ms: each job misses
    // its own tick but is collected on the next one.
    options.cadence_hz = 0.0;
    options.timeout = 40ms;
    model->setDelay(50ms);
    DetectorAdapter detector(model, options);

    int with_detections = 0;
    int timed_out = 0;
    for (int i = 0; i < 30; ++i) {
        const TimePoint started = Clock::now();
        DetectionOutcome out = detector.detect(makeFrame(started, i + 1), "person", 0.5, started);
        if (!out.detections.empty()) {
            ++with_detections;
        }
        if (out.status == DetectStatus::TimedOut) {
            ++timed_out;
        }
        std::this_thread::sleep_until(started + 67ms);
    }

    EXPECT_GE(with_detections, 25);
    EXPECT_LE(timed_out, 3);
    EXPECT_GE(detector.timeouts(), 25u);
}

TEST_F(DetectorAdapterTest, DrainWaitsForInFlightInferenceBeforeRelease)
{
    options.timeout = 5ms;
    model->setDelay(80ms);
    DetectorAdapter detector(model, options);

    const auto started = Clock::now();
    ASSERT_EQ(detector.detect(makeFrame(t0, 1), "person", 0.5, t0).status, DetectStatus::TimedOut);
    detector.drain();
    EXPECT_GE(Clock::now() - started, 70ms);
    model->release();

    // Finished before the release, so the result is still delivered.
    DetectionOutcome out = detector.detect(makeFrame(t0, 1), "person", 0.5, t0 + 66ms);
    EXPECT_EQ(out.status, DetectStatus::Fresh);
    EXPECT_EQ(out.detections.size(), 2u);

    detector.drain();
}

TEST_F(DetectorAdapterTest, FailureIsReportedAndClearsPreviousBoxes)
{
    options.cadence_hz = 0.0;
    DetectorAdapter detector(model, options);
    ASSERT_EQ(detector.detect(makeFrame(t0, 1), "person", 0.5, t0).detections.size(), 2u);

    model->setFail(true);
    DetectionOutcome out = detector.detect(makeFrame(t0 + 10ms, 2), "person", 0.5, t0 + 10ms);
    EXPECT_EQ(out.status, DetectStatus::Failed);
    EXPECT_NE(out.error.find("inference exploded"), std::string::npos);
    EXPECT_EQ(detector.failures(), 1u);

    out = detector.detect(makeFrame(t0 + 10ms, 2), "person", 0.5, t0 + 20ms);
    EXPECT_EQ(out.status, DetectStatus::Cached);
    EXPECT_TRUE(out.detections.empty());
}

TEST_F(DetectorAdapterTest, UnloadedModelFails)
{
    model->release();
    DetectorAdapter detector(model, options);
    DetectionOutcome out = detector.detect(makeFrame(t0, 1), "person", 0.5, t0);
    EXPECT_EQ(out.status, DetectStatus::Failed);
    EXPECT_EQ(model->calls(), 0);
}

TEST_F(DetectorAdapterTest, OldResultIsStale)
{
    options.max_result_age = 300ms;
    DetectorAdapter detector(model, options);
    FrameSource::FramePtr frame = makeFrame(t0, 1);
    detector.detect(frame, "person", 0.5, t0);

    EXPECT_TRUE(detector.is_result_fresh(300ms, t0 + 300ms));
    EXPECT_FALSE(detector.is_result_fresh(300ms, t0 + 301ms));

    DetectionOutcome out = detector.detect(frame, "person", 0.5, t0 + 400ms);
    EXPECT_EQ(out.status, DetectStatus::Stale);
    EXPECT_TRUE(out.detections.empty());
}

TEST_F(DetectorAdapterTest, NoFrameAndNoResultIsPending)
{
    DetectorAdapter detector(model, options);
    DetectionOutcome out = detector.detect(nullptr, "person", 0.5, t0);
    EXPECT_EQ(out.status, DetectStatus::Pending);
    EXPECT_FALSE(detector.is_result_fresh(1s, t0));
}

TEST_F(DetectorAdapterTest, ResetForgetsResultAndResubmits)
{
    DetectorAdapter detector(model, options);
    FrameSource::FramePtr frame = makeFrame(t0, 1);
    detector.detect(frame, "person", 0.5, t0);
    detector.reset();

    EXPECT_FALSE(detector.is_result_fresh(1s, t0));
    DetectionOutcome out = detector.detect(frame, "person", 0.5, t0 + 10ms);
    EXPECT_EQ(out.status, DetectStatus::Fresh);
    EXPECT_EQ(model->calls(), 2);
}

TEST(DetectorAdapterCtorTest, RequiresModel)
{
    EXPECT_THROW(DetectorAdapter(nullptr, DetectorOptions{}), std::invalid_argument);
}
