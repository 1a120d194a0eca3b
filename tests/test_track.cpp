/**
 * @file test_track.cpp
 * @brief Single-target track state and its miss timeout
 */

#include <gtest/gtest.h>

#include <chrono>
#include <optional>

#include "fakes.hpp"
#include "gaze/track.hpp"

using namespace gaze;
using namespace gaze::fakes;
using namespace std::chrono_literals;

class TrackStateTest : public ::testing::Test {
protected:
    TrackState track{1s};
    TimePoint t0 = TimePoint{} + 100s;
};

TEST_F(TrackStateTest, StartsEmpty)
{
    EXPECT_FALSE(track.live());
    EXPECT_EQ(track.update(std::nullopt, t0), TrackEvent::Empty);
}

TEST_F(TrackStateTest, AcquiresThenRefreshes)
{
    EXPECT_EQ(track.update(makeDetection("person", 0.9, 100, 100, 60, 120, t0), t0), TrackEvent::Acquired);
    ASSERT_TRUE(track.live());
    EXPECT_EQ(track.target()->first_seen, t0);

    const TimePoint t1 = t0 + 66ms;
    EXPECT_EQ(track.update(makeDetection("person", 0.8, 110, 105, 60, 120, t1), t1), TrackEvent::Refreshed);
    EXPECT_EQ(track.target()->first_seen, t0);
    EXPECT_EQ(track.target()->last_seen, t1);
    EXPECT_DOUBLE_EQ(track.target()->region.u, 110);
    EXPECT_DOUBLE_EQ(track.target()->confidence, 0.8);
}

TEST_F(TrackStateTest, LastSeenIsFrameTimeNotProcessingTime)
{
    track.update(makeDetection("person", 0.9, 100, 100, 60, 120, t0), t0 + 300ms);
    EXPECT_EQ(track.target()->last_seen, t0);
}

TEST_F(TrackStateTest, UnstampedDetectionUsesNow)
{
    track.update(makeDetection("person", 0.9, 100, 100), t0);
    EXPECT_EQ(track.target()->last_seen, t0);
}

TEST_F(TrackStateTest, CoastsUntilExactlyMissTimeout)
{
    track.update(makeDetection("person", 0.9, 100, 100, 60, 120, t0), t0);

    EXPECT_EQ(track.update(std::nullopt, t0 + 500ms), TrackEvent::Coasting);
    EXPECT_EQ(track.update(std::nullopt, t0 + 999ms), TrackEvent::Coasting);
    EXPECT_EQ(track.target()->consecutive_misses, 2);
    EXPECT_DOUBLE_EQ(track.target()->region.u, 100);

    EXPECT_EQ(track.update(std::nullopt, t0 + 1000ms), TrackEvent::Lost);
    EXPECT_FALSE(track.live());
    EXPECT_EQ(track.update(std::nullopt, t0 + 1100ms), TrackEvent::Empty);
}

TEST_F(TrackStateTest, MissTimeoutCountsFromFrameCaptureTime)
{
    // Detection from a frame captured 300 ms before the tick that saw it.
    const TimePoint captured = t0 - 300ms;
    ASSERT_EQ(track.update(makeDetection("person", 0.9, 100, 100, 60, 120, captured), t0),
              TrackEvent::Acquired);

    EXPECT_EQ(track.update(std::nullopt, t0 + 699ms), TrackEvent::Coasting);
    EXPECT_EQ(track.target()->consecutive_misses, 1);
    EXPECT_EQ(track.update(std::nullopt, t0 + 700ms), TrackEvent::Lost);
    EXPECT_FALSE(track.live());
}

TEST_F(TrackStateTest, DetectionResetsMissCount)
{
    track.update(makeDetection("person", 0.9, 100, 100, 60, 120, t0), t0);
    track.update(std::nullopt, t0 + 500ms);
    const TimePoint t1 = t0 + 900ms;
    track.update(makeDetection("person", 0.9, 120, 100, 60, 120, t1), t1);
    EXPECT_EQ(track.target()->consecutive_misses, 0);

    // The timeout now counts from the new sighting.
    EXPECT_EQ(track.update(std::nullopt, t0 + 1500ms), TrackEvent::Coasting);
}

TEST_F(TrackStateTest, ResetDropsTarget)
{
    track.update(makeDetection("person", 0.9, 100, 100, 60, 120, t0), t0);
    track.reset();
    EXPECT_FALSE(track.live());
}

TEST_F(TrackStateTest, JsonCarriesAges)
{
    track.update(makeDetection("person", 0.9, 100, 100, 60, 120, t0), t0);
    Json value = toJson(*track.target(), t0 + 2s);
    EXPECT_EQ(value.get_string("label"), "person");
    EXPECT_DOUBLE_EQ(value.get_number("age_s"), 2.0);
    EXPECT_DOUBLE_EQ(value.get_number("since_seen_s"), 2.0);
    EXPECT_DOUBLE_EQ(value["region"].get_number("u"), 100.0);
}
