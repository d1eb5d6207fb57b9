#include <gtest/gtest.h>

#include <opencv2/core.hpp>

#include "frame_throttle.hpp"

using namespace hazard;

namespace {

Frame solid(uint8_t value, uint64_t seq = 0) {
    Frame f;
    f.image = cv::Mat(120, 160, CV_8UC3, cv::Scalar::all(value));
    f.seq = seq;
    return f;
}

ThrottleConfig no_motion_gate() {
    ThrottleConfig cfg;
    cfg.motion_gate = false;
    return cfg;
}

}  // namespace

TEST(FrameThrottle, EmptyHistoryKeepsInitialSkip) {
    FrameThrottle throttle(no_motion_gate());
    EXPECT_EQ(throttle.skip_frames(), 1);
    EXPECT_DOUBLE_EQ(throttle.average_latency_ms(), 0.0);
    for (uint64_t i = 0; i < 5; ++i) EXPECT_TRUE(throttle.should_run_inference(solid(0), i));
}

TEST(FrameThrottle, SlowInferenceRaisesSkipUpToCap) {
    FrameThrottle throttle(no_motion_gate());
    for (int i = 0; i < 50; ++i) {
        throttle.record_latency(1000.0);
        EXPECT_GE(throttle.skip_frames(), 1);
        EXPECT_LE(throttle.skip_frames(), 6);
    }
    EXPECT_EQ(throttle.skip_frames(), 6);
}

TEST(FrameThrottle, FastInferenceLowersSkipToOne) {
    FrameThrottle throttle(no_motion_gate());
    for (int i = 0; i < 10; ++i) throttle.record_latency(1000.0);
    ASSERT_GT(throttle.skip_frames(), 1);

    for (int i = 0; i < 60; ++i) {
        throttle.record_latency(1.0);
        EXPECT_GE(throttle.skip_frames(), 1);
    }
    EXPECT_EQ(throttle.skip_frames(), 1);
}

TEST(FrameThrottle, LatencyInsideBandLeavesSkipAlone) {
    FrameThrottle throttle(no_motion_gate());
    // Target 15 fps = 66.7 ms; the band is roughly 40..120 ms.
    for (int i = 0; i < 20; ++i) throttle.record_latency(70.0);
    EXPECT_EQ(throttle.skip_frames(), 1);
    EXPECT_NEAR(throttle.average_latency_ms(), 70.0, 1e-9);
}

TEST(FrameThrottle, OnlyMultiplesOfSkipAreCandidates) {
    ThrottleConfig cfg = no_motion_gate();
    cfg.initial_skip = 3;
    FrameThrottle throttle(cfg);
    ASSERT_EQ(throttle.skip_frames(), 3);
    EXPECT_TRUE(throttle.should_run_inference(solid(0), 0));
    EXPECT_FALSE(throttle.should_run_inference(solid(0), 1));
    EXPECT_FALSE(throttle.should_run_inference(solid(0), 2));
    EXPECT_TRUE(throttle.should_run_inference(solid(0), 3));
}

TEST(FrameThrottle, StaticSceneStillRefreshesEveryThirdFrame) {
    ThrottleConfig cfg;
    cfg.max_static_skips = 2;
    FrameThrottle throttle(cfg);

    EXPECT_TRUE(throttle.should_run_inference(solid(40), 0));  // first frame counts as motion
    EXPECT_FALSE(throttle.should_run_inference(solid(40), 1));
    EXPECT_FALSE(throttle.should_run_inference(solid(40), 2));
    EXPECT_TRUE(throttle.should_run_inference(solid(40), 3));
    EXPECT_FALSE(throttle.should_run_inference(solid(40), 4));
    EXPECT_FALSE(throttle.should_run_inference(solid(40), 5));
    EXPECT_TRUE(throttle.should_run_inference(solid(40), 6));
}

TEST(FrameThrottle, MotionPassesTheGate) {
    ThrottleConfig cfg;
    cfg.max_static_skips = 0;
    FrameThrottle throttle(cfg);

    EXPECT_TRUE(throttle.should_run_inference(solid(0), 0));
    EXPECT_FALSE(throttle.should_run_inference(solid(0), 1));
    EXPECT_TRUE(throttle.should_run_inference(solid(200), 2));
    EXPECT_NEAR(throttle.last_motion(), 200.0, 1.0);
}

TEST(FrameThrottle, EmptyFrameFailsOpen) {
    FrameThrottle throttle(ThrottleConfig{});
    EXPECT_TRUE(throttle.should_run_inference(solid(10), 0));
    Frame empty;
    EXPECT_TRUE(throttle.should_run_inference(empty, 1));
    EXPECT_TRUE(throttle.should_run_inference(empty, 2));
}

TEST(FrameThrottle, ResetRestoresInitialState) {
    FrameThrottle throttle(no_motion_gate());
    for (int i = 0; i < 10; ++i) throttle.record_latency(1000.0);
    ASSERT_GT(throttle.skip_frames(), 1);
    throttle.reset();
    EXPECT_EQ(throttle.skip_frames(), 1);
    EXPECT_DOUBLE_EQ(throttle.average_latency_ms(), 0.0);
}
