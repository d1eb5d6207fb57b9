#pragma once

#include <cstdint>
#include <vector>
#include <opencv2/core.hpp>

#include "config.hpp"
#include "frame_types.hpp"

namespace hazard {

// Decides per tick whether a frame goes to inference. Combines a coarse
// every-Nth-cycle skip, a motion gate and a latency feedback loop that moves
// N between 1 and max_skip.
class FrameThrottle {
public:
    explicit FrameThrottle(const ThrottleConfig& cfg);

    bool should_run_inference(const Frame& frame, uint64_t cycle_index);

    // Feed the measured duration of an inference cycle.
    void record_latency(double ms);

    int skip_frames() const { return skip_frames_; }
    double average_latency_ms() const;
    double last_motion() const { return last_motion_; }
    void reset();

private:
    bool motion_detected(const cv::Mat& image);
    void adapt();

    ThrottleConfig cfg_;
    int skip_frames_{1};

    std::vector<double> history_;
    size_t history_next_{0};
    size_t history_count_{0};

    cv::Mat prev_thumb_;
    double last_motion_{0.0};
    int static_skips_{0};
};

}  // namespace hazard
