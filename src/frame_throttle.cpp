#include "frame_throttle.hpp"

#include <algorithm>
#include <iostream>
#include <opencv2/imgproc.hpp>

namespace hazard {

FrameThrottle::FrameThrottle(const ThrottleConfig& cfg) : cfg_(cfg) {
    cfg_.max_skip = std::max(1, cfg_.max_skip);
    if (cfg_.history_size == 0) cfg_.history_size = 1;
    if (cfg_.target_fps <= 0.0) cfg_.target_fps = 15.0;
    reset();
}

void FrameThrottle::reset() {
    skip_frames_ = std::clamp(cfg_.initial_skip, 1, cfg_.max_skip);
    history_.assign(cfg_.history_size, 0.0);
    history_next_ = 0;
    history_count_ = 0;
    prev_thumb_.release();
    last_motion_ = 0.0;
    static_skips_ = 0;
}

bool FrameThrottle::should_run_inference(const Frame& frame, uint64_t cycle_index) {
    if (cycle_index % static_cast<uint64_t>(skip_frames_) != 0) return false;
    if (!cfg_.motion_gate) return true;

    if (motion_detected(frame.image)) {
        static_skips_ = 0;
        return true;
    }
    if (cfg_.max_static_skips > 0 && static_skips_ >= cfg_.max_static_skips) {
        static_skips_ = 0;
        return true;
    }
    static_skips_++;
    return false;
}

bool FrameThrottle::motion_detected(const cv::Mat& image) {
    try {
        if (image.empty()) return true;

        const int thumb_w = std::max(8, cfg_.motion_thumb_width);
        const int thumb_h = std::max(1, image.rows * thumb_w / std::max(1, image.cols));
        cv::Mat small;
        cv::resize(image, small, cv::Size(thumb_w, thumb_h), 0, 0, cv::INTER_AREA);
        cv::Mat gray;
        if (small.channels() == 3) {
            cv::cvtColor(small, gray, cv::COLOR_BGR2GRAY);
        } else if (small.channels() == 4) {
            cv::cvtColor(small, gray, cv::COLOR_BGRA2GRAY);
        } else {
            gray = small;
        }

        if (prev_thumb_.empty() || prev_thumb_.size() != gray.size() || prev_thumb_.type() != gray.type()) {
            prev_thumb_ = gray;
            last_motion_ = 255.0;
            return true;
        }

        cv::Mat diff;
        cv::absdiff(gray, prev_thumb_, diff);
        last_motion_ = cv::mean(diff)[0];
        prev_thumb_ = gray;
        return last_motion_ >= cfg_.motion_threshold;
    } catch (const cv::Exception& e) {
        std::cerr << "[WARN] [throttle] motion gate failed, running inference: " << e.what() << std::endl;
        prev_thumb_.release();
        return true;
    }
}

void FrameThrottle::record_latency(double ms) {
    if (!(ms >= 0.0)) return;
    history_[history_next_] = ms;
    history_next_ = (history_next_ + 1) % history_.size();
    history_count_ = std::min(history_count_ + 1, history_.size());
    adapt();
}

double FrameThrottle::average_latency_ms() const {
    if (history_count_ == 0) return 0.0;
    double sum = 0.0;
    for (size_t i = 0; i < history_count_; ++i) sum += history_[i];
    return sum / static_cast<double>(history_count_);
}

void FrameThrottle::adapt() {
    if (history_count_ == 0) return;
    const double target_ms = 1000.0 / cfg_.target_fps;
    const double avg = average_latency_ms();
    if (avg > target_ms * cfg_.slow_factor) {
        skip_frames_ = std::min(skip_frames_ + 1, cfg_.max_skip);
    } else if (avg < target_ms * cfg_.fast_factor) {
        skip_frames_ = std::max(skip_frames_ - 1, 1);
    }
}

}  // namespace hazard
