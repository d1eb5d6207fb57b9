#include "video_source.hpp"

#include <iostream>

#include "errors.hpp"

namespace hazard {

VideoSource::VideoSource(const std::string& source, int target_fps, size_t buffer_frames)
    : source_(source), target_fps_(target_fps), buffer_(buffer_frames) {}

VideoSource::~VideoSource() {
    stop();
}

void VideoSource::start() {
    if (running_) return;

    // Allow numeric index or URL
    bool is_index = !source_.empty() && source_.find_first_not_of("0123456789") == std::string::npos;
    if (is_index) {
        cap_.open(std::stoi(source_));
    } else {
        cap_.open(source_);
    }
    if (!cap_.isOpened()) {
        throw PipelineError(ErrorClass::Fatal, "unable to open video source: " + source_);
    }
    if (target_fps_ > 0) {
        cap_.set(cv::CAP_PROP_FPS, target_fps_);
    }

    buffer_.reset();
    running_ = true;
    worker_ = std::thread(&VideoSource::run, this);
    std::cout << "[INFO] Video source opened: " << source_ << std::endl;
}

void VideoSource::stop() {
    running_ = false;
    buffer_.stop();
    if (worker_.joinable()) worker_.join();
    if (cap_.isOpened()) cap_.release();
}

bool VideoSource::next(Frame& out, std::chrono::milliseconds timeout) {
    return buffer_.pop_for(out, timeout);
}

void VideoSource::run() {
    const double sleep_ms = target_fps_ > 0 ? 1000.0 / target_fps_ : 0.0;
    int failures = 0;

    while (running_) {
        cv::Mat image;
        if (!cap_.read(image) || image.empty()) {
            if (++failures % 50 == 1) {
                std::cerr << "[WARN] Capture read failed, retrying..." << std::endl;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            continue;
        }
        failures = 0;

        Frame frame;
        frame.image = image;
        frame.timestamp_sec = monotonic_seconds();
        frame.seq = ++seq_;
        buffer_.push(std::move(frame));

        // Files play back at capture rate; live devices pace themselves.
        if (sleep_ms > 0.0 && !source_.empty() && source_.find("://") == std::string::npos &&
            source_.find_first_not_of("0123456789") != std::string::npos) {
            std::this_thread::sleep_for(std::chrono::milliseconds(static_cast<int>(sleep_ms)));
        }
    }
}

}  // namespace hazard
