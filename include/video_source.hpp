#pragma once

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <opencv2/videoio.hpp>
#include "frame_buffer.hpp"
#include "frame_types.hpp"

namespace hazard {

class FrameSource {
public:
    virtual ~FrameSource() = default;

    // Throws PipelineError(Fatal) when the underlying device cannot be opened.
    virtual void start() = 0;
    virtual void stop() = 0;
    virtual bool next(Frame& out, std::chrono::milliseconds timeout) = 0;
};

// Captures from a camera index or URL on its own thread.
class VideoSource : public FrameSource {
public:
    VideoSource(const std::string& source, int target_fps, size_t buffer_frames = 2);
    ~VideoSource() override;

    void start() override;
    void stop() override;
    bool next(Frame& out, std::chrono::milliseconds timeout) override;

private:
    void run();

    std::string source_;
    int target_fps_{30};
    cv::VideoCapture cap_;
    FrameBuffer<Frame> buffer_;
    std::thread worker_;
    std::atomic<bool> running_{false};
    uint64_t seq_{0};
};

}  // namespace hazard
