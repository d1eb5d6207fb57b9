#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "config.hpp"
#include "frame_throttle.hpp"
#include "frame_types.hpp"
#include "geo_resolver.hpp"
#include "inference_dispatcher.hpp"
#include "object_tracker.hpp"
#include "postprocess.hpp"
#include "video_source.hpp"

namespace hazard {

enum class TickOutcome { NoFrame, Skipped, Processed, Failed, Fatal };

inline const char* tick_outcome_to_string(TickOutcome t) {
    switch (t) {
        case TickOutcome::NoFrame: return "no_frame";
        case TickOutcome::Skipped: return "skipped";
        case TickOutcome::Processed: return "processed";
        case TickOutcome::Failed: return "failed";
        case TickOutcome::Fatal: return "fatal";
    }
    return "no_frame";
}

// Last measured duration of each stage, milliseconds.
struct StageLatencies {
    double throttle_ms{0.0};
    double preprocess_ms{0.0};
    double inference_ms{0.0};
    double postprocess_ms{0.0};
    double tracking_ms{0.0};
    double cycle_ms{0.0};
};

struct PipelineMetrics {
    bool running{false};
    double uptime_sec{0.0};
    double fps{0.0};                 // frames pulled per second
    double inference_fps{0.0};
    size_t tracked_count{0};
    InferenceMode mode{InferenceMode::Unknown};
    std::string served_by;

    uint64_t frames{0};
    uint64_t inferences{0};
    uint64_t skipped{0};
    uint64_t saves{0};
    uint64_t failures{0};
    int consecutive_failures{0};

    StageLatencies latency;
    int skip_frames{1};
    double average_latency_ms{0.0};

    bool degraded{false};
    std::optional<std::string> fatal_error;
    std::optional<GeoFix> geo;
};

// Any member may be left empty.
struct StatusListener {
    std::function<void(InferenceMode from, InferenceMode to)> on_mode_change;
    std::function<void(bool degraded, const std::string& reason)> on_degraded;
    std::function<void(const std::string& error)> on_fatal;
};

using SaveCallback = std::function<void(const SaveEvent&)>;
using PreviewCallback = std::function<void(const Frame&, const std::vector<TrackedObject>&)>;

// Runs frame -> throttle -> detect -> observations -> tracks -> save events.
// Components are owned by the caller and must outlive the pipeline.
class Pipeline {
public:
    Pipeline(const AppConfig& cfg,
             FrameSource& source,
             FrameThrottle& throttle,
             InferenceDispatcher& dispatcher,
             DetectionPostprocessor& postprocessor,
             ObjectTracker& tracker,
             GeoResolver& geo);
    ~Pipeline();

    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    // Starts every component and the loop thread. Throws PipelineError(Fatal)
    // when the inference backend or the frame source is unusable.
    void start();
    // Joins the loop and every background thread, then clears all state.
    void stop();
    // Blocks until the loop ends, on stop() or after a fatal error.
    void join();

    // One cycle. Safe to call without start() once the dispatcher is started.
    TickOutcome tick();

    void subscribe(SaveCallback cb);
    void set_preview(PreviewCallback cb);
    void set_status_listener(StatusListener listener);

    PipelineMetrics metrics() const;
    bool running() const { return running_.load(); }

private:
    void run_loop();
    void mark_stopped();
    void reset_state();
    void shutdown_locked();
    void note_success();
    void note_failure(const std::string& reason);
    void report_fatal(const std::string& error);
    void emit_saves(const Frame& frame, const std::vector<TrackedObject>& tracks);
    void emit_preview(const Frame& frame, const std::vector<TrackedObject>& tracks);

    AppConfig cfg_;
    FrameSource& source_;
    FrameThrottle& throttle_;
    InferenceDispatcher& dispatcher_;
    DetectionPostprocessor& post_;
    ObjectTracker& tracker_;
    GeoResolver& geo_;

    std::atomic<bool> running_{false};
    bool started_{false};
    std::thread loop_thread_;
    std::thread geo_thread_;
    std::mutex lifecycle_mu_;
    std::mutex done_mu_;
    std::condition_variable done_cv_;

    std::mutex callbacks_mu_;
    std::vector<SaveCallback> subscribers_;
    PreviewCallback preview_;
    StatusListener status_;

    // Touched by the tick thread only.
    uint64_t cycle_{0};
    std::vector<TrackedObject> last_tracks_;
    double fps_window_start_{0.0};
    uint64_t fps_window_frames_{0};
    uint64_t fps_window_inferences_{0};

    mutable std::mutex metrics_mu_;
    PipelineMetrics metrics_;
    double started_at_{0.0};
};

}  // namespace hazard
