#pragma once

#include <memory>

#include "config.hpp"
#include "event_publisher.hpp"
#include "frame_throttle.hpp"
#include "geo_resolver.hpp"
#include "inference_dispatcher.hpp"
#include "object_tracker.hpp"
#include "pipeline.hpp"
#include "postprocess.hpp"
#include "remote_backend.hpp"
#include "video_source.hpp"

namespace hazard {

// Builds the production component set from an AppConfig and wires the
// pipeline's save events into the report publisher.
class HazardApp {
public:
    explicit HazardApp(const AppConfig& cfg);
    ~HazardApp();

    HazardApp(const HazardApp&) = delete;
    HazardApp& operator=(const HazardApp&) = delete;

    // Throws PipelineError(Fatal) when the pipeline cannot start.
    void start();
    void stop();

    Pipeline& pipeline() { return *pipeline_; }
    const ReportPublisher& reports() const { return *reports_; }
    const AppConfig& config() const { return cfg_; }

private:
    AppConfig cfg_;
    HttpRemoteInference* remote_{nullptr};  // owned by dispatcher_

    std::unique_ptr<VideoSource> source_;
    std::unique_ptr<FrameThrottle> throttle_;
    std::unique_ptr<InferenceDispatcher> dispatcher_;
    std::unique_ptr<DetectionPostprocessor> post_;
    std::unique_ptr<ObjectTracker> tracker_;
    std::unique_ptr<GeoResolver> geo_;
    std::unique_ptr<ReportPublisher> reports_;
    std::unique_ptr<Pipeline> pipeline_;
};

}  // namespace hazard
