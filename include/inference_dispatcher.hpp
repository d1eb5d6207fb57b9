#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

#include "config.hpp"
#include "inference_backend.hpp"

namespace hazard {

// Serves detect() from a remote service or a local model. Remote failures
// within a call retry the legacy contract once, then fail over to the local
// model; a background probe switches back once the service is healthy.
class InferenceDispatcher {
public:
    using ModeListener = std::function<void(InferenceMode from, InferenceMode to)>;

    // Either backend may be null, but not both.
    InferenceDispatcher(const DispatcherConfig& cfg,
                        std::unique_ptr<RemoteInference> remote,
                        std::unique_ptr<LocalInference> local);
    ~InferenceDispatcher();

    InferenceDispatcher(const InferenceDispatcher&) = delete;
    InferenceDispatcher& operator=(const InferenceDispatcher&) = delete;

    // Picks the initial mode and starts the health thread. Throws
    // PipelineError(Fatal) when no backend is usable.
    void start();
    void stop();

    InferenceResult detect(const cv::Mat& model_input);

    // One synchronous probe of the remote backend while in Local mode.
    // Returns true when the mode switched back to Remote.
    bool check_health_now();

    InferenceMode mode() const { return mode_.load(); }
    void set_mode_listener(ModeListener listener);

private:
    void set_mode(InferenceMode to);
    bool ensure_local_loaded();
    InferenceResult run_local(const cv::Mat& model_input, bool after_failover);
    void health_loop();

    DispatcherConfig cfg_;
    std::unique_ptr<RemoteInference> remote_;
    std::unique_ptr<LocalInference> local_;

    std::atomic<InferenceMode> mode_{InferenceMode::Unknown};
    std::mutex local_mu_;

    std::mutex listener_mu_;
    ModeListener listener_;

    std::atomic<bool> running_{false};
    std::thread health_thread_;
    std::mutex health_mu_;
    std::condition_variable health_cv_;
};

}  // namespace hazard
