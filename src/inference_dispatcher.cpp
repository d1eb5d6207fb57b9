#include "inference_dispatcher.hpp"

#include <algorithm>
#include <iostream>

namespace hazard {

InferenceDispatcher::InferenceDispatcher(const DispatcherConfig& cfg,
                                         std::unique_ptr<RemoteInference> remote,
                                         std::unique_ptr<LocalInference> local)
    : cfg_(cfg), remote_(std::move(remote)), local_(std::move(local)) {}

InferenceDispatcher::~InferenceDispatcher() {
    stop();
}

void InferenceDispatcher::set_mode_listener(ModeListener listener) {
    std::lock_guard<std::mutex> lock(listener_mu_);
    listener_ = std::move(listener);
}

void InferenceDispatcher::set_mode(InferenceMode to) {
    const InferenceMode from = mode_.exchange(to);
    if (from == to) return;
    std::cout << "[INFO] [dispatcher] inference mode " << inference_mode_to_string(from)
              << " -> " << inference_mode_to_string(to) << std::endl;
    std::lock_guard<std::mutex> lock(listener_mu_);
    if (listener_) listener_(from, to);
}

bool InferenceDispatcher::ensure_local_loaded() {
    std::lock_guard<std::mutex> lock(local_mu_);
    if (!local_) return false;
    if (local_->loaded()) return true;
    return local_->load();
}

void InferenceDispatcher::start() {
    if (running_) return;
    mode_.store(InferenceMode::Unknown);

    if (remote_ && remote_->probe()) {
        std::cout << "[INFO] [dispatcher] remote backend ready at " << remote_->active_endpoint() << std::endl;
        set_mode(InferenceMode::Remote);
    } else {
        if (remote_) {
            std::cerr << "[WARN] [dispatcher] no remote endpoint answered; using local model" << std::endl;
        }
        if (!ensure_local_loaded()) {
            throw PipelineError(ErrorClass::Fatal, "no inference backend available");
        }
        set_mode(InferenceMode::Local);
    }

    running_ = true;
    if (remote_) {
        health_thread_ = std::thread(&InferenceDispatcher::health_loop, this);
    }
}

void InferenceDispatcher::stop() {
    {
        std::lock_guard<std::mutex> lock(health_mu_);
        running_ = false;
    }
    health_cv_.notify_all();
    if (health_thread_.joinable()) health_thread_.join();
    mode_.store(InferenceMode::Unknown);
}

InferenceResult InferenceDispatcher::run_local(const cv::Mat& model_input, bool after_failover) {
    if (!local_ || !local_->loaded()) {
        return InferenceResult::failure(InferenceError::Kind::NotLoaded, "local model not loaded", ErrorClass::Fatal);
    }
    auto result = local_->detect(model_input);
    if (result.ok() && after_failover) result.served_by += "+failover";
    return result;
}

InferenceResult InferenceDispatcher::detect(const cv::Mat& model_input) {
    // Read once: a concurrent health probe only affects the next call.
    const InferenceMode mode = mode_.load();

    if (mode == InferenceMode::Remote && remote_) {
        auto result = remote_->detect(model_input);
        if (result.ok()) return result;
        std::cerr << "[WARN] [dispatcher] remote detect failed ("
                  << inference_error_kind_to_string(result.error->kind) << "): " << result.error->message << std::endl;

        if (remote_->has_legacy()) {
            auto legacy = remote_->detect_legacy(model_input);
            if (legacy.ok()) return legacy;
            std::cerr << "[WARN] [dispatcher] legacy detect failed: " << legacy.error->message << std::endl;
        }

        if (!ensure_local_loaded()) {
            // Nothing to fail over to; stay on the remote and let the caller count the miss.
            return InferenceResult::failure(InferenceError::Kind::NoBackend,
                                            "remote failed and no local model is available",
                                            ErrorClass::Degraded);
        }
        set_mode(InferenceMode::Local);
        return run_local(model_input, true);
    }

    if (mode == InferenceMode::Local) {
        return run_local(model_input, false);
    }

    return InferenceResult::failure(InferenceError::Kind::NoBackend, "dispatcher not started", ErrorClass::Fatal);
}

bool InferenceDispatcher::check_health_now() {
    if (!remote_ || mode_.load() != InferenceMode::Local) return false;
    if (!remote_->probe()) return false;

    InferenceMode expected = InferenceMode::Local;
    if (!mode_.compare_exchange_strong(expected, InferenceMode::Remote)) return false;
    std::cout << "[INFO] [dispatcher] remote backend recovered at " << remote_->active_endpoint()
              << "; inference mode local -> remote" << std::endl;
    std::lock_guard<std::mutex> lock(listener_mu_);
    if (listener_) listener_(InferenceMode::Local, InferenceMode::Remote);
    return true;
}

void InferenceDispatcher::health_loop() {
    const auto interval = std::chrono::milliseconds(std::max(100, cfg_.health_interval_ms));
    std::unique_lock<std::mutex> lock(health_mu_);
    while (running_) {
        health_cv_.wait_for(lock, interval, [&] { return !running_; });
        if (!running_) break;
        lock.unlock();
        check_health_now();
        lock.lock();
    }
}

}  // namespace hazard
