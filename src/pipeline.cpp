#include "pipeline.hpp"

#include <iostream>

#include <opencv2/core.hpp>

#include "errors.hpp"

namespace hazard {

namespace {

double ms_since(double t0) {
    return (monotonic_seconds() - t0) * 1000.0;
}

}  // namespace

Pipeline::Pipeline(const AppConfig& cfg,
                   FrameSource& source,
                   FrameThrottle& throttle,
                   InferenceDispatcher& dispatcher,
                   DetectionPostprocessor& postprocessor,
                   ObjectTracker& tracker,
                   GeoResolver& geo)
    : cfg_(cfg),
      source_(source),
      throttle_(throttle),
      dispatcher_(dispatcher),
      post_(postprocessor),
      tracker_(tracker),
      geo_(geo) {
    dispatcher_.set_mode_listener([this](InferenceMode from, InferenceMode to) {
        {
            std::lock_guard<std::mutex> lock(metrics_mu_);
            metrics_.mode = to;
        }
        std::lock_guard<std::mutex> lock(callbacks_mu_);
        if (status_.on_mode_change) status_.on_mode_change(from, to);
    });
}

Pipeline::~Pipeline() {
    stop();
    dispatcher_.set_mode_listener(nullptr);
}

void Pipeline::subscribe(SaveCallback cb) {
    std::lock_guard<std::mutex> lock(callbacks_mu_);
    subscribers_.push_back(std::move(cb));
}

void Pipeline::set_preview(PreviewCallback cb) {
    std::lock_guard<std::mutex> lock(callbacks_mu_);
    preview_ = std::move(cb);
}

void Pipeline::set_status_listener(StatusListener listener) {
    std::lock_guard<std::mutex> lock(callbacks_mu_);
    status_ = std::move(listener);
}

void Pipeline::reset_state() {
    tracker_.reset();
    throttle_.reset();
    cycle_ = 0;
    last_tracks_.clear();
    fps_window_start_ = monotonic_seconds();
    fps_window_frames_ = 0;
    fps_window_inferences_ = 0;

    std::lock_guard<std::mutex> lock(metrics_mu_);
    metrics_ = PipelineMetrics{};
    metrics_.skip_frames = throttle_.skip_frames();
}

void Pipeline::start() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mu_);
    if (running_) return;
    shutdown_locked();  // a loop that ended on a fatal error

    reset_state();

    dispatcher_.start();
    try {
        source_.start();
    } catch (const std::exception&) {
        dispatcher_.stop();
        throw;
    }

    {
        std::lock_guard<std::mutex> lock(metrics_mu_);
        metrics_.mode = dispatcher_.mode();
    }
    started_at_ = monotonic_seconds();
    started_ = true;
    running_ = true;

    geo_thread_ = std::thread([this]() {
        geo_.acquire_initial();
        if (running_) geo_.start_continuous_updates();
    });
    loop_thread_ = std::thread(&Pipeline::run_loop, this);
    std::cout << "[INFO] [pipeline] started (mode " << inference_mode_to_string(dispatcher_.mode()) << ")" << std::endl;
}

void Pipeline::stop() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mu_);
    mark_stopped();
    shutdown_locked();
}

void Pipeline::mark_stopped() {
    {
        std::lock_guard<std::mutex> lock(done_mu_);
        running_ = false;
    }
    done_cv_.notify_all();
}

// Caller holds lifecycle_mu_ with running_ already false.
void Pipeline::shutdown_locked() {
    if (loop_thread_.joinable()) loop_thread_.join();
    if (geo_thread_.joinable()) {
        geo_.cancel();
        geo_thread_.join();
    }
    if (!started_) return;
    started_ = false;

    source_.stop();
    dispatcher_.stop();
    geo_.stop();

    tracker_.reset();
    throttle_.reset();
    last_tracks_.clear();
    {
        std::lock_guard<std::mutex> lock(metrics_mu_);
        metrics_.mode = InferenceMode::Unknown;
        metrics_.tracked_count = 0;
    }
    std::cout << "[INFO] [pipeline] stopped" << std::endl;
}

void Pipeline::join() {
    std::unique_lock<std::mutex> lock(done_mu_);
    done_cv_.wait(lock, [this] { return !running_.load(); });
}

void Pipeline::run_loop() {
    while (running_) {
        if (tick() == TickOutcome::Fatal) {
            mark_stopped();
            break;
        }
    }
}

TickOutcome Pipeline::tick() {
    Frame frame;
    if (!source_.next(frame, std::chrono::milliseconds(cfg_.frame_wait_ms))) {
        return TickOutcome::NoFrame;
    }
    const double cycle_start = monotonic_seconds();
    const uint64_t cycle = cycle_++;

    fps_window_frames_++;
    const double window = cycle_start - fps_window_start_;
    if (window >= 1.0) {
        std::lock_guard<std::mutex> lock(metrics_mu_);
        metrics_.fps = fps_window_frames_ / window;
        metrics_.inference_fps = fps_window_inferences_ / window;
        fps_window_frames_ = 0;
        fps_window_inferences_ = 0;
        fps_window_start_ = cycle_start;
    }

    StageLatencies lat;
    double t = monotonic_seconds();
    const bool run = throttle_.should_run_inference(frame, cycle);
    lat.throttle_ms = ms_since(t);

    if (!run) {
        {
            std::lock_guard<std::mutex> lock(metrics_mu_);
            metrics_.frames++;
            metrics_.skipped++;
        }
        emit_preview(frame, last_tracks_);
        return TickOutcome::Skipped;
    }

    TickOutcome outcome = TickOutcome::Processed;
    std::string served_by;
    try {
        t = monotonic_seconds();
        LetterboxParams lb;
        cv::Mat input = letterbox(frame.image, cfg_.img_size, lb);
        lat.preprocess_ms = ms_since(t);

        t = monotonic_seconds();
        InferenceResult result = dispatcher_.detect(input);
        lat.inference_ms = ms_since(t);
        fps_window_inferences_++;

        std::vector<Observation> observations;
        if (result.ok()) {
            served_by = result.served_by;
            t = monotonic_seconds();
            observations = post_.to_observations(result.detections, lb, frame.width(), frame.height());
            lat.postprocess_ms = ms_since(t);
        } else if (result.error->severity == ErrorClass::Fatal) {
            report_fatal(std::string("inference: ") + result.error->message);
            return TickOutcome::Fatal;
        } else {
            std::cerr << "[WARN] [pipeline] inference failed ("
                      << inference_error_kind_to_string(result.error->kind) << "): "
                      << result.error->message << std::endl;
            outcome = TickOutcome::Failed;
        }

        t = monotonic_seconds();
        last_tracks_ = tracker_.update(observations, frame.timestamp_sec);
        lat.tracking_ms = ms_since(t);
        for (const auto& gone : tracker_.evicted()) {
            std::cout << "[INFO] [pipeline] hazard out of view: " << gone.class_label << " #" << gone.id << std::endl;
        }

        emit_saves(frame, last_tracks_);
    } catch (const cv::Exception& e) {
        std::cerr << "[ERROR] [pipeline] OpenCV error in cycle " << cycle << ": " << e.what() << std::endl;
        outcome = TickOutcome::Failed;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] [pipeline] cycle " << cycle << " failed: " << e.what() << std::endl;
        outcome = TickOutcome::Failed;
    }

    lat.cycle_ms = ms_since(cycle_start);
    throttle_.record_latency(lat.cycle_ms);

    if (outcome == TickOutcome::Failed) {
        note_failure("inference cycle failed");
    } else {
        note_success();
    }

    {
        std::lock_guard<std::mutex> lock(metrics_mu_);
        metrics_.frames++;
        metrics_.inferences++;
        metrics_.latency = lat;
        metrics_.skip_frames = throttle_.skip_frames();
        metrics_.average_latency_ms = throttle_.average_latency_ms();
        metrics_.tracked_count = tracker_.size();
        if (!served_by.empty()) metrics_.served_by = served_by;
    }

    emit_preview(frame, last_tracks_);
    return outcome;
}

void Pipeline::emit_saves(const Frame& frame, const std::vector<TrackedObject>& tracks) {
    for (const auto& obj : tracks) {
        if (!tracker_.should_save(obj, frame.timestamp_sec)) continue;

        SaveEvent ev;
        ev.tracked_object_id = obj.id;
        ev.frame_snapshot = frame.image.clone();
        ev.class_label = obj.class_label;
        ev.confidence = obj.confidence;
        ev.score = obj.best_score;
        ev.box = cv::Rect2f(obj.x - obj.width / 2.0f, obj.y - obj.height / 2.0f, obj.width, obj.height);
        ev.geo = geo_.current_best();
        ev.timestamp_sec = frame.timestamp_sec;
        ev.wall_time_iso = now_iso_utc();

        std::cout << "[INFO] [pipeline] hazard saved: " << ev.class_label << " #" << ev.tracked_object_id
                  << " conf=" << ev.confidence << std::endl;
        {
            std::lock_guard<std::mutex> lock(metrics_mu_);
            metrics_.saves++;
        }

        std::lock_guard<std::mutex> lock(callbacks_mu_);
        for (auto& cb : subscribers_) {
            try {
                cb(ev);
            } catch (const std::exception& e) {
                std::cerr << "[ERROR] [pipeline] save subscriber failed: " << e.what() << std::endl;
            }
        }
    }
}

void Pipeline::emit_preview(const Frame& frame, const std::vector<TrackedObject>& tracks) {
    std::lock_guard<std::mutex> lock(callbacks_mu_);
    if (!preview_) return;
    try {
        preview_(frame, tracks);
    } catch (const std::exception& e) {
        std::cerr << "[WARN] [pipeline] preview failed: " << e.what() << std::endl;
    }
}

void Pipeline::note_success() {
    bool cleared = false;
    {
        std::lock_guard<std::mutex> lock(metrics_mu_);
        metrics_.consecutive_failures = 0;
        if (metrics_.degraded) {
            metrics_.degraded = false;
            cleared = true;
        }
    }
    if (!cleared) return;
    std::cout << "[INFO] [pipeline] recovered from degraded mode" << std::endl;
    std::lock_guard<std::mutex> lock(callbacks_mu_);
    if (status_.on_degraded) status_.on_degraded(false, "");
}

void Pipeline::note_failure(const std::string& reason) {
    bool raised = false;
    {
        std::lock_guard<std::mutex> lock(metrics_mu_);
        metrics_.failures++;
        metrics_.consecutive_failures++;
        if (!metrics_.degraded && metrics_.consecutive_failures >= cfg_.degraded_after_failures) {
            metrics_.degraded = true;
            raised = true;
        }
    }
    if (!raised) return;
    std::cerr << "[WARN] [pipeline] degraded: " << reason << std::endl;
    std::lock_guard<std::mutex> lock(callbacks_mu_);
    if (status_.on_degraded) status_.on_degraded(true, reason);
}

void Pipeline::report_fatal(const std::string& error) {
    std::cerr << "[ERROR] [pipeline] fatal: " << error << std::endl;
    {
        std::lock_guard<std::mutex> lock(metrics_mu_);
        metrics_.failures++;
        metrics_.fatal_error = error;
    }
    std::lock_guard<std::mutex> lock(callbacks_mu_);
    if (status_.on_fatal) status_.on_fatal(error);
}

PipelineMetrics Pipeline::metrics() const {
    std::lock_guard<std::mutex> lock(metrics_mu_);
    PipelineMetrics m = metrics_;
    m.running = running_.load();
    if (m.running) m.uptime_sec = monotonic_seconds() - started_at_;
    if (m.running) m.mode = dispatcher_.mode();
    m.geo = geo_.current_best();
    return m;
}

}  // namespace hazard
