#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <mutex>
#include <thread>

#include <opencv2/highgui.hpp>
#include <opencv2/imgproc.hpp>

#include "config.hpp"
#include "errors.hpp"
#include "hazard_app.hpp"

using namespace std::chrono_literals;

namespace {

std::atomic<bool> g_stop{false};
void on_signal(int) { g_stop = true; }

cv::Scalar color_for(const hazard::TrackedObject& obj) {
    switch (obj.state) {
        case hazard::TrackState::New: return cv::Scalar(0, 255, 255);
        case hazard::TrackState::Tracked: return cv::Scalar(0, 0, 255);
        default: return cv::Scalar(160, 160, 160);
    }
}

// Latest annotated frame, handed from the pipeline thread to the UI thread.
struct PreviewSlot {
    std::mutex mu;
    cv::Mat view;
    bool fresh{false};
};

}  // namespace

int main(int argc, char** argv) {
    hazard::AppConfig cfg;
    try {
        cfg = hazard::parse_args(argc, argv);
    } catch (const hazard::PipelineError& e) {
        std::cerr << "[ERROR] " << e.what() << std::endl;
        return 2;
    }

    std::cout << "[INFO] Starting hazard-node pipeline\n";
    std::cout << "       source : " << cfg.source << "\n";
    std::cout << "       model  : " << cfg.dispatcher.model_path << "\n";
    std::cout << "       remote : " << (cfg.dispatcher.remote_urls.empty() ? "none" : cfg.dispatcher.remote_urls.front()) << "\n";
    std::cout << "       reports: " << cfg.reports.jsonl_path << "\n";
    std::cout << "       ORT    : " << (cfg.dispatcher.use_ort ? "enabled" : "disabled (OpenCV DNN fallback)") << "\n";

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    hazard::HazardApp app(cfg);
    PreviewSlot slot;

    hazard::StatusListener listener;
    listener.on_mode_change = [](hazard::InferenceMode from, hazard::InferenceMode to) {
        std::cout << "[INFO] Inference " << hazard::inference_mode_to_string(from) << " -> "
                  << hazard::inference_mode_to_string(to) << std::endl;
    };
    listener.on_degraded = [](bool degraded, const std::string& reason) {
        if (degraded) {
            std::cerr << "[WARN] Pipeline degraded: " << reason << std::endl;
        } else {
            std::cout << "[INFO] Pipeline healthy again" << std::endl;
        }
    };
    listener.on_fatal = [](const std::string& error) {
        std::cerr << "[ERROR] Pipeline halted: " << error << std::endl;
    };
    app.pipeline().set_status_listener(listener);

    if (cfg.show_window) {
        app.pipeline().set_preview([&app, &slot](const hazard::Frame& frame,
                                                 const std::vector<hazard::TrackedObject>& tracks) {
            cv::Mat view = frame.image.clone();
            for (const auto& obj : tracks) {
                cv::Rect box(cvRound(obj.x - obj.width / 2), cvRound(obj.y - obj.height / 2),
                             cvRound(obj.width), cvRound(obj.height));
                cv::rectangle(view, box, color_for(obj), 2);
                std::string label = cv::format("%s #%llu %.2f", obj.class_label.c_str(),
                                               static_cast<unsigned long long>(obj.id), obj.confidence);
                cv::putText(view, label, cv::Point(box.x, std::max(12, box.y - 6)),
                            cv::FONT_HERSHEY_SIMPLEX, 0.5, color_for(obj), 1);
            }
            const auto m = app.pipeline().metrics();
            std::string status = cv::format("FPS: %.1f | %s | skip %d | tracked %zu",
                                            m.fps, hazard::inference_mode_to_string(m.mode),
                                            m.skip_frames, m.tracked_count);
            cv::putText(view, status, cv::Point(12, view.rows - 12),
                        cv::FONT_HERSHEY_SIMPLEX, 0.7, cv::Scalar(255, 255, 255), 2);

            std::lock_guard<std::mutex> lock(slot.mu);
            slot.view = view;
            slot.fresh = true;
        });
    }

    try {
        app.start();
    } catch (const hazard::PipelineError& e) {
        std::cerr << "[ERROR] Cannot start pipeline (" << hazard::error_class_to_string(e.error_class())
                  << "): " << e.what() << std::endl;
        return 1;
    }

    while (!g_stop && app.pipeline().running()) {
        if (!cfg.show_window) {
            std::this_thread::sleep_for(200ms);
            continue;
        }
        cv::Mat view;
        {
            std::lock_guard<std::mutex> lock(slot.mu);
            if (slot.fresh) {
                view = slot.view;
                slot.fresh = false;
            }
        }
        if (!view.empty()) cv::imshow("Hazard Node", view);
        int key = cv::waitKey(15);
        if (key == 'q' || key == 27) g_stop = true;
    }

    const auto m = app.pipeline().metrics();
    app.stop();
    if (cfg.show_window) cv::destroyAllWindows();
    std::cout << "[INFO] Stopped hazard-node pipeline (" << m.frames << " frames, " << m.saves << " reports)\n";
    return m.fatal_error ? 1 : 0;
}
