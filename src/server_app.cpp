#include "server_app.hpp"

#include <iostream>
#include <stdexcept>
#include <unistd.h>

#include "errors.hpp"

namespace hazard {

namespace {

void reply_json(httplib::Response& res, const nlohmann::json& j, int status = 200) {
    res.status = status;
    res.set_content(j.dump(), "application/json");
}

}  // namespace

StartRequest parse_start_request(const std::string& body) {
    StartRequest req;
    if (body.find_first_not_of(" \t\r\n") == std::string::npos) return req;

    nlohmann::json j = nlohmann::json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        throw std::invalid_argument("request body must be a JSON object");
    }
    if (j.contains("source")) {
        if (!j["source"].is_string()) throw std::invalid_argument("\"source\" must be a string");
        req.source = j["source"].get<std::string>();
    }
    if (j.contains("model")) {
        if (!j["model"].is_string()) throw std::invalid_argument("\"model\" must be a string");
        req.model = j["model"].get<std::string>();
    }
    if (j.contains("conf")) {
        if (!j["conf"].is_number()) throw std::invalid_argument("\"conf\" must be a number");
        const float conf = j["conf"].get<float>();
        if (conf < 0.0f || conf > 1.0f) throw std::invalid_argument("\"conf\" must be within [0, 1]");
        req.conf = conf;
    }
    return req;
}

AppConfig apply_start_request(const AppConfig& base, const StartRequest& req) {
    AppConfig cfg = base;
    if (req.source) cfg.source = *req.source;
    if (req.model) cfg.dispatcher.model_path = *req.model;
    if (req.conf) cfg.post.conf_threshold = *req.conf;
    return cfg;
}

nlohmann::json metrics_to_json(const PipelineMetrics& m) {
    nlohmann::json j;
    j["running"] = m.running;
    j["uptime_sec"] = m.uptime_sec;
    j["fps"] = m.fps;
    j["inference_fps"] = m.inference_fps;
    j["tracked_count"] = m.tracked_count;
    j["mode"] = inference_mode_to_string(m.mode);
    j["served_by"] = m.served_by;
    j["frames"] = m.frames;
    j["inferences"] = m.inferences;
    j["skipped"] = m.skipped;
    j["saves"] = m.saves;
    j["failures"] = m.failures;
    j["consecutive_failures"] = m.consecutive_failures;
    j["skip_frames"] = m.skip_frames;
    j["average_latency_ms"] = m.average_latency_ms;
    j["latency_ms"] = {
        {"throttle", m.latency.throttle_ms},
        {"preprocess", m.latency.preprocess_ms},
        {"inference", m.latency.inference_ms},
        {"postprocess", m.latency.postprocess_ms},
        {"tracking", m.latency.tracking_ms},
        {"cycle", m.latency.cycle_ms},
    };
    j["degraded"] = m.degraded;
    j["fatal_error"] = m.fatal_error ? nlohmann::json(*m.fatal_error) : nlohmann::json(nullptr);
    if (m.geo) {
        j["geo"] = {{"lat", m.geo->lat}, {"lng", m.geo->lng}, {"source", geo_source_to_string(m.geo->source)}};
    } else {
        j["geo"] = nullptr;
    }
    return j;
}

ServerApp::ServerApp(const AppConfig& cfg) : cfg_(cfg) {}

ServerApp::~ServerApp() {
    stop();
}

void ServerApp::start() {
    if (http_running_.exchange(true)) return;
    http_srv_ = std::make_unique<httplib::Server>();
    setup_routes();
    http_thread_ = std::thread(&ServerApp::run_http, this);
}

void ServerApp::stop() {
    stop_pipeline();
    if (http_srv_) http_srv_->stop();
    if (http_thread_.joinable()) http_thread_.join();
    http_srv_.reset();
    http_running_ = false;
}

void ServerApp::run_http() {
    std::cout << "[INFO] [server] listening on http://" << cfg_.http_bind << ":" << cfg_.http_port << std::endl;
    if (!http_srv_->listen(cfg_.http_bind, cfg_.http_port)) {
        std::cerr << "[ERROR] [server] cannot listen on " << cfg_.http_bind << ":" << cfg_.http_port << std::endl;
    }
    http_running_ = false;
}

void ServerApp::setup_routes() {
    http_srv_->Get("/health", [](const httplib::Request&, httplib::Response& res) {
        reply_json(res, {{"status", "ok"}});
    });

    http_srv_->Post("/pipeline/start", [this](const httplib::Request& req, httplib::Response& res) {
        StartRequest start;
        try {
            start = parse_start_request(req.body);
        } catch (const std::invalid_argument& e) {
            reply_json(res, {{"error", e.what()}}, 400);
            return;
        }
        if (auto err = start_pipeline(start)) {
            auto body = status();
            body["error"] = *err;
            reply_json(res, body, 500);
            return;
        }
        reply_json(res, status());
    });

    http_srv_->Post("/pipeline/stop", [this](const httplib::Request&, httplib::Response& res) {
        stop_pipeline();
        reply_json(res, status());
    });

    http_srv_->Get("/pipeline/status", [this](const httplib::Request&, httplib::Response& res) {
        reply_json(res, status());
    });

    http_srv_->Get("/reports", [this](const httplib::Request&, httplib::Response& res) {
        reply_json(res, read_reports(cfg_.reports.jsonl_path));
    });

    http_srv_->set_default_headers({{"Cache-Control", "no-store"}});
}

std::optional<std::string> ServerApp::start_pipeline(const StartRequest& req) {
    std::lock_guard<std::mutex> lock(pipeline_mu_);
    if (app_ && app_->pipeline().running()) return std::nullopt;
    if (app_) {
        app_->stop();
        app_.reset();
    }

    const AppConfig cfg = apply_start_request(cfg_, req);
    try {
        auto app = std::make_unique<HazardApp>(cfg);
        app->start();
        app_ = std::move(app);
        last_error_.reset();
        return std::nullopt;
    } catch (const PipelineError& e) {
        std::cerr << "[ERROR] [server] pipeline start failed (" << error_class_to_string(e.error_class())
                  << "): " << e.what() << std::endl;
        last_error_ = e.what();
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] [server] pipeline start failed: " << e.what() << std::endl;
        last_error_ = e.what();
    }
    return last_error_;
}

void ServerApp::stop_pipeline() {
    std::lock_guard<std::mutex> lock(pipeline_mu_);
    if (!app_) return;
    app_->stop();
    app_.reset();
}

nlohmann::json ServerApp::status() const {
    std::lock_guard<std::mutex> lock(pipeline_mu_);
    nlohmann::json j;
    j["pid"] = static_cast<int>(::getpid());

    const AppConfig& args = app_ ? app_->config() : cfg_;
    j["args"] = {
        {"VIDEO_SOURCE", args.source},
        {"IMG_SIZE", args.img_size},
        {"FPS", args.target_fps},
        {"HAZARD_MODEL", args.dispatcher.model_path},
        {"HAZARD_CONF", args.post.conf_threshold},
        {"REMOTE_URLS", args.dispatcher.remote_urls},
    };

    if (app_) {
        auto m = metrics_to_json(app_->pipeline().metrics());
        j["running"] = m["running"];
        j["uptime_sec"] = m["uptime_sec"];
        j["metrics"] = m;
        j["reports"] = {
            {"delivered", app_->reports().delivered()},
            {"failed", app_->reports().failed()},
            {"dropped", app_->reports().dropped()},
        };
    } else {
        j["running"] = false;
        j["uptime_sec"] = 0.0;
        j["metrics"] = nullptr;
    }
    j["last_error"] = last_error_ ? nlohmann::json(*last_error_) : nlohmann::json(nullptr);
    return j;
}

}  // namespace hazard
