#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

#include "config.hpp"
#include "hazard_app.hpp"
#include "pipeline.hpp"

#include <httplib.h>

namespace hazard {

// Overrides accepted by POST /pipeline/start.
struct StartRequest {
    std::optional<std::string> source;
    std::optional<std::string> model;
    std::optional<float> conf;
};

// Parses a /pipeline/start body. An empty body is valid. Throws
// std::invalid_argument on malformed JSON or mistyped fields.
StartRequest parse_start_request(const std::string& body);

AppConfig apply_start_request(const AppConfig& base, const StartRequest& req);

nlohmann::json metrics_to_json(const PipelineMetrics& m);

// HTTP control API: start/stop/status of one pipeline plus the saved reports.
class ServerApp {
public:
    explicit ServerApp(const AppConfig& cfg);
    ~ServerApp();

    void start();
    void stop();
    bool listening() const { return http_running_.load(); }

private:
    void run_http();
    void setup_routes();

    // Returns an error message when the pipeline could not start.
    std::optional<std::string> start_pipeline(const StartRequest& req);
    void stop_pipeline();
    nlohmann::json status() const;

    AppConfig cfg_;
    std::atomic<bool> http_running_{false};
    std::thread http_thread_;
    std::unique_ptr<httplib::Server> http_srv_;

    mutable std::mutex pipeline_mu_;
    std::unique_ptr<HazardApp> app_;
    std::optional<std::string> last_error_;
};

}  // namespace hazard
