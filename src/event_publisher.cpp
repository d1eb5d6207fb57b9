#include "event_publisher.hpp"

#include <cctype>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <thread>

#include <opencv2/imgcodecs.hpp>

#include "http_util.hpp"

namespace hazard {

namespace {

std::string snapshot_name(const SaveEvent& ev) {
    std::string stamp;
    for (char c : ev.wall_time_iso) {
        if (std::isalnum(static_cast<unsigned char>(c))) stamp.push_back(c);
    }
    std::ostringstream oss;
    oss << "hazard_" << ev.tracked_object_id << "_" << stamp << ".jpg";
    return oss.str();
}

void ensure_parent_dir(const std::filesystem::path& p) {
    auto parent = p.parent_path();
    if (parent.empty()) return;
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
        std::cerr << "[WARN] [reports] cannot create " << parent.string() << ": " << ec.message() << std::endl;
    }
}

}  // namespace

std::string location_note_for(const std::optional<GeoFix>& geo) {
    if (!geo) return "Unknown";
    switch (geo->source) {
        case GeoSource::HighAccuracyGPS: return "GPS";
        case GeoSource::LowAccuracyGPS: return "GPS (low accuracy)";
        case GeoSource::IP: return "Approximate (IP)";
        case GeoSource::Default: return "Default location";
    }
    return "Unknown";
}

nlohmann::json report_to_json(const SaveEvent& ev) {
    nlohmann::json j;
    j["type"] = "hazard_report";
    j["tracked_object_id"] = ev.tracked_object_id;
    j["class_label"] = ev.class_label;
    j["confidence"] = ev.confidence;
    j["score"] = ev.score;
    j["box"] = {ev.box.x, ev.box.y, ev.box.width, ev.box.height};
    j["timestamp"] = ev.timestamp_sec;
    j["time"] = ev.wall_time_iso;
    if (ev.geo) {
        j["geo"] = {{"lat", ev.geo->lat}, {"lng", ev.geo->lng}, {"source", geo_source_to_string(ev.geo->source)}};
    } else {
        j["geo"] = nullptr;
    }
    j["location_note"] = location_note_for(ev.geo);
    return j;
}

JsonlReportSink::JsonlReportSink(std::string jsonl_path, std::string snapshot_dir)
    : jsonl_path_(std::move(jsonl_path)), snapshot_dir_(std::move(snapshot_dir)) {}

void JsonlReportSink::submit(const SaveEvent& ev) {
    nlohmann::json j = report_to_json(ev);

    std::lock_guard<std::mutex> lock(mu_);
    if (!snapshot_dir_.empty() && !ev.frame_snapshot.empty()) {
        std::filesystem::path snap = std::filesystem::path(snapshot_dir_) / snapshot_name(ev);
        ensure_parent_dir(snap);
        if (cv::imwrite(snap.string(), ev.frame_snapshot)) {
            j["snapshot"] = snap.string();
        } else {
            std::cerr << "[WARN] [reports] failed to write snapshot " << snap.string() << std::endl;
        }
    }

    ensure_parent_dir(jsonl_path_);
    std::ofstream f(jsonl_path_, std::ios::app);
    if (!f) {
        throw std::runtime_error("unable to open reports file: " + jsonl_path_);
    }
    f << j.dump() << "\n";
}

HttpReportSink::HttpReportSink(std::string upload_url, int timeout_ms, int retries)
    : upload_url_(std::move(upload_url)), timeout_ms_(timeout_ms), retries_(retries < 0 ? 0 : retries) {}

void HttpReportSink::submit(const SaveEvent& ev) {
    if (!ev.geo) {
        // The report service rejects uploads without coordinates.
        throw std::runtime_error("report for object " + std::to_string(ev.tracked_object_id) + " has no location");
    }

    std::vector<uchar> jpeg;
    if (ev.frame_snapshot.empty() || !cv::imencode(".jpg", ev.frame_snapshot, jpeg)) {
        throw std::runtime_error("cannot encode snapshot for object " + std::to_string(ev.tracked_object_id));
    }

    nlohmann::json geo = {{"lat", ev.geo->lat}, {"lng", ev.geo->lng}};
    httplib::MultipartFormDataItems items = {
        {"file", std::string(jpeg.begin(), jpeg.end()), "detection.jpg", "image/jpeg"},
        {"hazardTypes", ev.class_label, "", ""},
        {"geoData", geo.dump(), "", ""},
        {"locationNote", location_note_for(ev.geo), "", ""},
        {"timestamp", ev.wall_time_iso, "", ""},
        {"confidence", std::to_string(ev.confidence), "", ""},
    };

    const UrlParts parts = split_url(upload_url_);
    const std::string path = parts.path.empty() ? "/upload-detection" : parts.path;

    std::string last_error;
    for (int attempt = 0; attempt <= retries_; ++attempt) {
        if (attempt > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(500 * attempt));
        }
        auto cli = make_client(parts.origin, timeout_ms_);
        auto res = cli->Post(path, items);
        if (!res) {
            last_error = httplib::to_string(res.error());
        } else if (res->status >= 200 && res->status < 300) {
            return;
        } else if (res->status < 500) {
            throw std::runtime_error("report upload rejected with HTTP " + std::to_string(res->status));
        } else {
            last_error = "HTTP " + std::to_string(res->status);
        }
        std::cerr << "[WARN] [reports] upload attempt " << (attempt + 1) << " failed: " << last_error << std::endl;
    }
    throw std::runtime_error("report upload failed: " + last_error);
}

nlohmann::json read_reports(const std::string& jsonl_path) {
    nlohmann::json out = nlohmann::json::array();
    std::ifstream f(jsonl_path);
    if (!f) return out;
    std::string line;
    while (std::getline(f, line)) {
        if (line.empty()) continue;
        auto j = nlohmann::json::parse(line, nullptr, false);
        if (j.is_discarded()) continue;
        out.push_back(std::move(j));
    }
    return out;
}

ReportPublisher::ReportPublisher(size_t queue_size) : queue_(queue_size) {}

ReportPublisher::~ReportPublisher() {
    stop();
}

void ReportPublisher::add_sink(std::unique_ptr<ReportSink> sink) {
    if (running_) throw std::logic_error("add_sink after start");
    sinks_.push_back(std::move(sink));
}

void ReportPublisher::start() {
    if (running_.exchange(true)) return;
    if (queue_.stopped()) queue_.reset();
    worker_ = std::thread(&ReportPublisher::run, this);
}

void ReportPublisher::stop() {
    if (!running_.exchange(false)) return;
    queue_.stop();
    if (worker_.joinable()) worker_.join();
}

void ReportPublisher::publish(const SaveEvent& ev) {
    if (queue_.push(ev)) {
        dropped_++;
        std::cerr << "[WARN] [reports] queue full, dropped oldest pending report" << std::endl;
    }
}

void ReportPublisher::run() {
    SaveEvent ev;
    while (queue_.pop(ev)) {
        for (auto& sink : sinks_) {
            try {
                sink->submit(ev);
                delivered_++;
            } catch (const std::exception& e) {
                failed_++;
                std::cerr << "[ERROR] [reports] " << sink->name() << " sink: " << e.what() << std::endl;
            }
        }
    }
}

}  // namespace hazard
