#include "remote_backend.hpp"

#include <algorithm>
#include <iostream>
#include <opencv2/imgcodecs.hpp>

#include <nlohmann/json.hpp>

#include "http_util.hpp"

namespace hazard {

namespace {

bool read_box(const nlohmann::json& item, std::array<float, 4>& box) {
    const char* key = item.contains("box") ? "box" : (item.contains("bbox") ? "bbox" : nullptr);
    if (!key) return false;
    const auto& b = item[key];
    if (!b.is_array() || b.size() != 4) return false;
    for (size_t i = 0; i < 4; ++i) {
        if (!b[i].is_number()) return false;
        box[i] = b[i].get<float>();
    }
    return true;
}

bool read_score(const nlohmann::json& item, float& score) {
    const char* key = item.contains("score") ? "score" : (item.contains("confidence") ? "confidence" : nullptr);
    if (!key || !item[key].is_number()) return false;
    score = item[key].get<float>();
    return true;
}

bool read_class(const nlohmann::json& item, const std::vector<std::string>& names, int& class_id) {
    if (item.contains("class_id") && item["class_id"].is_number()) {
        class_id = item["class_id"].get<int>();
        return true;
    }
    for (const char* key : {"label", "class_name"}) {
        if (!item.contains(key) || !item[key].is_string()) continue;
        const auto label = item[key].get<std::string>();
        auto it = std::find(names.begin(), names.end(), label);
        if (it == names.end()) return false;
        class_id = static_cast<int>(it - names.begin());
        return true;
    }
    return false;
}

}  // namespace

const char* inference_error_kind_to_string(InferenceError::Kind k) {
    switch (k) {
        case InferenceError::Kind::Timeout: return "timeout";
        case InferenceError::Kind::BadStatus: return "bad_status";
        case InferenceError::Kind::MalformedPayload: return "malformed_payload";
        case InferenceError::Kind::Transport: return "transport";
        case InferenceError::Kind::NotLoaded: return "not_loaded";
        case InferenceError::Kind::NoBackend: return "no_backend";
        case InferenceError::Kind::Internal: return "internal";
    }
    return "internal";
}

bool parse_detection_response(const std::string& body,
                              const std::vector<std::string>& class_names,
                              std::vector<RawDetection>& out,
                              std::string& err) {
    out.clear();
    nlohmann::json j = nlohmann::json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        err = "response is not a JSON object";
        return false;
    }
    if (j.contains("success") && j["success"].is_boolean() && !j["success"].get<bool>()) {
        err = "service reported success=false";
        return false;
    }
    if (!j.contains("detections") || !j["detections"].is_array()) {
        err = "missing detections array";
        return false;
    }

    size_t skipped = 0;
    for (const auto& item : j["detections"]) {
        RawDetection d;
        if (!item.is_object() || !read_box(item, d.box) || !read_score(item, d.score) ||
            !read_class(item, class_names, d.class_id)) {
            skipped++;
            continue;
        }
        out.push_back(d);
    }
    if (skipped > 0) {
        std::cerr << "[WARN] [remote] skipped " << skipped << " unreadable detection(s)" << std::endl;
    }
    return true;
}

HttpRemoteInference::HttpRemoteInference(const DispatcherConfig& cfg, std::vector<std::string> class_names)
    : cfg_(cfg), class_names_(std::move(class_names)) {}

std::string HttpRemoteInference::active_endpoint() const {
    std::lock_guard<std::mutex> lock(mu_);
    return active_;
}

bool HttpRemoteInference::probe_endpoint(const std::string& url) {
    const UrlParts parts = split_url(url);
    auto cli = make_client(parts.origin, cfg_.probe_timeout_ms);
    auto res = cli->Get(join_path(parts.path, "/health"));
    if (!res) {
        std::cerr << "[WARN] [remote] health probe " << url << " failed: " << httplib::to_string(res.error()) << std::endl;
        return false;
    }
    if (res->status < 200 || res->status >= 300) {
        std::cerr << "[WARN] [remote] health probe " << url << " returned HTTP " << res->status << std::endl;
        return false;
    }
    nlohmann::json j = nlohmann::json::parse(res->body, nullptr, false);
    if (!j.is_discarded() && j.is_object() && j.contains("status") && j["status"].is_string()) {
        const auto status = j["status"].get<std::string>();
        if (status != "ok" && status != "healthy" && status != "ready") {
            std::cerr << "[WARN] [remote] " << url << " not ready: " << status << std::endl;
            return false;
        }
    }
    return true;
}

bool HttpRemoteInference::probe() {
    for (const auto& url : cfg_.remote_urls) {
        if (probe_endpoint(url)) {
            std::lock_guard<std::mutex> lock(mu_);
            if (active_ != url) session_id_.clear();
            active_ = url;
            return true;
        }
    }
    return false;
}

bool HttpRemoteInference::encode_jpeg(const cv::Mat& image, std::string& out) const {
    std::vector<uchar> buf;
    const std::vector<int> params{cv::IMWRITE_JPEG_QUALITY, std::clamp(cfg_.jpeg_quality, 10, 100)};
    try {
        if (!cv::imencode(".jpg", image, buf, params)) return false;
    } catch (const cv::Exception& e) {
        std::cerr << "[WARN] [remote] JPEG encode failed: " << e.what() << std::endl;
        return false;
    }
    out.assign(buf.begin(), buf.end());
    return true;
}

bool HttpRemoteInference::ensure_session(const std::string& url, std::string& session, std::string& err) {
    {
        std::lock_guard<std::mutex> lock(mu_);
        session = session_id_;
    }
    if (!session.empty()) return true;

    const UrlParts parts = split_url(url);
    auto cli = make_client(parts.origin, cfg_.probe_timeout_ms);
    auto res = cli->Post(join_path(parts.path, "/session/start"), "{}", "application/json");
    if (!res) {
        err = "session start failed: " + httplib::to_string(res.error());
        return false;
    }
    if (res->status < 200 || res->status >= 300) {
        err = "session start returned HTTP " + std::to_string(res->status);
        return false;
    }
    nlohmann::json j = nlohmann::json::parse(res->body, nullptr, false);
    if (j.is_discarded() || !j.is_object() || !j.contains("session_id")) {
        err = "session start reply has no session_id";
        return false;
    }
    const auto& sid = j["session_id"];
    session = sid.is_string() ? sid.get<std::string>() : sid.dump();

    std::lock_guard<std::mutex> lock(mu_);
    session_id_ = session;
    std::cout << "[INFO] [remote] session " << session << " opened on " << url << std::endl;
    return true;
}

void HttpRemoteInference::end_session() {
    std::string url;
    std::string session;
    {
        std::lock_guard<std::mutex> lock(mu_);
        url = active_;
        session.swap(session_id_);
    }
    if (url.empty() || session.empty()) return;
    const UrlParts parts = split_url(url);
    auto cli = make_client(parts.origin, cfg_.probe_timeout_ms);
    auto res = cli->Post(join_path(parts.path, "/session/" + session + "/end"), "{}", "application/json");
    if (!res) {
        std::cerr << "[WARN] [remote] session end failed: " << httplib::to_string(res.error()) << std::endl;
    }
}

InferenceResult HttpRemoteInference::post_frame(const std::string& url, const std::string& path,
                                                const cv::Mat& model_input, const char* tag) {
    std::string jpeg;
    if (!encode_jpeg(model_input, jpeg)) {
        return InferenceResult::failure(InferenceError::Kind::Internal, "could not encode frame");
    }

    const UrlParts parts = split_url(url);
    auto cli = make_client(parts.origin, cfg_.detect_timeout_ms);
    httplib::MultipartFormDataItems items = {
        {"file", jpeg, "frame.jpg", "image/jpeg"},
    };
    auto res = cli->Post(join_path(parts.path, path), items);
    if (!res) {
        const auto err = res.error();
        const auto kind = (err == httplib::Error::Read || err == httplib::Error::Connection)
                              ? InferenceError::Kind::Timeout
                              : InferenceError::Kind::Transport;
        return InferenceResult::failure(kind, std::string(tag) + ": " + httplib::to_string(err));
    }
    if (res->status < 200 || res->status >= 300) {
        return InferenceResult::failure(InferenceError::Kind::BadStatus,
                                        std::string(tag) + ": HTTP " + std::to_string(res->status));
    }

    InferenceResult result;
    std::string err;
    if (!parse_detection_response(res->body, class_names_, result.detections, err)) {
        return InferenceResult::failure(InferenceError::Kind::MalformedPayload, std::string(tag) + ": " + err);
    }
    result.served_by = tag;
    return result;
}

InferenceResult HttpRemoteInference::detect(const cv::Mat& model_input) {
    const std::string url = active_endpoint();
    if (url.empty()) {
        return InferenceResult::failure(InferenceError::Kind::Transport, "no active remote endpoint");
    }
    std::string session;
    std::string err;
    if (!ensure_session(url, session, err)) {
        return InferenceResult::failure(InferenceError::Kind::Transport, err);
    }
    auto result = post_frame(url, "/detect/" + session, model_input, "remote");
    if (!result.ok() && result.error->kind == InferenceError::Kind::BadStatus) {
        // Sessions expire server side; open a fresh one on the next call.
        std::lock_guard<std::mutex> lock(mu_);
        session_id_.clear();
    }
    return result;
}

InferenceResult HttpRemoteInference::detect_legacy(const cv::Mat& model_input) {
    const std::string url = active_endpoint();
    if (url.empty()) {
        return InferenceResult::failure(InferenceError::Kind::Transport, "no active remote endpoint");
    }
    return post_frame(url, "/detect", model_input, "remote-legacy");
}

}  // namespace hazard
