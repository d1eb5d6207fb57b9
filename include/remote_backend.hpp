#pragma once

#include <mutex>
#include <string>
#include <vector>

#include "config.hpp"
#include "inference_backend.hpp"

namespace hazard {

// Parses a detection service reply. Accepts "box" or "bbox" corners,
// "score" or "confidence", and "class_id" or a "label" looked up in
// class_names. Returns false with err set when the payload is malformed.
bool parse_detection_response(const std::string& body,
                              const std::vector<std::string>& class_names,
                              std::vector<RawDetection>& out,
                              std::string& err);

class HttpRemoteInference : public RemoteInference {
public:
    HttpRemoteInference(const DispatcherConfig& cfg, std::vector<std::string> class_names);

    bool probe() override;
    InferenceResult detect(const cv::Mat& model_input) override;
    bool has_legacy() const override { return cfg_.legacy_fallback; }
    InferenceResult detect_legacy(const cv::Mat& model_input) override;
    std::string active_endpoint() const override;

    // Ends the remote session, if one was opened.
    void end_session();

private:
    bool probe_endpoint(const std::string& url);
    bool ensure_session(const std::string& url, std::string& session, std::string& err);
    InferenceResult post_frame(const std::string& url, const std::string& path, const cv::Mat& model_input,
                               const char* tag);
    bool encode_jpeg(const cv::Mat& image, std::string& out) const;

    DispatcherConfig cfg_;
    std::vector<std::string> class_names_;

    mutable std::mutex mu_;
    std::string active_;
    std::string session_id_;
};

}  // namespace hazard
