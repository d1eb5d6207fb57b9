#pragma once

#include <opencv2/core.hpp>
#include <optional>
#include <string>
#include <vector>

#include "errors.hpp"
#include "frame_types.hpp"

namespace hazard {

enum class InferenceMode { Unknown, Remote, Local };

inline const char* inference_mode_to_string(InferenceMode m) {
    switch (m) {
        case InferenceMode::Remote: return "remote";
        case InferenceMode::Local: return "local";
        default: return "unknown";
    }
}

struct InferenceError {
    enum class Kind { Timeout, BadStatus, MalformedPayload, Transport, NotLoaded, NoBackend, Internal };

    Kind kind{Kind::Internal};
    ErrorClass severity{ErrorClass::Transient};
    std::string message;
};

const char* inference_error_kind_to_string(InferenceError::Kind k);

struct InferenceResult {
    std::vector<RawDetection> detections;
    std::optional<InferenceError> error;
    std::string served_by;     // informational tag only

    bool ok() const { return !error.has_value(); }

    static InferenceResult failure(InferenceError::Kind kind, std::string message,
                                   ErrorClass severity = ErrorClass::Transient) {
        InferenceResult r;
        r.error = InferenceError{kind, severity, std::move(message)};
        return r;
    }
};

// Remote detection service. Implementations bound every call by their own
// timeouts.
class RemoteInference {
public:
    virtual ~RemoteInference() = default;

    // Tries candidate endpoints in order and keeps the first ready one active.
    virtual bool probe() = 0;
    virtual InferenceResult detect(const cv::Mat& model_input) = 0;
    virtual bool has_legacy() const = 0;
    virtual InferenceResult detect_legacy(const cv::Mat& model_input) = 0;
    virtual std::string active_endpoint() const = 0;
};

// In-process model with a one-time load.
class LocalInference {
public:
    virtual ~LocalInference() = default;

    virtual bool load() = 0;
    virtual bool loaded() const = 0;
    virtual InferenceResult detect(const cv::Mat& model_input) = 0;
};

}  // namespace hazard
