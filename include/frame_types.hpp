#pragma once

#include <opencv2/core.hpp>
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace hazard {

struct Frame {
    cv::Mat image;                 // BGR image
    double timestamp_sec{0.0};     // monotonic clock seconds
    uint64_t seq{0};

    int width() const { return image.cols; }
    int height() const { return image.rows; }
};

// Box corners are in model-input (letterboxed square) pixels.
struct RawDetection {
    std::array<float, 4> box{};    // x1, y1, x2, y2
    float score{0.0f};
    int class_id{-1};
};

struct LetterboxParams {
    float scale{1.0f};
    int new_w{0};
    int new_h{0};
    int offset_x{0};
    int offset_y{0};
    int target_size{0};
};

struct Observation {
    float center_x{0.0f};
    float center_y{0.0f};
    float width{0.0f};
    float height{0.0f};
    float area{0.0f};
    std::string class_label;
    float score{0.0f};
};

enum class TrackState { New, Tracked, Stale, Evicted };

inline const char* track_state_to_string(TrackState s) {
    switch (s) {
        case TrackState::New: return "new";
        case TrackState::Tracked: return "tracked";
        case TrackState::Stale: return "stale";
        case TrackState::Evicted: return "evicted";
    }
    return "new";
}

struct TrackedObject {
    uint64_t id{0};
    float x{0.0f};
    float y{0.0f};
    float width{0.0f};
    float height{0.0f};
    float area{0.0f};
    std::string class_label;

    double first_seen{0.0};
    double last_seen{0.0};

    float detection_confidence{0.0f};
    float stability{0.0f};
    float confidence{0.0f};
    float best_score{0.0f};

    int hits{0};
    int missed_frames{0};
    TrackState state{TrackState::New};
    std::optional<double> last_saved_at;
};

enum class GeoSource { HighAccuracyGPS, LowAccuracyGPS, IP, Default };

inline const char* geo_source_to_string(GeoSource s) {
    switch (s) {
        case GeoSource::HighAccuracyGPS: return "gps_high";
        case GeoSource::LowAccuracyGPS: return "gps_low";
        case GeoSource::IP: return "ip";
        case GeoSource::Default: return "default";
    }
    return "default";
}

struct GeoFix {
    double lat{0.0};
    double lng{0.0};
    GeoSource source{GeoSource::Default};
    double acquired_at{0.0};       // monotonic clock seconds
};

struct SaveEvent {
    uint64_t tracked_object_id{0};
    cv::Mat frame_snapshot;
    std::string class_label;
    float confidence{0.0f};
    float score{0.0f};
    cv::Rect2f box;                // source-frame pixels
    std::optional<GeoFix> geo;
    double timestamp_sec{0.0};
    std::string wall_time_iso;
};

double monotonic_seconds();
std::string now_iso_utc();

}  // namespace hazard
