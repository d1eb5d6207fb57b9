#pragma once

#include <map>
#include <string>
#include <vector>

namespace hazard {

struct ThrottleConfig {
    int initial_skip{1};
    int max_skip{6};
    double target_fps{15.0};
    size_t history_size{8};
    double slow_factor{1.8};          // avg latency above target * slow_factor -> skip more
    double fast_factor{0.6};          // avg latency below target * fast_factor -> skip less
    bool motion_gate{true};
    double motion_threshold{1.5};     // mean abs gray diff on the thumbnail, 0..255
    int motion_thumb_width{64};
    int max_static_skips{2};          // run anyway after this many motion-gated skips, 0 = never
};

struct TrackerConfig {
    float match_distance{100.0f};     // px, source-frame space
    int stale_after_missed{5};
    double evict_timeout_sec{3.0};
    float confidence_floor{0.2f};
    int stability_frames{5};
    float score_alpha{0.3f};          // weight of the new score in detection_confidence
    float smooth_min{0.3f};           // weight of the old position at stability 0
    float smooth_max{0.7f};           // weight of the old position at stability 1
    float miss_decay{0.85f};
    float weight_detection{0.6f};
    float weight_stability{0.4f};

    float save_min_confidence{0.6f};
    float save_min_stability{0.9f};
    float save_min_area{400.0f};
    double save_cooldown_sec{3.0};
};

struct ClassFilter {
    float threshold{0.0f};            // 0 = use the global threshold
    float max_area{0.0f};             // 0 = unbounded
    float min_aspect{0.0f};
    float max_aspect{0.0f};           // 0 = unbounded
};

struct PostprocessConfig {
    float conf_threshold{0.5f};
    float min_width{4.0f};
    float min_height{4.0f};
    float min_area{25.0f};
    std::map<std::string, ClassFilter> class_filters;
};

struct DispatcherConfig {
    std::vector<std::string> remote_urls;   // tried in order, empty = local only
    bool legacy_fallback{true};
    int probe_timeout_ms{5000};
    int detect_timeout_ms{10000};
    int health_interval_ms{30000};
    int jpeg_quality{80};

    std::string model_path{"models/hazard_detector.onnx"};
    bool use_ort{true};               // use ONNX Runtime when available
    bool has_objectness{false};       // yolov5-style output rows
    float local_min_score{0.1f};
    float nms_threshold{0.45f};
};

struct GeoConfig {
    std::string gps_device{};         // NMEA serial device, empty = no GPS
    int gps_baud{9600};
    double gps_max_hdop_high{2.0};
    int high_accuracy_timeout_ms{10000};
    int low_accuracy_timeout_ms{8000};
    std::vector<std::string> ip_lookup_urls{"http://ip-api.com/json"};
    int ip_timeout_ms{5000};
    bool default_enabled{true};
    double default_lat{32.0853};
    double default_lng{34.7818};
    int watch_interval_ms{5000};
};

struct ReportConfig {
    std::string jsonl_path{"reports.jsonl"};
    std::string snapshot_dir{"snapshots"};
    std::string upload_url{};         // empty = no HTTP upload
    int upload_timeout_ms{10000};
    int upload_retries{2};
    size_t queue_size{16};
};

struct AppConfig {
    std::string source{"0"};          // camera index as string or URL/RTSP
    std::string class_names_path{};   // optional path to names file
    std::vector<std::string> class_names{"crack", "knocked", "pothole", "surface_damage"};
    int img_size{640};
    int target_fps{30};               // capture rate
    bool show_window{false};          // optional OpenCV window for local debug
    int frame_wait_ms{500};
    int degraded_after_failures{5};
    std::string http_bind{"0.0.0.0"};
    int http_port{8000};

    ThrottleConfig throttle;
    TrackerConfig tracker;
    PostprocessConfig post;
    DispatcherConfig dispatcher;
    GeoConfig geo;
    ReportConfig reports;
};

AppConfig parse_args(int argc, char** argv);

// Overlays the keys present in a JSON file onto cfg. Throws PipelineError on
// unreadable or malformed files.
void load_config_file(const std::string& path, AppConfig& cfg);

std::vector<std::string> load_class_names(const std::string& path);

std::vector<std::string> split_list(const std::string& s, char sep = ',');

}  // namespace hazard
