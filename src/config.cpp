#include "config.hpp"

#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <string>

#include <nlohmann/json.hpp>

#include "errors.hpp"

namespace hazard {

static bool arg_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

namespace {

// Model input side; anything but a whole positive number is fatal.
int parse_img_size(const char* text, const std::string& origin) {
    char* end = nullptr;
    const long v = std::strtol(text, &end, 10);
    if (end == text || *end != '\0' || v <= 0 || v > 8192) {
        throw PipelineError(ErrorClass::Fatal, origin + " must be a positive integer, got \"" + text + "\"");
    }
    return static_cast<int>(v);
}

template <typename T>
void read_key(const nlohmann::json& j, const char* key, T& out) {
    if (j.contains(key)) out = j[key].get<T>();
}

void read_throttle(const nlohmann::json& j, ThrottleConfig& t) {
    read_key(j, "initial_skip", t.initial_skip);
    read_key(j, "max_skip", t.max_skip);
    read_key(j, "target_fps", t.target_fps);
    read_key(j, "history_size", t.history_size);
    read_key(j, "slow_factor", t.slow_factor);
    read_key(j, "fast_factor", t.fast_factor);
    read_key(j, "motion_gate", t.motion_gate);
    read_key(j, "motion_threshold", t.motion_threshold);
    read_key(j, "motion_thumb_width", t.motion_thumb_width);
    read_key(j, "max_static_skips", t.max_static_skips);
}

void read_tracker(const nlohmann::json& j, TrackerConfig& t) {
    read_key(j, "match_distance", t.match_distance);
    read_key(j, "stale_after_missed", t.stale_after_missed);
    read_key(j, "evict_timeout_sec", t.evict_timeout_sec);
    read_key(j, "confidence_floor", t.confidence_floor);
    read_key(j, "stability_frames", t.stability_frames);
    read_key(j, "score_alpha", t.score_alpha);
    read_key(j, "smooth_min", t.smooth_min);
    read_key(j, "smooth_max", t.smooth_max);
    read_key(j, "miss_decay", t.miss_decay);
    read_key(j, "weight_detection", t.weight_detection);
    read_key(j, "weight_stability", t.weight_stability);
    read_key(j, "save_min_confidence", t.save_min_confidence);
    read_key(j, "save_min_stability", t.save_min_stability);
    read_key(j, "save_min_area", t.save_min_area);
    read_key(j, "save_cooldown_sec", t.save_cooldown_sec);
}

void read_post(const nlohmann::json& j, PostprocessConfig& p) {
    read_key(j, "conf_threshold", p.conf_threshold);
    read_key(j, "min_width", p.min_width);
    read_key(j, "min_height", p.min_height);
    read_key(j, "min_area", p.min_area);
    if (j.contains("class_filters")) {
        for (const auto& item : j["class_filters"].items()) {
            ClassFilter f;
            read_key(item.value(), "threshold", f.threshold);
            read_key(item.value(), "max_area", f.max_area);
            read_key(item.value(), "min_aspect", f.min_aspect);
            read_key(item.value(), "max_aspect", f.max_aspect);
            p.class_filters[item.key()] = f;
        }
    }
}

void read_dispatcher(const nlohmann::json& j, DispatcherConfig& d) {
    read_key(j, "remote_urls", d.remote_urls);
    read_key(j, "legacy_fallback", d.legacy_fallback);
    read_key(j, "probe_timeout_ms", d.probe_timeout_ms);
    read_key(j, "detect_timeout_ms", d.detect_timeout_ms);
    read_key(j, "health_interval_ms", d.health_interval_ms);
    read_key(j, "jpeg_quality", d.jpeg_quality);
    read_key(j, "model_path", d.model_path);
    read_key(j, "use_ort", d.use_ort);
    read_key(j, "has_objectness", d.has_objectness);
    read_key(j, "local_min_score", d.local_min_score);
    read_key(j, "nms_threshold", d.nms_threshold);
}

void read_geo(const nlohmann::json& j, GeoConfig& g) {
    read_key(j, "gps_device", g.gps_device);
    read_key(j, "gps_baud", g.gps_baud);
    read_key(j, "gps_max_hdop_high", g.gps_max_hdop_high);
    read_key(j, "high_accuracy_timeout_ms", g.high_accuracy_timeout_ms);
    read_key(j, "low_accuracy_timeout_ms", g.low_accuracy_timeout_ms);
    read_key(j, "ip_lookup_urls", g.ip_lookup_urls);
    read_key(j, "ip_timeout_ms", g.ip_timeout_ms);
    read_key(j, "default_enabled", g.default_enabled);
    read_key(j, "default_lat", g.default_lat);
    read_key(j, "default_lng", g.default_lng);
    read_key(j, "watch_interval_ms", g.watch_interval_ms);
}

void read_reports(const nlohmann::json& j, ReportConfig& r) {
    read_key(j, "jsonl_path", r.jsonl_path);
    read_key(j, "snapshot_dir", r.snapshot_dir);
    read_key(j, "upload_url", r.upload_url);
    read_key(j, "upload_timeout_ms", r.upload_timeout_ms);
    read_key(j, "upload_retries", r.upload_retries);
    read_key(j, "queue_size", r.queue_size);
}

}  // namespace

std::vector<std::string> split_list(const std::string& s, char sep) {
    std::vector<std::string> out;
    std::string cur;
    for (char c : s) {
        if (c == sep) {
            if (!cur.empty()) out.push_back(cur);
            cur.clear();
        } else if (c != ' ') {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) out.push_back(cur);
    return out;
}

std::vector<std::string> load_class_names(const std::string& path) {
    std::vector<std::string> names;
    std::ifstream f(path);
    if (!f) {
        std::cerr << "[WARN] Unable to open class names file: " << path << std::endl;
        return names;
    }
    std::string line;
    while (std::getline(f, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (!line.empty()) names.push_back(line);
    }
    return names;
}

void load_config_file(const std::string& path, AppConfig& cfg) {
    std::ifstream ifs(path);
    if (!ifs) {
        throw PipelineError(ErrorClass::Fatal, "cannot open config file: " + path);
    }
    nlohmann::json j;
    try {
        ifs >> j;
        read_key(j, "source", cfg.source);
        read_key(j, "class_names_path", cfg.class_names_path);
        read_key(j, "class_names", cfg.class_names);
        read_key(j, "img_size", cfg.img_size);
        if (cfg.img_size <= 0) {
            throw PipelineError(ErrorClass::Fatal, "img_size in " + path + " must be a positive integer");
        }
        read_key(j, "target_fps", cfg.target_fps);
        read_key(j, "show_window", cfg.show_window);
        read_key(j, "frame_wait_ms", cfg.frame_wait_ms);
        read_key(j, "degraded_after_failures", cfg.degraded_after_failures);
        read_key(j, "http_bind", cfg.http_bind);
        read_key(j, "http_port", cfg.http_port);
        if (j.contains("throttle")) read_throttle(j["throttle"], cfg.throttle);
        if (j.contains("tracker")) read_tracker(j["tracker"], cfg.tracker);
        if (j.contains("postprocess")) read_post(j["postprocess"], cfg.post);
        if (j.contains("dispatcher")) read_dispatcher(j["dispatcher"], cfg.dispatcher);
        if (j.contains("geo")) read_geo(j["geo"], cfg.geo);
        if (j.contains("reports")) read_reports(j["reports"], cfg.reports);
    } catch (const nlohmann::json::exception& e) {
        throw PipelineError(ErrorClass::Fatal, "invalid config file " + path + ": " + e.what());
    }
}

AppConfig parse_args(int argc, char** argv) {
    AppConfig cfg;

    for (int i = 1; i + 1 < argc; ++i) {
        if (arg_eq(argv[i], "--config")) {
            load_config_file(argv[i + 1], cfg);
            break;
        }
    }

    if (const char* env_src = std::getenv("VIDEO_SOURCE")) cfg.source = env_src;
    if (const char* env_img = std::getenv("IMG_SIZE")) cfg.img_size = parse_img_size(env_img, "IMG_SIZE");
    if (const char* env_conf = std::getenv("HAZARD_CONF")) cfg.post.conf_threshold = static_cast<float>(std::atof(env_conf));
    if (const char* env_model = std::getenv("HAZARD_MODEL")) cfg.dispatcher.model_path = env_model;
    if (const char* env_fps = std::getenv("FPS")) cfg.target_fps = std::atoi(env_fps);
    if (const char* env_remote = std::getenv("REMOTE_URLS")) cfg.dispatcher.remote_urls = split_list(env_remote);
    if (const char* env_report = std::getenv("REPORT_URL")) cfg.reports.upload_url = env_report;
    if (const char* env_jsonl = std::getenv("REPORTS_JSONL")) cfg.reports.jsonl_path = env_jsonl;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        auto next = [&](int offset = 1) -> const char* {
            if (i + offset < argc) return argv[i + offset];
            return nullptr;
        };

        if (arg_eq(arg, "--config") && next()) {
            i++;
        } else if (arg_eq(arg, "--source") && next()) {
            cfg.source = next();
            i++;
        } else if (arg_eq(arg, "--model") && next()) {
            cfg.dispatcher.model_path = next();
            i++;
        } else if (arg_eq(arg, "--class-names") && next()) {
            cfg.class_names_path = next();
            i++;
        } else if (arg_eq(arg, "--img") && next()) {
            cfg.img_size = parse_img_size(next(), "--img");
            i++;
        } else if (arg_eq(arg, "--conf") && next()) {
            cfg.post.conf_threshold = static_cast<float>(std::atof(next()));
            i++;
        } else if (arg_eq(arg, "--remote") && next()) {
            cfg.dispatcher.remote_urls = split_list(next());
            i++;
        } else if (arg_eq(arg, "--no-legacy")) {
            cfg.dispatcher.legacy_fallback = false;
        } else if (arg_eq(arg, "--gps") && next()) {
            cfg.geo.gps_device = next();
            i++;
        } else if (arg_eq(arg, "--reports") && next()) {
            cfg.reports.jsonl_path = next();
            i++;
        } else if (arg_eq(arg, "--snapshots") && next()) {
            cfg.reports.snapshot_dir = next();
            i++;
        } else if (arg_eq(arg, "--upload-url") && next()) {
            cfg.reports.upload_url = next();
            i++;
        } else if (arg_eq(arg, "--cooldown") && next()) {
            cfg.tracker.save_cooldown_sec = std::atof(next());
            i++;
        } else if (arg_eq(arg, "--max-skip") && next()) {
            cfg.throttle.max_skip = std::atoi(next());
            i++;
        } else if (arg_eq(arg, "--no-ort")) {
            cfg.dispatcher.use_ort = false;
        } else if (arg_eq(arg, "--use-ort")) {
            cfg.dispatcher.use_ort = true;
        } else if (arg_eq(arg, "--show-window")) {
            cfg.show_window = true;
        } else if (arg_eq(arg, "--fps") && next()) {
            cfg.target_fps = std::atoi(next());
            i++;
        } else if (arg_eq(arg, "--port") && next()) {
            cfg.http_port = std::atoi(next());
            i++;
        } else if (arg_eq(arg, "--help")) {
            std::cout << "Usage: hazard_node [--config <json>] [--source <src>] [--model <onnx>]\n"
                      << "                   [--class-names <file>] [--img <size>] [--conf <thresh>]\n"
                      << "                   [--remote <url,url>] [--no-legacy] [--gps <tty>]\n"
                      << "                   [--reports <jsonl>] [--snapshots <dir>] [--upload-url <url>]\n"
                      << "                   [--cooldown <sec>] [--max-skip <n>] [--use-ort|--no-ort]\n"
                      << "                   [--show-window] [--fps <int>] [--port <int>]\n";
            std::exit(0);
        }
    }

    if (!cfg.class_names_path.empty()) {
        auto names = load_class_names(cfg.class_names_path);
        if (!names.empty()) cfg.class_names = names;
    }
    return cfg;
}

}  // namespace hazard
