#include "postprocess.hpp"

#include <algorithm>
#include <cmath>
#include <opencv2/imgproc.hpp>

namespace hazard {

LetterboxParams compute_letterbox(int src_w, int src_h, int target_size) {
    LetterboxParams p;
    p.target_size = target_size;
    if (src_w <= 0 || src_h <= 0 || target_size <= 0) return p;
    p.scale = std::min(static_cast<float>(target_size) / static_cast<float>(src_w),
                       static_cast<float>(target_size) / static_cast<float>(src_h));
    p.new_w = static_cast<int>(std::lround(src_w * p.scale));
    p.new_h = static_cast<int>(std::lround(src_h * p.scale));
    p.offset_x = (target_size - p.new_w) / 2;
    p.offset_y = (target_size - p.new_h) / 2;
    return p;
}

cv::Mat letterbox(const cv::Mat& bgr, int target_size, LetterboxParams& params) {
    params = compute_letterbox(bgr.cols, bgr.rows, target_size);
    cv::Mat out(target_size, target_size, bgr.type(), cv::Scalar::all(0));
    if (params.new_w <= 0 || params.new_h <= 0) return out;

    cv::Mat resized;
    cv::resize(bgr, resized, cv::Size(params.new_w, params.new_h), 0, 0, cv::INTER_LINEAR);
    resized.copyTo(out(cv::Rect(params.offset_x, params.offset_y, params.new_w, params.new_h)));
    return out;
}

std::string class_label_for(int class_id, const std::vector<std::string>& names) {
    if (class_id >= 0 && class_id < static_cast<int>(names.size())) return names[class_id];
    return "cls_" + std::to_string(class_id);
}

DetectionPostprocessor::DetectionPostprocessor(const PostprocessConfig& cfg, std::vector<std::string> class_names)
    : cfg_(cfg), class_names_(std::move(class_names)) {}

bool DetectionPostprocessor::passes_class_filter(const Observation& obs, float score_threshold) const {
    auto it = cfg_.class_filters.find(obs.class_label);
    if (it == cfg_.class_filters.end()) return true;
    const ClassFilter& f = it->second;

    if (f.threshold > 0.0f && obs.score < std::max(f.threshold, score_threshold)) return false;
    if (f.max_area > 0.0f && obs.area > f.max_area) return false;
    const float aspect = obs.width / std::max(obs.height, 1.0f);
    if (f.min_aspect > 0.0f && aspect < f.min_aspect) return false;
    if (f.max_aspect > 0.0f && aspect > f.max_aspect) return false;
    return true;
}

std::vector<Observation> DetectionPostprocessor::to_observations(const std::vector<RawDetection>& raw,
                                                                 const LetterboxParams& lb,
                                                                 int frame_w,
                                                                 int frame_h,
                                                                 float score_threshold) const {
    std::vector<Observation> out;
    if (lb.scale <= 0.0f || frame_w <= 0 || frame_h <= 0) return out;
    out.reserve(raw.size());

    const float fw = static_cast<float>(frame_w);
    const float fh = static_cast<float>(frame_h);

    for (const auto& d : raw) {
        if (!std::isfinite(d.score) || d.score < score_threshold) continue;

        float x1 = (d.box[0] - lb.offset_x) / lb.scale;
        float y1 = (d.box[1] - lb.offset_y) / lb.scale;
        float x2 = (d.box[2] - lb.offset_x) / lb.scale;
        float y2 = (d.box[3] - lb.offset_y) / lb.scale;
        if (!std::isfinite(x1) || !std::isfinite(y1) || !std::isfinite(x2) || !std::isfinite(y2)) continue;
        if (x2 < x1) std::swap(x1, x2);
        if (y2 < y1) std::swap(y1, y2);

        x1 = std::clamp(x1, 0.0f, fw);
        x2 = std::clamp(x2, 0.0f, fw);
        y1 = std::clamp(y1, 0.0f, fh);
        y2 = std::clamp(y2, 0.0f, fh);

        Observation obs;
        obs.width = x2 - x1;
        obs.height = y2 - y1;
        obs.area = obs.width * obs.height;
        if (obs.width < cfg_.min_width || obs.height < cfg_.min_height || obs.area < cfg_.min_area) continue;

        obs.center_x = 0.5f * (x1 + x2);
        obs.center_y = 0.5f * (y1 + y2);
        obs.class_label = class_label_for(d.class_id, class_names_);
        obs.score = d.score;
        if (!passes_class_filter(obs, score_threshold)) continue;

        out.push_back(std::move(obs));
    }
    return out;
}

}  // namespace hazard
