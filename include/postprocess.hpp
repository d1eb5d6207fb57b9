#pragma once

#include <opencv2/core.hpp>
#include <string>
#include <vector>

#include "config.hpp"
#include "frame_types.hpp"

namespace hazard {

LetterboxParams compute_letterbox(int src_w, int src_h, int target_size);

// Resizes bgr into a black target_size square preserving aspect ratio.
cv::Mat letterbox(const cv::Mat& bgr, int target_size, LetterboxParams& params);

std::string class_label_for(int class_id, const std::vector<std::string>& names);

class DetectionPostprocessor {
public:
    DetectionPostprocessor(const PostprocessConfig& cfg, std::vector<std::string> class_names);

    std::vector<Observation> to_observations(const std::vector<RawDetection>& raw,
                                             const LetterboxParams& lb,
                                             int frame_w,
                                             int frame_h,
                                             float score_threshold) const;

    std::vector<Observation> to_observations(const std::vector<RawDetection>& raw,
                                             const LetterboxParams& lb,
                                             int frame_w,
                                             int frame_h) const {
        return to_observations(raw, lb, frame_w, frame_h, cfg_.conf_threshold);
    }

private:
    bool passes_class_filter(const Observation& obs, float score_threshold) const;

    PostprocessConfig cfg_;
    std::vector<std::string> class_names_;
};

}  // namespace hazard
