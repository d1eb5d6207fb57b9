#pragma once

#include <opencv2/dnn.hpp>
#include <cstdint>
#include <string>
#include <vector>
#include <memory>

#include "config.hpp"
#include "inference_backend.hpp"

#ifdef USE_ONNXRUNTIME
#include <onnxruntime_cxx_api.h>
#endif

namespace hazard {

// Decodes a YOLO-style prediction tensor ([N, 4(+1)+C] or [4(+1)+C, N]) into
// model-input-space corner boxes, then applies per-class NMS.
std::vector<RawDetection> decode_yolo_output(const float* data,
                                             const std::vector<int64_t>& shape,
                                             bool has_objectness,
                                             float min_score,
                                             float nms_threshold);

class LocalModel : public LocalInference {
public:
    LocalModel(const DispatcherConfig& cfg, int img_size);

    bool load() override;
    bool loaded() const override { return ready_; }
    InferenceResult detect(const cv::Mat& model_input) override;

private:
#ifdef USE_ONNXRUNTIME
    InferenceResult run_ort(const cv::Mat& input);
#endif
    InferenceResult run_opencv(const cv::Mat& input);

    DispatcherConfig cfg_;
    int input_size_;
    bool ready_{false};
    bool use_ort_{false};

    cv::dnn::Net net_;

#ifdef USE_ONNXRUNTIME
    Ort::Env env_{ORT_LOGGING_LEVEL_WARNING, "hazard-node"};
    std::unique_ptr<Ort::Session> session_;
    Ort::MemoryInfo mem_info_{Ort::MemoryInfo::CreateCpu(OrtDeviceAllocator, OrtMemTypeCPU)};
    std::vector<std::string> input_name_strs_;
    std::vector<const char*> input_names_;
    std::vector<std::string> output_name_strs_;
    std::vector<const char*> output_names_;
#endif
};

}  // namespace hazard
