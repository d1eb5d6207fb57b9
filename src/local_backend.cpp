#include "local_backend.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <opencv2/imgproc.hpp>

namespace hazard {

std::vector<RawDetection> decode_yolo_output(const float* data,
                                             const std::vector<int64_t>& shape,
                                             bool has_objectness,
                                             float min_score,
                                             float nms_threshold) {
    std::vector<RawDetection> out;
    if (!data) return out;

    int rows = 0;
    int dims = 0;
    bool channel_first = false;
    if (shape.size() == 3) {
        rows = static_cast<int>(shape[1]);
        dims = static_cast<int>(shape[2]);
        if (shape[2] > shape[1]) {
            rows = static_cast<int>(shape[2]);
            dims = static_cast<int>(shape[1]);
            channel_first = true;
        }
    } else if (shape.size() == 2) {
        rows = static_cast<int>(shape[0]);
        dims = static_cast<int>(shape[1]);
    } else {
        return out;
    }

    const int class_start = has_objectness ? 5 : 4;
    const int classes = dims - class_start;
    if (rows <= 0 || classes <= 0) return out;

    std::vector<cv::Rect2d> boxes;
    std::vector<float> scores;
    std::vector<int> class_ids;

    for (int i = 0; i < rows; ++i) {
        const float* ptr = channel_first ? (data + i) : (data + i * dims);
        auto item = [&](int idx) -> float {
            return channel_first ? ptr[idx * rows] : ptr[idx];
        };

        int best_cls = -1;
        float best_score = 0.0f;
        const float objectness = has_objectness ? item(4) : 1.0f;
        for (int c = 0; c < classes; ++c) {
            float conf = objectness * item(class_start + c);
            if (conf > best_score) {
                best_score = conf;
                best_cls = c;
            }
        }
        if (best_cls < 0 || best_score < min_score) continue;

        const float cx = item(0);
        const float cy = item(1);
        const float w = item(2);
        const float h = item(3);
        boxes.emplace_back(cx - 0.5f * w, cy - 0.5f * h, w, h);
        scores.push_back(best_score);
        class_ids.push_back(best_cls);
    }

    // Offsetting boxes by class id keeps NMS from suppressing across classes.
    std::vector<cv::Rect2d> shifted(boxes);
    for (size_t i = 0; i < shifted.size(); ++i) {
        shifted[i].x += class_ids[i] * 4096.0;
        shifted[i].y += class_ids[i] * 4096.0;
    }
    std::vector<int> keep;
    cv::dnn::NMSBoxes(shifted, scores, min_score, nms_threshold, keep);

    out.reserve(keep.size());
    for (int idx : keep) {
        const auto& b = boxes[idx];
        RawDetection d;
        d.box = {static_cast<float>(b.x), static_cast<float>(b.y),
                 static_cast<float>(b.x + b.width), static_cast<float>(b.y + b.height)};
        d.score = scores[idx];
        d.class_id = class_ids[idx];
        out.push_back(d);
    }
    return out;
}

LocalModel::LocalModel(const DispatcherConfig& cfg, int img_size)
    : cfg_(cfg), input_size_(img_size), use_ort_(cfg.use_ort) {}

bool LocalModel::load() {
    if (ready_) return true;
    if (!std::filesystem::exists(cfg_.model_path)) {
        std::cerr << "[ERROR] Model file not found: " << cfg_.model_path << std::endl;
        return false;
    }

#ifdef USE_ONNXRUNTIME
    if (use_ort_) {
        try {
            Ort::SessionOptions opts;
            opts.SetGraphOptimizationLevel(ORT_ENABLE_ALL);
            session_ = std::make_unique<Ort::Session>(env_, cfg_.model_path.c_str(), opts);

            Ort::AllocatorWithDefaultOptions allocator;
            const size_t in_count = session_->GetInputCount();
            for (size_t i = 0; i < in_count; ++i) {
                auto name = session_->GetInputNameAllocated(i, allocator);
                input_name_strs_.push_back(name.get());
            }
            const size_t out_count = session_->GetOutputCount();
            for (size_t i = 0; i < out_count; ++i) {
                auto name = session_->GetOutputNameAllocated(i, allocator);
                output_name_strs_.push_back(name.get());
            }
            for (const auto& s : input_name_strs_) input_names_.push_back(s.c_str());
            for (const auto& s : output_name_strs_) output_names_.push_back(s.c_str());

            ready_ = true;
            std::cout << "[INFO] Loaded ORT model: " << cfg_.model_path << std::endl;
            return true;
        } catch (const Ort::Exception& e) {
            std::cerr << "[WARN] ONNX Runtime load failed (" << e.what() << "); falling back to OpenCV DNN." << std::endl;
            session_.reset();
            use_ort_ = false;
        }
    }
#else
    use_ort_ = false;
#endif

    try {
        net_ = cv::dnn::readNet(cfg_.model_path);
        net_.setPreferableBackend(cv::dnn::DNN_BACKEND_OPENCV);
        net_.setPreferableTarget(cv::dnn::DNN_TARGET_CPU);
        ready_ = !net_.empty();
        if (ready_) std::cout << "[INFO] Loaded OpenCV DNN model: " << cfg_.model_path << std::endl;
    } catch (const cv::Exception& e) {
        std::cerr << "[ERROR] Could not load model: " << e.what() << std::endl;
        ready_ = false;
    }
    return ready_;
}

InferenceResult LocalModel::detect(const cv::Mat& model_input) {
    if (!ready_) {
        return InferenceResult::failure(InferenceError::Kind::NotLoaded, "local model not loaded", ErrorClass::Fatal);
    }
    if (model_input.empty()) {
        return InferenceResult::failure(InferenceError::Kind::Internal, "empty model input");
    }

    cv::Mat input = model_input;
    if (input.cols != input_size_ || input.rows != input_size_) {
        cv::resize(model_input, input, cv::Size(input_size_, input_size_));
    }

    try {
#ifdef USE_ONNXRUNTIME
        if (use_ort_ && session_) {
            return run_ort(input);
        }
#endif
        return run_opencv(input);
    } catch (const cv::Exception& e) {
        return InferenceResult::failure(InferenceError::Kind::Internal, std::string("opencv: ") + e.what());
#ifdef USE_ONNXRUNTIME
    } catch (const Ort::Exception& e) {
        return InferenceResult::failure(InferenceError::Kind::Internal, std::string("ort: ") + e.what());
#endif
    }
}

#ifdef USE_ONNXRUNTIME
InferenceResult LocalModel::run_ort(const cv::Mat& input) {
    cv::Mat rgb;
    cv::cvtColor(input, rgb, cv::COLOR_BGR2RGB);
    rgb.convertTo(rgb, CV_32F, 1.0 / 255.0);

    std::vector<float> blob;
    blob.reserve(3 * input_size_ * input_size_);
    std::vector<int64_t> input_shape{1, 3, input_size_, input_size_};
    for (int c = 0; c < 3; ++c) {
        for (int y = 0; y < input_size_; ++y) {
            const float* row = rgb.ptr<float>(y);
            for (int x = 0; x < input_size_; ++x) {
                blob.push_back(row[x * 3 + c]);
            }
        }
    }

    Ort::Value input_tensor = Ort::Value::CreateTensor<float>(mem_info_, blob.data(), blob.size(),
                                                              input_shape.data(), input_shape.size());
    auto outputs = session_->Run(Ort::RunOptions{nullptr},
                                 input_names_.data(), &input_tensor, 1,
                                 output_names_.data(), output_names_.size());
    if (outputs.empty()) {
        return InferenceResult::failure(InferenceError::Kind::Internal, "model produced no output");
    }

    auto& out = outputs.front();
    InferenceResult result;
    result.detections = decode_yolo_output(out.GetTensorData<float>(),
                                           out.GetTensorTypeAndShapeInfo().GetShape(),
                                           cfg_.has_objectness, cfg_.local_min_score, cfg_.nms_threshold);
    result.served_by = "local-ort";
    return result;
}
#endif

InferenceResult LocalModel::run_opencv(const cv::Mat& input) {
    cv::Mat blob = cv::dnn::blobFromImage(input, 1.0 / 255.0, cv::Size(input_size_, input_size_),
                                          cv::Scalar(), true, false);
    net_.setInput(blob);
    cv::Mat pred = net_.forward();

    std::vector<int64_t> shape;
    for (int i = 0; i < pred.dims; ++i) shape.push_back(pred.size[i]);
    if (pred.type() != CV_32F) {
        return InferenceResult::failure(InferenceError::Kind::Internal, "unexpected output type");
    }

    InferenceResult result;
    result.detections = decode_yolo_output(reinterpret_cast<const float*>(pred.data), shape,
                                           cfg_.has_objectness, cfg_.local_min_score, cfg_.nms_threshold);
    result.served_by = "local-dnn";
    return result;
}

}  // namespace hazard
