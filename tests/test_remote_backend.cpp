#include <gtest/gtest.h>

#include <atomic>
#include <mutex>
#include <thread>

#include <httplib.h>

#include "http_util.hpp"
#include "remote_backend.hpp"

using namespace hazard;

namespace {

const std::vector<std::string> kNames{"crack", "knocked", "pothole", "surface_damage"};

// Detection service stand-in on a loopback port.
class StubDetectionService {
public:
    StubDetectionService() {
        srv_.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
            res.set_content(ready_ ? R"({"status":"ok"})" : R"({"status":"loading"})", "application/json");
        });
        srv_.Post("/session/start", [this](const httplib::Request&, httplib::Response& res) {
            sessions_++;
            res.set_content(R"({"session_id":"s-)" + std::to_string(sessions_.load()) + R"("})", "application/json");
        });
        srv_.Post(R"(/detect/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
            if (!req.has_file("file") || req.get_file_value("file").content_type != "image/jpeg") {
                res.status = 400;
                return;
            }
            {
                std::lock_guard<std::mutex> lock(mu_);
                last_session_ = req.matches[1];
            }
            if (fail_session_) {
                res.status = 404;
                return;
            }
            res.set_content(R"({"success":true,"detections":[{"bbox":[1,2,30,40],"confidence":0.8,"label":"pothole"}]})",
                            "application/json");
        });
        srv_.Post("/detect", [this](const httplib::Request& req, httplib::Response& res) {
            legacy_calls_++;
            if (!req.has_file("file")) {
                res.status = 400;
                return;
            }
            res.set_content(R"({"detections":[{"box":[5,5,15,15],"score":0.7,"class_id":0}]})", "application/json");
        });
        port_ = srv_.bind_to_any_port("127.0.0.1");
        thread_ = std::thread([this] { srv_.listen_after_bind(); });
        srv_.wait_until_ready();
    }
    ~StubDetectionService() {
        srv_.stop();
        if (thread_.joinable()) thread_.join();
    }

    std::string url() const { return "http://127.0.0.1:" + std::to_string(port_); }
    std::string last_session() {
        std::lock_guard<std::mutex> lock(mu_);
        return last_session_;
    }

    std::atomic<bool> ready_{true};
    std::atomic<bool> fail_session_{false};
    std::atomic<int> sessions_{0};
    std::atomic<int> legacy_calls_{0};

private:
    std::mutex mu_;
    std::string last_session_;
    httplib::Server srv_;
    std::thread thread_;
    int port_{0};
};

DispatcherConfig config_for(const std::vector<std::string>& urls) {
    DispatcherConfig cfg;
    cfg.remote_urls = urls;
    cfg.probe_timeout_ms = 500;
    cfg.detect_timeout_ms = 1000;
    return cfg;
}

const cv::Mat kInput(32, 32, CV_8UC3, cv::Scalar(10, 20, 30));

}  // namespace

TEST(ParseDetectionResponse, AcceptsBothFieldSpellings) {
    std::vector<RawDetection> out;
    std::string err;
    ASSERT_TRUE(parse_detection_response(
        R"({"detections":[{"box":[1,2,3,4],"score":0.5,"class_id":2},
                          {"bbox":[5,6,7,8],"confidence":0.6,"label":"crack"}]})",
        kNames, out, err));
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].class_id, 2);
    EXPECT_FLOAT_EQ(out[0].box[3], 4.0f);
    EXPECT_EQ(out[1].class_id, 0);
    EXPECT_FLOAT_EQ(out[1].score, 0.6f);
}

TEST(ParseDetectionResponse, SkipsUnreadableItems) {
    std::vector<RawDetection> out;
    std::string err;
    ASSERT_TRUE(parse_detection_response(
        R"({"detections":[{"box":[1,2,3],"score":0.5,"class_id":0},
                          {"box":[1,2,3,4],"score":"high","class_id":0},
                          {"box":[1,2,3,4],"score":0.5,"label":"cat"},
                          {"box":[1,2,3,4],"score":0.5,"label":"pothole"}]})",
        kNames, out, err));
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].class_id, 2);
}

TEST(ParseDetectionResponse, MalformedPayloads) {
    std::vector<RawDetection> out;
    std::string err;
    EXPECT_FALSE(parse_detection_response("not json", kNames, out, err));
    EXPECT_FALSE(parse_detection_response("[]", kNames, out, err));
    EXPECT_FALSE(parse_detection_response(R"({"success":false,"detections":[]})", kNames, out, err));
    EXPECT_FALSE(parse_detection_response(R"({"result":"ok"})", kNames, out, err));
    EXPECT_FALSE(err.empty());
    EXPECT_TRUE(parse_detection_response(R"({"detections":[]})", kNames, out, err));
    EXPECT_TRUE(out.empty());
}

TEST(SplitUrl, OriginAndPath) {
    auto p = split_url("http://host:8000/api/");
    EXPECT_EQ(p.origin, "http://host:8000");
    EXPECT_EQ(p.path, "/api");
    auto q = split_url("localhost:5000");
    EXPECT_EQ(q.origin, "http://localhost:5000");
    EXPECT_EQ(q.path, "");
    EXPECT_EQ(join_path("/api", "/health"), "/api/health");
    EXPECT_EQ(join_path("", "detect"), "/detect");
}

TEST(HttpRemoteInference, ProbeSkipsDeadAndNotReadyCandidates) {
    StubDetectionService loading;
    loading.ready_ = false;
    StubDetectionService ready;

    HttpRemoteInference remote(config_for({"http://127.0.0.1:1", loading.url(), ready.url()}), kNames);
    ASSERT_TRUE(remote.probe());
    EXPECT_EQ(remote.active_endpoint(), ready.url());
}

TEST(HttpRemoteInference, SessionDetectRoundTrip) {
    StubDetectionService svc;
    HttpRemoteInference remote(config_for({svc.url()}), kNames);
    ASSERT_TRUE(remote.probe());

    auto r = remote.detect(kInput);
    ASSERT_TRUE(r.ok()) << r.error->message;
    ASSERT_EQ(r.detections.size(), 1u);
    EXPECT_EQ(r.detections[0].class_id, 2);
    EXPECT_FLOAT_EQ(r.detections[0].box[2], 30.0f);
    EXPECT_EQ(svc.last_session(), "s-1");

    // The session is reused.
    ASSERT_TRUE(remote.detect(kInput).ok());
    EXPECT_EQ(svc.sessions_.load(), 1);
}

TEST(HttpRemoteInference, ExpiredSessionIsReopened) {
    StubDetectionService svc;
    HttpRemoteInference remote(config_for({svc.url()}), kNames);
    ASSERT_TRUE(remote.probe());
    ASSERT_TRUE(remote.detect(kInput).ok());

    svc.fail_session_ = true;
    auto r = remote.detect(kInput);
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error->kind, InferenceError::Kind::BadStatus);

    svc.fail_session_ = false;
    ASSERT_TRUE(remote.detect(kInput).ok());
    EXPECT_EQ(svc.sessions_.load(), 2);
}

TEST(HttpRemoteInference, LegacyContract) {
    StubDetectionService svc;
    HttpRemoteInference remote(config_for({svc.url()}), kNames);
    ASSERT_TRUE(remote.probe());
    auto r = remote.detect_legacy(kInput);
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.served_by, "remote-legacy");
    EXPECT_EQ(svc.legacy_calls_.load(), 1);
}

TEST(HttpRemoteInference, DetectWithoutProbeFails) {
    HttpRemoteInference remote(config_for({"http://127.0.0.1:1"}), kNames);
    auto r = remote.detect(kInput);
    EXPECT_FALSE(r.ok());
}
