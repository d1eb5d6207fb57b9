#include <gtest/gtest.h>

#include <utility>
#include <vector>

#include "fakes.hpp"
#include "inference_dispatcher.hpp"
#include "remote_backend.hpp"

using namespace hazard;
using namespace hazard::fakes;

namespace {

DispatcherConfig quiet_config() {
    DispatcherConfig cfg;
    cfg.health_interval_ms = 60000;
    cfg.probe_timeout_ms = 200;
    cfg.detect_timeout_ms = 200;
    return cfg;
}

struct Transitions {
    std::mutex mu;
    std::vector<std::pair<InferenceMode, InferenceMode>> seen;

    InferenceDispatcher::ModeListener listener() {
        return [this](InferenceMode from, InferenceMode to) {
            std::lock_guard<std::mutex> lock(mu);
            seen.emplace_back(from, to);
        };
    }
    size_t count() {
        std::lock_guard<std::mutex> lock(mu);
        return seen.size();
    }
};

const cv::Mat kInput(64, 64, CV_8UC3, cv::Scalar::all(0));

}  // namespace

TEST(InferenceDispatcher, UnreachableCandidatesSwitchToLocalExactlyOnce) {
    DispatcherConfig cfg = quiet_config();
    cfg.remote_urls = {"http://127.0.0.1:1", "http://127.0.0.1:2", "http://127.0.0.1:3"};
    auto remote = std::make_unique<HttpRemoteInference>(cfg, std::vector<std::string>{"pothole"});
    auto local = std::make_unique<FakeLocal>();
    auto* loc = local.get();

    InferenceDispatcher dispatcher(cfg, std::move(remote), std::move(local));
    Transitions t;
    dispatcher.set_mode_listener(t.listener());
    dispatcher.start();

    EXPECT_EQ(dispatcher.mode(), InferenceMode::Local);
    ASSERT_EQ(t.count(), 1u);
    EXPECT_EQ(t.seen[0].first, InferenceMode::Unknown);
    EXPECT_EQ(t.seen[0].second, InferenceMode::Local);
    EXPECT_EQ(loc->loads.load(), 1);

    auto r = dispatcher.detect(kInput);
    EXPECT_TRUE(r.ok());
    EXPECT_EQ(r.served_by, "fake-local");
    dispatcher.stop();
    EXPECT_EQ(t.count(), 1u);
}

TEST(InferenceDispatcher, HealthyRemoteNeverTouchesLocal) {
    auto remote = std::make_unique<FakeRemote>();
    remote->detections = {raw(0, 0, 10, 10, 0.9f, 2)};
    auto* rem = remote.get();
    auto local = std::make_unique<FakeLocal>();
    auto* loc = local.get();

    InferenceDispatcher dispatcher(quiet_config(), std::move(remote), std::move(local));
    dispatcher.start();
    ASSERT_EQ(dispatcher.mode(), InferenceMode::Remote);

    for (int i = 0; i < 10; ++i) {
        auto r = dispatcher.detect(kInput);
        ASSERT_TRUE(r.ok());
        EXPECT_EQ(r.detections.size(), 1u);
        EXPECT_EQ(r.served_by, "fake-remote");
    }
    EXPECT_EQ(rem->detects.load(), 10);
    EXPECT_EQ(rem->legacy_detects.load(), 0);
    EXPECT_EQ(loc->detects.load(), 0);
    EXPECT_EQ(loc->loads.load(), 0);
}

TEST(InferenceDispatcher, PrimaryFailureRetriesLegacyOnce) {
    auto remote = std::make_unique<FakeRemote>();
    remote->fail_primary = true;
    auto* rem = remote.get();
    auto local = std::make_unique<FakeLocal>();
    auto* loc = local.get();

    InferenceDispatcher dispatcher(quiet_config(), std::move(remote), std::move(local));
    dispatcher.start();

    auto r = dispatcher.detect(kInput);
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.served_by, "fake-remote-legacy");
    EXPECT_EQ(rem->legacy_detects.load(), 1);
    EXPECT_EQ(dispatcher.mode(), InferenceMode::Remote);
    EXPECT_EQ(loc->detects.load(), 0);
}

TEST(InferenceDispatcher, RemoteAndLegacyFailureFailsOverToLocal) {
    auto remote = std::make_unique<FakeRemote>();
    remote->fail_primary = true;
    remote->fail_legacy = true;
    auto* rem = remote.get();
    auto local = std::make_unique<FakeLocal>();
    auto* loc = local.get();

    InferenceDispatcher dispatcher(quiet_config(), std::move(remote), std::move(local));
    Transitions t;
    dispatcher.set_mode_listener(t.listener());
    dispatcher.start();
    ASSERT_EQ(dispatcher.mode(), InferenceMode::Remote);

    auto r = dispatcher.detect(kInput);
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.served_by, "fake-local+failover");
    EXPECT_EQ(dispatcher.mode(), InferenceMode::Local);
    EXPECT_EQ(loc->loads.load(), 1);

    // Later calls go straight to the local model.
    r = dispatcher.detect(kInput);
    EXPECT_EQ(r.served_by, "fake-local");
    EXPECT_EQ(rem->detects.load(), 1);

    ASSERT_EQ(t.count(), 2u);
    EXPECT_EQ(t.seen[1].first, InferenceMode::Remote);
    EXPECT_EQ(t.seen[1].second, InferenceMode::Local);
}

TEST(InferenceDispatcher, LegacyRetryCanBeDisabled) {
    auto remote = std::make_unique<FakeRemote>();
    remote->fail_primary = true;
    remote->legacy_enabled = false;
    auto* rem = remote.get();

    InferenceDispatcher dispatcher(quiet_config(), std::move(remote), std::make_unique<FakeLocal>());
    dispatcher.start();
    auto r = dispatcher.detect(kInput);
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(rem->legacy_detects.load(), 0);
    EXPECT_EQ(dispatcher.mode(), InferenceMode::Local);
}

TEST(InferenceDispatcher, RemoteFailureWithoutLocalIsDegraded) {
    auto remote = std::make_unique<FakeRemote>();
    remote->fail_primary = true;
    remote->fail_legacy = true;

    InferenceDispatcher dispatcher(quiet_config(), std::move(remote), nullptr);
    dispatcher.start();
    auto r = dispatcher.detect(kInput);
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error->kind, InferenceError::Kind::NoBackend);
    EXPECT_EQ(r.error->severity, ErrorClass::Degraded);
    EXPECT_EQ(dispatcher.mode(), InferenceMode::Remote);
}

TEST(InferenceDispatcher, HealthCheckReturnsToRemote) {
    auto remote = std::make_unique<FakeRemote>();
    remote->healthy = false;
    auto* rem = remote.get();

    InferenceDispatcher dispatcher(quiet_config(), std::move(remote), std::make_unique<FakeLocal>());
    Transitions t;
    dispatcher.set_mode_listener(t.listener());
    dispatcher.start();
    ASSERT_EQ(dispatcher.mode(), InferenceMode::Local);

    EXPECT_FALSE(dispatcher.check_health_now());
    EXPECT_EQ(dispatcher.mode(), InferenceMode::Local);

    rem->healthy = true;
    EXPECT_TRUE(dispatcher.check_health_now());
    EXPECT_EQ(dispatcher.mode(), InferenceMode::Remote);
    // Already remote: nothing to do.
    EXPECT_FALSE(dispatcher.check_health_now());

    auto r = dispatcher.detect(kInput);
    EXPECT_EQ(r.served_by, "fake-remote");
    ASSERT_EQ(t.count(), 2u);
    EXPECT_EQ(t.seen[1].second, InferenceMode::Remote);
}

TEST(InferenceDispatcher, BackgroundProbeRecoversRemote) {
    DispatcherConfig cfg = quiet_config();
    cfg.health_interval_ms = 100;
    auto remote = std::make_unique<FakeRemote>();
    remote->healthy = false;
    auto* rem = remote.get();

    InferenceDispatcher dispatcher(cfg, std::move(remote), std::make_unique<FakeLocal>());
    dispatcher.start();
    ASSERT_EQ(dispatcher.mode(), InferenceMode::Local);
    rem->healthy = true;
    EXPECT_TRUE(wait_for([&] { return dispatcher.mode() == InferenceMode::Remote; }));
    dispatcher.stop();
    EXPECT_EQ(dispatcher.mode(), InferenceMode::Unknown);
}

TEST(InferenceDispatcher, NoUsableBackendIsFatal) {
    auto local = std::make_unique<FakeLocal>();
    local->can_load = false;
    auto remote = std::make_unique<FakeRemote>();
    remote->healthy = false;

    InferenceDispatcher dispatcher(quiet_config(), std::move(remote), std::move(local));
    try {
        dispatcher.start();
        FAIL() << "start() should throw";
    } catch (const PipelineError& e) {
        EXPECT_EQ(e.error_class(), ErrorClass::Fatal);
    }
    auto r = dispatcher.detect(kInput);
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error->severity, ErrorClass::Fatal);
}
