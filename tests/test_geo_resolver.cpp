#include <gtest/gtest.h>

#include "fakes.hpp"
#include "geo_resolver.hpp"

using namespace hazard;
using namespace hazard::fakes;

namespace {

GeoConfig fast_config() {
    GeoConfig cfg;
    cfg.high_accuracy_timeout_ms = 50;
    cfg.low_accuracy_timeout_ms = 50;
    cfg.ip_timeout_ms = 50;
    cfg.watch_interval_ms = 100;
    return cfg;
}

}  // namespace

TEST(GeoResolver, HighAccuracyFixShortCircuits) {
    auto device = std::make_unique<FakeLocationProvider>();
    device->high = reading_ok(31.77, 35.21);
    auto* dev = device.get();
    auto ip = std::make_unique<FakeIpLocator>();
    auto* ipl = ip.get();

    GeoResolver geo(fast_config(), std::move(device), std::move(ip));
    auto fix = geo.acquire_initial();
    ASSERT_TRUE(fix.has_value());
    EXPECT_EQ(fix->source, GeoSource::HighAccuracyGPS);
    EXPECT_DOUBLE_EQ(fix->lat, 31.77);
    EXPECT_EQ(dev->recorded().size(), 1u);
    EXPECT_EQ(ipl->calls, 0);

    auto best = geo.current_best();
    ASSERT_TRUE(best.has_value());
    EXPECT_DOUBLE_EQ(best->lng, 35.21);
}

TEST(GeoResolver, TimeoutFallsBackToLowAccuracy) {
    auto device = std::make_unique<FakeLocationProvider>();
    device->high = reading_status(LocationReading::Status::Timeout);
    device->low = reading_ok(32.1, 34.8);
    auto* dev = device.get();

    GeoResolver geo(fast_config(), std::move(device), std::make_unique<FakeIpLocator>());
    auto fix = geo.acquire_initial();
    ASSERT_TRUE(fix.has_value());
    EXPECT_EQ(fix->source, GeoSource::LowAccuracyGPS);
    auto calls = dev->recorded();
    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(calls[0], LocationAccuracy::High);
    EXPECT_EQ(calls[1], LocationAccuracy::Low);
}

TEST(GeoResolver, PermissionDeniedGoesStraightToIpLookup) {
    auto device = std::make_unique<FakeLocationProvider>();
    device->high = reading_status(LocationReading::Status::Denied);
    device->low = reading_ok(1.0, 1.0);
    auto* dev = device.get();
    auto ip = std::make_unique<FakeIpLocator>();
    ip->result = LatLng{32.08, 34.78};

    GeoResolver geo(fast_config(), std::move(device), std::move(ip));
    auto fix = geo.acquire_initial();
    ASSERT_TRUE(fix.has_value());
    EXPECT_EQ(fix->source, GeoSource::IP);
    EXPECT_DOUBLE_EQ(fix->lat, 32.08);
    EXPECT_DOUBLE_EQ(fix->lng, 34.78);
    EXPECT_EQ(dev->recorded().size(), 1u);
}

TEST(GeoResolver, EverythingFailsGivesDefault) {
    auto device = std::make_unique<FakeLocationProvider>();
    device->high = reading_status(LocationReading::Status::Timeout);
    device->low = reading_status(LocationReading::Status::Unavailable);
    auto ip = std::make_unique<FakeIpLocator>();
    ip->throw_error = true;

    GeoConfig cfg = fast_config();
    cfg.default_lat = 10.5;
    cfg.default_lng = 20.25;
    GeoResolver geo(cfg, std::move(device), std::move(ip));
    auto fix = geo.acquire_initial();
    ASSERT_TRUE(fix.has_value());
    EXPECT_EQ(fix->source, GeoSource::Default);
    EXPECT_DOUBLE_EQ(fix->lat, 10.5);
    EXPECT_DOUBLE_EQ(fix->lng, 20.25);
}

TEST(GeoResolver, NoProvidersUsesDefault) {
    GeoResolver geo(fast_config(), nullptr, nullptr);
    auto fix = geo.acquire_initial();
    ASSERT_TRUE(fix.has_value());
    EXPECT_EQ(fix->source, GeoSource::Default);
}

TEST(GeoResolver, UnavailableOnlyWithDefaultDisabled) {
    GeoConfig cfg = fast_config();
    cfg.default_enabled = false;
    auto ip = std::make_unique<FakeIpLocator>();
    GeoResolver geo(cfg, nullptr, std::move(ip));
    EXPECT_FALSE(geo.acquire_initial().has_value());
    EXPECT_FALSE(geo.current_best().has_value());
}

TEST(GeoResolver, WatchOverwritesFixAndStopClearsIt) {
    auto device = std::make_unique<FakeLocationProvider>();
    device->high = reading_status(LocationReading::Status::Timeout);
    auto* dev = device.get();
    auto ip = std::make_unique<FakeIpLocator>();
    ip->result = LatLng{32.08, 34.78};

    GeoResolver geo(fast_config(), std::move(device), std::move(ip));
    ASSERT_EQ(geo.acquire_initial()->source, GeoSource::IP);

    geo.start_continuous_updates();
    // A failing watch keeps the last fix.
    std::this_thread::sleep_for(std::chrono::milliseconds(150));
    ASSERT_TRUE(geo.current_best().has_value());
    EXPECT_EQ(geo.current_best()->source, GeoSource::IP);

    dev->set_high(reading_ok(31.5, 34.9));
    ASSERT_TRUE(wait_for([&] {
        auto best = geo.current_best();
        return best && best->source == GeoSource::HighAccuracyGPS;
    }));
    EXPECT_DOUBLE_EQ(geo.current_best()->lat, 31.5);

    geo.stop();
    EXPECT_FALSE(geo.current_best().has_value());
}

TEST(GeoResolver, CancelGivesUpAtNextTier) {
    auto device = std::make_unique<FakeLocationProvider>();
    device->high = reading_status(LocationReading::Status::Timeout);
    device->low = reading_ok(32.1, 34.8);
    auto* dev = device.get();
    auto ip = std::make_unique<FakeIpLocator>();
    ip->result = LatLng{32.08, 34.78};
    auto* ipl = ip.get();

    GeoResolver geo(fast_config(), std::move(device), std::move(ip));
    dev->on_locate = [&geo](LocationAccuracy) { geo.cancel(); };
    EXPECT_FALSE(geo.acquire_initial().has_value());
    EXPECT_EQ(dev->recorded().size(), 1u);
    EXPECT_EQ(ipl->calls, 0);
    EXPECT_FALSE(geo.current_best().has_value());

    // stop() lifts the cancellation.
    geo.stop();
    dev->on_locate = nullptr;
    auto fix = geo.acquire_initial();
    ASSERT_TRUE(fix.has_value());
    EXPECT_EQ(fix->source, GeoSource::LowAccuracyGPS);
}
