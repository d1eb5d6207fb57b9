#include "geo_resolver.hpp"

#include <algorithm>
#include <iostream>

namespace hazard {

namespace {

LocationReading safe_locate(LocationProvider& device, LocationAccuracy accuracy, int timeout_ms) {
    try {
        return device.locate(accuracy, std::chrono::milliseconds(std::max(1, timeout_ms)));
    } catch (const std::exception& e) {
        LocationReading r;
        r.status = LocationReading::Status::Unavailable;
        r.detail = e.what();
        return r;
    }
}

}  // namespace

GeoResolver::GeoResolver(const GeoConfig& cfg,
                         std::unique_ptr<LocationProvider> device,
                         std::unique_ptr<IpLocator> ip)
    : cfg_(cfg), device_(std::move(device)), ip_(std::move(ip)) {}

GeoResolver::~GeoResolver() {
    stop();
}

void GeoResolver::publish(const GeoFix& fix) {
    std::lock_guard<std::mutex> lock(fix_mu_);
    best_ = fix;
}

std::optional<GeoFix> GeoResolver::current_best() const {
    std::lock_guard<std::mutex> lock(fix_mu_);
    return best_;
}

void GeoResolver::cancel() {
    cancelled_ = true;
}

std::optional<GeoFix> GeoResolver::acquire_initial() {
    auto abandoned = [this]() {
        if (!cancelled_) return false;
        std::cout << "[INFO] [geo] location lookup cancelled" << std::endl;
        return true;
    };

    if (abandoned()) return std::nullopt;
    if (device_) {
        auto high = safe_locate(*device_, LocationAccuracy::High, cfg_.high_accuracy_timeout_ms);
        if (high.status == LocationReading::Status::Ok) {
            GeoFix fix{high.lat, high.lng, GeoSource::HighAccuracyGPS, monotonic_seconds()};
            publish(fix);
            std::cout << "[INFO] [geo] location from high-accuracy GPS: " << fix.lat << ", " << fix.lng << std::endl;
            return fix;
        }
        std::cerr << "[WARN] [geo] high-accuracy GPS " << location_status_to_string(high.status)
                  << (high.detail.empty() ? "" : ": " + high.detail) << std::endl;

        if (abandoned()) return std::nullopt;
        if (high.status != LocationReading::Status::Denied) {
            auto low = safe_locate(*device_, LocationAccuracy::Low, cfg_.low_accuracy_timeout_ms);
            if (low.status == LocationReading::Status::Ok) {
                GeoFix fix{low.lat, low.lng, GeoSource::LowAccuracyGPS, monotonic_seconds()};
                publish(fix);
                std::cout << "[INFO] [geo] location from low-accuracy GPS: " << fix.lat << ", " << fix.lng << std::endl;
                return fix;
            }
            std::cerr << "[WARN] [geo] low-accuracy GPS " << location_status_to_string(low.status)
                      << (low.detail.empty() ? "" : ": " + low.detail) << std::endl;
        } else {
            std::cerr << "[WARN] [geo] GPS permission denied, trying IP lookup" << std::endl;
        }
    }

    if (abandoned()) return std::nullopt;
    if (ip_) {
        std::optional<LatLng> ll;
        try {
            ll = ip_->locate(std::chrono::milliseconds(std::max(1, cfg_.ip_timeout_ms)));
        } catch (const std::exception& e) {
            std::cerr << "[WARN] [geo] IP lookup failed: " << e.what() << std::endl;
        }
        if (ll) {
            GeoFix fix{ll->lat, ll->lng, GeoSource::IP, monotonic_seconds()};
            publish(fix);
            std::cout << "[INFO] [geo] location from IP lookup: " << fix.lat << ", " << fix.lng << std::endl;
            return fix;
        }
        std::cerr << "[WARN] [geo] IP lookup gave no location" << std::endl;
    }

    if (abandoned()) return std::nullopt;
    if (cfg_.default_enabled) {
        GeoFix fix{cfg_.default_lat, cfg_.default_lng, GeoSource::Default, monotonic_seconds()};
        publish(fix);
        std::cout << "[INFO] [geo] using default location: " << fix.lat << ", " << fix.lng << std::endl;
        return fix;
    }

    std::cerr << "[ERROR] [geo] location unavailable" << std::endl;
    return std::nullopt;
}

void GeoResolver::start_continuous_updates() {
    if (!device_ || cancelled_ || watching_.exchange(true)) return;
    watch_thread_ = std::thread(&GeoResolver::watch_loop, this);
}

void GeoResolver::stop() {
    {
        std::lock_guard<std::mutex> lock(watch_mu_);
        watching_ = false;
    }
    watch_cv_.notify_all();
    if (watch_thread_.joinable()) watch_thread_.join();

    std::lock_guard<std::mutex> lock(fix_mu_);
    best_.reset();
    cancelled_ = false;
}

void GeoResolver::watch_loop() {
    const int interval_ms = std::max(100, cfg_.watch_interval_ms);
    auto last_status = LocationReading::Status::Ok;

    std::unique_lock<std::mutex> lock(watch_mu_);
    while (watching_) {
        lock.unlock();
        auto reading = safe_locate(*device_, LocationAccuracy::High, interval_ms);
        lock.lock();
        if (!watching_) break;

        if (reading.status == LocationReading::Status::Ok) {
            publish(GeoFix{reading.lat, reading.lng, GeoSource::HighAccuracyGPS, monotonic_seconds()});
        } else if (reading.status != last_status) {
            std::cerr << "[WARN] [geo] location watch " << location_status_to_string(reading.status)
                      << (reading.detail.empty() ? "" : ": " + reading.detail) << std::endl;
        }
        last_status = reading.status;

        watch_cv_.wait_for(lock, std::chrono::milliseconds(interval_ms), [&] { return !watching_.load(); });
    }
}

}  // namespace hazard
