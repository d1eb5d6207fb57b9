#pragma once

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

#include "config.hpp"
#include "frame_types.hpp"
#include "location_provider.hpp"

namespace hazard {

// Holds the best known position. Tiers: high-accuracy GPS, low-accuracy
// GPS, IP lookup, configured default. Never throws.
class GeoResolver {
public:
    // Either provider may be null.
    GeoResolver(const GeoConfig& cfg,
                std::unique_ptr<LocationProvider> device,
                std::unique_ptr<IpLocator> ip);
    ~GeoResolver();

    GeoResolver(const GeoResolver&) = delete;
    GeoResolver& operator=(const GeoResolver&) = delete;

    // Walks the tiers until one answers. Returns nullopt when every tier
    // fails or cancel() was called; a tier in progress is not interrupted.
    std::optional<GeoFix> acquire_initial();
    std::optional<GeoFix> current_best() const;

    void start_continuous_updates();
    // Makes a running acquire_initial() give up at the next tier. Holds
    // until stop().
    void cancel();
    // Ends the watch and forgets the fix.
    void stop();

private:
    void publish(const GeoFix& fix);
    void watch_loop();

    GeoConfig cfg_;
    std::unique_ptr<LocationProvider> device_;
    std::unique_ptr<IpLocator> ip_;

    mutable std::mutex fix_mu_;
    std::optional<GeoFix> best_;

    std::atomic<bool> cancelled_{false};
    std::atomic<bool> watching_{false};
    std::thread watch_thread_;
    std::mutex watch_mu_;
    std::condition_variable watch_cv_;
};

}  // namespace hazard
