#include "hazard_app.hpp"

#include <iostream>

#include "local_backend.hpp"
#include "location_provider.hpp"

namespace hazard {

HazardApp::HazardApp(const AppConfig& cfg) : cfg_(cfg) {
    source_ = std::make_unique<VideoSource>(cfg_.source, cfg_.target_fps);
    throttle_ = std::make_unique<FrameThrottle>(cfg_.throttle);

    std::unique_ptr<RemoteInference> remote;
    if (!cfg_.dispatcher.remote_urls.empty()) {
        auto http = std::make_unique<HttpRemoteInference>(cfg_.dispatcher, cfg_.class_names);
        remote_ = http.get();
        remote = std::move(http);
    }
    std::unique_ptr<LocalInference> local;
    if (!cfg_.dispatcher.model_path.empty()) {
        local = std::make_unique<LocalModel>(cfg_.dispatcher, cfg_.img_size);
    }
    dispatcher_ = std::make_unique<InferenceDispatcher>(cfg_.dispatcher, std::move(remote), std::move(local));

    post_ = std::make_unique<DetectionPostprocessor>(cfg_.post, cfg_.class_names);
    tracker_ = std::make_unique<ObjectTracker>(cfg_.tracker);

    std::unique_ptr<LocationProvider> device;
    if (!cfg_.geo.gps_device.empty()) {
        device = std::make_unique<NmeaLocationProvider>(cfg_.geo.gps_device, cfg_.geo.gps_baud,
                                                        cfg_.geo.gps_max_hdop_high);
    }
    std::unique_ptr<IpLocator> ip;
    if (!cfg_.geo.ip_lookup_urls.empty()) {
        ip = std::make_unique<HttpIpLocator>(cfg_.geo.ip_lookup_urls);
    }
    geo_ = std::make_unique<GeoResolver>(cfg_.geo, std::move(device), std::move(ip));

    reports_ = std::make_unique<ReportPublisher>(cfg_.reports.queue_size);
    if (!cfg_.reports.jsonl_path.empty()) {
        reports_->add_sink(std::make_unique<JsonlReportSink>(cfg_.reports.jsonl_path, cfg_.reports.snapshot_dir));
    }
    if (!cfg_.reports.upload_url.empty()) {
        reports_->add_sink(std::make_unique<HttpReportSink>(cfg_.reports.upload_url, cfg_.reports.upload_timeout_ms,
                                                            cfg_.reports.upload_retries));
    }

    pipeline_ = std::make_unique<Pipeline>(cfg_, *source_, *throttle_, *dispatcher_, *post_, *tracker_, *geo_);
    pipeline_->subscribe([this](const SaveEvent& ev) { reports_->publish(ev); });
}

HazardApp::~HazardApp() {
    stop();
}

void HazardApp::start() {
    reports_->start();
    try {
        pipeline_->start();
    } catch (const std::exception&) {
        reports_->stop();
        throw;
    }
}

void HazardApp::stop() {
    pipeline_->stop();
    if (remote_) remote_->end_session();
    reports_->stop();
}

}  // namespace hazard
