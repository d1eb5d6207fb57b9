#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "config.hpp"
#include "frame_buffer.hpp"
#include "frame_types.hpp"

namespace hazard {

// Destination for saved hazards. submit() may throw on failure.
class ReportSink {
public:
    virtual ~ReportSink() = default;
    virtual void submit(const SaveEvent& ev) = 0;
    virtual std::string name() const = 0;
};

// JSON record for one event, without the image.
nlohmann::json report_to_json(const SaveEvent& ev);

// Human-readable origin of the coordinates.
std::string location_note_for(const std::optional<GeoFix>& geo);

// Snapshot JPEG in snapshot_dir plus one line per event appended to jsonl_path.
class JsonlReportSink : public ReportSink {
public:
    JsonlReportSink(std::string jsonl_path, std::string snapshot_dir);

    void submit(const SaveEvent& ev) override;
    std::string name() const override { return "jsonl"; }

private:
    std::string jsonl_path_;
    std::string snapshot_dir_;
    std::mutex mu_;
};

// Multipart upload to the report service, retried on transport errors and 5xx.
class HttpReportSink : public ReportSink {
public:
    HttpReportSink(std::string upload_url, int timeout_ms, int retries);

    void submit(const SaveEvent& ev) override;
    std::string name() const override { return "http"; }

private:
    std::string upload_url_;
    int timeout_ms_;
    int retries_;
};

// Reads a JSONL report file into a JSON array, skipping unparsable lines.
nlohmann::json read_reports(const std::string& jsonl_path);

// Hands events to the sinks on a worker thread. publish() never blocks on I/O;
// a full queue drops the oldest pending event.
class ReportPublisher {
public:
    explicit ReportPublisher(size_t queue_size = 16);
    ~ReportPublisher();

    ReportPublisher(const ReportPublisher&) = delete;
    ReportPublisher& operator=(const ReportPublisher&) = delete;

    void add_sink(std::unique_ptr<ReportSink> sink);

    void start();
    // Drains what is already queued, then joins.
    void stop();

    void publish(const SaveEvent& ev);

    uint64_t delivered() const { return delivered_.load(); }
    uint64_t failed() const { return failed_.load(); }
    uint64_t dropped() const { return dropped_.load(); }

private:
    void run();

    FrameBuffer<SaveEvent> queue_;
    std::vector<std::unique_ptr<ReportSink>> sinks_;
    std::thread worker_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> delivered_{0};
    std::atomic<uint64_t> failed_{0};
    std::atomic<uint64_t> dropped_{0};
};

}  // namespace hazard
