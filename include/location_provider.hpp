#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace hazard {

enum class LocationAccuracy { High, Low };

struct LocationReading {
    enum class Status { Ok, Timeout, Denied, Unavailable };

    Status status{Status::Unavailable};
    double lat{0.0};
    double lng{0.0};
    double hdop{0.0};
    std::string detail;
};

const char* location_status_to_string(LocationReading::Status s);

// Device positioning. locate() must return within timeout.
class LocationProvider {
public:
    virtual ~LocationProvider() = default;
    virtual LocationReading locate(LocationAccuracy accuracy, std::chrono::milliseconds timeout) = 0;
};

struct LatLng {
    double lat{0.0};
    double lng{0.0};
};

class IpLocator {
public:
    virtual ~IpLocator() = default;
    virtual std::optional<LatLng> locate(std::chrono::milliseconds timeout) = 0;
};

struct GgaFix {
    double lat{0.0};
    double lng{0.0};
    int quality{0};        // 0 = no fix
    int satellites{0};
    double hdop{99.9};
};

// Parses a $--GGA sentence, checksum included when present.
std::optional<GgaFix> parse_gga(const std::string& sentence);

// Reads NMEA-0183 from a serial GPS receiver.
class NmeaLocationProvider : public LocationProvider {
public:
    NmeaLocationProvider(std::string device_path, int baud, double max_hdop_high);

    LocationReading locate(LocationAccuracy accuracy, std::chrono::milliseconds timeout) override;

private:
    std::string device_path_;
    int baud_;
    double max_hdop_high_;
};

// Queries IP geolocation services in order. Replies may carry
// latitude/longitude or lat/lon.
class HttpIpLocator : public IpLocator {
public:
    explicit HttpIpLocator(std::vector<std::string> urls);

    std::optional<LatLng> locate(std::chrono::milliseconds timeout) override;

private:
    std::vector<std::string> urls_;
};

}  // namespace hazard
