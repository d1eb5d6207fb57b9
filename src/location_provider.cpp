#include "location_provider.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <poll.h>
#include <sstream>
#include <termios.h>
#include <unistd.h>

#include <nlohmann/json.hpp>

#include "http_util.hpp"

namespace hazard {

namespace {

struct FdGuard {
    int fd{-1};
    ~FdGuard() {
        if (fd != -1) ::close(fd);
    }
};

speed_t to_speed(int baud) {
    switch (baud) {
        case 4800: return B4800;
        case 19200: return B19200;
        case 38400: return B38400;
        case 57600: return B57600;
        case 115200: return B115200;
        default: return B9600;
    }
}

bool configure_tty(int fd, int baud, std::string& err) {
    struct termios options{};
    if (::tcgetattr(fd, &options) != 0) {
        err = std::string("tcgetattr failed: ") + std::strerror(errno);
        return false;
    }
    ::cfsetispeed(&options, to_speed(baud));
    ::cfsetospeed(&options, to_speed(baud));

    // 8N1, raw
    options.c_cflag |= (CLOCAL | CREAD);
    options.c_cflag &= ~CSIZE;
    options.c_cflag |= CS8;
    options.c_cflag &= ~PARENB;
    options.c_cflag &= ~CSTOPB;
    options.c_lflag &= ~(ICANON | ECHO | ECHOE | ISIG);
    options.c_oflag &= ~OPOST;
    options.c_iflag &= ~(IXON | IXOFF | IXANY | ICRNL);

    if (::tcsetattr(fd, TCSANOW, &options) != 0) {
        err = std::string("tcsetattr failed: ") + std::strerror(errno);
        return false;
    }
    return true;
}

double nmea_to_degrees(const std::string& value, const std::string& hemisphere) {
    const double v = std::atof(value.c_str());
    const double deg = std::floor(v / 100.0);
    double out = deg + (v - deg * 100.0) / 60.0;
    if (hemisphere == "S" || hemisphere == "W") out = -out;
    return out;
}

bool checksum_ok(const std::string& sentence) {
    auto star = sentence.find('*');
    if (star == std::string::npos) return true;
    if (star + 3 > sentence.size()) return false;
    unsigned char sum = 0;
    for (size_t i = 1; i < star; ++i) sum ^= static_cast<unsigned char>(sentence[i]);
    const auto expected = std::strtoul(sentence.substr(star + 1, 2).c_str(), nullptr, 16);
    return sum == expected;
}

}  // namespace

const char* location_status_to_string(LocationReading::Status s) {
    switch (s) {
        case LocationReading::Status::Ok: return "ok";
        case LocationReading::Status::Timeout: return "timeout";
        case LocationReading::Status::Denied: return "denied";
        case LocationReading::Status::Unavailable: return "unavailable";
    }
    return "unavailable";
}

std::optional<GgaFix> parse_gga(const std::string& sentence) {
    if (sentence.size() < 7 || sentence[0] != '$' || sentence.compare(3, 3, "GGA") != 0) return std::nullopt;
    if (!checksum_ok(sentence)) return std::nullopt;

    const auto star = sentence.find('*');
    std::string body = sentence.substr(1, star == std::string::npos ? std::string::npos : star - 1);
    std::vector<std::string> fields;
    std::stringstream ss(body);
    std::string field;
    while (std::getline(ss, field, ',')) fields.push_back(field);
    if (fields.size() < 9) return std::nullopt;

    GgaFix fix;
    fix.quality = std::atoi(fields[6].c_str());
    if (fix.quality <= 0 || fields[2].empty() || fields[4].empty()) {
        fix.quality = 0;
        return fix;
    }
    fix.lat = nmea_to_degrees(fields[2], fields[3]);
    fix.lng = nmea_to_degrees(fields[4], fields[5]);
    fix.satellites = std::atoi(fields[7].c_str());
    if (!fields[8].empty()) fix.hdop = std::atof(fields[8].c_str());
    return fix;
}

NmeaLocationProvider::NmeaLocationProvider(std::string device_path, int baud, double max_hdop_high)
    : device_path_(std::move(device_path)), baud_(baud), max_hdop_high_(max_hdop_high) {}

LocationReading NmeaLocationProvider::locate(LocationAccuracy accuracy, std::chrono::milliseconds timeout) {
    using clock = std::chrono::steady_clock;
    LocationReading reading;

    FdGuard guard;
    guard.fd = ::open(device_path_.c_str(), O_RDONLY | O_NOCTTY | O_NONBLOCK);
    if (guard.fd == -1) {
        const int e = errno;
        reading.status = (e == EACCES || e == EPERM) ? LocationReading::Status::Denied
                                                     : LocationReading::Status::Unavailable;
        reading.detail = device_path_ + ": " + std::strerror(e);
        return reading;
    }
    if (::isatty(guard.fd)) {
        std::string err;
        if (!configure_tty(guard.fd, baud_, err)) {
            reading.status = LocationReading::Status::Unavailable;
            reading.detail = err;
            return reading;
        }
    }

    const auto deadline = clock::now() + timeout;
    std::string pending;
    char buf[512];

    while (true) {
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now());
        if (left.count() <= 0) break;

        struct pollfd pfd{guard.fd, POLLIN, 0};
        const int pr = ::poll(&pfd, 1, static_cast<int>(left.count()));
        if (pr < 0) {
            if (errno == EINTR) continue;
            reading.status = LocationReading::Status::Unavailable;
            reading.detail = std::string("poll failed: ") + std::strerror(errno);
            return reading;
        }
        if (pr == 0) break;

        const ssize_t n = ::read(guard.fd, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EAGAIN || errno == EINTR) continue;
            reading.status = LocationReading::Status::Unavailable;
            reading.detail = std::string("read failed: ") + std::strerror(errno);
            return reading;
        }
        if (n == 0) {
            // Plain files end; wait out the deadline like a silent receiver would.
            ::usleep(20000);
            continue;
        }
        pending.append(buf, static_cast<size_t>(n));

        size_t nl;
        while ((nl = pending.find('\n')) != std::string::npos) {
            std::string line = pending.substr(0, nl);
            pending.erase(0, nl + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();

            auto fix = parse_gga(line);
            if (!fix || fix->quality <= 0) continue;
            if (accuracy == LocationAccuracy::High && fix->hdop > max_hdop_high_) continue;

            reading.status = LocationReading::Status::Ok;
            reading.lat = fix->lat;
            reading.lng = fix->lng;
            reading.hdop = fix->hdop;
            return reading;
        }
        if (pending.size() > 4096) pending.clear();
    }

    reading.status = LocationReading::Status::Timeout;
    reading.detail = "no usable GGA fix before deadline";
    return reading;
}

HttpIpLocator::HttpIpLocator(std::vector<std::string> urls) : urls_(std::move(urls)) {}

std::optional<LatLng> HttpIpLocator::locate(std::chrono::milliseconds timeout) {
    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + timeout;

    for (const auto& url : urls_) {
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now());
        if (left.count() <= 0) break;

        const UrlParts parts = split_url(url);
        auto cli = make_client(parts.origin, static_cast<int>(left.count()));
        auto res = cli->Get(parts.path.empty() ? "/" : parts.path);
        if (!res) {
            std::cerr << "[WARN] [geo] IP lookup " << url << " failed: " << httplib::to_string(res.error()) << std::endl;
            continue;
        }
        if (res->status != 200) {
            std::cerr << "[WARN] [geo] IP lookup " << url << " returned HTTP " << res->status << std::endl;
            continue;
        }
        nlohmann::json j = nlohmann::json::parse(res->body, nullptr, false);
        if (j.is_discarded() || !j.is_object()) continue;

        for (const auto& keys : {std::make_pair("latitude", "longitude"), std::make_pair("lat", "lon")}) {
            if (j.contains(keys.first) && j.contains(keys.second) &&
                j[keys.first].is_number() && j[keys.second].is_number()) {
                return LatLng{j[keys.first].get<double>(), j[keys.second].get<double>()};
            }
        }
        std::cerr << "[WARN] [geo] IP lookup " << url << " reply has no coordinates" << std::endl;
    }
    return std::nullopt;
}

}  // namespace hazard
