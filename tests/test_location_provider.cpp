#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>

#include "location_provider.hpp"

using namespace hazard;

namespace {

std::string with_checksum(const std::string& body) {
    unsigned char sum = 0;
    for (char c : body) sum ^= static_cast<unsigned char>(c);
    char hex[4];
    std::snprintf(hex, sizeof(hex), "%02X", sum);
    return "$" + body + "*" + hex;
}

std::string write_nmea(const std::string& name, const std::vector<std::string>& lines) {
    const std::string path = ::testing::TempDir() + name;
    std::ofstream f(path, std::ios::trunc);
    for (const auto& l : lines) f << l << "\r\n";
    return path;
}

}  // namespace

TEST(ParseGga, ReferenceSentence) {
    auto fix = parse_gga("$GPGGA,123519,4807.038,N,01131.000,E,1,08,0.9,545.4,M,46.9,M,,*47");
    ASSERT_TRUE(fix.has_value());
    EXPECT_EQ(fix->quality, 1);
    EXPECT_EQ(fix->satellites, 8);
    EXPECT_NEAR(fix->lat, 48.1173, 1e-4);
    EXPECT_NEAR(fix->lng, 11.516667, 1e-5);
    EXPECT_DOUBLE_EQ(fix->hdop, 0.9);
}

TEST(ParseGga, SouthernAndWesternHemispheres) {
    auto fix = parse_gga(with_checksum("GNGGA,010203,3352.000,S,15112.000,W,2,10,1.1,10.0,M,0.0,M,,"));
    ASSERT_TRUE(fix.has_value());
    EXPECT_NEAR(fix->lat, -33.866667, 1e-5);
    EXPECT_NEAR(fix->lng, -151.2, 1e-5);
}

TEST(ParseGga, RejectsBadChecksumAndOtherSentences) {
    EXPECT_FALSE(parse_gga("$GPGGA,123519,4807.038,N,01131.000,E,1,08,0.9,545.4,M,46.9,M,,*48").has_value());
    EXPECT_FALSE(parse_gga("$GPRMC,123519,A,4807.038,N,01131.000,E,022.4,084.4,230394,003.1,W*6A").has_value());
    EXPECT_FALSE(parse_gga("garbage").has_value());
}

TEST(ParseGga, NoFixReportsQualityZero) {
    auto fix = parse_gga(with_checksum("GPGGA,123519,,,,,0,00,,,M,,M,,"));
    ASSERT_TRUE(fix.has_value());
    EXPECT_EQ(fix->quality, 0);
}

TEST(NmeaLocationProvider, ReadsFixFromDevice) {
    const auto path = write_nmea("gps_good.nmea", {
        with_checksum("GPGGA,120000,,,,,0,00,,,M,,M,,"),
        with_checksum("GPGGA,120001,3204.800,N,03446.680,E,1,09,0.8,30.0,M,0.0,M,,"),
    });
    NmeaLocationProvider gps(path, 9600, 2.0);
    auto r = gps.locate(LocationAccuracy::High, std::chrono::milliseconds(500));
    ASSERT_EQ(r.status, LocationReading::Status::Ok) << r.detail;
    EXPECT_NEAR(r.lat, 32.08, 1e-6);
    EXPECT_NEAR(r.lng, 34.778, 1e-6);
}

TEST(NmeaLocationProvider, PoorHdopOnlySatisfiesLowAccuracy) {
    const auto path = write_nmea("gps_poor.nmea", {
        with_checksum("GPGGA,120001,3204.800,N,03446.680,E,1,04,6.5,30.0,M,0.0,M,,"),
    });
    NmeaLocationProvider gps(path, 9600, 2.0);
    auto high = gps.locate(LocationAccuracy::High, std::chrono::milliseconds(100));
    EXPECT_EQ(high.status, LocationReading::Status::Timeout);
    auto low = gps.locate(LocationAccuracy::Low, std::chrono::milliseconds(100));
    EXPECT_EQ(low.status, LocationReading::Status::Ok);
    EXPECT_DOUBLE_EQ(low.hdop, 6.5);
}

TEST(NmeaLocationProvider, MissingDeviceIsUnavailable) {
    NmeaLocationProvider gps("/nonexistent/ttyGPS0", 9600, 2.0);
    auto r = gps.locate(LocationAccuracy::High, std::chrono::milliseconds(50));
    EXPECT_EQ(r.status, LocationReading::Status::Unavailable);
    EXPECT_FALSE(r.detail.empty());
}
