#include <gtest/gtest.h>
#include <ArduinoJson.h>
#include "telemetry_codec.h"

TEST(TelemetryCodec, EncodesReading) {
    Reading r;
    r.deviceId = "aa:bb:cc:dd:ee:ff";
    r.y = 12.34;
    r.x = -5.67;
    EXPECT_EQ(encodeReading(r), "{\"id\":\"aa:bb:cc:dd:ee:ff\",\"y\":12.34,\"x\":-5.67}");
}

TEST(TelemetryCodec, EmptyIdIsNull) {
    Reading r;
    EXPECT_EQ(encodeReading(r), "{\"id\":null,\"y\":0,\"x\":0}");
}

TEST(TelemetryCodec, StatusCarriesStateStatsAndReading) {
    BridgeStatus status;
    status.state = ConnectionState::Connected;
    status.stats.startMs = 1000;
    status.stats.sessionStartMs = 5000;
    status.stats.lastDataMs = 9000;
    status.stats.totalConnections = 2;
    status.stats.totalDisconnections = 1;
    status.stats.framesDecoded = 42;
    status.reading.deviceId = "aa:bb";
    status.reading.y = 1.5;
    status.reading.x = -3.2;
    status.deviceAddress = "aa:bb";
    status.deviceName = "KIRIRI01";
    status.consumers = 3;
    status.nowMs = 11000;

    DynamicJsonDocument doc(1024);
    ASSERT_FALSE(deserializeJson(doc, encodeStatus(status)));

    EXPECT_STREQ(doc["state"].as<const char*>(), "connected");
    EXPECT_EQ(doc["uptimeMs"].as<uint32_t>(), 10000u);
    EXPECT_EQ(doc["consumers"].as<int>(), 3);
    EXPECT_STREQ(doc["device"]["name"].as<const char*>(), "KIRIRI01");
    EXPECT_EQ(doc["stats"]["totalConnections"].as<int>(), 2);
    EXPECT_EQ(doc["stats"]["totalDisconnections"].as<int>(), 1);
    EXPECT_EQ(doc["stats"]["framesDecoded"].as<int>(), 42);
    EXPECT_EQ(doc["stats"]["sessionMs"].as<long>(), 6000);
    EXPECT_EQ(doc["stats"]["lastDataAgeMs"].as<long>(), 2000);
    EXPECT_STREQ(doc["reading"]["id"].as<const char*>(), "aa:bb");
    EXPECT_DOUBLE_EQ(doc["reading"]["y"].as<double>(), 1.5);
}

TEST(TelemetryCodec, StatusWithoutSessionUsesSentinels) {
    BridgeStatus status;
    status.state = ConnectionState::Reconnecting;
    status.nextRetryDelayMs = 7500;

    DynamicJsonDocument doc(1024);
    ASSERT_FALSE(deserializeJson(doc, encodeStatus(status)));

    EXPECT_STREQ(doc["state"].as<const char*>(), "reconnecting");
    EXPECT_TRUE(doc["device"]["address"].isNull());
    EXPECT_EQ(doc["stats"]["sessionMs"].as<long>(), -1);
    EXPECT_EQ(doc["stats"]["lastDataAgeMs"].as<long>(), -1);
    EXPECT_EQ(doc["stats"]["nextRetryDelayMs"].as<uint32_t>(), 7500u);
    EXPECT_TRUE(doc["reading"]["id"].isNull());
}
