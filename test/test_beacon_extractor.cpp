#include <gtest/gtest.h>
#include "beacon_extractor.h"
#include "beacon_registry.h"
#include "fakes.h"
#include "token_codec.h"

static RadioCapabilities allCaps() {
    FakeRadio r;
    return r.capabilities();
}

TEST(BeaconExtractor, StrategyOrderFollowsCapabilities) {
    BeaconExtractor all(allCaps());
    ASSERT_EQ(3u, all.strategies().size());
    EXPECT_EQ(ExtractionStrategy::SERVICE_IDENTIFIER, all.strategies()[0]);
    EXPECT_EQ(ExtractionStrategy::DEVICE_NAME, all.strategies()[1]);
    EXPECT_EQ(ExtractionStrategy::IBEACON, all.strategies()[2]);

    RadioCapabilities caps;
    caps.reportsManufacturerData = true;
    BeaconExtractor vendorOnly(caps);
    ASSERT_EQ(1u, vendorOnly.strategies().size());
    EXPECT_EQ(ExtractionStrategy::IBEACON, vendorOnly.strategies()[0]);
}

TEST(BeaconExtractor, ServiceIdentifierAmongOtherUuids) {
    BeaconExtractor ex(allCaps());
    RadioFrame f = serviceFrame("0000180f-0000-1000-8000-00805f9b34fb", -60);
    f.serviceUuids.push_back(TokenCodec::encodeServiceIdentifier(0x0A1B, 0x2C3D));

    ExtractedToken t;
    ASSERT_TRUE(ex.extract(f, t));
    EXPECT_EQ(0x0A1B2C3Du, t.token);
    EXPECT_EQ(ExtractionStrategy::SERVICE_IDENTIFIER, t.via);
}

TEST(BeaconExtractor, FallsBackToDeviceName) {
    BeaconExtractor ex(allCaps());
    RadioFrame f;
    f.localName = "PXDEADBEEF";

    ExtractedToken t;
    ASSERT_TRUE(ex.extract(f, t));
    EXPECT_EQ(0xDEADBEEFu, t.token);
    EXPECT_EQ(0xDEAD, t.major);
    EXPECT_EQ(0xBEEF, t.minor);
    EXPECT_EQ(ExtractionStrategy::DEVICE_NAME, t.via);
}

TEST(BeaconExtractor, FallsBackToIBeacon) {
    BeaconExtractor ex(allCaps());
    RadioFrame f;
    f.localName        = "Headphones";
    f.manufacturerData = TokenCodec::encodeIBeacon(0x0001, 0x0002, -59);

    ExtractedToken t;
    ASSERT_TRUE(ex.extract(f, t));
    EXPECT_EQ(0x00010002u, t.token);
    EXPECT_EQ(ExtractionStrategy::IBEACON, t.via);
}

TEST(BeaconExtractor, FirstStrategyWins) {
    BeaconExtractor ex(allCaps());
    RadioFrame f = serviceFrame(TokenCodec::encodeServiceIdentifier(1, 1), -60);
    f.localName = "PX00020002";

    ExtractedToken t;
    ASSERT_TRUE(ex.extract(f, t));
    EXPECT_EQ(0x00010001u, t.token);
}

TEST(BeaconExtractor, UnsupportedStrategyIsNotTried) {
    RadioCapabilities caps;
    caps.reportsServiceUuids = true;
    BeaconExtractor ex(caps);

    RadioFrame f;
    f.localName = "PXDEADBEEF";
    ExtractedToken t;
    EXPECT_FALSE(ex.extract(f, t));
}

TEST(BeaconExtractor, ForeignFramesAreIgnored) {
    BeaconExtractor ex(allCaps());
    RadioFrame f = serviceFrame("0000180d-0000-1000-8000-00805f9b34fb", -40);
    f.localName        = "Fitbit";
    f.manufacturerData = std::string("\x06\x00\x01\x09", 4);

    ExtractedToken t;
    EXPECT_FALSE(ex.extract(f, t));
}

// ─── Registry ────────────────────────────────────────────────────────────────

static DiscoveredBeacon sighting(BeaconToken token, int rssi, uint32_t at) {
    DiscoveredBeacon b;
    b.token        = token;
    b.rssi         = rssi;
    b.lastSeenAtMs = at;
    return b;
}

TEST(BeaconRegistry, OneEntryPerTokenWithLatestReading) {
    BeaconRegistry reg;
    EXPECT_TRUE(reg.upsert(sighting(0x0A1B2C3D, -55, 100)));
    EXPECT_FALSE(reg.upsert(sighting(0x0A1B2C3D, -62, 200)));
    ASSERT_EQ(1u, reg.size());

    DiscoveredBeacon b;
    ASSERT_TRUE(reg.find(0x0A1B2C3D, b));
    EXPECT_EQ(-62, b.rssi);
    EXPECT_EQ(200u, b.lastSeenAtMs);
}

TEST(BeaconRegistry, EvictsOnlyPastTimeout) {
    BeaconRegistry reg;
    reg.upsert(sighting(1, -50, 0));
    reg.upsert(sighting(2, -50, 5000));

    EXPECT_EQ(0u, reg.evictStale(10000, 10000));
    EXPECT_EQ(1u, reg.evictStale(10001, 10000));
    ASSERT_EQ(1u, reg.size());

    DiscoveredBeacon b;
    EXPECT_TRUE(reg.find(2, b));
}

TEST(BeaconRegistry, EvictionSurvivesClockWrap) {
    BeaconRegistry reg;
    reg.upsert(sighting(1, -50, 0xFFFFF000u));
    EXPECT_EQ(0u, reg.evictStale(0x00000100u, 10000));
    EXPECT_EQ(1u, reg.evictStale(0x00003000u, 10000));
}
