#include <gtest/gtest.h>
#include "ble_scanner.h"
#include "fakes.h"
#include "token_codec.h"

class ScannerTest : public ::testing::Test {
protected:
    FakeRadio           radio;
    FakeClock           clock;
    BluetoothStateGuard guard{radio, clock};
    BeaconExtractor     extractor{radio.capabilities()};
    ScanningController  scanner{radio, guard, clock, extractor};

    std::vector<std::vector<DiscoveredBeacon> > deliveries;

    ScanCallback recorder() {
        std::vector<std::vector<DiscoveredBeacon> > *out = &deliveries;
        return [out](const std::vector<DiscoveredBeacon> &b) { out->push_back(b); };
    }

    void emit(BeaconToken token, int rssi) {
        uint16_t major, minor;
        TokenCodec::decode(token, major, minor);
        radio.emit(serviceFrame(TokenCodec::encodeServiceIdentifier(major, minor), rssi));
    }

    // Advance in small steps, polling like the main loop
    void run(uint32_t ms) {
        for (uint32_t t = 0; t < ms; t += 100) {
            clock.advance(100);
            scanner.poll();
        }
    }
};

TEST_F(ScannerTest, StartsOneContinuousScanWithDuplicates) {
    ASSERT_TRUE(scanner.start(recorder()));
    EXPECT_TRUE(scanner.isScanning());
    EXPECT_EQ(1, radio.scanStarts);
    EXPECT_TRUE(radio.lastAllowDuplicates);

    ASSERT_TRUE(scanner.start(recorder()));
    EXPECT_EQ(1, radio.scanStarts);
    EXPECT_EQ(2u, scanner.subscriberCount());
}

TEST_F(ScannerTest, FailsFastWhenRadioOff) {
    radio.radioState = RadioState::POWERED_OFF;
    EXPECT_FALSE(scanner.start(recorder()));
    EXPECT_EQ(ScannerState::IDLE, scanner.state());
    EXPECT_EQ(0u, scanner.subscriberCount());
    EXPECT_EQ(0, radio.scanStarts);
    EXPECT_EQ(0u, radio.listenerCount());
}

TEST_F(ScannerTest, FailsWhenNativeScanFails) {
    radio.scanFails = true;
    EXPECT_FALSE(scanner.start(recorder()));
    EXPECT_EQ(ScannerState::IDLE, scanner.state());
    EXPECT_EQ(0u, scanner.subscriberCount());
}

TEST_F(ScannerTest, DebouncesDelivery) {
    ASSERT_TRUE(scanner.start(recorder()));
    emit(0x0A1B2C3D, -55);
    EXPECT_TRUE(scanner.notificationPending());

    run(1900);
    EXPECT_TRUE(deliveries.empty());
    run(100);
    ASSERT_EQ(1u, deliveries.size());
    ASSERT_EQ(1u, deliveries[0].size());
    EXPECT_EQ(0x0A1B2C3Du, deliveries[0][0].token);
}

TEST_F(ScannerTest, SteadyTrafficKeepsFixedCadence) {
    ASSERT_TRUE(scanner.start(recorder()));
    for (int i = 0; i < 20; i++) {
        emit(0x0A1B2C3D, -60);
        run(300);
    }
    // 6 s of continuous frames at a 2 s cadence
    EXPECT_EQ(3u, deliveries.size());
}

TEST_F(ScannerTest, SingleEntryWithLatestRssi) {
    ASSERT_TRUE(scanner.start(recorder()));
    emit(0x0A1B2C3D, -55);
    clock.advance(500);
    emit(0x0A1B2C3D, -62);
    run(2000);

    ASSERT_EQ(1u, deliveries.size());
    ASSERT_EQ(1u, deliveries[0].size());
    EXPECT_EQ(-62, deliveries[0][0].rssi);
    EXPECT_GT(deliveries[0][0].distanceMeters, 0.0f);
}

TEST_F(ScannerTest, WeakAndForeignFramesAreDropped) {
    ScanOptions opts;
    opts.minRssi = -80;
    ASSERT_TRUE(scanner.start(recorder(), opts));

    emit(0x0A1B2C3D, -81);
    radio.emit(serviceFrame("0000180d-0000-1000-8000-00805f9b34fb", -40));
    EXPECT_FALSE(scanner.notificationPending());
    EXPECT_TRUE(scanner.beacons().empty());

    emit(0x0A1B2C3D, -80);
    EXPECT_EQ(1u, scanner.beacons().size());
}

TEST_F(ScannerTest, StaleBeaconIsReportedGone) {
    ASSERT_TRUE(scanner.start(recorder()));
    emit(0x0A1B2C3D, -55);

    run(12000);
    ASSERT_FALSE(deliveries.empty());
    EXPECT_EQ(1u, deliveries.front().size());
    EXPECT_TRUE(deliveries.back().empty());

    // Nothing left to report, timer stays idle
    size_t count = deliveries.size();
    run(10000);
    EXPECT_EQ(count, deliveries.size());
    EXPECT_FALSE(scanner.notificationPending());
}

TEST_F(ScannerTest, LastSubscriberStopsScan) {
    SubscriberId a, b;
    ASSERT_TRUE(scanner.start(recorder(), ScanOptions(), &a));
    ASSERT_TRUE(scanner.start(recorder(), ScanOptions(), &b));

    scanner.removeSubscriber(a);
    EXPECT_TRUE(scanner.isScanning());
    EXPECT_EQ(0, radio.scanStops);

    scanner.removeSubscriber(b);
    EXPECT_FALSE(scanner.isScanning());
    EXPECT_EQ(1, radio.scanStops);
}

TEST_F(ScannerTest, StopIsIdempotentAndClearsTimer) {
    ASSERT_TRUE(scanner.start(recorder()));
    emit(0x0A1B2C3D, -55);
    scanner.stop();
    scanner.stop();
    EXPECT_EQ(1, radio.scanStops);
    EXPECT_FALSE(scanner.notificationPending());

    run(3000);
    EXPECT_TRUE(deliveries.empty());
}

TEST_F(ScannerTest, RestartBeginsWithEmptyRegistry) {
    ASSERT_TRUE(scanner.start(recorder()));
    emit(0x0A1B2C3D, -55);
    scanner.stop();

    ASSERT_TRUE(scanner.start(recorder()));
    EXPECT_TRUE(scanner.beacons().empty());
}

TEST_F(ScannerTest, SubscriberMayUnsubscribeDuringDelivery) {
    SubscriberId first = 0;
    ScanningController *s = &scanner;
    SubscriberId *firstId = &first;
    int secondCalls = 0;
    int *calls = &secondCalls;

    ASSERT_TRUE(scanner.start([s, firstId](const std::vector<DiscoveredBeacon> &) {
        s->removeSubscriber(*firstId);
    }, ScanOptions(), &first));
    ASSERT_TRUE(scanner.start([calls](const std::vector<DiscoveredBeacon> &) { (*calls)++; }));

    emit(0x0A1B2C3D, -55);
    run(2000);
    EXPECT_EQ(1, secondCalls);
    EXPECT_EQ(1u, scanner.subscriberCount());
    EXPECT_TRUE(scanner.isScanning());
}
