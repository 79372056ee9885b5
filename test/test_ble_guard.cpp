#include <gtest/gtest.h>
#include "ble_guard.h"
#include "fakes.h"

class GuardTest : public ::testing::Test {
protected:
    FakeRadio           radio;
    FakeClock           clock;
    BluetoothStateGuard guard{radio, clock};
};

TEST_F(GuardTest, CheckStateReflectsRadio) {
    radio.radioState = RadioState::POWERED_OFF;
    BluetoothStatus st = guard.checkState();
    EXPECT_TRUE(st.supported);
    EXPECT_FALSE(st.enabled);

    radio.radioState = RadioState::UNSUPPORTED;
    st = guard.checkState();
    EXPECT_FALSE(st.supported);
    EXPECT_FALSE(st.enabled);
    EXPECT_EQ(RadioState::UNSUPPORTED, st.state);
}

TEST_F(GuardTest, ReadyImmediatelyWhenPoweredOn) {
    EXPECT_TRUE(guard.waitForReady(1000));
    EXPECT_EQ(0u, clock.sleeps);
    EXPECT_EQ(0u, radio.listenerCount());
}

TEST_F(GuardTest, WaitsForPowerOn) {
    radio.radioState = RadioState::POWERED_OFF;
    FakeRadio *r = &radio;
    int calls = 0;
    int *c = &calls;
    clock.onSleep = [r, c](uint32_t) {
        if (++*c == 5) r->setState(RadioState::POWERED_ON);
    };
    EXPECT_TRUE(guard.waitForReady(1000));
    EXPECT_EQ(5, calls);
    EXPECT_EQ(0u, radio.listenerCount());
}

TEST_F(GuardTest, TimesOutAndDetachesListener) {
    radio.radioState = RadioState::POWERED_OFF;
    uint32_t start = clock.now;
    EXPECT_FALSE(guard.waitForReady(500));
    EXPECT_GE(clock.now - start, 500u);
    EXPECT_EQ(0u, radio.listenerCount());
}

TEST_F(GuardTest, UnsupportedFailsWithoutWaiting) {
    radio.radioState = RadioState::UNSUPPORTED;
    EXPECT_FALSE(guard.waitForReady(5000));
    EXPECT_EQ(0u, clock.sleeps);
    EXPECT_EQ(0u, radio.listenerCount());
}

TEST_F(GuardTest, ImplicitModelNeedsOnlySupport) {
    EXPECT_TRUE(guard.requestPermissions());
    EXPECT_TRUE(radio.requested.empty());

    radio.radioState = RadioState::UNSUPPORTED;
    EXPECT_FALSE(guard.requestPermissions());
}

TEST_F(GuardTest, ExplicitModelRequestsByApiLevel) {
    radio.model    = PermissionModel::EXPLICIT;
    radio.apiLevel = 31;
    EXPECT_TRUE(guard.requestPermissions());
    ASSERT_EQ(4u, radio.requested.size());
    EXPECT_EQ(RadioPermission::SCAN, radio.requested[0]);
    EXPECT_EQ(RadioPermission::FINE_LOCATION, radio.requested[3]);

    radio.apiLevel = 30;
    EXPECT_TRUE(guard.requestPermissions());
    ASSERT_EQ(1u, radio.requested.size());
    EXPECT_EQ(RadioPermission::FINE_LOCATION, radio.requested[0]);
}

TEST_F(GuardTest, DeniedPermissionFailsEnsureReady) {
    radio.model = PermissionModel::EXPLICIT;
    radio.grant = false;
    EXPECT_FALSE(guard.ensureReady(1000));
}

TEST_F(GuardTest, EnsureReadyWaitsAfterGrant) {
    radio.model      = PermissionModel::EXPLICIT;
    radio.radioState = RadioState::POWERED_OFF;
    EXPECT_FALSE(guard.ensureReady(200));
    EXPECT_EQ(0u, radio.listenerCount());
}
