#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <stdio.h>
#include "ble_advertiser.h"
#include "fakes.h"
#include "token_codec.h"

using ::testing::_;
using ::testing::DoAll;
using ::testing::InSequence;
using ::testing::Return;
using ::testing::SetArgReferee;
using ::testing::StrEq;

static const char *REGISTER_PATH = "/api/v1/discovery/beacon/register";

static std::string registerBody(const char *token, uint32_t ttl) {
    char buf[128];
    snprintf(buf, sizeof(buf), "{\"beaconToken\":\"%s\",\"ttlSeconds\":%lu}", token,
             (unsigned long)ttl);
    return buf;
}

class AdvertiserTest : public ::testing::Test {
protected:
    ::testing::StrictMock<MockHttpTransport> http;
    FakeRadio           radio;
    FakeClock           clock;
    BluetoothStateGuard guard{radio, clock};
    DiscoveryClient     client{http, clock};
    AdvertisingController advertiser{radio, guard, client, clock,
                                     BroadcastCapability::SERVICE_IDENTIFIER};

    void expectRegister(const char *token, uint32_t ttl = 300) {
        EXPECT_CALL(http, request(StrEq("POST"), REGISTER_PATH, _, _))
            .WillOnce(DoAll(SetArgReferee<3>(httpResponse(201, registerBody(token, ttl))),
                            Return(true)));
    }

    void expectDeregister(const char *token) {
        EXPECT_CALL(http, request(StrEq("DELETE"),
                                  std::string("/api/v1/discovery/beacon/") + token, _, _))
            .WillOnce(DoAll(SetArgReferee<3>(httpResponse(204, "")), Return(true)));
    }
};

TEST_F(AdvertiserTest, StartBroadcastsServiceIdentifierAndName) {
    expectRegister("0A1B2C3D");
    ASSERT_TRUE(advertiser.start(DiscoveryContext::P2P_RECEIVE));

    EXPECT_EQ(AdvertiserState::BROADCASTING, advertiser.state());
    BeaconToken token;
    ASSERT_TRUE(advertiser.activeToken(token));
    EXPECT_EQ(0x0A1B2C3Du, token);

    ASSERT_EQ(1u, radio.payloads.size());
    EXPECT_EQ(BroadcastCapability::SERVICE_IDENTIFIER, radio.payloads[0].kind);
    EXPECT_EQ("E2C56DB5-DFFB-0A1B-2C3D-D0F5A71096E0", radio.payloads[0].serviceIdentifier);
    EXPECT_EQ("PX0A1B2C3D", radio.payloads[0].localName);
    EXPECT_EQ(300u, advertiser.remainingSeconds());

    expectDeregister("0A1B2C3D");
    advertiser.stop();
}

TEST_F(AdvertiserTest, StopDeregistersExactlyOnce) {
    expectRegister("0A1B2C3D");
    ASSERT_TRUE(advertiser.start(DiscoveryContext::MERCHANT_RECEIVE));

    expectDeregister("0A1B2C3D");
    advertiser.stop();
    advertiser.stop();

    EXPECT_EQ(AdvertiserState::IDLE, advertiser.state());
    BeaconToken token;
    EXPECT_FALSE(advertiser.activeToken(token));
    EXPECT_FALSE(radio.advertising);
    EXPECT_EQ(0u, advertiser.remainingSeconds());
}

TEST_F(AdvertiserTest, RegistrationFailureNeverBroadcasts) {
    EXPECT_CALL(http, request(StrEq("POST"), REGISTER_PATH, _, _))
        .WillOnce(DoAll(SetArgReferee<3>(httpResponse(401, "{}")), Return(true)));

    EXPECT_FALSE(advertiser.start(DiscoveryContext::P2P_RECEIVE));
    EXPECT_EQ(AdvertiserState::IDLE, advertiser.state());
    EXPECT_EQ(0, radio.advertiseStarts);
}

TEST_F(AdvertiserTest, NativeFailuresAreRetried) {
    radio.advertiseFailures = ADV_START_RETRIES - 1;
    expectRegister("00000001");

    uint32_t before = clock.now;
    ASSERT_TRUE(advertiser.start(DiscoveryContext::P2P_RECEIVE));
    EXPECT_EQ(ADV_START_RETRIES, radio.advertiseStarts);
    EXPECT_EQ((uint32_t)(ADV_START_RETRIES - 1) * ADV_RETRY_BACKOFF_MS, clock.now - before);

    expectDeregister("00000001");
    advertiser.stop();
}

TEST_F(AdvertiserTest, ExhaustedRetriesReleaseToken) {
    radio.advertiseFailures = ADV_START_RETRIES + 1;
    {
        InSequence seq;
        expectRegister("00000002");
        expectDeregister("00000002");
    }

    EXPECT_FALSE(advertiser.start(DiscoveryContext::P2P_RECEIVE));
    EXPECT_EQ(ADV_START_RETRIES + 1, radio.advertiseStarts);
    EXPECT_EQ(AdvertiserState::IDLE, advertiser.state());
    BeaconToken token;
    EXPECT_FALSE(advertiser.activeToken(token));
}

TEST_F(AdvertiserTest, RadioOffAfterRegisterReleasesToken) {
    radio.radioState = RadioState::POWERED_OFF;
    {
        InSequence seq;
        expectRegister("00000003");
        expectDeregister("00000003");
    }

    EXPECT_FALSE(advertiser.start(DiscoveryContext::P2P_RECEIVE));
    EXPECT_EQ(0, radio.advertiseStarts);
    EXPECT_EQ(AdvertiserState::IDLE, advertiser.state());
}

TEST_F(AdvertiserTest, RestartReplacesPreviousRegistration) {
    {
        InSequence seq;
        expectRegister("00000004");
        expectDeregister("00000004");
        expectRegister("00000005");
    }
    ASSERT_TRUE(advertiser.start(DiscoveryContext::P2P_RECEIVE));
    ASSERT_TRUE(advertiser.start(DiscoveryContext::MERCHANT_RECEIVE));

    BeaconToken token;
    ASSERT_TRUE(advertiser.activeToken(token));
    EXPECT_EQ(5u, token);
    EXPECT_EQ(DiscoveryContext::MERCHANT_RECEIVE, advertiser.context());

    expectDeregister("00000005");
    advertiser.stop();
}

TEST_F(AdvertiserTest, ExpiryEndsBroadcastWithoutDeregister) {
    expectRegister("00000006", 60);
    ASSERT_TRUE(advertiser.start(DiscoveryContext::P2P_RECEIVE));

    clock.advance(59000);
    advertiser.poll();
    EXPECT_TRUE(advertiser.isAdvertising());

    clock.advance(1000);
    advertiser.poll();
    EXPECT_EQ(AdvertiserState::IDLE, advertiser.state());
    EXPECT_FALSE(radio.advertising);

    // Nothing held, so no deregister on stop
    advertiser.stop();
}

TEST_F(AdvertiserTest, AutoRenewBeforeExpiry) {
    AdvertiseOptions opts;
    opts.autoRenew = true;
    opts.registration.ttlSeconds = 120;
    {
        InSequence seq;
        expectRegister("00000007", 120);
        expectDeregister("00000007");
        expectRegister("00000008", 120);
    }
    ASSERT_TRUE(advertiser.start(DiscoveryContext::P2P_RECEIVE, opts));

    clock.advance((120 - ADV_RENEW_MARGIN_S) * 1000 - 1);
    advertiser.poll();
    BeaconToken token;
    ASSERT_TRUE(advertiser.activeToken(token));
    EXPECT_EQ(7u, token);

    clock.advance(1);
    advertiser.poll();
    ASSERT_TRUE(advertiser.activeToken(token));
    EXPECT_EQ(8u, token);
    EXPECT_TRUE(advertiser.isAdvertising());

    expectDeregister("00000008");
    advertiser.stop();
}

TEST(AdvertisePayload, IBeaconCarriesMajorMinor) {
    BeaconRegistration reg;
    reg.token = 0x12345678;
    TokenCodec::decode(reg.token, reg.major, reg.minor);

    AdvertisePayload p = AdvertisingController::buildPayload(BroadcastCapability::IBEACON, reg);
    EXPECT_EQ(BroadcastCapability::IBEACON, p.kind);
    EXPECT_TRUE(p.serviceIdentifier.empty());

    uint16_t major, minor;
    BeaconToken token;
    ASSERT_TRUE(TokenCodec::decodeIBeacon(p.manufacturerData, major, minor, token));
    EXPECT_EQ(0x12345678u, token);
}
