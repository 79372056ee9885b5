#include <gtest/gtest.h>
#include "config.h"
#include "token_codec.h"

TEST(TokenCodec, EncodeCombinesMajorAndMinor) {
    EXPECT_EQ(0x0A1B2C3Du, TokenCodec::encode(0x0A1B, 0x2C3D));
    EXPECT_EQ(0xFFFF0000u, TokenCodec::encode(0xFFFF, 0));
    EXPECT_EQ(0x0000FFFFu, TokenCodec::encode(0, 0xFFFF));
}

TEST(TokenCodec, EncodeMasksToSixteenBits) {
    EXPECT_EQ(0x23454567u, TokenCodec::encode(0x12345, 0x34567));
}

TEST(TokenCodec, DecodeIsInverseAtBoundaries) {
    const BeaconToken tokens[] = {0u, 1u, 0xFFFFu, 0x10000u, 0xDEADBEEFu, 0xFFFFFFFFu};
    for (size_t i = 0; i < sizeof(tokens) / sizeof(tokens[0]); i++) {
        uint16_t major, minor;
        TokenCodec::decode(tokens[i], major, minor);
        EXPECT_EQ(tokens[i], TokenCodec::encode(major, minor));
    }
}

TEST(TokenCodec, HexIsUppercaseAndPadded) {
    EXPECT_EQ("0000002A", TokenCodec::toHex(42));
    EXPECT_EQ("DEADBEEF", TokenCodec::toHex(0xDEADBEEF));
}

TEST(TokenCodec, FromHexAcceptsEitherCase) {
    BeaconToken t = 0;
    ASSERT_TRUE(TokenCodec::fromHex("deadBEEF", t));
    EXPECT_EQ(0xDEADBEEFu, t);
}

TEST(TokenCodec, FromHexRejectsMalformed) {
    BeaconToken t = 7;
    EXPECT_FALSE(TokenCodec::fromHex("", t));
    EXPECT_FALSE(TokenCodec::fromHex("DEADBEE", t));
    EXPECT_FALSE(TokenCodec::fromHex("DEADBEEF0", t));
    EXPECT_FALSE(TokenCodec::fromHex("DEADBEEG", t));
    EXPECT_EQ(7u, t);
}

TEST(TokenCodec, ServiceIdentifierLayout) {
    EXPECT_EQ("E2C56DB5-DFFB-0A1B-2C3D-D0F5A71096E0",
              TokenCodec::encodeServiceIdentifier(0x0A1B, 0x2C3D));
}

TEST(TokenCodec, ServiceIdentifierRoundTrip) {
    uint16_t major, minor;
    BeaconToken token;
    std::string id = TokenCodec::encodeServiceIdentifier(0xBEEF, 0x0001);
    ASSERT_TRUE(TokenCodec::decodeServiceIdentifier(id, major, minor, token));
    EXPECT_EQ(0xBEEF, major);
    EXPECT_EQ(0x0001, minor);
    EXPECT_EQ(0xBEEF0001u, token);
}

TEST(TokenCodec, ServiceIdentifierAcceptsLowercaseFromStack) {
    uint16_t major, minor;
    BeaconToken token;
    ASSERT_TRUE(TokenCodec::decodeServiceIdentifier("e2c56db5-dffb-0a1b-2c3d-d0f5a71096e0",
                                                    major, minor, token));
    EXPECT_EQ(0x0A1B2C3Du, token);
}

TEST(TokenCodec, ServiceIdentifierRejectsForeignUuids) {
    uint16_t major, minor;
    BeaconToken token;
    // Wrong prefix, wrong suffix, bad separator, non-hex, short
    EXPECT_FALSE(TokenCodec::decodeServiceIdentifier("0000180D-DFFB-0A1B-2C3D-D0F5A71096E0",
                                                     major, minor, token));
    EXPECT_FALSE(TokenCodec::decodeServiceIdentifier("E2C56DB5-DFFB-0A1B-2C3D-000000000000",
                                                     major, minor, token));
    EXPECT_FALSE(TokenCodec::decodeServiceIdentifier("E2C56DB5-DFFB-0A1B_2C3D-D0F5A71096E0",
                                                     major, minor, token));
    EXPECT_FALSE(TokenCodec::decodeServiceIdentifier("E2C56DB5-DFFB-0A1G-2C3D-D0F5A71096E0",
                                                     major, minor, token));
    EXPECT_FALSE(TokenCodec::decodeServiceIdentifier("E2C56DB5-DFFB-0A1B-2C3D", major, minor, token));
    EXPECT_FALSE(TokenCodec::decodeServiceIdentifier("", major, minor, token));
}

TEST(TokenCodec, DeviceName) {
    EXPECT_EQ("PX0A1B2C3D", TokenCodec::encodeDeviceName(0x0A1B2C3D));

    BeaconToken token;
    ASSERT_TRUE(TokenCodec::decodeDeviceName("PX0A1B2C3D", token));
    EXPECT_EQ(0x0A1B2C3Du, token);

    EXPECT_FALSE(TokenCodec::decodeDeviceName("PX0A1B2C3", token));
    EXPECT_FALSE(TokenCodec::decodeDeviceName("QX0A1B2C3D", token));
    EXPECT_FALSE(TokenCodec::decodeDeviceName("PXZZZZZZZZ", token));
    EXPECT_FALSE(TokenCodec::decodeDeviceName("Galaxy Buds", token));
}

TEST(TokenCodec, IBeaconLayout) {
    std::string data = TokenCodec::encodeIBeacon(0x1234, 0xABCD, -59);
    ASSERT_EQ(25u, data.size());
    const uint8_t *p = (const uint8_t *)data.data();
    EXPECT_EQ(0x4C, p[0]);
    EXPECT_EQ(0x00, p[1]);
    EXPECT_EQ(0x02, p[2]);
    EXPECT_EQ(0x15, p[3]);
    EXPECT_EQ(0xE2, p[4]);
    EXPECT_EQ(0xE0, p[19]);
    EXPECT_EQ(0x12, p[20]);
    EXPECT_EQ(0x34, p[21]);
    EXPECT_EQ(0xAB, p[22]);
    EXPECT_EQ(0xCD, p[23]);
    EXPECT_EQ((uint8_t)-59, p[24]);
}

TEST(TokenCodec, IBeaconDecodesWithAndWithoutCompanyId) {
    std::string data = TokenCodec::encodeIBeacon(0x1234, 0xABCD, -59);
    uint16_t major, minor;
    BeaconToken token;

    ASSERT_TRUE(TokenCodec::decodeIBeacon(data, major, minor, token));
    EXPECT_EQ(0x1234ABCDu, token);

    token = 0;
    ASSERT_TRUE(TokenCodec::decodeIBeacon(data.substr(2), major, minor, token));
    EXPECT_EQ(0x1234ABCDu, token);
}

TEST(TokenCodec, IBeaconRejectsOtherUuidsAndShortPayloads) {
    std::string data = TokenCodec::encodeIBeacon(1, 2, -59);
    uint16_t major, minor;
    BeaconToken token;

    std::string other = data;
    other[10] ^= 0x01;
    EXPECT_FALSE(TokenCodec::decodeIBeacon(other, major, minor, token));
    EXPECT_FALSE(TokenCodec::decodeIBeacon(data.substr(0, 20), major, minor, token));

    std::string wrongType = data;
    wrongType[2] = 0x03;
    EXPECT_FALSE(TokenCodec::decodeIBeacon(wrongType, major, minor, token));
}

TEST(TokenCodec, ParseUuid) {
    uint8_t out[16];
    ASSERT_TRUE(TokenCodec::parseUuid(BEACON_UUID, out));
    EXPECT_EQ(0xE2, out[0]);
    EXPECT_EQ(0xC5, out[1]);
    EXPECT_EQ(0xE0, out[15]);
    EXPECT_FALSE(TokenCodec::parseUuid("E2C56DB5DFFB48D2B060D0F5A71096E0", out));
}
