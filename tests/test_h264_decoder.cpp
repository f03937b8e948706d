// =============================================================================
// Scry - H264Decoder Unit Tests
// =============================================================================
// Covers the checks done before the bitstream reaches FFmpeg. Decoding real
// pictures is exercised on a device.
// =============================================================================

#include <gtest/gtest.h>
#include "video/h264_decoder.hpp"

#include <vector>

using namespace scry;
using namespace scry::video;

namespace {

AccessUnit unitOf(std::vector<uint8_t> bytes, uint64_t seq = 0) {
    AccessUnit u;
    u.data = std::move(bytes);
    u.seq = seq;
    return u;
}

} // namespace

TEST(H264DecoderTest, WellFormedUnit) {
    const uint8_t sps_idr[] = {
        0x00, 0x00, 0x00, 0x01, 0x67, 0x42, 0x00, 0x0A,
        0x00, 0x00, 0x01, 0x65, 0x88, 0x80, 0x20,
    };
    const char* why = nullptr;
    EXPECT_TRUE(H264Decoder::is_well_formed(sps_idr, sizeof(sps_idr), &why));
}

TEST(H264DecoderTest, MissingStartCode) {
    const uint8_t data[] = {0x65, 0x88, 0x80, 0x20};
    const char* why = nullptr;
    EXPECT_FALSE(H264Decoder::is_well_formed(data, sizeof(data), &why));
    ASSERT_NE(why, nullptr);
    EXPECT_STREQ(why, "no start code");
}

TEST(H264DecoderTest, LeadingBytesBeforeStartCode) {
    const uint8_t data[] = {0xFF, 0x00, 0x00, 0x01, 0x65, 0x88};
    EXPECT_FALSE(H264Decoder::is_well_formed(data, sizeof(data), nullptr));
}

TEST(H264DecoderTest, ForbiddenZeroBit) {
    const uint8_t data[] = {
        0x00, 0x00, 0x00, 0x01, 0x65, 0x88,
        0x00, 0x00, 0x01, 0xE5, 0x88,
    };
    const char* why = nullptr;
    EXPECT_FALSE(H264Decoder::is_well_formed(data, sizeof(data), &why));
    EXPECT_STREQ(why, "forbidden_zero_bit set");
}

TEST(H264DecoderTest, EmptyUnit) {
    EXPECT_FALSE(H264Decoder::is_well_formed(nullptr, 0, nullptr));
}

TEST(H264DecoderTest, FeedBeforeInitFails) {
    H264Decoder decoder;
    EXPECT_FALSE(decoder.is_initialized());
    auto r = decoder.feed(unitOf({0x00, 0x00, 0x00, 0x01, 0x65, 0x88}));
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::Decode);
}

TEST(H264DecoderTest, CreateInitializes) {
    auto r = H264Decoder::create();
    ASSERT_TRUE(r.is_ok()) << r.error().message;
    EXPECT_TRUE(r.value() != nullptr);
}

TEST(H264DecoderTest, MalformedUnitIsDecodeErrorAndDecoderSurvives) {
    H264Decoder decoder;
    ASSERT_TRUE(decoder.init());

    auto bad = decoder.feed(unitOf({0xDE, 0xAD, 0xBE, 0xEF}, 7));
    ASSERT_TRUE(bad.is_err());
    EXPECT_EQ(bad.error().kind, ErrorKind::Decode);
    EXPECT_EQ(decoder.error_count(), 1u);

    auto again = decoder.feed(unitOf({0x00, 0x00, 0x01, 0x80}, 8));
    ASSERT_TRUE(again.is_err());
    EXPECT_EQ(decoder.error_count(), 2u);
    EXPECT_EQ(decoder.units_fed(), 2u);
    EXPECT_EQ(decoder.frames_decoded(), 0u);
    EXPECT_TRUE(decoder.is_initialized());
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
