// =============================================================================
// Scry - VideoSource Unit Tests
// =============================================================================
#include <gtest/gtest.h>
#include "fakes.hpp"
#include "video/video_source.hpp"

#include <string>
#include <thread>

using namespace scry;
using namespace scry::fakes;
using scry::video::VideoSource;

namespace {

std::vector<uint8_t> text(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

} // namespace

TEST(VideoSourceTest, UnitsArriveInOrderThenEnd) {
    auto transport = std::make_shared<FakeTransport>();
    transport->video_bytes = unitStream({false, false, false, false});
    transport->video_live = false;
    SharedLink link(transport);

    auto started = VideoSource::start(link, "DEVICE1", VideoOptions{});
    ASSERT_TRUE(started.is_ok()) << started.error().message;
    auto source = std::move(started).value();

    for (uint64_t i = 0; i < 4; i++) {
        auto u = source->next();
        ASSERT_TRUE(u.is_ok());
        ASSERT_TRUE(u.value().has_value()) << "unit " << i;
        EXPECT_EQ(u.value()->seq, i);
        EXPECT_EQ(u.value()->data, sliceUnit(false, static_cast<uint8_t>(i + 1)));
    }

    auto end = source->next();
    ASSERT_TRUE(end.is_ok());
    EXPECT_FALSE(end.value().has_value());
    EXPECT_TRUE(source->ended());
    EXPECT_EQ(source->units_produced(), 4u);
}

TEST(VideoSourceTest, EndIsNotRestartable) {
    auto transport = std::make_shared<FakeTransport>();
    transport->video_bytes = unitStream({false});
    transport->video_live = false;
    SharedLink link(transport);

    auto source = VideoSource::start(link, "DEVICE1", VideoOptions{}).value_or(nullptr);
    ASSERT_NE(source, nullptr);
    ASSERT_TRUE(source->next().value().has_value());
    for (int i = 0; i < 3; i++) {
        auto r = source->next();
        ASSERT_TRUE(r.is_ok());
        EXPECT_FALSE(r.value().has_value());
    }
}

TEST(VideoSourceTest, PassesCaptureOptions) {
    auto transport = std::make_shared<FakeTransport>();
    transport->video_bytes = unitStream({false});
    transport->video_live = false;
    SharedLink link(transport);

    VideoOptions opts;
    opts.width = 1080;
    opts.height = 2400;
    opts.bit_rate = 4000000;
    ASSERT_TRUE(VideoSource::start(link, "DEVICE1", opts).is_ok());
    EXPECT_EQ(transport->lastVideoOptions().width, 1080);
    EXPECT_EQ(transport->lastVideoOptions().bit_rate, 4000000);
}

TEST(VideoSourceTest, CaptureDenialIsDistinct) {
    auto transport = std::make_shared<FakeTransport>();
    transport->video_bytes = text("ERROR: unable to get output buffers (err=-38)\n");
    transport->video_live = false;
    SharedLink link(transport);

    auto r = VideoSource::start(link, "DEVICE1", VideoOptions{});
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::CaptureUnavailable);
}

TEST(VideoSourceTest, SecureDisplayIsCaptureDenial) {
    auto transport = std::make_shared<FakeTransport>();
    transport->video_bytes = text("Screen recording is not allowed on a secure display");
    transport->video_live = false;
    SharedLink link(transport);

    auto r = VideoSource::start(link, "DEVICE1", VideoOptions{});
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::CaptureUnavailable);
}

TEST(VideoSourceTest, OtherTextIsConnectionError) {
    auto transport = std::make_shared<FakeTransport>();
    transport->video_bytes = text("error: device offline");
    transport->video_live = false;
    SharedLink link(transport);

    auto r = VideoSource::start(link, "DEVICE1", VideoOptions{});
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::Connection);
}

TEST(VideoSourceTest, EmptyStreamIsConnectionError) {
    auto transport = std::make_shared<FakeTransport>();
    transport->video_live = false;
    SharedLink link(transport);

    auto r = VideoSource::start(link, "DEVICE1", VideoOptions{});
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::Connection);
}

TEST(VideoSourceTest, UnknownDeviceIsConnectionError) {
    auto transport = std::make_shared<FakeTransport>();
    SharedLink link(transport);

    auto r = VideoSource::start(link, "NOPE", VideoOptions{});
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::Connection);
}

TEST(VideoSourceTest, StopUnblocksNext) {
    auto transport = std::make_shared<FakeTransport>();
    transport->video_bytes = unitStream({false});
    transport->video_live = true;
    SharedLink link(transport);

    auto source = VideoSource::start(link, "DEVICE1", VideoOptions{}).value_or(nullptr);
    ASSERT_NE(source, nullptr);

    std::atomic<bool> finished{false};
    bool got_unit = true;
    std::thread reader([&]() {
        auto r = source->next();
        got_unit = r.is_ok() && r.value().has_value();
        finished = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(finished.load());
    source->stop();
    reader.join();

    EXPECT_FALSE(got_unit);
    EXPECT_TRUE(transport->stream(ChannelKind::Video, 0)->isClosed());
    EXPECT_FALSE(source->next().value().has_value());
}

TEST(VideoSourceTest, DenialMarkers) {
    EXPECT_TRUE(VideoSource::looks_like_capture_denial("Permission Denial: ..."));
    EXPECT_TRUE(VideoSource::looks_like_capture_denial("protected content"));
    EXPECT_FALSE(VideoSource::looks_like_capture_denial("device offline"));
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
