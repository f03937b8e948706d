// =============================================================================
// Scry - AdbCommandTranslator Unit Tests
// =============================================================================
// Control frames in, device shell lines out.

#include <gtest/gtest.h>
#include "adb_command_translator.hpp"
#include "input_encoder.hpp"
#include "scry_protocol.hpp"

#include <string>
#include <vector>

using namespace scry;
using namespace scry::protocol;

namespace {

// Encodes ev and runs every frame through the translator
std::vector<std::string> translateEvent(AdbCommandTranslator& tr, const InputEvent& ev) {
    InputEncoder enc(30);
    auto bytes = enc.encode(ev);
    FrameReader reader;
    reader.append(bytes.data(), bytes.size());

    std::vector<std::string> lines;
    Frame f;
    while (reader.next(f)) {
        auto r = tr.translate(f);
        EXPECT_TRUE(r.is_ok()) << cmd_name(f.cmd);
        if (r.is_err()) break;
        for (auto& l : r.value()) lines.push_back(l);
    }
    return lines;
}

Frame pointFrame(uint8_t cmd, int32_t x, int32_t y) {
    Frame f;
    f.cmd = cmd;
    put_i32(f.payload, x);
    put_i32(f.payload, y);
    return f;
}

} // namespace

TEST(AdbCommandTranslatorTest, Tap) {
    AdbCommandTranslator tr;
    auto lines = translateEvent(tr, Tap{120, 340});
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "input tap 120 340");
    EXPECT_FALSE(tr.gestureActive());
}

TEST(AdbCommandTranslatorTest, LongPressBecomesStationarySwipe) {
    AdbCommandTranslator tr;
    auto lines = translateEvent(tr, LongPress{50, 60, 700});
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "input swipe 50 60 50 60 700");
}

TEST(AdbCommandTranslatorTest, SwipeIsOneCommand) {
    AdbCommandTranslator tr;
    auto lines = translateEvent(tr, Swipe{0, 0, 100, 100, 300});
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "input swipe 0 0 100 100 300");
}

TEST(AdbCommandTranslatorTest, ScrollSwipesAcrossAnchor) {
    AdbCommandTranslator tr;
    auto lines = translateEvent(tr, Scroll{540, 1200, 0, 300});
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "input swipe 540 1500 540 900 100");
}

TEST(AdbCommandTranslatorTest, Key) {
    AdbCommandTranslator tr;
    auto lines = translateEvent(tr, Key{keycode::HOME});
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "input keyevent 3");
}

TEST(AdbCommandTranslatorTest, AsciiTextQuotedWithSpaces) {
    AdbCommandTranslator tr;
    auto lines = translateEvent(tr, KeyText{"it's here"});
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "input text 'it'\\''s%shere'");
}

TEST(AdbCommandTranslatorTest, UnicodeTextUsesImeBroadcast) {
    AdbCommandTranslator tr;
    auto lines = translateEvent(tr, Paste{"héllo"});
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "am broadcast -a ADB_INPUT_B64 --es msg aMOpbGxv");
}

TEST(AdbCommandTranslatorTest, PercentTextUsesImeBroadcast) {
    AdbCommandTranslator tr;
    auto lines = translateEvent(tr, KeyText{"50%sale"});
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "am broadcast -a ADB_INPUT_B64 --es msg NTAlc2FsZQ==");
}

TEST(AdbCommandTranslatorTest, EmptyTextProducesNothing) {
    AdbCommandTranslator tr;
    auto lines = translateEvent(tr, KeyText{""});
    EXPECT_TRUE(lines.empty());
}

TEST(AdbCommandTranslatorTest, OpenFileScansThenViews) {
    AdbCommandTranslator tr;
    Frame f;
    f.cmd = CMD_OPEN_FILE;
    put_string(f.payload, "/sdcard/Download/cat.png");
    put_string(f.payload, "image/*");

    auto r = tr.translate(f);
    ASSERT_TRUE(r.is_ok());
    ASSERT_EQ(r.value().size(), 2u);
    EXPECT_EQ(r.value()[0],
              "am broadcast -a android.intent.action.MEDIA_SCANNER_SCAN_FILE -d 'file:///sdcard/Download/cat.png'");
    EXPECT_EQ(r.value()[1],
              "am start -a android.intent.action.VIEW -d 'file:///sdcard/Download/cat.png' -t 'image/*'");
}

TEST(AdbCommandTranslatorTest, OpenFileOutsideAllowedDirsRejected) {
    AdbCommandTranslator tr;
    Frame f;
    f.cmd = CMD_OPEN_FILE;
    put_string(f.payload, "/system/bin/sh");
    put_string(f.payload, "*/*");

    auto r = tr.translate(f);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::Config);
}

TEST(AdbCommandTranslatorTest, MoveWithoutDownRejected) {
    AdbCommandTranslator tr;
    auto r = tr.translate(pointFrame(CMD_TOUCH_MOVE, 1, 2));
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::Config);
}

TEST(AdbCommandTranslatorTest, MalformedPayloadResetsGesture) {
    AdbCommandTranslator tr;
    ASSERT_TRUE(tr.translate(pointFrame(CMD_TOUCH_DOWN, 1, 2)).is_ok());
    EXPECT_TRUE(tr.gestureActive());

    Frame bad;
    bad.cmd = CMD_TOUCH_MOVE;
    bad.payload = {1, 2, 3};
    EXPECT_TRUE(tr.translate(bad).is_err());
    EXPECT_FALSE(tr.gestureActive());
}

TEST(AdbCommandTranslatorTest, WaitOutsideGestureIgnored) {
    AdbCommandTranslator tr;
    Frame w;
    w.cmd = CMD_WAIT;
    put_u32(w.payload, 250);
    auto r = tr.translate(w);
    ASSERT_TRUE(r.is_ok());
    EXPECT_TRUE(r.value().empty());

    // A later tap is not stretched by that wait
    auto lines = translateEvent(tr, Tap{7, 8});
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "input tap 7 8");
}

TEST(AdbCommandTranslatorTest, FileCommandsAreNotControl) {
    AdbCommandTranslator tr;
    Frame f;
    f.cmd = CMD_SEND;
    auto r = tr.translate(f);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::Config);
}

TEST(AdbCommandTranslatorTest, Base64) {
    EXPECT_EQ(AdbCommandTranslator::base64Encode(""), "");
    EXPECT_EQ(AdbCommandTranslator::base64Encode("M"), "TQ==");
    EXPECT_EQ(AdbCommandTranslator::base64Encode("Ma"), "TWE=");
    EXPECT_EQ(AdbCommandTranslator::base64Encode("Man"), "TWFu");
}

TEST(AdbCommandTranslatorTest, PlainAscii) {
    EXPECT_TRUE(AdbCommandTranslator::isPlainAscii("hello world!"));
    EXPECT_FALSE(AdbCommandTranslator::isPlainAscii("tab\there"));
    EXPECT_FALSE(AdbCommandTranslator::isPlainAscii("héllo"));
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
