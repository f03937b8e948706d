// =============================================================================
// Scry - InputEncoder Unit Tests
// =============================================================================
#include <gtest/gtest.h>
#include "input_encoder.hpp"
#include "scry_protocol.hpp"

#include <vector>

using namespace scry;
using namespace scry::protocol;

namespace {

std::vector<Frame> decode(const std::vector<uint8_t>& bytes) {
    FrameReader reader;
    reader.append(bytes.data(), bytes.size());
    std::vector<Frame> frames;
    Frame f;
    while (reader.next(f)) frames.push_back(f);
    EXPECT_FALSE(reader.corrupt());
    EXPECT_EQ(reader.buffered(), 0u);
    return frames;
}

int32_t x_of(const Frame& f) { return get_i32(f.payload.data()); }
int32_t y_of(const Frame& f) { return get_i32(f.payload.data() + 4); }

} // namespace

TEST(InputEncoderTest, TapIsPressRelease) {
    InputEncoder enc;
    auto frames = decode(enc.encode(Tap{120, 340}));
    ASSERT_EQ(frames.size(), 2u);
    EXPECT_EQ(frames[0].cmd, CMD_TOUCH_DOWN);
    EXPECT_EQ(frames[1].cmd, CMD_TOUCH_UP);
    EXPECT_EQ(x_of(frames[0]), 120);
    EXPECT_EQ(y_of(frames[0]), 340);
    EXPECT_EQ(x_of(frames[1]), 120);
    EXPECT_EQ(y_of(frames[1]), 340);
}

TEST(InputEncoderTest, LongPressHolds) {
    InputEncoder enc;
    auto frames = decode(enc.encode(LongPress{10, 20, 800}));
    ASSERT_EQ(frames.size(), 3u);
    EXPECT_EQ(frames[0].cmd, CMD_TOUCH_DOWN);
    EXPECT_EQ(frames[1].cmd, CMD_WAIT);
    EXPECT_EQ(get_u32(frames[1].payload.data()), 800u);
    EXPECT_EQ(frames[2].cmd, CMD_TOUCH_UP);
}

TEST(InputEncoderTest, SwipeInterpolatesMoves) {
    InputEncoder enc(30);
    auto frames = decode(enc.encode(Swipe{0, 0, 100, 100, 300}));

    ASSERT_GE(frames.size(), 4u);
    EXPECT_EQ(frames.front().cmd, CMD_TOUCH_DOWN);
    EXPECT_EQ(x_of(frames.front()), 0);
    EXPECT_EQ(y_of(frames.front()), 0);
    EXPECT_EQ(frames.back().cmd, CMD_TOUCH_UP);
    EXPECT_EQ(x_of(frames.back()), 100);
    EXPECT_EQ(y_of(frames.back()), 100);

    int moves = 0;
    uint32_t waited = 0;
    int32_t last_x = 0;
    for (size_t i = 1; i + 1 < frames.size(); i++) {
        const Frame& f = frames[i];
        // Only waits and moves between press and release
        ASSERT_TRUE(f.cmd == CMD_TOUCH_MOVE || f.cmd == CMD_WAIT) << cmd_name(f.cmd);
        if (f.cmd == CMD_TOUCH_MOVE) {
            moves++;
            EXPECT_GE(x_of(f), last_x);
            last_x = x_of(f);
        } else {
            waited += get_u32(f.payload.data());
        }
    }
    EXPECT_EQ(moves, 10);
    EXPECT_EQ(waited, 300u);
    EXPECT_EQ(last_x, 100);
}

TEST(InputEncoderTest, ShortSwipeStillMoves) {
    InputEncoder enc(30);
    auto frames = decode(enc.encode(Swipe{5, 5, 50, 500, 10}));
    ASSERT_EQ(frames.size(), 4u);   // DOWN, WAIT, MOVE, UP
    EXPECT_EQ(frames[1].cmd, CMD_WAIT);
    EXPECT_EQ(get_u32(frames[1].payload.data()), 10u);
    EXPECT_EQ(frames[2].cmd, CMD_TOUCH_MOVE);
    EXPECT_EQ(x_of(frames[2]), 50);
    EXPECT_EQ(y_of(frames[2]), 500);
}

TEST(InputEncoderTest, UnevenDurationSumsExactly) {
    InputEncoder enc(30);
    auto frames = decode(enc.encode(Swipe{0, 0, 0, 1000, 100}));
    uint32_t waited = 0;
    for (const auto& f : frames) {
        if (f.cmd == CMD_WAIT) waited += get_u32(f.payload.data());
    }
    EXPECT_EQ(waited, 100u);
}

TEST(InputEncoderTest, ScrollCarriesAnchorAndDelta) {
    InputEncoder enc;
    auto frames = decode(enc.encode(Scroll{540, 1200, 0, -300}));
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0].cmd, CMD_SCROLL);
    ASSERT_EQ(frames[0].payload.size(), 16u);
    EXPECT_EQ(get_i32(frames[0].payload.data()), 540);
    EXPECT_EQ(get_i32(frames[0].payload.data() + 4), 1200);
    EXPECT_EQ(get_i32(frames[0].payload.data() + 8), 0);
    EXPECT_EQ(get_i32(frames[0].payload.data() + 12), -300);
}

TEST(InputEncoderTest, TextIsOneLengthPrefixedFrame) {
    InputEncoder enc;
    auto frames = decode(enc.encode(KeyText{"héllo wörld"}));
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0].cmd, CMD_TEXT);
    EXPECT_EQ(frames[0].payload[0], TEXT_TYPED);

    std::vector<uint8_t> rest(frames[0].payload.begin() + 1, frames[0].payload.end());
    size_t off = 0;
    std::string s;
    ASSERT_TRUE(get_string(rest, off, s));
    EXPECT_EQ(s, "héllo wörld");
}

TEST(InputEncoderTest, PasteFlag) {
    InputEncoder enc;
    auto frames = decode(enc.encode(Paste{"clipboard"}));
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0].payload[0], TEXT_PASTE);
}

TEST(InputEncoderTest, LongTextSplitsOnCharacterBoundary) {
    // 3-byte characters never divide MAX_PAYLOAD - 5 evenly
    std::string text;
    for (int i = 0; i < 30000; i++) text += "あ";
    InputEncoder enc;
    auto frames = decode(enc.encode(Paste{text}));
    ASSERT_GT(frames.size(), 1u);

    std::string joined;
    for (const auto& f : frames) {
        ASSERT_EQ(f.cmd, CMD_TEXT);
        std::vector<uint8_t> rest(f.payload.begin() + 1, f.payload.end());
        size_t off = 0;
        std::string part;
        ASSERT_TRUE(get_string(rest, off, part));
        EXPECT_EQ(part.size() % 3, 0u);
        joined += part;
    }
    EXPECT_EQ(joined, text);
}

TEST(InputEncoderTest, KeyCode) {
    InputEncoder enc;
    auto frames = decode(enc.encode(Key{keycode::BACK}));
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0].cmd, CMD_KEY);
    EXPECT_EQ(get_i32(frames[0].payload.data()), 4);
}

TEST(InputEncoderTest, SequenceNumbersContinueAcrossEvents) {
    InputEncoder enc;
    auto a = decode(enc.encode(Tap{1, 1}));
    auto b = decode(enc.encode(Key{3}));
    ASSERT_EQ(a.size(), 2u);
    ASSERT_EQ(b.size(), 1u);
    EXPECT_EQ(a[0].seq, 0u);
    EXPECT_EQ(a[1].seq, 1u);
    EXPECT_EQ(b[0].seq, 2u);
    EXPECT_EQ(enc.next_seq(), 3u);
}

// ---------------------------------------------------------------------------
// Pointer helpers
// ---------------------------------------------------------------------------

TEST(InputEventTest, ShortDragIsTap) {
    InputEvent ev = gestureFromDrag(100, 100, 110, 105);
    ASSERT_TRUE(std::holds_alternative<Tap>(ev));
    EXPECT_EQ(std::get<Tap>(ev).x, 100);
}

TEST(InputEventTest, LongDragIsSwipe) {
    InputEvent ev = gestureFromDrag(100, 100, 100, 400);
    ASSERT_TRUE(std::holds_alternative<Swipe>(ev));
    const auto& sw = std::get<Swipe>(ev);
    EXPECT_EQ(sw.y1, 400);
    EXPECT_EQ(sw.duration_ms, DRAG_SWIPE_MS);
}

TEST(InputEventTest, WheelNotches) {
    InputEvent ev = scrollFromWheel(300, 800, -2);
    ASSERT_TRUE(std::holds_alternative<Scroll>(ev));
    EXPECT_EQ(std::get<Scroll>(ev).dy, -600);
    EXPECT_STREQ(inputEventName(ev), "Scroll");
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
