#include <gtest/gtest.h>
#include "frame_parser.h"

static std::vector<uint8_t> bytes(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

TEST(FrameParser, DecodesCentidegrees) {
    auto value = parseFrame("N:1234:-567\r");
    ASSERT_TRUE(value.has_value());
    EXPECT_DOUBLE_EQ(value->y, 12.34);
    EXPECT_DOUBLE_EQ(value->x, -5.67);
}

TEST(FrameParser, DecodesRangeExtremes) {
    const long samples[] = {-99999, -100, -1, 0, 1, 150, 99999};
    for (long y : samples) {
        for (long x : samples) {
            std::string frame = "N:" + std::to_string(y) + ":" + std::to_string(x) + "\r";
            auto value = parseFrame(frame);
            ASSERT_TRUE(value.has_value()) << frame;
            EXPECT_DOUBLE_EQ(value->y, y / 100.0) << frame;
            EXPECT_DOUBLE_EQ(value->x, x / 100.0) << frame;
        }
    }
}

TEST(FrameParser, TrimsWhitespaceAroundNumbers) {
    auto value = parseFrame("N: 150 :\t-320 \r");
    ASSERT_TRUE(value.has_value());
    EXPECT_DOUBLE_EQ(value->y, 1.5);
    EXPECT_DOUBLE_EQ(value->x, -3.2);
}

TEST(FrameParser, AcceptsExplicitPlusSign) {
    auto value = parseFrame("N:+5:+6\r");
    ASSERT_TRUE(value.has_value());
    EXPECT_DOUBLE_EQ(value->y, 0.05);
    EXPECT_DOUBLE_EQ(value->x, 0.06);
}

TEST(FrameParser, SkipsGarbagePrefix) {
    auto value = parseFrame("\x01\xffxyz N:100:200\r");
    ASSERT_TRUE(value.has_value());
    EXPECT_DOUBLE_EQ(value->y, 1.0);
    EXPECT_DOUBLE_EQ(value->x, 2.0);
}

TEST(FrameParser, IgnoresTrailingBytes) {
    auto value = parseFrame("N:1:2\r\nN:3:4\r");
    ASSERT_TRUE(value.has_value());
    EXPECT_DOUBLE_EQ(value->y, 0.01);
    EXPECT_DOUBLE_EQ(value->x, 0.02);
}

TEST(FrameParser, MissingMarkersYieldNoFrame) {
    EXPECT_FALSE(parseFrame("1234:-567\r").has_value());   // no start
    EXPECT_FALSE(parseFrame("N:1234-567\r").has_value());  // no separator
    EXPECT_FALSE(parseFrame("N:1234:-567").has_value());   // no end
    EXPECT_FALSE(parseFrame("N:1234:-567\n").has_value()); // wrong end
}

TEST(FrameParser, RejectsBadNumbers) {
    EXPECT_FALSE(parseFrame("N::5\r").has_value());
    EXPECT_FALSE(parseFrame("N:5:\r").has_value());
    EXPECT_FALSE(parseFrame("N:  :5\r").has_value());
    EXPECT_FALSE(parseFrame("N:abc:5\r").has_value());
    EXPECT_FALSE(parseFrame("N:12a:5\r").has_value());
    EXPECT_FALSE(parseFrame("N:1.5:5\r").has_value());
    EXPECT_FALSE(parseFrame("N:5:1:2\r").has_value());
    EXPECT_FALSE(parseFrame("N:-:5\r").has_value());
}

TEST(FrameParser, RejectsValuesOutside32Bits) {
    EXPECT_TRUE(parseFrame("N:2147483647:-2147483648\r").has_value());
    EXPECT_FALSE(parseFrame("N:2147483648:0\r").has_value());
    EXPECT_FALSE(parseFrame("N:0:-2147483649\r").has_value());
    EXPECT_FALSE(parseFrame("N:99999999999999999999999:0\r").has_value());
}

TEST(FrameParser, OnlyFirstStartMarkerAnchors) {
    // The first "N:" wins even though a valid frame follows
    EXPECT_FALSE(parseFrame("N:xx N:1:2\r").has_value());
}

TEST(FrameParser, EmptyAndNullInput) {
    EXPECT_FALSE(parseFrame("").has_value());
    EXPECT_FALSE(parseFrame(nullptr, 5).has_value());
    EXPECT_FALSE(parseFrame("N:").has_value());
}

TEST(FrameParser, BinaryNoiseNeverDecodes) {
    std::vector<uint8_t> noise;
    for (int i = 0; i < 256; i++) {
        noise.push_back(static_cast<uint8_t>((i * 37) & 0xff));
    }
    // Must return without throwing; content has no "N:" followed by digits
    EXPECT_NO_THROW(parseFrame(noise.data(), noise.size()));
}

// -----------------------------------------------------------------------------
// FrameAssembler
// -----------------------------------------------------------------------------

TEST(FrameAssembler, PassesCompleteFrameThrough) {
    FrameAssembler assembler(64);
    auto data = bytes("N:150:-320\r");
    auto frames = assembler.push(data.data(), data.size());
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_DOUBLE_EQ(frames[0].y, 1.5);
    EXPECT_DOUBLE_EQ(frames[0].x, -3.2);
    EXPECT_EQ(assembler.pendingBytes(), 0u);
    EXPECT_EQ(assembler.droppedSegments(), 0u);
}

TEST(FrameAssembler, JoinsFrameSplitAcrossNotifications) {
    FrameAssembler assembler(64);
    auto first = bytes("N:12");
    auto second = bytes("34:-56");
    auto third = bytes("7\r");

    EXPECT_TRUE(assembler.push(first.data(), first.size()).empty());
    EXPECT_TRUE(assembler.push(second.data(), second.size()).empty());
    auto frames = assembler.push(third.data(), third.size());
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_DOUBLE_EQ(frames[0].y, 12.34);
    EXPECT_DOUBLE_EQ(frames[0].x, -5.67);
}

TEST(FrameAssembler, KeepsTrailingStartByte) {
    FrameAssembler assembler(64);
    auto first = bytes("noiseN");
    auto second = bytes(":5:6\r");

    EXPECT_TRUE(assembler.push(first.data(), first.size()).empty());
    EXPECT_EQ(assembler.pendingBytes(), 1u);
    auto frames = assembler.push(second.data(), second.size());
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_DOUBLE_EQ(frames[0].y, 0.05);
    EXPECT_DOUBLE_EQ(frames[0].x, 0.06);
}

TEST(FrameAssembler, EmitsEveryFrameInOrder) {
    FrameAssembler assembler(64);
    auto data = bytes("N:1:1\rN:2:2\rN:3:3\r");
    auto frames = assembler.push(data.data(), data.size());
    ASSERT_EQ(frames.size(), 3u);
    EXPECT_DOUBLE_EQ(frames[0].y, 0.01);
    EXPECT_DOUBLE_EQ(frames[1].y, 0.02);
    EXPECT_DOUBLE_EQ(frames[2].y, 0.03);
}

TEST(FrameAssembler, ReanchorsOnLastStartBeforeEnd) {
    FrameAssembler assembler(64);
    auto data = bytes("N:12N:100:200\r");
    auto frames = assembler.push(data.data(), data.size());
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_DOUBLE_EQ(frames[0].y, 1.0);
    EXPECT_DOUBLE_EQ(frames[0].x, 2.0);
}

TEST(FrameAssembler, CountsUndecodableSegments) {
    FrameAssembler assembler(64);
    auto data = bytes("garbage\rN:x:1\rN:7:8\r");
    auto frames = assembler.push(data.data(), data.size());
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_DOUBLE_EQ(frames[0].y, 0.07);
    EXPECT_EQ(assembler.droppedSegments(), 2u);
}

TEST(FrameAssembler, DiscardsNoiseWithoutStart) {
    FrameAssembler assembler(64);
    auto data = bytes("hello world");
    EXPECT_TRUE(assembler.push(data.data(), data.size()).empty());
    EXPECT_EQ(assembler.pendingBytes(), 0u);
    EXPECT_EQ(assembler.droppedSegments(), 1u);

    // An empty push discards nothing
    EXPECT_TRUE(assembler.push(nullptr, 0).empty());
    EXPECT_EQ(assembler.droppedSegments(), 1u);
}

TEST(FrameAssembler, NoiseInFrontOfStartIsNotCounted) {
    FrameAssembler assembler(64);
    auto data = bytes("noiseN:1");
    EXPECT_TRUE(assembler.push(data.data(), data.size()).empty());
    EXPECT_EQ(assembler.pendingBytes(), 3u);
    EXPECT_EQ(assembler.droppedSegments(), 0u);
}

TEST(FrameAssembler, DropsOversizeTail) {
    FrameAssembler assembler(16);
    auto data = bytes("N:1234567890123456789");
    EXPECT_TRUE(assembler.push(data.data(), data.size()).empty());
    EXPECT_EQ(assembler.pendingBytes(), 0u);
    EXPECT_EQ(assembler.droppedSegments(), 1u);

    // Recovers with the next clean frame
    auto next = bytes("N:1:2\r");
    EXPECT_EQ(assembler.push(next.data(), next.size()).size(), 1u);
}

TEST(FrameAssembler, ResetForgetsPartialFrame) {
    FrameAssembler assembler(64);
    auto first = bytes("N:12");
    auto second = bytes(":34\r");
    assembler.push(first.data(), first.size());
    assembler.reset();
    EXPECT_EQ(assembler.pendingBytes(), 0u);
    EXPECT_TRUE(assembler.push(second.data(), second.size()).empty());
}
