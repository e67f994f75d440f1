#include <algorithm>

#include <gtest/gtest.h>

#include "OxiFrameDecoder.h"
#include "FrameBuilder.h"

namespace {

OxiDecodeResult decodeAll(const OxiFrameDecoder& decoder, const Bytes& bytes) {
  return decoder.decode(Bytes(), bytes.data(), bytes.size());
}

// Feeds bytes in pieces of the given size and collects everything
std::vector<OxiReading> decodeInPieces(const OxiFrameDecoder& decoder, const Bytes& bytes, size_t piece, Bytes& remaining) {
  std::vector<OxiReading> readings;
  remaining.clear();
  for (size_t pos = 0; pos < bytes.size(); pos += piece) {
    const size_t n = std::min(piece, bytes.size() - pos);
    OxiDecodeResult r = decoder.decode(remaining, bytes.data() + pos, n);
    remaining.swap(r.remaining);
    readings.insert(readings.end(), r.readings.begin(), r.readings.end());
  }
  return readings;
}

void expectVitals(const OxiReading& r, uint8_t spo2, uint16_t pulse) {
  EXPECT_EQ(r.kind, OxiReadingKind::Vitals);
  EXPECT_EQ(r.spo2, spo2);
  EXPECT_EQ(r.pulseRate, pulse);
}

} // namespace

TEST(FrameDecoder, Crc8MatchesCheckValue) {
  const uint8_t check[] = {'1', '2', '3', '4', '5', '6', '7', '8', '9'};
  EXPECT_EQ(OxiFrameDecoder::crc8(check, sizeof(check)), 0xF4);
  EXPECT_EQ(OxiFrameDecoder::crc8(nullptr, 0), 0x00);
}

TEST(FrameDecoder, DecodesParamsFrame) {
  OxiFrameDecoder decoder;
  OxiDecodeResult r = decodeAll(decoder, paramsFrame(97, 72));

  ASSERT_EQ(r.readings.size(), 1u);
  expectVitals(r.readings[0], 97, 72);
  EXPECT_TRUE(r.remaining.empty());
  EXPECT_EQ(r.frames, 1u);
  EXPECT_EQ(r.discardedBytes, 0u);
  EXPECT_EQ(r.malformedFrames, 0u);
}

TEST(FrameDecoder, WaveFrameYieldsSamplesInOrder) {
  OxiFrameDecoder decoder;
  OxiDecodeResult r = decodeAll(decoder, waveFrame(10, 20, 30, 40, 50));

  ASSERT_EQ(r.readings.size(), OXI_WAVE_SAMPLES);
  for (size_t i = 0; i < OXI_WAVE_SAMPLES; i++) {
    EXPECT_EQ(r.readings[i].kind, OxiReadingKind::Pleth);
    EXPECT_TRUE(r.readings[i].hasWave);
    EXPECT_EQ(r.readings[i].wave, static_cast<uint8_t>(10 * (i + 1)));
    EXPECT_FALSE(r.readings[i].spo2Valid());
  }
}

TEST(FrameDecoder, SkipsGarbageBeforeMarker) {
  OxiFrameDecoder decoder;
  OxiDecodeResult r = decodeAll(decoder, concat({{0x01, 0x02, 0x55, 0x03}, paramsFrame(95, 60)}));

  ASSERT_EQ(r.readings.size(), 1u);
  expectVitals(r.readings[0], 95, 60);
  EXPECT_EQ(r.discardedBytes, 4u);
  EXPECT_TRUE(r.remaining.empty());
}

TEST(FrameDecoder, GarbageFrameAndPartialFrame) {
  OxiFrameDecoder decoder;
  const Bytes a = paramsFrame(98, 70);
  const Bytes b = paramsFrame(97, 71);
  const Bytes bHead(b.begin(), b.end() - 1);

  OxiDecodeResult first = decodeAll(decoder, concat({{0x13, 0x37, 0x00}, a, bHead}));
  ASSERT_EQ(first.readings.size(), 1u);
  expectVitals(first.readings[0], 98, 70);
  EXPECT_EQ(first.remaining, bHead);

  const uint8_t last = b.back();
  OxiDecodeResult second = decoder.decode(first.remaining, &last, 1);
  ASSERT_EQ(second.readings.size(), 1u);
  expectVitals(second.readings[0], 97, 71);
  EXPECT_TRUE(second.remaining.empty());
}

TEST(FrameDecoder, SplitAtEveryBoundaryGivesSameReadings) {
  OxiFrameDecoder decoder;
  const Bytes stream = concat({paramsFrame(96, 80), waveFrame(1, 2, 3, 4, 5), {0x00, 0x10}, paramsFrame(94, 81)});
  const std::vector<OxiReading> whole = decodeAll(decoder, stream).readings;
  ASSERT_EQ(whole.size(), 7u);

  for (size_t split = 0; split <= stream.size(); split++) {
    OxiDecodeResult head = decoder.decode(Bytes(), stream.data(), split);
    OxiDecodeResult tail = decoder.decode(head.remaining, stream.data() + split, stream.size() - split);

    std::vector<OxiReading> got = head.readings;
    got.insert(got.end(), tail.readings.begin(), tail.readings.end());

    ASSERT_EQ(got.size(), whole.size()) << "split at " << split;
    for (size_t i = 0; i < got.size(); i++) {
      EXPECT_EQ(got[i].kind, whole[i].kind) << "split at " << split;
      EXPECT_EQ(got[i].spo2, whole[i].spo2) << "split at " << split;
      EXPECT_EQ(got[i].pulseRate, whole[i].pulseRate) << "split at " << split;
      EXPECT_EQ(got[i].wave, whole[i].wave) << "split at " << split;
    }
    EXPECT_TRUE(tail.remaining.empty()) << "split at " << split;
  }
}

TEST(FrameDecoder, ByteByByteFeedKeepsWireOrder) {
  OxiFrameDecoder decoder;
  Bytes stream;
  for (uint8_t i = 0; i < 20; i++) stream = concat({stream, paramsFrame(80 + i, 60 + i)});

  Bytes remaining;
  std::vector<OxiReading> readings = decodeInPieces(decoder, stream, 1, remaining);

  ASSERT_EQ(readings.size(), 20u);
  for (uint8_t i = 0; i < 20; i++) expectVitals(readings[i], 80 + i, 60 + i);
  EXPECT_TRUE(remaining.empty());
}

TEST(FrameDecoder, BufferWithoutMarkerIsDiscarded) {
  OxiFrameDecoder decoder;
  const Bytes noise = {0x00, 0x55, 0x0F, 0x08, 0x01, 0x61, 0x48, 0x7E};
  OxiDecodeResult r = decodeAll(decoder, noise);

  EXPECT_TRUE(r.readings.empty());
  EXPECT_TRUE(r.remaining.empty());
  EXPECT_EQ(r.discardedBytes, noise.size());
}

TEST(FrameDecoder, TrailingFirstMarkerByteIsKept) {
  OxiFrameDecoder decoder;
  OxiDecodeResult r = decodeAll(decoder, {0x01, 0x02, OXI_FRAME_MARKER_0});

  EXPECT_EQ(r.discardedBytes, 2u);
  EXPECT_EQ(r.remaining, Bytes{OXI_FRAME_MARKER_0});

  // The marker completes in the next notification
  Bytes frameRest = paramsFrame(99, 65);
  frameRest.erase(frameRest.begin());
  OxiDecodeResult next = decoder.decode(r.remaining, frameRest.data(), frameRest.size());
  ASSERT_EQ(next.readings.size(), 1u);
  expectVitals(next.readings[0], 99, 65);
}

TEST(FrameDecoder, IncompleteHeaderIsKept) {
  OxiFrameDecoder decoder;
  const Bytes head = {OXI_FRAME_MARKER_0, OXI_FRAME_MARKER_1, OXI_TOKEN_LIVE};
  OxiDecodeResult r = decodeAll(decoder, head);

  EXPECT_TRUE(r.readings.empty());
  EXPECT_EQ(r.remaining, head);
  EXPECT_EQ(r.discardedBytes, 0u);
}

TEST(FrameDecoder, BadChecksumDropsOnlyTheFrame) {
  OxiFrameDecoder decoder;
  Bytes broken = paramsFrame(90, 90);
  broken.back() ^= 0xFF;

  OxiDecodeResult r = decodeAll(decoder, concat({broken, paramsFrame(91, 91)}));

  ASSERT_EQ(r.readings.size(), 1u);
  expectVitals(r.readings[0], 91, 91);
  EXPECT_EQ(r.malformedFrames, 1u);
  EXPECT_EQ(r.discardedBytes, broken.size() - 1);
}

TEST(FrameDecoder, BogusHeaderDoesNotSwallowFollowingFrame) {
  OxiFrameDecoder decoder;
  // The bogus header reads the next frame's marker as its length (0xAA > max length)
  OxiDecodeResult r = decodeAll(decoder, concat({{OXI_FRAME_MARKER_0, OXI_FRAME_MARKER_1, 0x42}, paramsFrame(92, 77)}));

  ASSERT_EQ(r.readings.size(), 1u);
  expectVitals(r.readings[0], 92, 77);
  EXPECT_EQ(r.malformedFrames, 1u);
  EXPECT_EQ(r.discardedBytes, 2u);
}

TEST(FrameDecoder, MalformedRunsAreSplitAtValidFrames) {
  OxiFrameDecoder decoder;
  const Bytes bad = {OXI_FRAME_MARKER_0, OXI_FRAME_MARKER_1, OXI_TOKEN_LIVE, 0x01};

  OxiDecodeResult r = decodeAll(decoder, concat({bad, bad, paramsFrame(97, 72), bad, bad, bad,
                                                 paramsFrame(96, 71), bad}));

  EXPECT_EQ(r.readings.size(), 2u);
  EXPECT_EQ(r.malformedFrames, 6u);
  EXPECT_EQ(r.leadingMalformed, 2u);
  EXPECT_EQ(r.longestInnerRun, 3u);
  EXPECT_EQ(r.trailingMalformed, 1u);

  OxiDecodeResult noise = decodeAll(decoder, concat({bad, bad, bad}));

  EXPECT_EQ(noise.frames, 0u);
  EXPECT_EQ(noise.leadingMalformed, 3u);
  EXPECT_EQ(noise.trailingMalformed, 3u);
  EXPECT_EQ(noise.longestInnerRun, 0u);
}

TEST(FrameDecoder, KnownTypeWithWrongLengthIsMalformed) {
  OxiFrameDecoder decoder;
  OxiDecodeResult r = decodeAll(decoder, makeFrame(OXI_TOKEN_LIVE, OXI_TYPE_PARAMS, {97, 72}));

  EXPECT_TRUE(r.readings.empty());
  EXPECT_EQ(r.malformedFrames, 1u);
  EXPECT_EQ(r.frames, 0u);
}

TEST(FrameDecoder, UnknownTypesAreConsumedSilently) {
  OxiFrameDecoder decoder;
  const Bytes battery = makeFrame(OXI_TOKEN_LIVE, 0x21, {0x03});
  const Bytes other   = makeFrame(0xF0, OXI_TYPE_PARAMS, {1, 2, 3});

  OxiDecodeResult r = decodeAll(decoder, concat({battery, other, paramsFrame(97, 72)}));

  ASSERT_EQ(r.readings.size(), 1u);
  expectVitals(r.readings[0], 97, 72);
  EXPECT_EQ(r.frames, 3u);
  EXPECT_EQ(r.malformedFrames, 0u);
  EXPECT_EQ(r.discardedBytes, 0u);
}

TEST(FrameDecoder, SearchingAndOutOfRangeValuesBecomeSentinels) {
  OxiFrameDecoder decoder;
  OxiDecodeResult r = decodeAll(decoder, concat({paramsFrame(0, 0), paramsFrame(120, 20), paramsFrame(35, 250)}));

  ASSERT_EQ(r.readings.size(), 3u);
  EXPECT_EQ(r.readings[0].spo2, OXI_SPO2_NONE);
  EXPECT_EQ(r.readings[0].pulseRate, OXI_PULSE_NONE);
  EXPECT_FALSE(r.readings[1].spo2Valid());
  EXPECT_FALSE(r.readings[1].pulseValid());
  expectVitals(r.readings[2], 35, 250);
}

TEST(FrameDecoder, ChecksumCanBeDisabled) {
  OxiFrameDecoder decoder(OxiChecksum::None);
  Bytes frame = paramsFrame(97, 72);
  frame.back() ^= 0x5A;

  OxiDecodeResult r = decodeAll(decoder, frame);
  ASSERT_EQ(r.readings.size(), 1u);
  expectVitals(r.readings[0], 97, 72);
  EXPECT_EQ(decoder.getChecksum(), OxiChecksum::None);
}

TEST(FrameDecoder, RedecodingRemainderIsIdempotent) {
  OxiFrameDecoder decoder;
  Bytes frame = paramsFrame(97, 72);
  frame.resize(7);

  OxiDecodeResult first  = decodeAll(decoder, frame);
  OxiDecodeResult second = decoder.decode(first.remaining, nullptr, 0);

  EXPECT_EQ(second.remaining, first.remaining);
  EXPECT_TRUE(second.readings.empty());
  EXPECT_EQ(second.discardedBytes, 0u);
  EXPECT_EQ(second.malformedFrames, 0u);
}

TEST(FrameDecoder, BufferStaysBoundedOnNoise) {
  OxiFrameDecoder decoder;
  Bytes remaining;
  uint32_t seed = 12345;

  for (int chunk = 0; chunk < 500; chunk++) {
    Bytes noise(20);
    for (uint8_t& b : noise) {
      seed = seed * 1103515245u + 12345u;
      b = static_cast<uint8_t>(seed >> 16);
      if ((seed & 0x7) == 0) b = OXI_FRAME_MARKER_0;   // plenty of false starts
    }
    OxiDecodeResult r = decoder.decode(remaining, noise.data(), noise.size());
    remaining.swap(r.remaining);
    ASSERT_LT(remaining.size(), OXI_FRAME_MAX_BYTES);
  }

  // Still in sync afterwards
  const Bytes frame = concat({Bytes(OXI_FRAME_MAX_BYTES, 0x00), paramsFrame(97, 72)});
  OxiDecodeResult r = decoder.decode(remaining, frame.data(), frame.size());
  ASSERT_FALSE(r.readings.empty());
  expectVitals(r.readings.back(), 97, 72);
}
