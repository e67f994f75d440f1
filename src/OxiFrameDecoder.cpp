// ****************************************************************************************************
// Frame decoder for the oximeter notification stream
// ****************************************************************************************************
#include "OxiFrameDecoder.h"

uint8_t OxiFrameDecoder::crc8(const uint8_t* data, size_t len) {
  uint8_t crc = 0x00;
  for (size_t i = 0; i < len; i++) {
    crc ^= data[i];
    for (uint8_t bit = 0; bit < 8; bit++) {
      crc = (crc & 0x80) ? static_cast<uint8_t>((crc << 1) ^ 0x07) : static_cast<uint8_t>(crc << 1);
    }
  }
  return crc;
}

uint8_t OxiFrameDecoder::normalizeSpo2(uint8_t raw) {
  if (raw == OXI_DEVICE_SEARCHING) return OXI_SPO2_NONE;
  if (raw < OXI_SPO2_MIN_VALID || raw > OXI_SPO2_MAX_VALID) return OXI_SPO2_NONE;
  return raw;
}

uint16_t OxiFrameDecoder::normalizePulse(uint16_t raw) {
  if (raw == OXI_DEVICE_SEARCHING) return OXI_PULSE_NONE;
  if (raw < OXI_PULSE_MIN_VALID || raw > OXI_PULSE_MAX_VALID) return OXI_PULSE_NONE;
  return raw;
}

// ===== Decode =================================================================================

OxiDecodeResult OxiFrameDecoder::decode(const std::vector<uint8_t>& buffer, const uint8_t* data, size_t len) const {
  OxiDecodeResult result;

  std::vector<uint8_t> work;
  work.reserve(buffer.size() + len);
  work.insert(work.end(), buffer.begin(), buffer.end());
  if (data && len) work.insert(work.end(), data, data + len);

  const size_t size = work.size();
  size_t pos  = 0;     // next byte to examine
  size_t keep = size;  // start of the tail carried into the next call
  size_t run  = 0;     // malformed candidates since the last valid frame

  while (pos < size) {
    // Hunt for the marker. A trailing 0xAA may be the first half of one.
    size_t start = pos;
    while (start < size) {
      if (work[start] == OXI_FRAME_MARKER_0 &&
          (start + 1 == size || work[start + 1] == OXI_FRAME_MARKER_1)) {
        break;
      }
      start++;
    }
    result.discardedBytes += start - pos;
    if (start >= size) break;

    size_t frameLen = 0;
    Candidate candidate = inspect(&work[start], size - start, frameLen);

    if (candidate == Candidate::Incomplete) {
      keep = start;
      break;
    }
    if (candidate == Candidate::Malformed) {
      // Only the leading marker byte goes, a valid frame may start inside this candidate
      result.malformedFrames++;
      run++;
      pos = start + 1;
      continue;
    }

    if (result.frames == 0) {
      result.leadingMalformed = run;
    } else if (run > result.longestInnerRun) {
      result.longestInnerRun = run;
    }
    run = 0;

    parse(&work[start], result.readings);
    result.frames++;
    pos = start + frameLen;
  }

  if (result.frames == 0) result.leadingMalformed = run;
  result.trailingMalformed = run;

  result.remaining.assign(work.begin() + keep, work.end());
  return result;
}

OxiFrameDecoder::Candidate OxiFrameDecoder::inspect(const uint8_t* frame, size_t available, size_t& frameLen) const {
  if (available < OXI_FRAME_HEADER_BYTES) return Candidate::Incomplete;

  const uint8_t token = frame[OXI_FRAME_TOKEN_OFFSET];
  const uint8_t len   = frame[OXI_FRAME_LEN_OFFSET];
  if (len < OXI_FRAME_MIN_LEN || len > OXI_FRAME_MAX_LEN) return Candidate::Malformed;

  if (available <= OXI_FRAME_TYPE_OFFSET) return Candidate::Incomplete;
  const uint8_t type = frame[OXI_FRAME_TYPE_OFFSET];

  // Known frames have a fixed length
  if (token == OXI_TOKEN_LIVE) {
    if (type == OXI_TYPE_PARAMS && len != OXI_PARAMS_LEN) return Candidate::Malformed;
    if (type == OXI_TYPE_WAVE   && len != OXI_WAVE_LEN)   return Candidate::Malformed;
  }

  frameLen = OXI_FRAME_HEADER_BYTES + len;
  if (available < frameLen) return Candidate::Incomplete;

  if (checksum == OxiChecksum::Crc8) {
    if (crc8(frame, frameLen - 1) != frame[frameLen - 1]) return Candidate::Malformed;
  }
  return Candidate::Valid;
}

void OxiFrameDecoder::parse(const uint8_t* frame, std::vector<OxiReading>& out) const {
  if (frame[OXI_FRAME_TOKEN_OFFSET] != OXI_TOKEN_LIVE) return;

  switch (frame[OXI_FRAME_TYPE_OFFSET]) {
    case OXI_TYPE_PARAMS: {
      OxiReading r;
      r.kind      = OxiReadingKind::Vitals;
      r.spo2      = normalizeSpo2(frame[OXI_PARAMS_SPO2_OFFSET]);
      r.pulseRate = normalizePulse(frame[OXI_PARAMS_PULSE_OFFSET]);
      out.push_back(r);
      break;
    }
    case OXI_TYPE_WAVE:
      for (size_t i = 0; i < OXI_WAVE_SAMPLES; i++) {
        OxiReading r;
        r.kind    = OxiReadingKind::Pleth;
        r.hasWave = true;
        r.wave    = frame[OXI_WAVE_FIRST_OFFSET + i];
        out.push_back(r);
      }
      break;
    default:
      // other live data (battery, mode) carries no reading
      break;
  }
}
