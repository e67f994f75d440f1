/******************************************************************************************************/
// Frame decoder for the oximeter notification stream
//
// The device streams frames back to back over one characteristic, split across notifications
// at arbitrary points:
//
//   offset  0    1    2      3    4     5 ...          4+len-1
//           AA   55   token  len  type  payload ...    crc8
//
// len counts every byte after itself (type and crc included), a frame is 4 + len bytes.
// Every layout constant lives in this header so a capture from another model can correct it.
/******************************************************************************************************/

#ifndef OXI_FRAME_DECODER_H
#define OXI_FRAME_DECODER_H

#include <stdint.h>
#include <stddef.h>
#include <vector>
#include "OxiTypes.h"

// ===== Wire layout =====
inline constexpr uint8_t        OXI_FRAME_MARKER_0       = 0xAA;
inline constexpr uint8_t        OXI_FRAME_MARKER_1       = 0x55;
inline constexpr size_t         OXI_FRAME_HEADER_BYTES   = 4;      // marker(2) + token + len
inline constexpr size_t         OXI_FRAME_TOKEN_OFFSET   = 2;
inline constexpr size_t         OXI_FRAME_LEN_OFFSET     = 3;
inline constexpr size_t         OXI_FRAME_TYPE_OFFSET    = 4;
inline constexpr uint8_t        OXI_FRAME_MIN_LEN        = 2;      // type + crc
inline constexpr uint8_t        OXI_FRAME_MAX_LEN        = 64;
inline constexpr size_t         OXI_FRAME_MAX_BYTES      = OXI_FRAME_HEADER_BYTES + OXI_FRAME_MAX_LEN;

inline constexpr uint8_t        OXI_TOKEN_LIVE           = 0x0F;   // live measurement data

// Parameter frame: AA 55 0F 08 01 <spo2> <pulse> .. .. .. .. <crc>
inline constexpr uint8_t        OXI_TYPE_PARAMS          = 0x01;
inline constexpr uint8_t        OXI_PARAMS_LEN           = 0x08;
inline constexpr size_t         OXI_PARAMS_SPO2_OFFSET   = 5;
inline constexpr size_t         OXI_PARAMS_PULSE_OFFSET  = 6;

// Waveform frame: AA 55 0F 07 02 <w0> <w1> <w2> <w3> <w4> <crc>
inline constexpr uint8_t        OXI_TYPE_WAVE            = 0x02;
inline constexpr uint8_t        OXI_WAVE_LEN             = 0x07;
inline constexpr size_t         OXI_WAVE_FIRST_OFFSET    = 5;
inline constexpr size_t         OXI_WAVE_SAMPLES         = 5;

// Value the device sends for SpO2 and pulse while searching / no finger
inline constexpr uint8_t        OXI_DEVICE_SEARCHING     = 0x00;

struct OxiDecodeResult {
  std::vector<uint8_t>    remaining;            // unconsumed tail, carry into the next call
  std::vector<OxiReading> readings;             // wire order
  size_t                  discardedBytes  = 0;  // skipped while hunting for a marker
  size_t                  malformedFrames = 0;  // candidates rejected (bad length or checksum)
  size_t                  frames          = 0;  // valid frames, including unknown types

  // Runs of consecutive malformed candidates, split at valid frames
  size_t                  leadingMalformed  = 0;  // before the first valid frame (all of them if none)
  size_t                  trailingMalformed = 0;  // after the last valid frame (all of them if none)
  size_t                  longestInnerRun   = 0;  // longest run between two valid frames
};

class OxiFrameDecoder {
public:
  explicit OxiFrameDecoder(OxiChecksum checksum = OxiChecksum::Crc8) : checksum(checksum) {}

  // Appends data to buffer and extracts every complete frame.
  // All resynchronization state lives in the returned remaining buffer.
  OxiDecodeResult decode(const std::vector<uint8_t>& buffer, const uint8_t* data, size_t len) const;

  OxiChecksum getChecksum() const { return checksum; }

  // CRC-8, polynomial 0x07, init 0x00, no reflection
  static uint8_t crc8(const uint8_t* data, size_t len);

  static uint8_t  normalizeSpo2(uint8_t raw);
  static uint16_t normalizePulse(uint16_t raw);

private:
  OxiChecksum checksum;

  enum class Candidate : uint8_t {
    Incomplete,   // need more bytes
    Malformed,    // drop the leading marker byte and rescan
    Valid
  };

  Candidate inspect(const uint8_t* frame, size_t available, size_t& frameLen) const;
  void      parse(const uint8_t* frame, std::vector<OxiReading>& out) const;
};

#endif // OXI_FRAME_DECODER_H
