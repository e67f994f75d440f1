/******************************************************************************************************/
// Shared types for the BLEOximeter library
//
// Readings, device identity, configuration, connection states and errors.
// Nothing in here depends on Arduino or NimBLE.
/******************************************************************************************************/

#ifndef OXI_TYPES_H
#define OXI_TYPES_H

#include <stdint.h>
#include <stddef.h>
#include <atomic>
#include <string>

/******************************************************************************************************/
/* Constants */
/******************************************************************************************************/

// Nordic UART (NUS) UUIDs, the oximeter streams on the TX characteristic
static constexpr const char     OXI_NUS_SERVICE_UUID[]           = {"6E400001-B5A3-F393-E0A9-E50E24DCCA9E"};
static constexpr const char     OXI_NUS_CHARACTERISTIC_UUID_TX[] = {"6E400003-B5A3-F393-E0A9-E50E24DCCA9E"};

// Only peripherals whose local name contains this string are tried
static constexpr const char     OXI_DEFAULT_NAME_FILTER[]        = {"OxySmart"};

// Reading sentinels
inline constexpr uint8_t        OXI_SPO2_NONE                    = 0xFF;
inline constexpr uint16_t       OXI_PULSE_NONE                   = 0xFFFF;

// Physiological ranges, anything outside is reported as the sentinel
inline constexpr uint8_t        OXI_SPO2_MIN_VALID               = 35;
inline constexpr uint8_t        OXI_SPO2_MAX_VALID               = 100;
inline constexpr uint16_t       OXI_PULSE_MIN_VALID              = 25;
inline constexpr uint16_t       OXI_PULSE_MAX_VALID              = 250;

// ===== Timing defaults =====
inline constexpr uint32_t       OXI_SCAN_TIME_MS                 = 2000;   // scan window per discovery attempt
inline constexpr uint32_t       OXI_CONNECT_TIMEOUT_MS           = 5000;
inline constexpr uint32_t       OXI_CHUNK_WAIT_MS                = 250;    // nextChunk() wait slice
inline constexpr uint32_t       OXI_INACTIVITY_TIMEOUT_MS        = 30000;  // connected but silent -> reconnect
inline constexpr uint32_t       OXI_RETRY_INITIAL_MS             = 1000;
inline constexpr uint32_t       OXI_RETRY_MAX_MS                 = 16000;
inline constexpr uint32_t       OXI_MIN_RETRY_DELAY_MS           = 100;    // floor, no zero delay spin
inline constexpr uint16_t       OXI_MAX_BAD_FRAMES               = 32;     // consecutive malformed frames -> DecodeFatal

// Connection handle value meaning "no link"
inline constexpr uint16_t       OXI_LINK_NONE                    = 0xFFFF;

/******************************************************************************************************/
/* Structures */
/******************************************************************************************************/

enum class OxiConnState : uint8_t {
  Idle,         // not started, or cancelled and torn down
  Discovering,  // scanning for the peripheral
  Connecting,   // link layer connect in progress
  Subscribing,  // service/characteristic lookup and subscribe
  Streaming,    // notifications flowing
  Failed        // waiting out the retry delay
};

enum class OxiError : uint8_t {
  None,
  NotFound,         // no matching peripheral in range
  ConnectFailed,    // link layer failure
  SubscribeFailed,  // GATT failure after connect succeeded
  Disconnected,     // link dropped while streaming
  DecodeFatal,      // decoder could not resynchronize within bounds
  Stalled,          // connected, but no reading within the inactivity timeout
  Cancelled
};

enum class OxiChecksum : uint8_t {
  None,   // trust marker and length
  Crc8    // CRC-8 poly 0x07 over the frame
};

enum class OxiReadingKind : uint8_t {
  Vitals, // SpO2 and pulse rate
  Pleth   // one plethysmograph sample
};

struct OxiReading {
  OxiReadingKind kind      = OxiReadingKind::Vitals;
  uint8_t        spo2      = OXI_SPO2_NONE;   // percent, or OXI_SPO2_NONE
  uint16_t       pulseRate = OXI_PULSE_NONE;  // beats per minute, or OXI_PULSE_NONE
  bool           hasWave   = false;
  uint8_t        wave      = 0;               // raw waveform sample

  bool spo2Valid()  const { return spo2 != OXI_SPO2_NONE; }
  bool pulseValid() const { return pulseRate != OXI_PULSE_NONE; }
};

struct OxiDeviceIdentity {
  std::string nameFilter = OXI_DEFAULT_NAME_FILTER; // substring of the advertised local name
  std::string address;                              // optional "aa:bb:cc:dd:ee:ff", wins over the name

  // name may be empty when the peripheral does not advertise one
  bool matches(const std::string& name, const std::string& addr) const;
};

struct OxiConfig {
  OxiDeviceIdentity identity;
  std::string       serviceUuid         = OXI_NUS_SERVICE_UUID;
  std::string       notifyUuid          = OXI_NUS_CHARACTERISTIC_UUID_TX;
  uint32_t          scanTimeMs          = OXI_SCAN_TIME_MS;
  uint32_t          connectTimeoutMs    = OXI_CONNECT_TIMEOUT_MS;
  uint32_t          chunkWaitMs         = OXI_CHUNK_WAIT_MS;
  uint32_t          inactivityTimeoutMs = OXI_INACTIVITY_TIMEOUT_MS;
  uint32_t          retryInitialMs      = OXI_RETRY_INITIAL_MS;
  uint32_t          retryMaxMs          = OXI_RETRY_MAX_MS;
  uint16_t          maxBadFrames        = OXI_MAX_BAD_FRAMES;
  OxiChecksum       checksum            = OxiChecksum::Crc8;
};

struct OxiStats {
  uint32_t attempts          = 0; // discovery attempts started
  uint32_t sessions          = 0; // sessions that reached Streaming
  uint32_t notFound          = 0;
  uint32_t connectFailed     = 0;
  uint32_t subscribeFailed   = 0;
  uint32_t disconnects       = 0;
  uint32_t decodeFatal       = 0;
  uint32_t stalls            = 0;
  uint32_t chunks            = 0;
  uint32_t bytesRx           = 0;
  uint32_t readings          = 0;
  uint32_t discardedBytes    = 0;
  uint32_t malformedFrames   = 0;
};

// Set from any task, observed by the supervisor loop and the session
class OxiCancelToken {
public:
  void cancel()          { flag.store(true); }
  void reset()           { flag.store(false); }
  bool cancelled() const { return flag.load(); }

private:
  std::atomic<bool> flag{false};
};

const char* oxiStateToStr(OxiConnState state);
const char* oxiErrorToStr(OxiError error);

// CSV presentation: "time,spo2,heartrate" and "<ms>,<spo2>,<pulse>"
const char* oxiFormatCsvHeader();
// Returns false (and writes nothing) for pleth samples and for vitals with neither value available
bool        oxiFormatCsv(const OxiReading& reading, uint32_t timeMs, char* out, size_t outLen);

#endif // OXI_TYPES_H
