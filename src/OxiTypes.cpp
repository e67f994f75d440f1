#include <algorithm>
#include <cctype>
#include <cstdio>
#include "OxiTypes.h"

static bool equalsIgnoreCase(const std::string& a, const std::string& b) {
  if (a.size() != b.size()) return false;
  return std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
    return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
  });
}

bool OxiDeviceIdentity::matches(const std::string& name, const std::string& addr) const {
  if (!address.empty()) {
    return equalsIgnoreCase(address, addr);
  }
  // Peripherals without a local name are known by their address
  const std::string& label = name.empty() ? addr : name;
  return label.find(nameFilter) != std::string::npos;
}

const char* oxiStateToStr(OxiConnState state) {
  switch (state) {
    case OxiConnState::Idle:        return "Idle";
    case OxiConnState::Discovering: return "Discovering";
    case OxiConnState::Connecting:  return "Connecting";
    case OxiConnState::Subscribing: return "Subscribing";
    case OxiConnState::Streaming:   return "Streaming";
    case OxiConnState::Failed:      return "Failed";
    default:                        return "Unknown";
  }
}

const char* oxiErrorToStr(OxiError error) {
  switch (error) {
    case OxiError::None:            return "None";
    case OxiError::NotFound:        return "NotFound";
    case OxiError::ConnectFailed:   return "ConnectFailed";
    case OxiError::SubscribeFailed: return "SubscribeFailed";
    case OxiError::Disconnected:    return "Disconnected";
    case OxiError::DecodeFatal:     return "DecodeFatal";
    case OxiError::Stalled:         return "Stalled";
    case OxiError::Cancelled:       return "Cancelled";
    default:                        return "Unknown";
  }
}

const char* oxiFormatCsvHeader() {
  return "time,spo2,heartrate";
}

bool oxiFormatCsv(const OxiReading& reading, uint32_t timeMs, char* out, size_t outLen) {
  if (reading.kind != OxiReadingKind::Vitals) return false;
  // Null data: the device is searching or has no finger
  if (!reading.spo2Valid() && !reading.pulseValid()) return false;
  if (!out || outLen == 0) return false;

  char spo2[8];
  char pulse[8];
  if (reading.spo2Valid()) snprintf(spo2, sizeof(spo2), "%u", (unsigned)reading.spo2);
  else                     snprintf(spo2, sizeof(spo2), "-");
  if (reading.pulseValid()) snprintf(pulse, sizeof(pulse), "%u", (unsigned)reading.pulseRate);
  else                      snprintf(pulse, sizeof(pulse), "-");

  int n = snprintf(out, outLen, "%lu,%s,%s", (unsigned long)timeMs, spo2, pulse);
  return n > 0 && (size_t)n < outLen;
}
