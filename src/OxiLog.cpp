#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <utility>
#include "OxiLog.h"

static std::atomic<uint8_t> currentLogLevel{OXI_LOG_INFO};
static OxiLogWriter         logWriter;

void oxiSetLogLevel(uint8_t level) {
  currentLogLevel = (level > OXI_LOG_DEBUG) ? OXI_LOG_DEBUG : level;
}

uint8_t oxiGetLogLevel() {
  return currentLogLevel;
}

void oxiSetLogWriter(OxiLogWriter writer) {
  logWriter = std::move(writer);
}

const char* oxiLogLevelName(uint8_t level) {
  switch (level) {
    case OXI_LOG_ERROR:   return "ERROR";
    case OXI_LOG_WARNING: return "WARN";
    case OXI_LOG_INFO:    return "INFO";
    case OXI_LOG_DEBUG:   return "DEBUG";
    default:              return "NONE";
  }
}

void oxiLogPrintLevel(uint8_t level, const char* format, ...) {
  if (!logWriter) return;

  char buffer[OXI_LOG_LINE_MAX];

  va_list args;
  va_start(args, format);
  int n = vsnprintf(buffer, sizeof(buffer), format, args);
  va_end(args);

  if (n < 0) return;
  logWriter(level, buffer);
}

const char* oxiHexDump(const uint8_t* data, size_t len, char* out, size_t outLen) {
  static const char hex[] = "0123456789ABCDEF";
  if (!out || outLen == 0) return out;

  size_t pos = 0;
  for (size_t i = 0; i < len; i++) {
    // two digits and the terminator must fit
    if (pos + 2 >= outLen) break;
    out[pos++] = hex[(data[i] >> 4) & 0x0F];
    out[pos++] = hex[data[i] & 0x0F];
    if (pos + 1 < outLen) out[pos++] = ' ';
  }
  if (pos > 0 && out[pos - 1] == ' ') pos--; // drop trailing blank
  out[pos] = '\0';
  return out;
}
