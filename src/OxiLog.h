/******************************************************************************************************/
// Logging for the BLEOximeter library
//
// Level gated printf style messages. Output goes to a writer installed by the application
// (BLEOximeter routes it to Serial). Without a writer all messages are dropped.
/******************************************************************************************************/

#ifndef OXI_LOG_H
#define OXI_LOG_H

#include <stdint.h>
#include <stddef.h>
#include <functional>

// Log levels: ascending by verbosity for comparisons like (level >= OXI_LOG_INFO)
#define OXI_LOG_NONE     0
#define OXI_LOG_ERROR    1
#define OXI_LOG_WARNING  2
#define OXI_LOG_INFO     3
#define OXI_LOG_DEBUG    4

#define OXI_LOG_LINE_MAX 256

#define OXI_LOGE(...) do { if (oxiGetLogLevel() >= OXI_LOG_ERROR)   oxiLogPrintLevel(OXI_LOG_ERROR,   __VA_ARGS__); } while (0)
#define OXI_LOGW(...) do { if (oxiGetLogLevel() >= OXI_LOG_WARNING) oxiLogPrintLevel(OXI_LOG_WARNING, __VA_ARGS__); } while (0)
#define OXI_LOGI(...) do { if (oxiGetLogLevel() >= OXI_LOG_INFO)    oxiLogPrintLevel(OXI_LOG_INFO,    __VA_ARGS__); } while (0)
#define OXI_LOGD(...) do { if (oxiGetLogLevel() >= OXI_LOG_DEBUG)   oxiLogPrintLevel(OXI_LOG_DEBUG,   __VA_ARGS__); } while (0)

// Receives one complete message (no line terminator) and its level
using OxiLogWriter = std::function<void(uint8_t level, const char* line)>;

void        oxiSetLogLevel(uint8_t level);
uint8_t     oxiGetLogLevel();
void        oxiSetLogWriter(OxiLogWriter writer);
const char* oxiLogLevelName(uint8_t level);

void        oxiLogPrintLevel(uint8_t level, const char* format, ...) __attribute__((format(printf, 2, 3)));

// Renders as many bytes as fit as "AA 55 0F ..." into out, returns out
const char* oxiHexDump(const uint8_t* data, size_t len, char* out, size_t outLen);

#endif // OXI_LOG_H
