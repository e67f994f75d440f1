/******************************************************************************************************/
// Include file for BLEOximeter library
//
// Connects to a BLE pulse oximeter as a central, decodes its notification stream into SpO2 and
// pulse rate readings and keeps reconnecting for as long as it runs.
/******************************************************************************************************/

#ifndef BLE_OXIMETER_H
#define BLE_OXIMETER_H

#ifndef ARDUINO_ARCH_ESP32
  #error "BLEOximeter needs an ESP32 (NimBLE-Arduino and FreeRTOS)."
#endif

// Standard Libraries
#include <stdint.h>
#include <inttypes.h>
#include <functional>
#include <memory>
#include <string>

#include <Arduino.h>
#include <NimBLEDevice.h>

#include "freertos/FreeRTOS.h"
#include "freertos/queue.h"
#include "freertos/task.h"

#include "OxiLog.h"
#include "OxiTypes.h"
#include "OxiFrameDecoder.h"
#include "OxiBleAdapter.h"
#include "OxiSession.h"
#include "OxiSupervisor.h"
#include "OxiNimBLEAdapter.h"

/******************************************************************************************************/
/* Definitions */
/* Constants   */
/******************************************************************************************************/

#define BLE_OXIMETER_VERSION_STRING "BLE Oximeter Library v1.0.0"

inline constexpr UBaseType_t    OXI_READING_QUEUE_DEPTH         = 32;     // readings waiting for loop()
inline constexpr uint32_t       OXI_TASK_STACK_BYTES            = 6144;
inline constexpr UBaseType_t    OXI_TASK_PRIORITY               = 1;
inline constexpr BaseType_t     OXI_TASK_CORE                   = 1;
inline constexpr uint32_t       OXI_TASK_STOP_TIMEOUT_MS        = 8000;   // > scan + connect timeouts
inline constexpr uint32_t       OXI_DELAY_SLICE_MS              = 20;

enum class OxiPumpMode {
  Polling,   // update() from loop() runs one supervisor step
  Task       // the supervisor runs in its own FreeRTOS task
};

/***************************************************************************************************/
/* Device Driver */
/***************************************************************************************************/

class BLEOximeter {
// ================================================================================================
public:
// ================================================================================================
  // Provide a nested alias so user code can refer to BLEOximeter::PumpMode
  using PumpMode = ::OxiPumpMode;

  BLEOximeter() = default;
  ~BLEOximeter();

  BLEOximeter(const BLEOximeter&)            = delete;
  BLEOximeter& operator=(const BLEOximeter&) = delete;

  // ----------------------------------------------------------------------------------------------
  // Lifecycle
  // ----------------------------------------------------------------------------------------------
  bool     begin(const OxiConfig& cfg = OxiConfig(), const char* deviceName = "BLEOximeter");
           // NimBLE init, starts the supervisor (task or polling)
  void     end();
           // cancels, waits for the supervisor, releases the link and NimBLE
  void     update();
           // Polling mode: one supervisor step. May block up to the scan or retry time.

  // ----------------------------------------------------------------------------------------------
  // Readings
  // ----------------------------------------------------------------------------------------------
  int      available();
           // readings waiting in the queue
  bool     read(OxiReading& reading);
           // oldest reading, false when none
  uint32_t getReadingDrops() const { return readingDrops; }

  // ----------------------------------------------------------------------------------------------
  // State
  // ----------------------------------------------------------------------------------------------
  OxiConnState     getState()     const { return supervisor ? supervisor->getState() : OxiConnState::Idle; }
  const char*      stateToStr()   const { return oxiStateToStr(getState()); }
  bool             isStreaming()  const { return getState() == OxiConnState::Streaming; }
  OxiError         getLastError() const { return supervisor ? supervisor->getLastError() : OxiError::None; }
  const OxiConfig& getConfig()    const { return config; }

  PumpMode getPumpMode() const { return pumpMode; }
  void     setPumpMode(PumpMode m); // selects Polling or Task mode

  // ----------------------------------------------------------------------------------------------
  // Logging / Stats
  // ----------------------------------------------------------------------------------------------
  void     setLogLevel(uint8_t lvl) { oxiSetLogLevel(lvl); }
  uint8_t  getLogLevel() const { return oxiGetLogLevel(); }
  void     printStats(Stream &out);
  void     printStats() { printStats(Serial); }
  void     clearStats();

  // ----------------------------------------------------------------------------------------------
  // Event hooks - called from the supervisor task in Task mode, keep handlers light
  // ----------------------------------------------------------------------------------------------
  void     setOnReading(std::function<void(const OxiReading& reading)> cb) { onReading = std::move(cb); }
  void     setOnStateChange(std::function<void(OxiConnState from, OxiConnState to)> cb) { onStateChange = std::move(cb); }
  void     setOnAttemptFailed(std::function<void(OxiError error, uint32_t attempt)> cb) { onAttemptFailed = std::move(cb); }
  void     setOnRawData(std::function<void(const uint8_t* data, size_t len)> cb) { onRawData = std::move(cb); }

// ================================================================================================
private:
// ================================================================================================
  void       handleReading(const OxiReading& reading);
  bool       delaySliced(uint32_t ms);

  void       startSupervisorTask();
  void       stopSupervisorTask();
  static void supervisorTask(void* arg);

  OxiConfig                             config;
  OxiNimBLEAdapter                      adapter;
  std::unique_ptr<OxiBleSessionFactory> factory;
  std::unique_ptr<OxiSupervisor>        supervisor;

  QueueHandle_t     readingQueue  = nullptr;
  volatile uint32_t readingDrops  = 0;
  bool              started       = false;

  TaskHandle_t      supervisorTaskHandle = nullptr;
  volatile bool     taskRunning   = false;
  volatile PumpMode pumpMode      = PumpMode::Task;

  std::function<void(const OxiReading& reading)>          onReading;
  std::function<void(OxiConnState from, OxiConnState to)> onStateChange;
  std::function<void(OxiError error, uint32_t attempt)>   onAttemptFailed;
  std::function<void(const uint8_t* data, size_t len)>    onRawData;
};

#endif // BLE_OXIMETER_H
