// ****************************************************************************************************
// BLE Oximeter Library
//
// BLE pulse oximeter client for Arduino using NimBLE
// Finds the oximeter, subscribes to its Nordic UART TX characteristic and turns the frame
// stream into readings, reconnecting whenever the link is lost.
// ****************************************************************************************************
#include "BLEOximeter.h"

// ==============================================================================================
// ==============================================================================================

BLEOximeter::~BLEOximeter() {
  end();
}

bool BLEOximeter::begin(const OxiConfig& cfg, const char* deviceName) {
  if (started) return true;
  config = cfg;

  // Route library logs to Serial
  oxiSetLogWriter([](uint8_t level, const char* line) {
    Serial.printf("[%s] %s\r\n", oxiLogLevelName(level), line);
  });

  NimBLEDevice::init(deviceName);
  OXI_LOGI("BLEOximeter: %s, NimBLE initialized as \"%s\".", BLE_OXIMETER_VERSION_STRING, deviceName);

  if (!adapter.begin()) {
    NimBLEDevice::deinit(true);
    return false;
  }

  readingQueue = xQueueCreate(OXI_READING_QUEUE_DEPTH, sizeof(OxiReading));
  if (!readingQueue) {
    OXI_LOGE("BLEOximeter: Could not allocate reading queue.");
    adapter.end();
    NimBLEDevice::deinit(true);
    return false;
  }
  readingDrops = 0;

  factory.reset(new OxiBleSessionFactory(adapter, config));
  supervisor.reset(new OxiSupervisor(*factory, config));

  supervisor->setClock([]() { return static_cast<uint32_t>(millis()); });
  supervisor->setDelay([this](uint32_t ms) { return delaySliced(ms); });

  supervisor->setOnReading([this](const OxiReading& r) { handleReading(r); });
  supervisor->setOnStateChange([this](OxiConnState from, OxiConnState to) {
    if (onStateChange) onStateChange(from, to);
  });
  supervisor->setOnAttemptFailed([this](OxiError error, uint32_t attempt) {
    if (onAttemptFailed) onAttemptFailed(error, attempt);
  });
  supervisor->setOnRawData([this](const uint8_t* data, size_t len) {
    if (onRawData) onRawData(data, len);
  });

  started = true;
  if (pumpMode == PumpMode::Task) startSupervisorTask();
  return true;
}

void BLEOximeter::end() {
  if (!started) return;

  stopSupervisorTask();
  // Polling mode, or a task that did not stop in time: the session goes with the supervisor
  supervisor.reset();
  factory.reset();
  adapter.end();

  if (readingQueue) {
    vQueueDelete(readingQueue);
    readingQueue = nullptr;
  }

  NimBLEDevice::deinit(true);
  started = false;
  OXI_LOGI("BLEOximeter: Stopped.");
  oxiSetLogWriter(nullptr);
}

void BLEOximeter::update() {
  if (!started || pumpMode != PumpMode::Polling || !supervisor) return;
  supervisor->advance();
}

// ===== Readings ===============================================================================

void BLEOximeter::handleReading(const OxiReading& reading) {
  if (readingQueue) {
    if (xQueueSend(readingQueue, &reading, 0) != pdTRUE) {
      // Full: overwrite oldest so the newest reading is kept
      OxiReading oldest;
      if (xQueueReceive(readingQueue, &oldest, 0) == pdTRUE) readingDrops++;
      if (xQueueSend(readingQueue, &reading, 0) != pdTRUE) readingDrops++;
    }
  }
  if (onReading) onReading(reading);
}

int BLEOximeter::available() {
  if (!readingQueue) return 0;
  return static_cast<int>(uxQueueMessagesWaiting(readingQueue));
}

bool BLEOximeter::read(OxiReading& reading) {
  if (!readingQueue) return false;
  return xQueueReceive(readingQueue, &reading, 0) == pdTRUE;
}

// ===== Pump ===================================================================================

bool BLEOximeter::delaySliced(uint32_t ms) {
  uint32_t remaining = ms;
  while (remaining > 0) {
    if (supervisor && supervisor->isCancelled()) return false;
    const uint32_t slice = (remaining < OXI_DELAY_SLICE_MS) ? remaining : OXI_DELAY_SLICE_MS;
    vTaskDelay(pdMS_TO_TICKS(slice) ? pdMS_TO_TICKS(slice) : 1);
    remaining -= slice;
  }
  return !(supervisor && supervisor->isCancelled());
}

void BLEOximeter::setPumpMode(PumpMode m) {
  if (pumpMode == m) return;

  if (!started) {
    pumpMode = m; // applied by begin()
    return;
  }

  if (m == PumpMode::Task) {
    pumpMode = m;
    startSupervisorTask();
  } else {
    stopSupervisorTask();
    pumpMode = m;
  }
}

void BLEOximeter::startSupervisorTask() {
  if (supervisorTaskHandle || !supervisor) return;

  supervisor->reset();
  taskRunning = true;
  BaseType_t rc = xTaskCreatePinnedToCore(
    BLEOximeter::supervisorTask,
    "OxiSupervisor",
    OXI_TASK_STACK_BYTES,
    this,
    OXI_TASK_PRIORITY,
    &supervisorTaskHandle,
    OXI_TASK_CORE);
  if (rc != pdPASS) {
    supervisorTaskHandle = nullptr;
    taskRunning          = false;
    pumpMode             = PumpMode::Polling;
    OXI_LOGW("BLEOximeter: Supervisor task creation failed; staying in polling mode.");
  } else {
    OXI_LOGI("BLEOximeter: Supervisor task started.");
  }
}

void BLEOximeter::stopSupervisorTask() {
  if (!supervisor) return;
  supervisor->cancel();

  if (supervisorTaskHandle) {
    const uint32_t t0 = millis();
    while (taskRunning && (millis() - t0) < OXI_TASK_STOP_TIMEOUT_MS) {
      vTaskDelay(pdMS_TO_TICKS(10));
    }
    if (taskRunning) {
      OXI_LOGE("BLEOximeter: Supervisor task did not stop, deleting it.");
      vTaskDelete(supervisorTaskHandle);
      taskRunning = false;
    }
    supervisorTaskHandle = nullptr;
  } else {
    // Polling: nothing is blocked, step once so the session is torn down
    supervisor->advance();
  }
  supervisor->reset();
}

void BLEOximeter::supervisorTask(void* arg) {
  BLEOximeter* self = static_cast<BLEOximeter*>(arg);
  if (self && self->supervisor) {
    self->supervisor->run();
  }
  if (self) self->taskRunning = false;
  vTaskDelete(nullptr);
}

// ===== Stats ==================================================================================

void BLEOximeter::clearStats() {
  if (supervisor) supervisor->clearStats();
  readingDrops = 0;
}

// Report statistics
void BLEOximeter::printStats(Stream &out) {
  out.print(F("BLEOximeter Stats:\r\n"));

  out.print(F("  Pump: "));
  out.print(pumpMode == PumpMode::Task ? F("Task") : F("Polling"));
  out.print(F("  State: "));
  out.print(stateToStr());
  out.print(F("  Last error: "));
  out.print(oxiErrorToStr(getLastError()));
  out.print(F("\r\n"));

  out.print(F("  Device: filter=\""));
  out.print(config.identity.nameFilter.c_str());
  out.print(F("\""));
  if (!config.identity.address.empty()) {
    out.print(F(" address="));
    out.print(config.identity.address.c_str());
  }
  if (adapter.isLinkUp()) {
    out.print(F(" peer="));
    out.print(adapter.getPeerAddress().c_str());
  }
  out.print(F("\r\n"));

  if (!supervisor) return;
  const OxiStats s = supervisor->getStats(); // snapshot, the supervisor task keeps counting

  out.print(F("  Attempts: "));          out.print(s.attempts);
  out.print(F(" sessions="));            out.print(s.sessions);
  out.print(F(" fail-streak="));         out.print(supervisor->getFailStreak());
  out.print(F("\r\n"));

  out.print(F("  Failures: not-found="));  out.print(s.notFound);
  out.print(F(" connect="));               out.print(s.connectFailed);
  out.print(F(" subscribe="));             out.print(s.subscribeFailed);
  out.print(F(" disconnect="));            out.print(s.disconnects);
  out.print(F(" decode="));                out.print(s.decodeFatal);
  out.print(F(" stalled="));               out.print(s.stalls);
  out.print(F("\r\n"));

  out.print(F("  RX: chunks="));         out.print(s.chunks);
  out.print(F(" bytes="));               out.print(s.bytesRx);
  out.print(F(" readings="));            out.print(s.readings);
  out.print(F(" dropped-readings="));    out.print(readingDrops);
  out.print(F("\r\n"));

  out.print(F("  Resync: discarded="));  out.print(s.discardedBytes);
  out.print(F(" malformed="));           out.print(s.malformedFrames);
  out.print(F(" notify-drops="));        out.print(adapter.getNotifyDrops());
  out.print(F(" truncated="));           out.print(adapter.getTruncatedBytes());
  out.print(F("\r\n"));
}
