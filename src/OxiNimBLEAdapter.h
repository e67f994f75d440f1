/******************************************************************************************************/
// NimBLE central adapter
//
// Implements OxiBleAdapter with NimBLE-Arduino 2.x on ESP32. NimBLE callbacks run in the host
// task; notifications and disconnects reach the supervisor task through a FreeRTOS queue.
/******************************************************************************************************/

#ifndef OXI_NIMBLE_ADAPTER_H
#define OXI_NIMBLE_ADAPTER_H

#include <stdint.h>
#include <string>
#include <vector>

#include <NimBLEDevice.h>
#include "freertos/FreeRTOS.h"
#include "freertos/queue.h"
#include "freertos/semphr.h"

#include "OxiBleAdapter.h"

inline constexpr size_t         OXI_NOTIFY_MAX_BYTES    = 244;   // ATT payload at MTU 247
inline constexpr UBaseType_t    OXI_NOTIFY_QUEUE_DEPTH  = 16;
inline constexpr uint32_t       OXI_WAIT_SLICE_MS       = 50;    // interrupt() is noticed at least this often
inline constexpr uint32_t       OXI_BLOCKING_GRACE_MS   = 500;   // past the scan/connect time before giving up
inline constexpr uint16_t       OXI_SCAN_INTERVAL       = 1349;  // 0.625 ms units
inline constexpr uint16_t       OXI_SCAN_WINDOW         = 449;

class OxiNimBLEAdapter : public OxiBleAdapter {
public:
  OxiNimBLEAdapter() = default;
  ~OxiNimBLEAdapter() override;

  // NimBLEDevice::init() must have run
  bool          begin();
  void          end();

  bool          scan(const OxiDeviceIdentity& identity, uint32_t durationMs, std::vector<OxiPeer>& found) override;
  uint16_t      connect(const OxiPeer& peer, uint32_t timeoutMs) override;
  bool          subscribe(uint16_t link, const std::string& serviceUuid, const std::string& charUuid) override;
  OxiWaitResult waitNotification(uint16_t link, uint32_t timeoutMs, std::vector<uint8_t>& payload) override;
  void          release(uint16_t link) override;
  void          interrupt() override;
  void          clearInterrupt() override;

  bool          isLinkUp()          const { return linkHandle != OXI_LINK_NONE && !linkDown; }
  uint32_t      getNotifyDrops()    const { return notifyDrops; }
  uint32_t      getTruncatedBytes() const { return truncatedBytes; }
  int           getDisconnectReason() const { return disconnectReason; }
  const std::string& getPeerAddress() const { return peerAddr; }

private:
  struct NotifyItem {
    uint16_t len;                          // 0 wakes a waiter without data
    uint8_t  data[OXI_NOTIFY_MAX_BYTES];
  };

  class ClientCallbacks;
  friend class ClientCallbacks;

  void          onNotify(const uint8_t* data, size_t len);
  void          wakeWaiter();
  void          drainQueue();
  void          destroyClient();
  NimBLERemoteCharacteristic* findCharacteristic(const std::string& serviceUuid, const std::string& charUuid);

  NimBLEClient*      client          = nullptr;
  ClientCallbacks*   clientCallbacks = nullptr;
  QueueHandle_t      notifyQueue     = nullptr;
  SemaphoreHandle_t  clientLock      = nullptr;   // guards client against interrupt() from other tasks

  volatile uint16_t  linkHandle      = OXI_LINK_NONE;
  volatile bool      linkDown        = false;
  volatile bool      connecting      = false;
  volatile bool      connectDone     = false;   // onConnect or onConnectFail seen
  volatile bool      linkUp          = false;
  volatile bool      interrupted     = false;
  volatile int       disconnectReason = 0;
  volatile uint32_t  notifyDrops     = 0;
  volatile uint32_t  truncatedBytes  = 0;
  std::string        peerAddr;
};

#endif // OXI_NIMBLE_ADAPTER_H
