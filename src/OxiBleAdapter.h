/******************************************************************************************************/
// BLE adapter capability used by the session
//
// The core never reaches into a BLE stack directly. Anything that can scan, connect, subscribe
// and hand over notifications can drive a session (OxiNimBLEAdapter on ESP32, fakes in tests).
/******************************************************************************************************/

#ifndef OXI_BLE_ADAPTER_H
#define OXI_BLE_ADAPTER_H

#include <stdint.h>
#include <string>
#include <vector>
#include "OxiTypes.h"

struct OxiPeer {
  std::string name;          // advertised local name, may be empty
  std::string address;       // "aa:bb:cc:dd:ee:ff"
  uint8_t     addressType = 0;
};

enum class OxiWaitResult : uint8_t {
  Notification,  // payload delivered
  Timeout,       // nothing within the wait
  Disconnected,  // link dropped
  Interrupted    // interrupt() was called
};

class OxiBleAdapter {
public:
  virtual ~OxiBleAdapter() = default;

  // Scans for durationMs and appends every peripheral matching identity to found.
  // Returns false when the scan could not run at all.
  virtual bool          scan(const OxiDeviceIdentity& identity, uint32_t durationMs, std::vector<OxiPeer>& found) = 0;

  // Returns a link handle, OXI_LINK_NONE on failure
  virtual uint16_t      connect(const OxiPeer& peer, uint32_t timeoutMs) = 0;

  // Locates the characteristic (must support notify) and subscribes
  virtual bool          subscribe(uint16_t link, const std::string& serviceUuid, const std::string& charUuid) = 0;

  virtual OxiWaitResult waitNotification(uint16_t link, uint32_t timeoutMs, std::vector<uint8_t>& payload) = 0;

  // Disconnects and frees everything held for link
  virtual void          release(uint16_t link) = 0;

  // Wakes any blocked scan/connect/wait; stays in effect until clearInterrupt()
  virtual void          interrupt() = 0;
  virtual void          clearInterrupt() = 0;
};

// Owns one link handle and releases it exactly once
class OxiConnection {
public:
  OxiConnection() = default;
  OxiConnection(OxiBleAdapter* adapter, uint16_t handle) : adapter(adapter), handle(handle) {}
  ~OxiConnection() { reset(); }

  OxiConnection(const OxiConnection&)            = delete;
  OxiConnection& operator=(const OxiConnection&) = delete;

  OxiConnection(OxiConnection&& other) noexcept
    : adapter(other.adapter), handle(other.handle) {
    other.adapter = nullptr;
    other.handle  = OXI_LINK_NONE;
  }

  OxiConnection& operator=(OxiConnection&& other) noexcept {
    if (this != &other) {
      reset();
      adapter       = other.adapter;
      handle        = other.handle;
      other.adapter = nullptr;
      other.handle  = OXI_LINK_NONE;
    }
    return *this;
  }

  void reset() {
    OxiBleAdapter* owner = adapter;
    uint16_t       link  = handle;
    adapter = nullptr;
    handle  = OXI_LINK_NONE;
    if (owner && link != OXI_LINK_NONE) owner->release(link);
  }

  bool     valid()     const { return adapter != nullptr && handle != OXI_LINK_NONE; }
  uint16_t getHandle() const { return handle; }

private:
  OxiBleAdapter* adapter = nullptr;
  uint16_t       handle  = OXI_LINK_NONE;
};

#endif // OXI_BLE_ADAPTER_H
