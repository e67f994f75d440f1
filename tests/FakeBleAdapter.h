/******************************************************************************************************/
// Scripted OxiBleAdapter for host tests
//
// Thread safe: the supervisor may block in connect() or waitNotification() on one thread while
// the test pushes notifications, drops the link or interrupts from another.
/******************************************************************************************************/

#ifndef OXI_FAKE_BLE_ADAPTER_H
#define OXI_FAKE_BLE_ADAPTER_H

#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "OxiBleAdapter.h"

class FakeBleAdapter : public OxiBleAdapter {
public:
  // ----- script, set before the adapter is used -----
  std::vector<OxiPeer>  peers;
  bool                  scanWorks   = true;
  std::set<std::string> refuseConnect;     // by address
  std::set<std::string> refuseSubscribe;   // by address
  bool                  holdConnect = false;   // connect() blocks until interrupt()

  bool scan(const OxiDeviceIdentity& identity, uint32_t durationMs, std::vector<OxiPeer>& found) override {
    std::lock_guard<std::mutex> lock(mtx);
    (void)durationMs;
    scans++;
    if (interrupted || !scanWorks) return false;
    for (const OxiPeer& peer : peers) {
      if (identity.matches(peer.name, peer.address)) found.push_back(peer);
    }
    return true;
  }

  uint16_t connect(const OxiPeer& peer, uint32_t timeoutMs) override {
    std::unique_lock<std::mutex> lock(mtx);
    (void)timeoutMs;
    connectOrder.push_back(peer.address);

    if (holdConnect) {
      connecting = true;
      cv.notify_all();
      cv.wait(lock, [this] { return interrupted; });
      connecting = false;
      return OXI_LINK_NONE;
    }
    if (interrupted || refuseConnect.count(peer.address)) return OXI_LINK_NONE;

    link        = nextHandle++;
    linkAddress = peer.address;
    linkDown    = false;
    inbox.clear();
    cv.notify_all();
    return link;
  }

  bool subscribe(uint16_t l, const std::string& serviceUuid, const std::string& charUuid) override {
    std::lock_guard<std::mutex> lock(mtx);
    (void)serviceUuid;
    (void)charUuid;
    subscribes++;
    if (l == OXI_LINK_NONE || l != link || linkDown) return false;
    return refuseSubscribe.count(linkAddress) == 0;
  }

  OxiWaitResult waitNotification(uint16_t l, uint32_t timeoutMs, std::vector<uint8_t>& payload) override {
    std::unique_lock<std::mutex> lock(mtx);
    payload.clear();
    if (l == OXI_LINK_NONE || l != link) return OxiWaitResult::Disconnected;

    waiting = true;
    cv.notify_all();
    cv.wait_for(lock, std::chrono::milliseconds(timeoutMs),
                [this] { return interrupted || linkDown || !inbox.empty(); });
    waiting = false;

    if (interrupted) return OxiWaitResult::Interrupted;
    if (!inbox.empty()) {
      payload = inbox.front();
      inbox.pop_front();
      return OxiWaitResult::Notification;
    }
    if (linkDown) return OxiWaitResult::Disconnected;
    return OxiWaitResult::Timeout;
  }

  void release(uint16_t l) override {
    std::lock_guard<std::mutex> lock(mtx);
    releases[l]++;
    if (l == link) {
      link     = OXI_LINK_NONE;
      linkDown = false;
      inbox.clear();
    }
    cv.notify_all();
  }

  void interrupt() override {
    std::lock_guard<std::mutex> lock(mtx);
    interrupted = true;
    cv.notify_all();
  }

  void clearInterrupt() override {
    std::lock_guard<std::mutex> lock(mtx);
    interrupted = false;
  }

  // ----- test side -----
  void pushNotification(const std::vector<uint8_t>& bytes) {
    std::lock_guard<std::mutex> lock(mtx);
    inbox.push_back(bytes);
    cv.notify_all();
  }

  void dropLink() {
    std::lock_guard<std::mutex> lock(mtx);
    linkDown = true;
    cv.notify_all();
  }

  // True once someone waits for notifications on the given link
  bool waitForWaiter(uint16_t l, int ms) {
    std::unique_lock<std::mutex> lock(mtx);
    return cv.wait_for(lock, std::chrono::milliseconds(ms), [this, l] { return waiting && link == l; });
  }

  bool waitForConnecting(int ms) {
    std::unique_lock<std::mutex> lock(mtx);
    return cv.wait_for(lock, std::chrono::milliseconds(ms), [this] { return connecting; });
  }

  int releaseCount(uint16_t l) {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = releases.find(l);
    return it == releases.end() ? 0 : it->second;
  }

  int totalReleases() {
    std::lock_guard<std::mutex> lock(mtx);
    int total = 0;
    for (const auto& entry : releases) total += entry.second;
    return total;
  }

  uint16_t currentLink() {
    std::lock_guard<std::mutex> lock(mtx);
    return link;
  }

  int scanCount() {
    std::lock_guard<std::mutex> lock(mtx);
    return scans;
  }

  std::vector<std::string> connectAttempts() {
    std::lock_guard<std::mutex> lock(mtx);
    return connectOrder;
  }

private:
  std::mutex                       mtx;
  std::condition_variable          cv;

  std::deque<std::vector<uint8_t>> inbox;
  std::map<uint16_t, int>          releases;
  std::vector<std::string>         connectOrder;
  std::string                      linkAddress;

  uint16_t link        = OXI_LINK_NONE;
  uint16_t nextHandle  = 1;
  bool     linkDown    = false;
  bool     interrupted = false;
  bool     waiting     = false;
  bool     connecting  = false;
  int      scans       = 0;
  int      subscribes  = 0;
};

#endif // OXI_FAKE_BLE_ADAPTER_H
