// ****************************************************************************************************
// NimBLE central adapter
//
// Scans for the oximeter, owns the NimBLEClient of the current link and forwards its
// notifications to whichever task waits in waitNotification().
// ****************************************************************************************************
#include <algorithm>
#include <cstring>
#include "OxiNimBLEAdapter.h"
#include "OxiLog.h"

// === Code Names ===
// NimBLE reports HCI reasons offset by BLE_HS_ERR_HCI_BASE (0x200)
static const char *hciReasonName(int reason) {
  const int code = (reason >= 0x200 && reason < 0x300) ? (reason - 0x200) : reason;
  switch (code) {
    case 0x00:   return "OK";
    case 0x05:   return "AUTH_FAILURE";
    case 0x08:   return "CONN_TIMEOUT";
    case 0x13:   return "REMOTE_USER_TERMINATED";
    case 0x14:   return "REMOTE_LOW_RESOURCES";
    case 0x15:   return "REMOTE_POWER_OFF";
    case 0x16:   return "LOCAL_HOST_TERMINATED";
    case 0x1A:   return "UNSUPPORTED_REMOTE_FEATURE";
    case 0x22:   return "LMP_RESPONSE_TIMEOUT";
    case 0x3B:   return "UNACCEPTABLE_CONN_PARAMS";
    case 0x3D:   return "MIC_FAILURE";
    case 0x3E:   return "CONN_FAILED_TO_ESTABLISH";
    default:     return "UNKNOWN";
  }
} // end of hciReasonName

// ===== Client Callbacks =======================================================================
class OxiNimBLEAdapter::ClientCallbacks : public NimBLEClientCallbacks {
public:
  explicit ClientCallbacks(OxiNimBLEAdapter *owner) : owner(owner) {}

  void onConnect(NimBLEClient *pClient) override {
    if (owner) {
      owner->linkUp      = true;
      owner->connectDone = true;
    }
    OXI_LOGD("NimBLE: Link up to [%s].", pClient->getPeerAddress().toString().c_str());
  }

  void onConnectFail(NimBLEClient *pClient, int reason) override {
    if (owner) owner->connectDone = true;
    OXI_LOGD("NimBLE: Connect to [%s] failed, reason=%d %s.",
             pClient->getPeerAddress().toString().c_str(), reason, hciReasonName(reason));
  }

  // Runs in the NimBLE host task
  void onDisconnect(NimBLEClient *pClient, int reason) override {
    if (!owner) return;
    owner->disconnectReason = reason;
    owner->linkUp           = false;
    owner->linkDown         = true;
    owner->wakeWaiter();
    OXI_LOGI("NimBLE: Disconnected from [%s], reason=%d %s.",
             pClient->getPeerAddress().toString().c_str(), reason, hciReasonName(reason));
  }

private:
  OxiNimBLEAdapter *owner;
}; // end of ClientCallbacks =====================================================================

// ==============================================================================================
// ==============================================================================================

OxiNimBLEAdapter::~OxiNimBLEAdapter() {
  end();
}

bool OxiNimBLEAdapter::begin() {
  if (!notifyQueue) notifyQueue = xQueueCreate(OXI_NOTIFY_QUEUE_DEPTH, sizeof(NotifyItem));
  if (!clientLock)  clientLock  = xSemaphoreCreateMutex();
  if (!clientCallbacks) clientCallbacks = new ClientCallbacks(this);

  if (!notifyQueue || !clientLock) {
    OXI_LOGE("NimBLE: Could not allocate notification queue.");
    return false;
  }

  NimBLEScan *scanner = NimBLEDevice::getScan();
  scanner->setActiveScan(true);        // names are usually in the scan response
  scanner->setInterval(OXI_SCAN_INTERVAL);
  scanner->setWindow(OXI_SCAN_WINDOW);

  interrupted    = false;
  linkDown       = false;
  notifyDrops    = 0;
  truncatedBytes = 0;
  return true;
}

void OxiNimBLEAdapter::end() {
  destroyClient();
  if (notifyQueue) { vQueueDelete(notifyQueue); notifyQueue = nullptr; }
  if (clientLock)  { vSemaphoreDelete(clientLock); clientLock = nullptr; }
  delete clientCallbacks;
  clientCallbacks = nullptr;
}

// ===== Scan ===================================================================================

bool OxiNimBLEAdapter::scan(const OxiDeviceIdentity& identity, uint32_t durationMs, std::vector<OxiPeer>& found) {
  found.clear();
  if (interrupted) return false;

  NimBLEScan *scanner = NimBLEDevice::getScan();
  if (scanner->isScanning()) scanner->stop();
  scanner->clearResults();

  if (!scanner->start(durationMs, false, true)) {
    OXI_LOGW("NimBLE: Scan could not be started.");
    return false;
  }

  // Wait in slices so an interrupt() that ran before start() is still noticed
  uint32_t waited = 0;
  while (scanner->isScanning() && !interrupted && waited < durationMs + OXI_BLOCKING_GRACE_MS) {
    vTaskDelay(pdMS_TO_TICKS(OXI_WAIT_SLICE_MS));
    waited += OXI_WAIT_SLICE_MS;
  }
  if (scanner->isScanning()) scanner->stop();
  if (interrupted) {
    scanner->clearResults();
    return false;
  }

  NimBLEScanResults results = scanner->getResults();

  for (int i = 0; i < results.getCount(); i++) {
    const NimBLEAdvertisedDevice *device = results.getDevice(i);
    if (!device) continue;

    const std::string name = device->haveName() ? device->getName() : std::string();
    const std::string addr = device->getAddress().toString();
    OXI_LOGD("NimBLE: Seen \"%s\" [%s] rssi=%d.", name.c_str(), addr.c_str(), device->getRSSI());
    if (!identity.matches(name, addr)) continue;

    OxiPeer peer;
    peer.name        = name;
    peer.address     = addr;
    peer.addressType = device->getAddress().getType();
    found.push_back(peer);
  }
  scanner->clearResults();
  return true;
}

// ===== Connect ================================================================================

uint16_t OxiNimBLEAdapter::connect(const OxiPeer& peer, uint32_t timeoutMs) {
  if (interrupted || !clientLock) return OXI_LINK_NONE;

  // One link at a time
  if (client) {
    OXI_LOGW("NimBLE: Dropping stale client before connecting.");
    destroyClient();
  }
  drainQueue();
  linkDown         = false;
  linkUp           = false;
  connectDone      = false;
  disconnectReason = 0;

  xSemaphoreTake(clientLock, portMAX_DELAY);
  client = NimBLEDevice::createClient();
  if (client) {
    client->setClientCallbacks(clientCallbacks, false);
    client->setConnectTimeout(timeoutMs);
    connecting = true;
  }
  NimBLEClient *c = client;
  xSemaphoreGive(clientLock);

  if (!c) {
    OXI_LOGE("NimBLE: Could not create client.");
    return OXI_LINK_NONE;
  }

  // Asynchronous so the wait below can see an interrupt() that came before the connect started
  bool ok = c->connect(NimBLEAddress(peer.address, peer.addressType), true, true);

  uint32_t waited = 0;
  while (ok && !connectDone && !interrupted && waited < timeoutMs + OXI_BLOCKING_GRACE_MS) {
    vTaskDelay(pdMS_TO_TICKS(OXI_WAIT_SLICE_MS));
    waited += OXI_WAIT_SLICE_MS;
  }
  if (ok && !connectDone) {
    xSemaphoreTake(clientLock, portMAX_DELAY);
    c->cancelConnect();
    xSemaphoreGive(clientLock);
  }
  connecting = false;
  ok = ok && linkUp && c->isConnected();

  if (!ok || interrupted) {
    OXI_LOGW("NimBLE: Connect to [%s] %s.", peer.address.c_str(), interrupted ? "interrupted" : "failed");
    destroyClient();
    return OXI_LINK_NONE;
  }

  peerAddr   = peer.address;
  linkHandle = c->getConnHandle();
  OXI_LOGD("NimBLE: Connected, handle=%u mtu=%u.", (unsigned)linkHandle, (unsigned)c->getMTU());
  return linkHandle;
}

// ===== Subscribe ==============================================================================

NimBLERemoteCharacteristic* OxiNimBLEAdapter::findCharacteristic(const std::string& serviceUuid, const std::string& charUuid) {
  const NimBLEUUID charId(charUuid);

  if (!serviceUuid.empty()) {
    NimBLERemoteService *service = client->getService(NimBLEUUID(serviceUuid));
    if (!service) {
      OXI_LOGW("NimBLE: Service %s not found.", serviceUuid.c_str());
      return nullptr;
    }
    return service->getCharacteristic(charId);
  }

  // No service given: search every service on the peer
  for (NimBLERemoteService *service : client->getServices(true)) {
    NimBLERemoteCharacteristic *chr = service->getCharacteristic(charId);
    if (chr) return chr;
  }
  return nullptr;
}

bool OxiNimBLEAdapter::subscribe(uint16_t link, const std::string& serviceUuid, const std::string& charUuid) {
  if (!client || link == OXI_LINK_NONE || link != linkHandle || !client->isConnected()) return false;

  NimBLERemoteCharacteristic *chr = findCharacteristic(serviceUuid, charUuid);
  if (!chr) {
    OXI_LOGW("NimBLE: Characteristic %s not found.", charUuid.c_str());
    return false;
  }
  if (!chr->canNotify()) {
    OXI_LOGW("NimBLE: Characteristic %s does not notify.", charUuid.c_str());
    return false;
  }

  return chr->subscribe(true, [this](NimBLERemoteCharacteristic *pChr, uint8_t *pData, size_t length, bool isNotify) {
    (void)pChr;
    (void)isNotify;
    onNotify(pData, length);
  });
}

// Runs in the NimBLE host task, must not block
void OxiNimBLEAdapter::onNotify(const uint8_t* data, size_t len) {
  if (!notifyQueue || !data || len == 0) return;

  NotifyItem item;
  const size_t n = std::min(len, OXI_NOTIFY_MAX_BYTES);
  item.len = static_cast<uint16_t>(n);
  memcpy(item.data, data, n);
  if (n < len) truncatedBytes += static_cast<uint32_t>(len - n);

  if (xQueueSend(notifyQueue, &item, 0) != pdTRUE) notifyDrops++;
}

// ===== Wait ===================================================================================

OxiWaitResult OxiNimBLEAdapter::waitNotification(uint16_t link, uint32_t timeoutMs, std::vector<uint8_t>& payload) {
  payload.clear();
  if (!notifyQueue || link == OXI_LINK_NONE || link != linkHandle) return OxiWaitResult::Disconnected;

  uint32_t remaining = timeoutMs;
  NotifyItem item;

  for (;;) {
    if (interrupted) return OxiWaitResult::Interrupted;
    // Bytes that arrived before the drop are still delivered
    if (linkDown && uxQueueMessagesWaiting(notifyQueue) == 0) return OxiWaitResult::Disconnected;

    const uint32_t slice = std::min(remaining, OXI_WAIT_SLICE_MS);
    if (xQueueReceive(notifyQueue, &item, pdMS_TO_TICKS(slice)) == pdTRUE) {
      if (item.len == 0) continue; // wake marker
      payload.assign(item.data, item.data + item.len);
      return OxiWaitResult::Notification;
    }
    if (remaining <= slice) return OxiWaitResult::Timeout;
    remaining -= slice;
  }
}

// ===== Release / Interrupt ====================================================================

void OxiNimBLEAdapter::release(uint16_t link) {
  if (link == OXI_LINK_NONE) return;
  if (link != linkHandle) {
    OXI_LOGW("NimBLE: Release of unknown link %u ignored.", (unsigned)link);
    return;
  }
  destroyClient();
}

void OxiNimBLEAdapter::destroyClient() {
  NimBLEClient *c = nullptr;
  if (clientLock) xSemaphoreTake(clientLock, portMAX_DELAY);
  c          = client;
  client     = nullptr;
  connecting = false;
  linkHandle = OXI_LINK_NONE;
  if (clientLock) xSemaphoreGive(clientLock);

  if (c) {
    if (c->isConnected()) c->disconnect();
    NimBLEDevice::deleteClient(c);
    OXI_LOGD("NimBLE: Client released.");
  }
  drainQueue();
  linkDown = false;
  peerAddr.clear();
}

void OxiNimBLEAdapter::interrupt() {
  interrupted = true;

  NimBLEScan *scanner = NimBLEDevice::getScan();
  if (scanner && scanner->isScanning()) scanner->stop();

  if (clientLock) {
    xSemaphoreTake(clientLock, portMAX_DELAY);
    if (client && connecting) client->cancelConnect();
    xSemaphoreGive(clientLock);
  }
  wakeWaiter();
}

void OxiNimBLEAdapter::clearInterrupt() {
  interrupted = false;
}

void OxiNimBLEAdapter::wakeWaiter() {
  if (!notifyQueue) return;
  NotifyItem marker;
  marker.len = 0;
  xQueueSend(notifyQueue, &marker, 0); // a full queue wakes the waiter anyway
}

void OxiNimBLEAdapter::drainQueue() {
  if (notifyQueue) xQueueReset(notifyQueue);
}
