/******************************************************************************************************/
// One live link to the oximeter
//
// A session is built by open(), streams until the link drops or decoding gives up, and is then
// thrown away. It never reconnects by itself; OxiSupervisor decides when to build the next one.
/******************************************************************************************************/

#ifndef OXI_SESSION_H
#define OXI_SESSION_H

#include <stdint.h>
#include <functional>
#include <memory>
#include <vector>
#include "OxiTypes.h"
#include "OxiBleAdapter.h"
#include "OxiFrameDecoder.h"

enum class OxiChunkStatus : uint8_t {
  Data,          // a notification arrived (readings may still be empty)
  Timeout,       // nothing within the wait
  Disconnected,  // link dropped, session is terminated
  DecodeFatal,   // decoder could not resynchronize, session is terminated
  Cancelled      // cancellation observed, session is terminated
};

struct OxiChunk {
  OxiChunkStatus          status          = OxiChunkStatus::Timeout;
  std::vector<uint8_t>    bytes;            // raw notification payload
  std::vector<OxiReading> readings;         // decoded from this and earlier payloads, wire order
  size_t                  discardedBytes  = 0;
  size_t                  malformedFrames = 0;
};

class OxiSession {
public:
  virtual ~OxiSession() = default;

  // Waits up to timeoutMs for the next notification
  virtual OxiChunk nextChunk(uint32_t timeoutMs, const OxiCancelToken& cancel) = 0;
  virtual bool     isTerminated() const = 0;
};

struct OxiOpenResult {
  std::unique_ptr<OxiSession> session;
  OxiError                    error = OxiError::None;
  OxiPeer                     peer;
};

// Progress callback: Connecting, then Subscribing
using OxiStageFn = std::function<void(OxiConnState stage)>;

class OxiSessionFactory {
public:
  virtual ~OxiSessionFactory() = default;

  virtual OxiOpenResult open(const OxiDeviceIdentity& identity, const OxiCancelToken& cancel, const OxiStageFn& onStage) = 0;

  // Wakes a blocked open() or nextChunk()
  virtual void interrupt() = 0;
  virtual void clearInterrupt() = 0;
};

// ===== Session on top of an OxiBleAdapter =====================================================

class OxiBleSession : public OxiSession {
public:
  // Scan, connect, subscribe. Every matching peripheral is tried in scan order.
  static OxiOpenResult open(OxiBleAdapter& adapter, const OxiConfig& config, const OxiDeviceIdentity& identity,
                            const OxiCancelToken& cancel, const OxiStageFn& onStage);

  OxiChunk nextChunk(uint32_t timeoutMs, const OxiCancelToken& cancel) override;
  bool     isTerminated() const override { return terminated; }

  uint16_t getHandle()         const { return connection.getHandle(); }
  size_t   getBufferedBytes()  const { return decodeBuffer.size(); }

private:
  OxiBleSession(OxiBleAdapter& adapter, OxiConnection&& connection, const OxiConfig& config);

  void terminate();

  OxiBleAdapter&       adapter;
  OxiConnection        connection;
  OxiFrameDecoder      decoder;
  std::vector<uint8_t> decodeBuffer;
  uint16_t             maxBadFrames;
  uint16_t             badFrameStreak = 0;
  bool                 terminated     = false;
};

class OxiBleSessionFactory : public OxiSessionFactory {
public:
  OxiBleSessionFactory(OxiBleAdapter& adapter, const OxiConfig& config) : adapter(adapter), config(config) {}

  OxiOpenResult open(const OxiDeviceIdentity& identity, const OxiCancelToken& cancel, const OxiStageFn& onStage) override {
    return OxiBleSession::open(adapter, config, identity, cancel, onStage);
  }
  void interrupt() override      { adapter.interrupt(); }
  void clearInterrupt() override { adapter.clearInterrupt(); }

private:
  OxiBleAdapter& adapter;
  OxiConfig      config;
};

#endif // OXI_SESSION_H
