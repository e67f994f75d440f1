/******************************************************************************************************/
// Reconnection supervisor
//
// Explicit state machine around the session:
//
//   Idle -> Discovering -> Connecting -> Subscribing -> Streaming
//             ^                                            |
//             +------------- Failed (bounded delay) <------+  (any stage can fail)
//
// advance() runs one step and can be driven synchronously from tests or loop().
// run() keeps stepping until cancel() is called from elsewhere.
/******************************************************************************************************/

#ifndef OXI_SUPERVISOR_H
#define OXI_SUPERVISOR_H

#include <stdint.h>
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>
#include "OxiTypes.h"
#include "OxiSession.h"

class OxiSupervisor {
public:
  // Sleeps for ms, returns false when woken early by cancellation
  using DelayFn = std::function<bool(uint32_t ms)>;
  // Monotonic milliseconds
  using ClockFn = std::function<uint32_t()>;

  OxiSupervisor(OxiSessionFactory& factory, const OxiConfig& config);
  ~OxiSupervisor();

  OxiSupervisor(const OxiSupervisor&)            = delete;
  OxiSupervisor& operator=(const OxiSupervisor&) = delete;

  // ----------------------------------------------------------------------------------------------
  // Lifecycle
  // ----------------------------------------------------------------------------------------------
  OxiConnState advance();
           // one state machine step, returns the new state
  void     run();
           // step until cancelled, then tear down and return in Idle
  void     cancel();
           // safe from any task: wakes a blocked scan/connect/wait
  void     reset();
           // clears a previous cancel so run() can be used again
  bool     isCancelled() const { return cancelToken.cancelled(); }

  // ----------------------------------------------------------------------------------------------
  // Pluggable time
  // ----------------------------------------------------------------------------------------------
  void     setDelay(DelayFn fn) { delayFn = std::move(fn); }
  void     setClock(ClockFn fn) { clockFn = std::move(fn); }

  // ----------------------------------------------------------------------------------------------
  // Event hooks - run in the supervisor's context, keep handlers light
  // ----------------------------------------------------------------------------------------------
  void     setOnReading(std::function<void(const OxiReading& reading)> cb) { onReading = std::move(cb); }
  void     setOnStateChange(std::function<void(OxiConnState from, OxiConnState to)> cb) { onStateChange = std::move(cb); }
  void     setOnAttemptFailed(std::function<void(OxiError error, uint32_t attempt)> cb) { onAttemptFailed = std::move(cb); }
  void     setOnResync(std::function<void(size_t discardedBytes, size_t malformedFrames)> cb) { onResync = std::move(cb); }
  void     setOnRawData(std::function<void(const uint8_t* data, size_t len)> cb) { onRawData = std::move(cb); }

  // ----------------------------------------------------------------------------------------------
  // State / statistics accessors
  // ----------------------------------------------------------------------------------------------
  OxiConnState    getState()       const { return state.load(); }
  // Safe from any task while run() is active
  OxiError        getLastError()   const { return lastError.load(); }
  uint32_t        getAttempts()    const { return getStats().attempts; }
  uint32_t        getFailStreak()  const { return failStreak.load(); }
  OxiStats        getStats()       const;   // consistent snapshot
  void            clearStats();
  bool            hasSession()     const { return session != nullptr; }

  // Delay before the next attempt after failStreak consecutive failures
  uint32_t        retryDelayMs(uint32_t failures) const;

private:
  OxiConnState onIdle();
  OxiConnState onDiscovering();
  OxiConnState onStreaming();
  OxiConnState onFailed();

  void         transition(OxiConnState next);
  OxiConnState fail(OxiError error);
  void         teardown();
  uint32_t     now() const;

  OxiSessionFactory&          factory;
  OxiConfig                   config;
  OxiCancelToken              cancelToken;

  std::unique_ptr<OxiSession> session;
  std::atomic<OxiConnState>   state{OxiConnState::Idle};
  std::atomic<OxiError>       lastError{OxiError::None};
  std::atomic<uint32_t>       failStreak{0};        // consecutive failed attempts, reset on Streaming
  uint32_t                    lastReadingMs  = 0;

  mutable std::mutex          statsLock;            // stats are written by the supervisor, read by anyone
  OxiStats                    stats;

  DelayFn                     delayFn;
  ClockFn                     clockFn;

  std::function<void(const OxiReading& reading)>                     onReading;
  std::function<void(OxiConnState from, OxiConnState to)>            onStateChange;
  std::function<void(OxiError error, uint32_t attempt)>              onAttemptFailed;
  std::function<void(size_t discardedBytes, size_t malformedFrames)> onResync;
  std::function<void(const uint8_t* data, size_t len)>               onRawData;
};

#endif // OXI_SUPERVISOR_H
