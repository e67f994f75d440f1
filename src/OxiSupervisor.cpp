// ****************************************************************************************************
// Reconnection supervisor
//
// Keeps exactly one session attempt in flight and rebuilds the session after every failure,
// forever, until cancelled.
// ****************************************************************************************************
#include <algorithm>
#include <chrono>
#include <mutex>
#include <thread>
#include "OxiSupervisor.h"
#include "OxiLog.h"

static constexpr uint32_t DELAY_SLICE_MS = 20; // cancellation is checked at least this often while waiting

static uint32_t steadyMillis() {
  using namespace std::chrono;
  return static_cast<uint32_t>(duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count());
}

static bool sleepSliced(uint32_t ms, const OxiCancelToken& cancel) {
  using namespace std::chrono;
  const auto deadline = steady_clock::now() + milliseconds(ms);
  while (!cancel.cancelled()) {
    const auto current = steady_clock::now();
    if (current >= deadline) return true;
    std::this_thread::sleep_for(std::min<steady_clock::duration>(deadline - current, milliseconds(DELAY_SLICE_MS)));
  }
  return false;
}

OxiSupervisor::OxiSupervisor(OxiSessionFactory& factory, const OxiConfig& config)
  : factory(factory), config(config) {
  delayFn = [this](uint32_t ms) { return sleepSliced(ms, cancelToken); };
  clockFn = steadyMillis;
}

OxiSupervisor::~OxiSupervisor() {
  teardown();
}

// ===== Lifecycle ==============================================================================

void OxiSupervisor::run() {
  OXI_LOGI("Supervisor: Started, looking for \"%s\".", config.identity.nameFilter.c_str());
  while (!cancelToken.cancelled()) {
    advance();
  }
  teardown();
  transition(OxiConnState::Idle);
  OXI_LOGI("Supervisor: Stopped.");
}

void OxiSupervisor::cancel() {
  cancelToken.cancel();
  factory.interrupt();
}

void OxiSupervisor::reset() {
  cancelToken.reset();
  factory.clearInterrupt();
}

OxiStats OxiSupervisor::getStats() const {
  std::lock_guard<std::mutex> lock(statsLock);
  return stats;
}

void OxiSupervisor::clearStats() {
  std::lock_guard<std::mutex> lock(statsLock);
  stats = OxiStats();
}

// ===== State Machine ==========================================================================

OxiConnState OxiSupervisor::advance() {
  OxiConnState next;
  switch (state.load()) {
    default:
    case OxiConnState::Idle:
      // start, unless cancelled
      next = onIdle();
      break;
    case OxiConnState::Discovering:
    case OxiConnState::Connecting:
    case OxiConnState::Subscribing:
      // a full open(): scan, connect, subscribe
      // go to streaming, or failed
      next = onDiscovering();
      break;
    case OxiConnState::Streaming:
      // one nextChunk()
      // stay, or failed on disconnect / decode fatal / inactivity
      next = onStreaming();
      break;
    case OxiConnState::Failed:
      // bounded delay, then discovering
      next = onFailed();
      break;
  }
  transition(next);
  return next;
}

OxiConnState OxiSupervisor::onIdle() {
  if (cancelToken.cancelled()) return OxiConnState::Idle;
  return OxiConnState::Discovering;
}

OxiConnState OxiSupervisor::onDiscovering() {
  if (cancelToken.cancelled()) {
    teardown();
    return OxiConnState::Idle;
  }

  teardown(); // never two sessions
  uint32_t attempt;
  {
    std::lock_guard<std::mutex> lock(statsLock);
    attempt = ++stats.attempts;
  }
  OXI_LOGI("Supervisor: Attempt %lu.", (unsigned long)attempt);

  OxiOpenResult opened = factory.open(config.identity, cancelToken,
                                      [this](OxiConnState stage) { transition(stage); });

  if (cancelToken.cancelled()) {
    OXI_LOGI("Supervisor: Attempt %lu cancelled.", (unsigned long)attempt);
    return OxiConnState::Idle; // opened.session, if any, is released here
  }
  if (!opened.session) {
    return fail(opened.error == OxiError::None ? OxiError::ConnectFailed : opened.error);
  }

  session       = std::move(opened.session);
  lastError     = OxiError::None;
  failStreak    = 0;
  lastReadingMs = now();
  {
    std::lock_guard<std::mutex> lock(statsLock);
    stats.sessions++;
  }

  OXI_LOGI("Supervisor: Streaming from \"%s\" [%s].", opened.peer.name.c_str(), opened.peer.address.c_str());
  return OxiConnState::Streaming;
}

OxiConnState OxiSupervisor::onStreaming() {
  if (!session) return fail(OxiError::Disconnected);

  OxiChunk chunk = session->nextChunk(config.chunkWaitMs, cancelToken);

  {
    std::lock_guard<std::mutex> lock(statsLock);
    if (!chunk.bytes.empty()) {
      stats.chunks++;
      stats.bytesRx += static_cast<uint32_t>(chunk.bytes.size());
    }
    stats.discardedBytes  += static_cast<uint32_t>(chunk.discardedBytes);
    stats.malformedFrames += static_cast<uint32_t>(chunk.malformedFrames);
    stats.readings        += static_cast<uint32_t>(chunk.readings.size());
  }

  if (!chunk.bytes.empty() && onRawData) onRawData(chunk.bytes.data(), chunk.bytes.size());
  if ((chunk.discardedBytes || chunk.malformedFrames) && onResync) onResync(chunk.discardedBytes, chunk.malformedFrames);

  // Readings decoded before a failure are still delivered, in wire order
  for (const OxiReading& reading : chunk.readings) {
    if (onReading) onReading(reading);
  }
  if (!chunk.readings.empty()) lastReadingMs = now();

  switch (chunk.status) {
    case OxiChunkStatus::Cancelled:
      teardown();
      return OxiConnState::Idle;
    case OxiChunkStatus::Disconnected:
      return fail(OxiError::Disconnected);
    case OxiChunkStatus::DecodeFatal:
      return fail(OxiError::DecodeFatal);
    case OxiChunkStatus::Data:
    case OxiChunkStatus::Timeout:
    default:
      break;
  }

  if (cancelToken.cancelled()) {
    teardown();
    return OxiConnState::Idle;
  }

  // Connected but silent: treat like a dead link
  if (config.inactivityTimeoutMs > 0 && (now() - lastReadingMs) >= config.inactivityTimeoutMs) {
    OXI_LOGW("Supervisor: No readings for %lu ms, forcing reconnect.", (unsigned long)(now() - lastReadingMs));
    return fail(OxiError::Stalled);
  }
  return OxiConnState::Streaming;
}

OxiConnState OxiSupervisor::onFailed() {
  teardown();
  if (cancelToken.cancelled()) return OxiConnState::Idle;

  const uint32_t delayMs = retryDelayMs(failStreak);
  OXI_LOGI("Supervisor: Retrying in %lu ms.", (unsigned long)delayMs);

  const bool fullDelay = delayFn ? delayFn(delayMs) : sleepSliced(delayMs, cancelToken);
  if (cancelToken.cancelled()) return OxiConnState::Idle;
  if (!fullDelay) OXI_LOGD("Supervisor: Retry delay cut short.");
  return OxiConnState::Discovering;
}

// ===== Helpers ================================================================================

void OxiSupervisor::transition(OxiConnState next) {
  const OxiConnState prev = state.exchange(next);
  if (prev == next) return;
  OXI_LOGD("Supervisor: %s -> %s.", oxiStateToStr(prev), oxiStateToStr(next));
  if (onStateChange) onStateChange(prev, next);
}

OxiConnState OxiSupervisor::fail(OxiError error) {
  lastError.store(error);
  failStreak++;

  uint32_t attempt;
  {
    std::lock_guard<std::mutex> lock(statsLock);
    switch (error) {
      case OxiError::NotFound:        stats.notFound++;        break;
      case OxiError::ConnectFailed:   stats.connectFailed++;   break;
      case OxiError::SubscribeFailed: stats.subscribeFailed++; break;
      case OxiError::Disconnected:    stats.disconnects++;     break;
      case OxiError::DecodeFatal:     stats.decodeFatal++;     break;
      case OxiError::Stalled:         stats.stalls++;          break;
      default:                                                 break;
    }
    attempt = stats.attempts;
  }

  OXI_LOGW("Supervisor: Attempt %lu failed: %s.", (unsigned long)attempt, oxiErrorToStr(error));
  if (onAttemptFailed) onAttemptFailed(error, attempt);

  teardown();
  return OxiConnState::Failed;
}

void OxiSupervisor::teardown() {
  // Destroying the session releases its link exactly once
  session.reset();
}

uint32_t OxiSupervisor::now() const {
  return clockFn ? clockFn() : steadyMillis();
}

uint32_t OxiSupervisor::retryDelayMs(uint32_t failures) const {
  const uint32_t base = std::max(config.retryInitialMs, OXI_MIN_RETRY_DELAY_MS);
  const uint32_t cap  = std::max(config.retryMaxMs, base);

  uint32_t delayMs = base;
  for (uint32_t i = 1; i < failures && delayMs < cap; i++) {
    delayMs = (delayMs > cap / 2) ? cap : delayMs * 2;
  }
  return std::min(delayMs, cap);
}
