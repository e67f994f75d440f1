// ****************************************************************************************************
// Oximeter session: one BLE link from subscribe to disconnect
// ****************************************************************************************************
#include <algorithm>
#include <utility>
#include "OxiSession.h"
#include "OxiLog.h"

OxiBleSession::OxiBleSession(OxiBleAdapter& adapter, OxiConnection&& connection, const OxiConfig& config)
  : adapter(adapter),
    connection(std::move(connection)),
    decoder(config.checksum),
    maxBadFrames(config.maxBadFrames) {
}

// ===== open() =================================================================================

OxiOpenResult OxiBleSession::open(OxiBleAdapter& adapter, const OxiConfig& config, const OxiDeviceIdentity& identity,
                                  const OxiCancelToken& cancel, const OxiStageFn& onStage) {
  OxiOpenResult result;
  if (cancel.cancelled()) {
    result.error = OxiError::Cancelled;
    return result;
  }

  std::vector<OxiPeer> peers;
  OXI_LOGI("Session: Scanning %lu ms for \"%s\"%s%s.",
           (unsigned long)config.scanTimeMs,
           identity.nameFilter.c_str(),
           identity.address.empty() ? "" : " at ",
           identity.address.c_str());

  if (!adapter.scan(identity, config.scanTimeMs, peers)) {
    result.error = cancel.cancelled() ? OxiError::Cancelled : OxiError::NotFound;
    if (result.error == OxiError::NotFound) OXI_LOGW("Session: Scan could not be started.");
    return result;
  }
  if (cancel.cancelled()) {
    result.error = OxiError::Cancelled;
    return result;
  }
  if (peers.empty()) {
    OXI_LOGI("Session: No matching peripheral found.");
    result.error = OxiError::NotFound;
    return result;
  }

  OxiError lastError = OxiError::ConnectFailed;

  for (const OxiPeer& peer : peers) {
    if (cancel.cancelled()) {
      result.error = OxiError::Cancelled;
      return result;
    }

    OXI_LOGI("Session: Found matching peripheral \"%s\" [%s].", peer.name.c_str(), peer.address.c_str());
    if (onStage) onStage(OxiConnState::Connecting);

    OxiConnection connection(&adapter, adapter.connect(peer, config.connectTimeoutMs));
    if (!connection.valid()) {
      OXI_LOGW("Session: Error connecting to [%s], skipping.", peer.address.c_str());
      lastError = OxiError::ConnectFailed;
      continue;
    }
    if (cancel.cancelled()) {
      result.error = OxiError::Cancelled;
      return result; // connection released on scope exit
    }

    OXI_LOGI("Session: Connected to [%s], link %u.", peer.address.c_str(), (unsigned)connection.getHandle());
    if (onStage) onStage(OxiConnState::Subscribing);

    if (!adapter.subscribe(connection.getHandle(), config.serviceUuid, config.notifyUuid)) {
      OXI_LOGW("Session: Couldn't subscribe to %s on [%s], skipping.", config.notifyUuid.c_str(), peer.address.c_str());
      lastError = OxiError::SubscribeFailed;
      continue;
    }
    if (cancel.cancelled()) {
      result.error = OxiError::Cancelled;
      return result;
    }

    OXI_LOGI("Session: Subscribed to %s.", config.notifyUuid.c_str());
    result.session.reset(new OxiBleSession(adapter, std::move(connection), config));
    result.peer  = peer;
    result.error = OxiError::None;
    return result;
  }

  result.error = cancel.cancelled() ? OxiError::Cancelled : lastError;
  return result;
}

// ===== nextChunk() ============================================================================

OxiChunk OxiBleSession::nextChunk(uint32_t timeoutMs, const OxiCancelToken& cancel) {
  OxiChunk chunk;

  if (terminated) {
    chunk.status = OxiChunkStatus::Disconnected;
    return chunk;
  }
  if (cancel.cancelled()) {
    terminate();
    chunk.status = OxiChunkStatus::Cancelled;
    return chunk;
  }

  OxiWaitResult wait = adapter.waitNotification(connection.getHandle(), timeoutMs, chunk.bytes);

  if (wait == OxiWaitResult::Disconnected) {
    OXI_LOGI("Session: Peripheral disconnected.");
    terminate();
    chunk.status = OxiChunkStatus::Disconnected;
    return chunk;
  }
  if (wait != OxiWaitResult::Notification) {
    if (cancel.cancelled()) {
      terminate();
      chunk.status = OxiChunkStatus::Cancelled;
    } else {
      chunk.status = OxiChunkStatus::Timeout;
    }
    return chunk;
  }

  if (oxiGetLogLevel() >= OXI_LOG_DEBUG) {
    char hex[OXI_LOG_LINE_MAX - 32];
    OXI_LOGD("Session: Got raw data: %s", oxiHexDump(chunk.bytes.data(), chunk.bytes.size(), hex, sizeof(hex)));
  }

  OxiDecodeResult decoded = decoder.decode(decodeBuffer, chunk.bytes.data(), chunk.bytes.size());
  decodeBuffer.swap(decoded.remaining);
  chunk.readings        = std::move(decoded.readings);
  chunk.discardedBytes  = decoded.discardedBytes;
  chunk.malformedFrames = decoded.malformedFrames;

  // A run of malformed frames may start in an earlier chunk and only ends at a valid frame
  size_t longestRun = badFrameStreak + decoded.leadingMalformed;
  size_t streak     = longestRun;
  if (decoded.frames > 0) {
    longestRun = std::max(longestRun, decoded.longestInnerRun);
    longestRun = std::max(longestRun, decoded.trailingMalformed);
    streak     = decoded.trailingMalformed;
  }
  badFrameStreak = (streak > 0xFFFF) ? 0xFFFF : static_cast<uint16_t>(streak);

  if (decoded.discardedBytes || decoded.malformedFrames) {
    OXI_LOGD("Session: Resync, discarded %u bytes, %u malformed frames.",
             (unsigned)decoded.discardedBytes, (unsigned)decoded.malformedFrames);
  }

  if (longestRun > maxBadFrames) {
    OXI_LOGE("Session: %u malformed frames in a row, giving up on this link.", (unsigned)longestRun);
    terminate();
    chunk.status = OxiChunkStatus::DecodeFatal;
    return chunk;
  }

  chunk.status = OxiChunkStatus::Data;
  return chunk;
}

void OxiBleSession::terminate() {
  connection.reset();
  decodeBuffer.clear();
  badFrameStreak = 0;
  terminated     = true;
}
