#ifndef __APC_SESSION_CONFIG__
#define __APC_SESSION_CONFIG__

#include "CancellationToken.hpp"
#include "FrameReader.hpp"
#include "Headers.hpp"
#include "InvokeIdPool.hpp"

namespace apc {
/** @brief What the loop does with a notification when the sink is full. */
enum class OverflowPolicy {
  /** Wait for room. Stalls the whole read path until a consumer pops. */
  BLOCK,
  /** Log, count and throw the notification away. */
  DROP_NEWEST,
};

struct SessionConfig {
  /** @brief Client name written into every command header. */
  string clientId = "apc";
  /** @brief Rolling read deadline; zero disables it. */
  chrono::milliseconds readTimeout = chrono::milliseconds(0);
  /** @brief How long to wait for the AGTSTART notification. */
  chrono::milliseconds handshakeTimeout = chrono::seconds(30);
  /** @brief Default command deadline; zero waits until shutdown. */
  chrono::milliseconds commandTimeout = chrono::milliseconds(0);
  /** @brief Wait for a free invoke id instead of failing; zero fails fast. */
  chrono::milliseconds invokeIdWait = chrono::milliseconds(0);
  int maxInvokeId = InvokeIdPool::DEFAULT_MAX_ID;
  size_t eventQueueCapacity = 128;
  size_t notificationCapacity = 128;
  OverflowPolicy notificationOverflow = OverflowPolicy::BLOCK;
  size_t maxRecordSize = FrameReader::DEFAULT_MAX_RECORD_SIZE;
};

/** @brief Per-command overrides. */
struct CommandOptions {
  /** @brief Replaces SessionConfig::commandTimeout when set. */
  optional<chrono::milliseconds> timeout;
  shared_ptr<CancellationToken> cancellation;
};
}  // namespace apc

#endif  // __APC_SESSION_CONFIG__
