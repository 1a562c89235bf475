#pragma once

#include <chrono>
#include <cstddef>

////////////////////////////////////////////////////////////////////////

namespace rkv {

////////////////////////////////////////////////////////////////////////

// Maximum size of a gRPC message sent to or received from a node.
constexpr int kMaxNodeGrpcMessageSize = 100 * 1024 * 1024;

////////////////////////////////////////////////////////////////////////

// Backoff used by a transaction coordinator when a request runs into
// the unresolved write intent of a different transaction.
constexpr std::chrono::milliseconds kTxnRetryBackoff(150);
constexpr std::chrono::milliseconds kTxnMaxRetryBackoff(5000);
constexpr double kTxnRetryBackoffMultiplier = 2;

// Zero means retry until the intent gets resolved.
constexpr int kTxnRetryMaxAttempts = 0;

////////////////////////////////////////////////////////////////////////

// Number of responses to mutating requests a store remembers for
// replaying retried requests.
constexpr size_t kResponseCacheCapacity = 8192;

// How long a store remembers reads and aborted transactions. Anything
// older gets evicted, raising the store's low-water mark: writes at
// or below it get pushed and transactions starting below it get
// aborted.
constexpr std::chrono::seconds kTimestampCacheWindow(10);

// A transaction that hasn't sent a request to a store for this long
// gets aborted so that its write intents are released.
constexpr std::chrono::seconds kTxnExpiration(30);

////////////////////////////////////////////////////////////////////////

// Attempts made by a 'RemoteKV' for a request when the node is
// unavailable.
constexpr int kRemoteKVMaxAttempts = 5;
constexpr std::chrono::milliseconds kRemoteKVBackoff(50);
constexpr std::chrono::milliseconds kRemoteKVMaxBackoff(1000);

////////////////////////////////////////////////////////////////////////

}  // namespace rkv

////////////////////////////////////////////////////////////////////////
