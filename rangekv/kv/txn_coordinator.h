#pragma once

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

#include "rangekv/hlc.h"
#include "rangekv/kv/errors.h"
#include "rangekv/kv/kv.h"
#include "rangekv/retry.h"
#include "rkv/v1alpha1/data.pb.h"

////////////////////////////////////////////////////////////////////////

namespace rkv::kv {

////////////////////////////////////////////////////////////////////////

using rkv::v1alpha1::IsolationType;
using rkv::v1alpha1::Timestamp;
using rkv::v1alpha1::Transaction;

////////////////////////////////////////////////////////////////////////

// Parameters of a transaction, see 'RunTransaction()'.
struct TransactionOptions {
  std::string user;

  // See 'MakePriority()'.
  int32_t user_priority = 1;

  IsolationType isolation = rkv::v1alpha1::SERIALIZABLE;

  // How requests that run into unresolved write intents get retried.
  RetryOptions retry_options;
};

////////////////////////////////////////////////////////////////////////

// Proxies requests to a wrapped KV on behalf of a single transaction:
//
//   * begins the transaction with the key of the first request,
//   * stamps every request with the transaction and the most recent
//     timestamp seen by any earlier request,
//   * stamps mutating requests with an idempotency token,
//   * retries requests that run into write intents,
//   * increments the epoch on ordering conflicts and begins a new
//     transaction on aborted conflicts, passing those errors on so
//     that the transaction logic gets run again.
//
// Safe to call 'Execute()' concurrently. After 'EndTransaction()' any
// request fails with a 'TransactionClosedError'.
class TxnCoordinator final : public KV {
 public:
  TxnCoordinator(
      KV* wrapped,
      hlc::Clock* clock,
      const TransactionOptions& options);

  TxnCoordinator(const TxnCoordinator&) = delete;
  TxnCoordinator& operator=(const TxnCoordinator&) = delete;

  Response Execute(Request request) override;

  // Commits or aborts the transaction once all outstanding requests
  // have completed so that the final timestamp includes all of them.
  Result<void> EndTransaction(bool commit);

  // Returns the current transaction, if one has begun.
  std::optional<Transaction> transaction();

  // Returns the timestamp the next request will be stamped with.
  Timestamp timestamp();

 private:
  // Interprets 'response' to an attempt of 'request', updating the
  // transaction and timestamp accordingly. Must hold 'mutex_'.
  RetryStatus HandleResponse(const Request& request, const Response& response);

  // Counts requests that have been dispatched but not completed.
  class Outstanding final {
   public:
    void Increment();
    void Decrement();
    void WaitUntilZero();

   private:
    std::mutex mutex_;
    std::condition_variable zero_;
    int64_t count_ = 0;
  };

  KV* const wrapped_;
  hlc::Clock* const clock_;
  const TransactionOptions options_;

  // Protects 'txn_', 'timestamp_', and 'done_'.
  std::mutex mutex_;

  std::optional<Transaction> txn_;
  Timestamp timestamp_;
  bool done_ = false;

  Outstanding outstanding_;
};

////////////////////////////////////////////////////////////////////////

}  // namespace rkv::kv

////////////////////////////////////////////////////////////////////////
