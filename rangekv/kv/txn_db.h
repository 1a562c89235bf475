#pragma once

#include <functional>
#include <memory>

#include "rangekv/kv/db.h"
#include "rangekv/kv/errors.h"
#include "rangekv/kv/txn_coordinator.h"

////////////////////////////////////////////////////////////////////////

namespace rkv::kv {

////////////////////////////////////////////////////////////////////////

// A single attempt at a transaction: a 'DB' whose requests all go
// through the same 'TxnCoordinator'.
class TxnDB final {
 public:
  TxnDB(DB& db, const TransactionOptions& options);

  TxnDB(const TxnDB&) = delete;
  TxnDB& operator=(const TxnDB&) = delete;

  DB& db() {
    return db_;
  }

  TxnCoordinator& coordinator() {
    return *coordinator_;
  }

  Result<void> Commit() {
    return coordinator_->EndTransaction(true);
  }

  Result<void> Abort() {
    return coordinator_->EndTransaction(false);
  }

 private:
  std::unique_ptr<TxnCoordinator> coordinator_;
  DB db_;
};

////////////////////////////////////////////////////////////////////////

// Runs 'retryable' within a transaction, running it again for as long
// as it fails due to a transaction restart (i.e., an ordering or an
// aborted conflict). Commits if 'retryable' succeeds, otherwise aborts
// and returns the error.
//
// 'retryable' must only use the 'DB' it is passed and must be
// idempotent since it may be run more than once.
Result<void> RunTransaction(
    DB& db,
    const TransactionOptions& options,
    const std::function<Result<void>(DB&)>& retryable);

////////////////////////////////////////////////////////////////////////

}  // namespace rkv::kv

////////////////////////////////////////////////////////////////////////
