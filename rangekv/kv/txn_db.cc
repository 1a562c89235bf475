#include "rangekv/kv/txn_db.h"

////////////////////////////////////////////////////////////////////////

using tl::make_unexpected;

////////////////////////////////////////////////////////////////////////

namespace rkv::kv {

////////////////////////////////////////////////////////////////////////

namespace {

TransactionOptions WithUser(DB& db, TransactionOptions options) {
  if (options.user.empty()) {
    options.user = db.user();
  }
  return options;
}

}  // namespace

////////////////////////////////////////////////////////////////////////

TxnDB::TxnDB(DB& db, const TransactionOptions& options)
  : coordinator_(
        std::make_unique<TxnCoordinator>(
            db.kv(),
            db.clock(),
            WithUser(db, options))),
    db_(coordinator_.get(), db.clock(), WithUser(db, options).user) {}

////////////////////////////////////////////////////////////////////////

Result<void> RunTransaction(
    DB& db,
    const TransactionOptions& options,
    const std::function<Result<void>(DB&)>& retryable) {
  TxnDB txn_db(db, options);

  Result<void> result = retryable(txn_db.db());

  while (!result.has_value() && IsTransactionRestartError(result.error())) {
    RANGEKV_KV_LOG(1) << "Running transaction again after: "
                      << result.error().message();
    result = retryable(txn_db.db());
  }

  if (!result.has_value()) {
    Result<void> abort = txn_db.Abort();
    if (!abort.has_value()) {
      return make_unexpected(
          MakeAbortFailedError(result.error(), abort.error()));
    }
    return result;
  }

  return txn_db.Commit();
}

////////////////////////////////////////////////////////////////////////

}  // namespace rkv::kv

////////////////////////////////////////////////////////////////////////
