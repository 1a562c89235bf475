#include "rangekv/kv/errors.h"

#include "fmt/format.h"
#include "rangekv/hlc.h"
#include "rangekv/keys.h"

////////////////////////////////////////////////////////////////////////

namespace rkv::kv {

////////////////////////////////////////////////////////////////////////

Error MakeError(std::string message) {
  Error error;
  error.set_message(std::move(message));
  return error;
}

////////////////////////////////////////////////////////////////////////

Error MakeWriteIntentError(
    const std::string& key,
    const Transaction& txn,
    bool resolved) {
  Error error = MakeError(
      fmt::format(
          "Conflicting write intent at key '{}' from transaction '{}' "
          "({}resolved)",
          keys::PrettyPrint(key),
          keys::PrettyPrint(txn.id()),
          resolved ? "" : "un"));
  auto* write_intent = error.mutable_write_intent();
  write_intent->set_key(key);
  *write_intent->mutable_txn() = txn;
  write_intent->set_resolved(resolved);
  return error;
}

////////////////////////////////////////////////////////////////////////

Error MakeTransactionRetryError(const Transaction& txn) {
  Error error = MakeError(
      fmt::format(
          "Transaction '{}' must be retried at timestamp {}",
          keys::PrettyPrint(txn.id()),
          hlc::ToString(txn.timestamp())));
  *error.mutable_transaction_retry()->mutable_txn() = txn;
  return error;
}

////////////////////////////////////////////////////////////////////////

Error MakeTransactionAbortedError(const Transaction& txn) {
  Error error = MakeError(
      fmt::format(
          "Transaction '{}' has been aborted",
          keys::PrettyPrint(txn.id())));
  *error.mutable_transaction_aborted()->mutable_txn() = txn;
  return error;
}

////////////////////////////////////////////////////////////////////////

Error MakeTransactionClosedError() {
  Error error = MakeError(
      "Transaction has already been ended (committed/aborted)");
  error.mutable_transaction_closed();
  return error;
}

////////////////////////////////////////////////////////////////////////

Error MakeNonTransactionalOperationError(const std::string& method) {
  Error error = MakeError(
      fmt::format(
          "Method '{}' cannot be invoked within a transaction",
          method));
  error.mutable_non_transactional_operation()->set_method(method);
  return error;
}

////////////////////////////////////////////////////////////////////////

Error MakeMeta1SplitError(const RangeDescriptor& desc) {
  Error error = MakeError(
      fmt::format(
          "Range {} ['{}', '{}') regards meta1 keys and therefore "
          "cannot be split",
          desc.range_id(),
          keys::PrettyPrint(desc.start_key()),
          keys::PrettyPrint(desc.end_key())));
  *error.mutable_meta1_split()->mutable_desc() = desc;
  return error;
}

////////////////////////////////////////////////////////////////////////

Error MakeConditionFailedError(const std::optional<std::string>& actual) {
  Error error = MakeError(
      actual.has_value()
          ? fmt::format(
              "Unexpected value '{}'",
              keys::PrettyPrint(*actual))
          : std::string("Unexpected missing value"));
  auto* condition_failed = error.mutable_condition_failed();
  if (actual.has_value()) {
    condition_failed->set_actual_value(*actual);
  }
  return error;
}

////////////////////////////////////////////////////////////////////////

Error MakeAbortFailedError(const Error& error, const Error& abort_error) {
  Error composite = error;
  composite.set_message(
      fmt::format(
          "after error {}; failed abort: {}",
          error.message(),
          abort_error.message()));
  return composite;
}

////////////////////////////////////////////////////////////////////////

Response MakeErrorResponse(Error error) {
  Response response;
  *response.mutable_header()->mutable_error() = std::move(error);
  return response;
}

////////////////////////////////////////////////////////////////////////

Conflict ClassifyConflict(const Response& response) {
  if (!response.header().has_error()) {
    return Other();
  }

  const Error& error = response.header().error();

  switch (error.detail_case()) {
    case Error::kWriteIntent:
      return WriteIntentConflict{
          error.write_intent().resolved(),
          error.write_intent().txn()};
    case Error::kTransactionRetry:
      return OrderingConflict{error.transaction_retry().txn()};
    case Error::kTransactionAborted:
      return AbortedConflict{error.transaction_aborted().txn()};
    default:
      return Other();
  }
}

////////////////////////////////////////////////////////////////////////

bool IsTransactionRestartError(const Error& error) {
  return error.has_transaction_retry() || error.has_transaction_aborted();
}

////////////////////////////////////////////////////////////////////////

}  // namespace rkv::kv

////////////////////////////////////////////////////////////////////////
