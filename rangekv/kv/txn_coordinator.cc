#include "rangekv/kv/txn_coordinator.h"

#include <algorithm>

#include "fmt/format.h"
#include "rangekv/keys.h"
#include "rangekv/kv/transaction.h"

////////////////////////////////////////////////////////////////////////

using rkv::v1alpha1::ClientCmdID;
using rkv::v1alpha1::RequestHeader;

using tl::make_unexpected;

////////////////////////////////////////////////////////////////////////

namespace rkv::kv {

////////////////////////////////////////////////////////////////////////

void TxnCoordinator::Outstanding::Increment() {
  std::unique_lock lock(mutex_);
  count_++;
}

void TxnCoordinator::Outstanding::Decrement() {
  std::unique_lock lock(mutex_);
  CHECK_GT(count_, 0);
  if (--count_ == 0) {
    zero_.notify_all();
  }
}

void TxnCoordinator::Outstanding::WaitUntilZero() {
  std::unique_lock lock(mutex_);
  zero_.wait(lock, [this]() { return count_ == 0; });
}

////////////////////////////////////////////////////////////////////////

TxnCoordinator::TxnCoordinator(
    KV* wrapped,
    hlc::Clock* clock,
    const TransactionOptions& options)
  : wrapped_(CHECK_NOTNULL(wrapped)),
    clock_(CHECK_NOTNULL(clock)),
    options_(options) {}

////////////////////////////////////////////////////////////////////////

std::optional<Transaction> TxnCoordinator::transaction() {
  std::unique_lock lock(mutex_);
  return txn_;
}

////////////////////////////////////////////////////////////////////////

Timestamp TxnCoordinator::timestamp() {
  std::unique_lock lock(mutex_);
  return timestamp_;
}

////////////////////////////////////////////////////////////////////////

Response TxnCoordinator::Execute(Request request) {
  {
    std::unique_lock lock(mutex_);

    if (done_) {
      return MakeErrorResponse(MakeTransactionClosedError());
    }

    if (!IsTransactional(request)) {
      return MakeErrorResponse(
          MakeNonTransactionalOperationError(MethodName(request)));
    }

    // If the transaction hasn't yet begun, begin it now using the key
    // of this request as the anchor.
    if (!txn_.has_value()) {
      txn_ = NewTransaction(
          request.header().key(),
          options_.user_priority,
          options_.isolation,
          *clock_);
      timestamp_ = txn_->timestamp();

      RANGEKV_KV_LOG(1) << "Began transaction '"
                        << keys::PrettyPrint(txn_->id()) << "' at "
                        << hlc::ToString(timestamp_) << " with priority "
                        << txn_->priority();
    }

    RequestHeader* header = request.mutable_header();
    header->set_user(options_.user);
    *header->mutable_timestamp() = timestamp_;
    *header->mutable_txn() = *txn_;

    // NOTE: must be incremented while holding 'mutex_' so that an
    // 'EndTransaction()' that sets 'done_' after we've released the
    // lock is guaranteed to wait for us.
    outstanding_.Increment();
  }

  RetryOptions retry_options = options_.retry_options;
  if (retry_options.tag.empty()) {
    retry_options.tag = fmt::format(
        "retrying '{}' on write intent error",
        MethodName(request));
  }

  const bool read_only = IsReadOnly(request);

  Response response;

  tl::expected<void, std::string> retry = RetryWithBackoff(
      retry_options,
      [&]() {
        // Stamp mutating requests with a new command ID for every
        // attempt. A retry of the same attempt (e.g., by the
        // transport) reuses it and thus won't be applied twice.
        if (!read_only) {
          ClientCmdID* cmd_id = request.mutable_header()->mutable_cmd_id();
          cmd_id->set_wall_time(clock_->Now().wall_time());
          cmd_id->set_random(RandomInt63());
        }

        response = wrapped_->Execute(request);

        if (response.header().has_timestamp()) {
          clock_->Update(response.header().timestamp());
        }

        std::unique_lock lock(mutex_);

        RetryStatus status = HandleResponse(request, response);

        if (status != RetryStatus::kBreak) {
          // Our priority may have been upgraded (or the transaction
          // replaced by a concurrent request) so make sure the next
          // attempt carries the latest.
          RequestHeader* header = request.mutable_header();
          *header->mutable_timestamp() =
              hlc::Max(header->timestamp(), timestamp_);
          *header->mutable_txn() = *txn_;
        }

        return status;
      });

  if (!retry.has_value()) {
    response = MakeErrorResponse(
        MakeError(
            fmt::format(
                "{}: {}",
                retry.error(),
                response.header().error().message())));
  }

  outstanding_.Decrement();

  return response;
}

////////////////////////////////////////////////////////////////////////

RetryStatus TxnCoordinator::HandleResponse(
    const Request& request,
    const Response& response) {
  CHECK(txn_.has_value());

  Conflict conflict = ClassifyConflict(response);

  if (auto* write_intent = std::get_if<WriteIntentConflict>(&conflict)) {
    if (write_intent->resolved) {
      // The conflicting intent is gone, retry right away.
      RANGEKV_KV_LOG(2) << "Retrying " << MethodName(request)
                        << " after resolved write intent";
      return RetryStatus::kReset;
    }

    // Otherwise back off and retry with a priority right below that
    // of the conflicting transaction.
    UpgradePriority(*txn_, write_intent->txn.priority() - 1);

    RANGEKV_KV_LOG(2) << "Backing off " << MethodName(request)
                      << " after unresolved write intent of '"
                      << keys::PrettyPrint(write_intent->txn.id()) << "'";

    return RetryStatus::kContinue;
  }

  if (auto* ordering = std::get_if<OrderingConflict>(&conflict)) {
    // Only handle the conflict once even if more than one
    // concurrent request ran into it.
    if (ordering->txn.id() == txn_->id()
        && ordering->txn.epoch() >= txn_->epoch()) {
      const int32_t priority = txn_->priority();

      txn_ = ordering->txn;
      txn_->set_epoch(txn_->epoch() + 1);
      txn_->set_status(rkv::v1alpha1::PENDING);
      txn_->clear_orig_timestamp();
      UpgradePriority(*txn_, priority);

      *txn_->mutable_timestamp() =
          hlc::Max(txn_->timestamp(), request.header().timestamp());

      timestamp_ = hlc::Max(timestamp_, txn_->timestamp());

      RANGEKV_KV_LOG(1) << "Restarting transaction '"
                        << keys::PrettyPrint(txn_->id()) << "' at epoch "
                        << txn_->epoch() << " and timestamp "
                        << hlc::ToString(timestamp_);
    }
  } else if (auto* aborted = std::get_if<AbortedConflict>(&conflict)) {
    if (aborted->txn.id() == txn_->id()) {
      const int32_t priority = std::max(
          txn_->priority(),
          aborted->txn.priority());

      txn_ = NewTransaction(
          txn_->key(),
          options_.user_priority,
          options_.isolation,
          *clock_);
      UpgradePriority(*txn_, priority);

      *txn_->mutable_timestamp() = hlc::Max(txn_->timestamp(), timestamp_);
      timestamp_ = txn_->timestamp();

      RANGEKV_KV_LOG(1) << "Replaced aborted transaction '"
                        << keys::PrettyPrint(aborted->txn.id())
                        << "' with '" << keys::PrettyPrint(txn_->id())
                        << "' with priority " << txn_->priority();
    }
  }

  // Success, or an error that is passed on (including the ordering
  // and aborted conflicts handled above). Either way the response
  // timestamp is the earliest at which we may continue.
  if (hlc::Less(timestamp_, response.header().timestamp())) {
    timestamp_ = response.header().timestamp();
  }

  return RetryStatus::kBreak;
}

////////////////////////////////////////////////////////////////////////

Result<void> TxnCoordinator::EndTransaction(bool commit) {
  // First, disallow any further requests.
  {
    std::unique_lock lock(mutex_);
    if (done_) {
      return make_unexpected(MakeTransactionClosedError());
    }
    done_ = true;
  }

  // Wait for all outstanding requests to complete. This gives us an
  // accurate final timestamp.
  outstanding_.WaitUntilZero();

  Request request;

  {
    std::unique_lock lock(mutex_);

    if (!txn_.has_value()) {
      // No request was ever made so there is nothing to end.
      return {};
    }

    RequestHeader* header = request.mutable_header();
    header->set_key(txn_->key());
    header->set_user(options_.user);
    *header->mutable_timestamp() = timestamp_;
    *header->mutable_txn() = *txn_;
    header->mutable_cmd_id()->set_wall_time(clock_->Now().wall_time());
    header->mutable_cmd_id()->set_random(RandomInt63());

    request.mutable_end_transaction()->set_commit(commit);
  }

  RANGEKV_KV_LOG(1) << (commit ? "Committing" : "Aborting")
                    << " transaction '"
                    << keys::PrettyPrint(request.header().txn().id()) << "'";

  Response response = wrapped_->Execute(std::move(request));

  if (response.header().has_error()) {
    return make_unexpected(response.header().error());
  }

  if (response.has_end_transaction()) {
    std::unique_lock lock(mutex_);
    txn_ = response.end_transaction().txn();
  }

  return {};
}

////////////////////////////////////////////////////////////////////////

}  // namespace rkv::kv

////////////////////////////////////////////////////////////////////////
