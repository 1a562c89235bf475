#include "rangekv/storage/store.h"

#include <chrono>
#include <limits>
#include <utility>

#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "fmt/format.h"
#include "rangekv/keys.h"
#include "rangekv/kv/transaction.h"
#include "rangekv/settings.h"
#include "rangekv/storage/addressing.h"
#include "rocksdb/db.h"
#include "rocksdb/write_batch.h"

////////////////////////////////////////////////////////////////////////

using rkv::kv::Error;
using rkv::kv::MakeError;
using rkv::v1alpha1::BatchRequest;
using rkv::v1alpha1::KeyValue;

using tl::make_unexpected;

////////////////////////////////////////////////////////////////////////

namespace rkv::storage {

////////////////////////////////////////////////////////////////////////

namespace {

// Every write is synced unless stated otherwise.
rocksdb::WriteOptions DefaultWriteOptions(bool sync = true) {
  rocksdb::WriteOptions write_options = rocksdb::WriteOptions();
  write_options.sync = sync;
  return write_options;
}

std::string MakeCmdIDKey(const rkv::v1alpha1::ClientCmdID& cmd_id) {
  return fmt::format("{}:{}", cmd_id.wall_time(), cmd_id.random());
}

// Whether 'pusher' wins a conflict over a write intent of 'holder':
// the higher priority wins, a tie goes to the older transaction and
// then to the smaller ID so that two transactions never wait on each
// other forever.
bool CanPush(const Transaction& pusher, const Transaction& holder) {
  if (pusher.priority() != holder.priority()) {
    return pusher.priority() > holder.priority();
  }
  if (!hlc::Equal(pusher.orig_timestamp(), holder.orig_timestamp())) {
    return hlc::Less(pusher.orig_timestamp(), holder.orig_timestamp());
  }
  return pusher.id() < holder.id();
}

int64_t Nanoseconds(std::chrono::nanoseconds duration) {
  return duration.count();
}

std::string Describe(const RangeDescriptor& desc) {
  return fmt::format(
      "{} ['{}', '{}')",
      desc.range_id(),
      keys::PrettyPrint(desc.start_key()),
      keys::PrettyPrint(desc.end_key()));
}

}  // namespace

////////////////////////////////////////////////////////////////////////

Store::Store(
    const std::filesystem::path& state_directory,
    std::unique_ptr<rocksdb::TransactionDB>&& db)
  : state_directory_(state_directory),
    db_(std::move(db)),
    responses_(kResponseCacheCapacity) {}

////////////////////////////////////////////////////////////////////////

Store::~Store() {
  // Any transaction that hasn't ended gets rolled back, which must
  // happen before the database gets closed.
  if (!txns_.empty()) {
    RANGEKV_STORAGE_LOG(1) << "Rolling back " << txns_.size()
                           << " ongoing transaction(s)";
  }
  txns_.clear();
}

////////////////////////////////////////////////////////////////////////

expected<std::unique_ptr<Store>> Store::Instantiate(
    const std::filesystem::path& state_directory) {
  RANGEKV_STORAGE_LOG(1) << "Attempting to open rocksdb at '"
                         << state_directory.string() << "'";

  rocksdb::Options options;
  options.create_if_missing = true;

  rocksdb::TransactionDBOptions txn_db_options;

  rocksdb::TransactionDB* txn_db = nullptr;

  rocksdb::Status status = rocksdb::TransactionDB::Open(
      options,
      txn_db_options,
      state_directory.string(),
      &txn_db);

  if (!status.ok()) {
    return make_unexpected(
        fmt::format(
            "Failed to open rocksdb at '{}': {}",
            state_directory.string(),
            status.ToString()));
  }

  std::unique_ptr<Store> store(new Store(
      state_directory,
      std::unique_ptr<rocksdb::TransactionDB>(txn_db)));

  Result<void> bootstrap = store->Bootstrap();
  if (!bootstrap.has_value()) {
    return make_unexpected(
        fmt::format(
            "Failed to bootstrap rocksdb at '{}': {}",
            state_directory.string(),
            bootstrap.error().message()));
  }

  RANGEKV_STORAGE_LOG(1) << "Opened rocksdb at '" << state_directory.string()
                         << "'";

  return store;
}

////////////////////////////////////////////////////////////////////////

Result<void> Store::Bootstrap() {
  const std::string key = keys::MakeRangeDescriptorKey(keys::kKeyMin);

  std::string data;
  rocksdb::Status status = db_->Get(rocksdb::ReadOptions(), key, &data);

  if (status.ok()) {
    RANGEKV_STORAGE_LOG(1) << "Already bootstrapped";
    return {};
  } else if (!status.IsNotFound()) {
    return make_unexpected(
        MakeError(
            fmt::format(
                "Failed to read first range descriptor: {}",
                status.ToString())));
  }

  RangeDescriptor desc;
  desc.set_range_id(1);
  desc.set_start_key(keys::kKeyMin);
  desc.set_end_key(keys::kKeyMax);

  kv::Batch batch;
  batch.Put(keys::kRangeIDGeneratorKey, absl::StrCat(desc.range_id()));
  batch.Put(key, desc);

  Result<void> addressing = addressing::OnCreate(batch, desc);
  if (!addressing.has_value()) {
    return make_unexpected(addressing.error());
  }

  RANGEKV_STORAGE_LOG(1) << "Bootstrapping range " << Describe(desc);

  return Apply(batch.request());
}

////////////////////////////////////////////////////////////////////////

Response Store::Execute(Request request) {
  std::unique_lock lock(mutex_);

  RANGEKV_STORAGE_LOG(2) << "Execute { " << request.ShortDebugString()
                         << " }";

  // Replay the response to a mutating request we've already seen.
  std::optional<std::string> cmd_id;
  if (request.header().has_cmd_id() && !kv::IsReadOnly(request)) {
    cmd_id = MakeCmdIDKey(request.header().cmd_id());
    Option<Response> cached = responses_.get(*cmd_id);
    if (cached.isSome()) {
      RANGEKV_STORAGE_LOG(1) << "Replaying response for command '"
                             << *cmd_id << "'";
      return cached.get();
    }
  }

  Response response = Dispatch(request);

  if (cmd_id.has_value()) {
    responses_.put(*cmd_id, response);
  }

  Result<void> gc = CollectGarbage();
  if (!gc.has_value()) {
    LOG(WARNING) << "Failed to collect garbage: " << gc.error().message();
  }

  return response;
}

////////////////////////////////////////////////////////////////////////

Response Store::Dispatch(const Request& request) {
  const RequestHeader& header = request.header();

  Timestamp timestamp = header.timestamp();
  if (hlc::IsZero(timestamp)) {
    timestamp = clock_.Now();
  } else {
    clock_.Update(timestamp);
  }

  Response response;

  auto Done = [&](const Result<void>& result) {
    if (!result.has_value()) {
      response = kv::MakeErrorResponse(result.error());
    }
    *response.mutable_header()->mutable_timestamp() = timestamp;
    return response;
  };

  switch (request.method_case()) {
    case Request::METHOD_NOT_SET:
      return Done(make_unexpected(MakeError("Request is missing a method")));
    case Request::kEndTransaction:
      return Done(EndTransaction(request, response));
    case Request::kBatch:
    case Request::kAdminSplit:
    case Request::kAdminMerge:
    case Request::kRangeLookup:
      if (header.has_txn()) {
        return Done(
            make_unexpected(
                kv::MakeNonTransactionalOperationError(
                    kv::MethodName(request))));
      }
      break;
    default:
      break;
  }

  switch (request.method_case()) {
    case Request::kBatch:
      return Done(RunBatch(request, timestamp, response));
    case Request::kAdminSplit:
      return Done(AdminSplit(request, response));
    case Request::kAdminMerge:
      return Done(AdminMerge(request, response));
    case Request::kRangeLookup: {
      Result<RangeDescriptor> desc = LookupRange(header.key());
      if (!desc.has_value()) {
        return Done(make_unexpected(desc.error()));
      }
      *response.mutable_range_lookup()->mutable_range() = std::move(*desc);
      return Done({});
    }
    default:
      break;
  }

  TxnState* state = nullptr;

  if (header.has_txn()) {
    Result<TxnState*> lookup = LookupOrBeginTransaction(header.txn());
    if (!lookup.has_value()) {
      return Done(make_unexpected(lookup.error()));
    }
    state = *lookup;
    // Everything within a transaction happens at the timestamp of
    // the transaction.
    timestamp = state->record.timestamp();
  }

  return Done(ExecuteKeyValue(request, timestamp, state, response));
}

////////////////////////////////////////////////////////////////////////

Result<void> Store::ExecuteKeyValue(
    const Request& request,
    Timestamp& timestamp,
    TxnState* state,
    Response& response) {
  const std::string& key = request.header().key();
  const std::string& end_key = request.header().end_key();

  switch (request.method_case()) {
    case Request::kContains:
    case Request::kGet: {
      Result<void> check = CheckIntent(key, state);
      if (!check.has_value()) {
        return check;
      }

      Result<std::optional<std::string>> value = Read(key, state);
      if (!value.has_value()) {
        return make_unexpected(value.error());
      }

      MarkRead(key, timestamp, state);

      if (request.has_contains()) {
        response.mutable_contains()->set_exists(value->has_value());
      } else if (value->has_value()) {
        response.mutable_get()->set_value(std::move(**value));
      } else {
        response.mutable_get();
      }
      return {};
    }

    case Request::kPut: {
      Result<void> prepare = PrepareWrite(key, timestamp, state);
      if (!prepare.has_value()) {
        return prepare;
      }

      Result<void> write = Write(key, request.put().value(), state);
      if (!write.has_value()) {
        return write;
      }

      response.mutable_put();
      return {};
    }

    case Request::kConditionalPut: {
      Result<void> prepare = PrepareWrite(key, timestamp, state);
      if (!prepare.has_value()) {
        return prepare;
      }

      Result<std::optional<std::string>> value = Read(key, state);
      if (!value.has_value()) {
        return make_unexpected(value.error());
      }

      const auto& conditional_put = request.conditional_put();

      std::optional<std::string> expected_value;
      if (conditional_put.has_expected_value()) {
        expected_value = conditional_put.expected_value();
      }

      if (*value != expected_value) {
        return make_unexpected(kv::MakeConditionFailedError(*value));
      }

      Result<void> write = Write(key, conditional_put.value(), state);
      if (!write.has_value()) {
        return write;
      }

      response.mutable_conditional_put();
      return {};
    }

    case Request::kIncrement: {
      Result<void> prepare = PrepareWrite(key, timestamp, state);
      if (!prepare.has_value()) {
        return prepare;
      }

      Result<std::optional<std::string>> value = Read(key, state);
      if (!value.has_value()) {
        return make_unexpected(value.error());
      }

      int64_t current = 0;
      if (value->has_value() && !absl::SimpleAtoi(**value, &current)) {
        return make_unexpected(
            MakeError(
                fmt::format(
                    "Value '{}' at key '{}' is not an integer",
                    keys::PrettyPrint(**value),
                    keys::PrettyPrint(key))));
      }

      const int64_t increment = request.increment().increment();

      if ((increment > 0
           && current > std::numeric_limits<int64_t>::max() - increment)
          || (increment < 0
              && current < std::numeric_limits<int64_t>::min() - increment)) {
        return make_unexpected(
            MakeError(
                fmt::format(
                    "Incrementing {} at key '{}' by {} overflows",
                    current,
                    keys::PrettyPrint(key),
                    increment)));
      }

      const int64_t new_value = current + increment;

      Result<void> write = Write(key, absl::StrCat(new_value), state);
      if (!write.has_value()) {
        return write;
      }

      response.mutable_increment()->set_new_value(new_value);
      return {};
    }

    case Request::kDeleteKey: {
      Result<void> prepare = PrepareWrite(key, timestamp, state);
      if (!prepare.has_value()) {
        return prepare;
      }

      Result<void> write = Write(key, std::nullopt, state);
      if (!write.has_value()) {
        return write;
      }

      response.mutable_delete_key();
      return {};
    }

    case Request::kDeleteRange: {
      Result<void> check = CheckIntents(key, end_key, state);
      if (!check.has_value()) {
        return check;
      }

      Result<std::vector<KeyValue>> rows = ReadRange(key, end_key, 0, state);
      if (!rows.has_value()) {
        return make_unexpected(rows.error());
      }

      // Prepare every write before doing any of them so that we
      // never delete only some of the keys.
      for (const KeyValue& row : *rows) {
        Result<void> prepare = PrepareWrite(row.key(), timestamp, state);
        if (!prepare.has_value()) {
          return prepare;
        }
      }

      for (const KeyValue& row : *rows) {
        Result<void> write = Write(row.key(), std::nullopt, state);
        if (!write.has_value()) {
          return write;
        }
      }

      response.mutable_delete_range()->set_num_deleted(rows->size());
      return {};
    }

    case Request::kScan: {
      Result<void> check = CheckIntents(key, end_key, state);
      if (!check.has_value()) {
        return check;
      }

      Result<std::vector<KeyValue>> rows =
          ReadRange(key, end_key, request.scan().max_results(), state);
      if (!rows.has_value()) {
        return make_unexpected(rows.error());
      }

      auto* scan = response.mutable_scan();
      for (KeyValue& row : *rows) {
        MarkRead(row.key(), timestamp, state);
        *scan->add_rows() = std::move(row);
      }
      return {};
    }

    default:
      return make_unexpected(
          MakeError(
              fmt::format(
                  "Unsupported method '{}'",
                  kv::MethodName(request))));
  }
}

////////////////////////////////////////////////////////////////////////

Result<Store::TxnState*> Store::LookupTransaction(const Transaction& txn) {
  auto aborted = aborted_.find(txn.id());
  if (aborted != std::end(aborted_)) {
    return make_unexpected(kv::MakeTransactionAbortedError(aborted->second));
  }

  auto iterator = txns_.find(txn.id());
  if (iterator == std::end(txns_)) {
    // We might have forgotten that it was aborted.
    if (!hlc::Less(low_water_, txn.timestamp())) {
      Transaction aborted = txn;
      aborted.set_status(rkv::v1alpha1::ABORTED);
      return make_unexpected(kv::MakeTransactionAbortedError(aborted));
    }
    return nullptr;
  }

  TxnState& state = iterator->second;
  state.last_active = clock_.Now().wall_time();

  if (txn.epoch() < state.record.epoch()) {
    return make_unexpected(
        MakeError(
            fmt::format(
                "Transaction '{}' is at epoch {} but request is from "
                "epoch {}",
                keys::PrettyPrint(txn.id()),
                state.record.epoch(),
                txn.epoch())));
  } else if (txn.epoch() > state.record.epoch()) {
    RANGEKV_STORAGE_LOG(1) << "Transaction '" << keys::PrettyPrint(txn.id())
                           << "' restarted at epoch " << txn.epoch()
                           << ", discarding " << state.intents.size()
                           << " write intent(s)";

    Result<void> rollback = Rollback(state);
    if (!rollback.has_value()) {
      return make_unexpected(rollback.error());
    }

    Result<std::unique_ptr<rocksdb::Transaction>> begin =
        BeginRocksDBTransaction();
    if (!begin.has_value()) {
      return make_unexpected(begin.error());
    }

    state.txn = std::move(*begin);
    state.record.set_epoch(txn.epoch());
    *state.record.mutable_timestamp() =
        hlc::Max(state.record.timestamp(), txn.timestamp());
    *state.record.mutable_orig_timestamp() = state.record.timestamp();
  }

  kv::UpgradePriority(state.record, txn.priority());

  return &state;
}

////////////////////////////////////////////////////////////////////////

Result<Store::TxnState*> Store::LookupOrBeginTransaction(
    const Transaction& txn) {
  Result<TxnState*> lookup = LookupTransaction(txn);
  if (!lookup.has_value() || *lookup != nullptr) {
    return lookup;
  }

  Result<std::unique_ptr<rocksdb::Transaction>> begin =
      BeginRocksDBTransaction();
  if (!begin.has_value()) {
    return make_unexpected(begin.error());
  }

  RANGEKV_STORAGE_LOG(1) << "Beginning transaction '"
                         << keys::PrettyPrint(txn.id()) << "' at "
                         << hlc::ToString(txn.timestamp())
                         << " with priority " << txn.priority();

  auto [iterator, inserted] = txns_.try_emplace(txn.id());
  CHECK(inserted);

  TxnState& state = iterator->second;
  state.record = txn;
  state.record.set_status(rkv::v1alpha1::PENDING);
  *state.record.mutable_orig_timestamp() = txn.timestamp();
  state.txn = std::move(*begin);
  state.last_active = clock_.Now().wall_time();

  return &state;
}

////////////////////////////////////////////////////////////////////////

Result<std::unique_ptr<rocksdb::Transaction>>
Store::BeginRocksDBTransaction() {
  rocksdb::Transaction* txn = db_->BeginTransaction(
      DefaultWriteOptions(),
      rocksdb::TransactionOptions());

  if (txn == nullptr) {
    return make_unexpected(
        MakeError("Failed to begin transaction: Unknown rocksdb failure"));
  }

  return std::unique_ptr<rocksdb::Transaction>(txn);
}

////////////////////////////////////////////////////////////////////////

Result<void> Store::Rollback(TxnState& state) {
  rocksdb::Status status = state.txn->Rollback();

  if (!status.ok()) {
    return make_unexpected(
        MakeError(
            fmt::format(
                "Failed to roll back transaction '{}': {}",
                keys::PrettyPrint(state.record.id()),
                status.ToString())));
  }

  for (const std::string& key : state.intents) {
    intents_.erase(key);
  }
  state.intents.clear();

  return {};
}

////////////////////////////////////////////////////////////////////////

Result<Transaction> Store::Abort(
    const std::string& txn_id,
    int32_t pusher_priority) {
  auto iterator = txns_.find(txn_id);
  CHECK(iterator != std::end(txns_));

  TxnState& state = iterator->second;

  Result<void> rollback = Rollback(state);
  if (!rollback.has_value()) {
    return make_unexpected(rollback.error());
  }

  // Make sure the transaction doesn't lose against the pusher again
  // once it gets retried.
  kv::UpgradePriority(state.record, pusher_priority - 1);
  state.record.set_status(rkv::v1alpha1::ABORTED);

  RANGEKV_STORAGE_LOG(1) << "Aborted transaction '"
                         << keys::PrettyPrint(txn_id) << "' (priority now "
                         << state.record.priority() << ")";

  Transaction record = state.record;

  aborted_.emplace(txn_id, record);
  txns_.erase(iterator);

  return record;
}

////////////////////////////////////////////////////////////////////////

Result<void> Store::CollectGarbage() {
  const int64_t now = clock_.Now().wall_time();

  if (now - last_gc_ < Nanoseconds(kTimestampCacheWindow)) {
    return {};
  }

  last_gc_ = now;

  const Timestamp threshold =
      hlc::MakeTimestamp(now - Nanoseconds(kTimestampCacheWindow));

  std::vector<std::string> expired;
  for (const auto& [txn_id, state] : txns_) {
    if (now - state.last_active > Nanoseconds(kTxnExpiration)) {
      expired.push_back(txn_id);
    }
  }

  for (const std::string& txn_id : expired) {
    RANGEKV_STORAGE_LOG(1) << "Transaction '" << keys::PrettyPrint(txn_id)
                           << "' expired";
    Result<Transaction> aborted = Abort(txn_id, 0);
    if (!aborted.has_value()) {
      return make_unexpected(aborted.error());
    }
  }

  low_water_ = hlc::Max(low_water_, threshold);

  size_t evicted_reads = 0;
  for (auto iterator = std::begin(read_marks_);
       iterator != std::end(read_marks_);) {
    if (hlc::Less(low_water_, iterator->second.timestamp)) {
      ++iterator;
    } else {
      iterator = read_marks_.erase(iterator);
      evicted_reads++;
    }
  }

  size_t evicted_txns = 0;
  for (auto iterator = std::begin(aborted_);
       iterator != std::end(aborted_);) {
    if (hlc::Less(low_water_, iterator->second.timestamp())) {
      ++iterator;
    } else {
      iterator = aborted_.erase(iterator);
      evicted_txns++;
    }
  }

  RANGEKV_STORAGE_LOG(2) << "Evicted " << evicted_reads << " read(s) and "
                         << evicted_txns << " aborted transaction(s) "
                         << "below " << hlc::ToString(low_water_);

  return {};
}

////////////////////////////////////////////////////////////////////////

Result<void> Store::CheckIntent(const std::string& key, TxnState* state) {
  auto iterator = intents_.find(key);

  if (iterator == std::end(intents_)
      || (state != nullptr && iterator->second == state->record.id())) {
    return {};
  }

  auto holder = txns_.find(iterator->second);
  CHECK(holder != std::end(txns_))
      << "Write intent at '" << keys::PrettyPrint(key)
      << "' from unknown transaction";

  if (state != nullptr && CanPush(state->record, holder->second.record)) {
    // Copy the ID since aborting releases the intent.
    const std::string holder_id = holder->first;

    Result<Transaction> aborted = Abort(holder_id, state->record.priority());
    if (!aborted.has_value()) {
      return make_unexpected(aborted.error());
    }

    return make_unexpected(kv::MakeWriteIntentError(key, *aborted, true));
  }

  return make_unexpected(
      kv::MakeWriteIntentError(key, holder->second.record, false));
}

////////////////////////////////////////////////////////////////////////

Result<void> Store::CheckIntents(
    const std::string& start_key,
    const std::string& end_key,
    TxnState* state) {
  for (auto iterator = intents_.lower_bound(start_key);
       iterator != std::end(intents_) && iterator->first < end_key;
       ++iterator) {
    if (state == nullptr || iterator->second != state->record.id()) {
      // Copy the key since the intent might get released.
      const std::string key = iterator->first;
      return CheckIntent(key, state);
    }
  }
  return {};
}

////////////////////////////////////////////////////////////////////////

void Store::MarkRead(
    const std::string& key,
    const Timestamp& timestamp,
    TxnState* state) {
  const std::string txn_id = state != nullptr ? state->record.id() : "";

  ReadMark& mark = read_marks_[key];

  if (hlc::Less(mark.timestamp, timestamp)) {
    mark.timestamp = timestamp;
    mark.txn_id = txn_id;
  } else if (hlc::Equal(mark.timestamp, timestamp) && mark.txn_id != txn_id) {
    // Read by more than one party at the same timestamp, any write
    // gets pushed.
    mark.txn_id.clear();
  }
}

////////////////////////////////////////////////////////////////////////

Result<void> Store::PrepareWrite(
    const std::string& key,
    Timestamp& timestamp,
    TxnState* state) {
  Result<void> check = CheckIntent(key, state);
  if (!check.has_value()) {
    return check;
  }

  // Anything at or below the low-water mark might have been read by
  // someone else.
  Timestamp read = low_water_;
  bool own_read = false;

  auto iterator = read_marks_.find(key);
  if (iterator != std::end(read_marks_)
      && hlc::Less(low_water_, iterator->second.timestamp)) {
    read = iterator->second.timestamp;
    own_read = state != nullptr
        && iterator->second.txn_id == state->record.id();
  }

  if (!own_read && !hlc::IsZero(read) && !hlc::Less(read, timestamp)) {
    timestamp = hlc::Next(read);

    RANGEKV_STORAGE_LOG(2) << "Pushed write of '" << keys::PrettyPrint(key)
                           << "' to " << hlc::ToString(timestamp);

    if (state != nullptr) {
      *state->record.mutable_timestamp() = timestamp;
      if (state->record.isolation() == rkv::v1alpha1::SERIALIZABLE) {
        return make_unexpected(kv::MakeTransactionRetryError(state->record));
      }
    }
  }

  return {};
}

////////////////////////////////////////////////////////////////////////

Result<std::optional<std::string>> Store::Read(
    const std::string& key,
    TxnState* state) {
  std::string value;

  rocksdb::Status status = state != nullptr
      ? state->txn->Get(rocksdb::ReadOptions(), key, &value)
      : db_->Get(rocksdb::ReadOptions(), key, &value);

  if (status.IsNotFound()) {
    return std::optional<std::string>();
  } else if (!status.ok()) {
    return make_unexpected(
        MakeError(
            fmt::format(
                "Failed to read key '{}': {}",
                keys::PrettyPrint(key),
                status.ToString())));
  }

  return std::optional<std::string>(std::move(value));
}

////////////////////////////////////////////////////////////////////////

Result<std::vector<KeyValue>> Store::ReadRange(
    const std::string& start_key,
    const std::string& end_key,
    int64_t max_results,
    TxnState* state) {
  std::vector<KeyValue> rows;

  if (end_key <= start_key) {
    return rows;
  }

  // Exclusive, just like 'end_key'.
  rocksdb::Slice upper_bound(end_key);
  rocksdb::ReadOptions read_options = rocksdb::ReadOptions();
  read_options.iterate_upper_bound = &upper_bound;

  std::unique_ptr<rocksdb::Iterator> iterator(CHECK_NOTNULL(
      state != nullptr ? state->txn->GetIterator(read_options)
                       : db_->NewIterator(read_options)));

  for (iterator->Seek(start_key); iterator->Valid(); iterator->Next()) {
    // NOTE: the iterator of a transaction also includes its own
    // writes which are not necessarily bounded.
    if (iterator->key().compare(upper_bound) >= 0) {
      break;
    }

    if (max_results > 0 && static_cast<int64_t>(rows.size()) >= max_results) {
      break;
    }

    KeyValue& row = rows.emplace_back();
    row.set_key(iterator->key().ToString());
    row.set_value(iterator->value().ToString());
  }

  if (!iterator->status().ok()) {
    return make_unexpected(
        MakeError(
            fmt::format(
                "Failed to scan ['{}', '{}'): {}",
                keys::PrettyPrint(start_key),
                keys::PrettyPrint(end_key),
                iterator->status().ToString())));
  }

  return rows;
}

////////////////////////////////////////////////////////////////////////

Result<void> Store::Write(
    const std::string& key,
    const std::optional<std::string>& value,
    TxnState* state) {
  rocksdb::Status status;

  if (state != nullptr) {
    status = value.has_value() ? state->txn->Put(key, *value)
                               : state->txn->Delete(key);
    if (status.ok()) {
      intents_[key] = state->record.id();
      state->intents.insert(key);
    }
  } else {
    status = value.has_value()
        ? db_->Put(DefaultWriteOptions(), key, *value)
        : db_->Delete(DefaultWriteOptions(), key);
  }

  if (!status.ok()) {
    return make_unexpected(
        MakeError(
            fmt::format(
                "Failed to {} key '{}': {}",
                value.has_value() ? "put" : "delete",
                keys::PrettyPrint(key),
                status.ToString())));
  }

  return {};
}

////////////////////////////////////////////////////////////////////////

Result<void> Store::EndTransaction(const Request& request, Response& response) {
  const RequestHeader& header = request.header();

  if (!header.has_txn()) {
    return make_unexpected(
        MakeError("Method 'end_transaction' requires a transaction"));
  }

  const bool commit = request.end_transaction().commit();

  Result<TxnState*> lookup = LookupTransaction(header.txn());

  if (!lookup.has_value()) {
    // Aborting a transaction that has already been aborted is a
    // noop, committing it is not.
    if (!commit && lookup.error().has_transaction_aborted()) {
      *response.mutable_end_transaction()->mutable_txn() =
          lookup.error().transaction_aborted().txn();
      return {};
    }
    return make_unexpected(lookup.error());
  }

  Transaction record;

  if (*lookup == nullptr) {
    // None of the requests of the transaction have made it here,
    // so there's nothing to commit or abort.
    record = header.txn();
  } else {
    TxnState& state = **lookup;

    if (commit) {
      if (state.record.isolation() == rkv::v1alpha1::SERIALIZABLE
          && hlc::Less(state.record.orig_timestamp(),
                       state.record.timestamp())) {
        return make_unexpected(kv::MakeTransactionRetryError(state.record));
      }

      rocksdb::Status status = state.txn->Commit();

      if (!status.ok()) {
        Error error = MakeError(
            fmt::format(
                "Failed to commit transaction '{}': {}",
                keys::PrettyPrint(state.record.id()),
                status.ToString()));
        Result<void> rollback = Rollback(state);
        if (!rollback.has_value()) {
          error = kv::MakeAbortFailedError(error, rollback.error());
        }
        // Copy the ID since erasing destroys 'state'.
        const std::string txn_id = state.record.id();
        txns_.erase(txn_id);
        return make_unexpected(error);
      }

      for (const std::string& key : state.intents) {
        intents_.erase(key);
      }
    } else {
      Result<void> rollback = Rollback(state);
      if (!rollback.has_value()) {
        return make_unexpected(rollback.error());
      }
    }

    record = state.record;

    txns_.erase(record.id());
  }

  record.set_status(
      commit ? rkv::v1alpha1::COMMITTED : rkv::v1alpha1::ABORTED);

  RANGEKV_STORAGE_LOG(1) << (commit ? "Committed" : "Aborted")
                         << " transaction '" << keys::PrettyPrint(record.id())
                         << "' at " << hlc::ToString(record.timestamp());

  *response.mutable_end_transaction()->mutable_txn() = std::move(record);

  return {};
}

////////////////////////////////////////////////////////////////////////

Result<void> Store::RunBatch(
    const Request& request,
    Timestamp& timestamp,
    Response& response) {
  const BatchRequest& batch = request.batch();

  for (const auto& mutation : batch.mutations()) {
    Result<void> prepare = PrepareWrite(mutation.key(), timestamp, nullptr);
    if (!prepare.has_value()) {
      return prepare;
    }
  }

  Result<void> apply = Apply(batch);
  if (!apply.has_value()) {
    return apply;
  }

  response.mutable_batch();
  return {};
}

////////////////////////////////////////////////////////////////////////

Result<void> Store::Apply(const BatchRequest& batch) {
  rocksdb::WriteBatch write_batch;

  for (const auto& mutation : batch.mutations()) {
    rocksdb::Status status = mutation.deletion()
        ? write_batch.Delete(mutation.key())
        : write_batch.Put(mutation.key(), mutation.value());
    if (!status.ok()) {
      return make_unexpected(
          MakeError(
              fmt::format(
                  "Failed to add key '{}' to batch: {}",
                  keys::PrettyPrint(mutation.key()),
                  status.ToString())));
    }
  }

  rocksdb::Status status = db_->Write(DefaultWriteOptions(), &write_batch);

  if (!status.ok()) {
    return make_unexpected(
        MakeError(
            fmt::format(
                "Failed to apply batch of {} mutation(s): {}",
                batch.mutations_size(),
                status.ToString())));
  }

  return {};
}

////////////////////////////////////////////////////////////////////////

Result<int64_t> Store::AllocateRangeID(kv::Batch& batch) {
  std::string data;
  rocksdb::Status status =
      db_->Get(rocksdb::ReadOptions(), keys::kRangeIDGeneratorKey, &data);

  if (!status.ok()) {
    return make_unexpected(
        MakeError(
            fmt::format(
                "Failed to read range ID generator: {}",
                status.ToString())));
  }

  int64_t range_id = 0;
  if (!absl::SimpleAtoi(data, &range_id)) {
    return make_unexpected(
        MakeError(
            fmt::format(
                "Range ID generator holds '{}' which is not an integer",
                keys::PrettyPrint(data))));
  }

  range_id++;

  batch.Put(keys::kRangeIDGeneratorKey, absl::StrCat(range_id));

  return range_id;
}

////////////////////////////////////////////////////////////////////////

Result<RangeDescriptor> Store::LookupRange(const std::string& key) {
  // A range is addressed by the record at its end key, thus the
  // range containing 'key' is the one with the first record
  // _strictly_ after the addressing key for 'key'. Keys within the
  // level-1 range are all in the first range, i.e., the first
  // level-1 record.
  std::string start_key;
  std::string end_key;

  if (key < keys::kMeta2Prefix) {
    start_key = keys::kMeta1Prefix;
    end_key = keys::kMeta2Prefix;
  } else {
    std::string meta_key = keys::RangeMetaKey(key);
    start_key = keys::Next(meta_key);
    end_key = keys::HasPrefix(meta_key, keys::kMeta1Prefix)
        ? keys::kMeta2Prefix
        : keys::kMetaMax;
  }

  Result<std::vector<KeyValue>> rows =
      ReadRange(start_key, end_key, 1, nullptr);
  if (!rows.has_value()) {
    return make_unexpected(rows.error());
  }

  if (rows->empty()) {
    return make_unexpected(
        MakeError(
            fmt::format(
                "No range found for key '{}'",
                keys::PrettyPrint(key))));
  }

  RangeDescriptor desc;
  if (!desc.ParseFromString(rows->front().value())) {
    return make_unexpected(
        MakeError(
            fmt::format(
                "Failed to parse range descriptor at '{}'",
                keys::PrettyPrint(rows->front().key()))));
  }

  return desc;
}

////////////////////////////////////////////////////////////////////////

Result<void> Store::AdminSplit(const Request& request, Response& response) {
  const std::string& split_key = request.header().key();

  Result<RangeDescriptor> original = LookupRange(split_key);
  if (!original.has_value()) {
    return make_unexpected(original.error());
  }

  if (split_key == original->start_key()) {
    return make_unexpected(
        MakeError(
            fmt::format(
                "Range {} already starts at '{}'",
                Describe(*original),
                keys::PrettyPrint(split_key))));
  }

  kv::Batch batch;

  Result<int64_t> range_id = AllocateRangeID(batch);
  if (!range_id.has_value()) {
    return make_unexpected(range_id.error());
  }

  RangeDescriptor left = *original;
  left.set_end_key(split_key);

  RangeDescriptor right;
  right.set_range_id(*range_id);
  right.set_start_key(split_key);
  right.set_end_key(original->end_key());

  Result<void> addressing =
      addressing::OnSplit(batch, *original, left, right);
  if (!addressing.has_value()) {
    return addressing;
  }

  batch.Put(keys::MakeRangeDescriptorKey(left.start_key()), left);
  batch.Put(keys::MakeRangeDescriptorKey(right.start_key()), right);

  Result<void> apply = Apply(batch.request());
  if (!apply.has_value()) {
    return apply;
  }

  RANGEKV_STORAGE_LOG(1) << "Split range " << Describe(*original) << " into "
                         << Describe(left) << " and " << Describe(right);

  auto* admin_split = response.mutable_admin_split();
  *admin_split->mutable_left() = std::move(left);
  *admin_split->mutable_right() = std::move(right);

  return {};
}

////////////////////////////////////////////////////////////////////////

Result<void> Store::AdminMerge(const Request& request, Response& response) {
  Result<RangeDescriptor> left = LookupRange(request.header().key());
  if (!left.has_value()) {
    return make_unexpected(left.error());
  }

  if (left->end_key() == keys::kKeyMax) {
    return make_unexpected(
        MakeError(
            fmt::format(
                "Range {} is the last range and can not be merged",
                Describe(*left))));
  }

  Result<RangeDescriptor> right = LookupRange(left->end_key());
  if (!right.has_value()) {
    return make_unexpected(right.error());
  }

  RangeDescriptor merged = *left;
  merged.set_end_key(right->end_key());

  kv::Batch batch;

  Result<void> addressing =
      addressing::OnMerge(batch, *left, *right, merged);
  if (!addressing.has_value()) {
    return addressing;
  }

  batch.Delete(keys::MakeRangeDescriptorKey(right->start_key()));
  batch.Put(keys::MakeRangeDescriptorKey(merged.start_key()), merged);

  Result<void> apply = Apply(batch.request());
  if (!apply.has_value()) {
    return apply;
  }

  RANGEKV_STORAGE_LOG(1) << "Merged ranges " << Describe(*left) << " and "
                         << Describe(*right) << " into " << Describe(merged);

  *response.mutable_admin_merge()->mutable_merged() = std::move(merged);

  return {};
}

////////////////////////////////////////////////////////////////////////

}  // namespace rkv::storage

////////////////////////////////////////////////////////////////////////
