#pragma once

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "glog/logging.h"
#include "rangekv/hlc.h"
#include "rangekv/kv/batch.h"
#include "rangekv/kv/errors.h"
#include "rangekv/kv/kv.h"
#include "rkv/v1alpha1/data.pb.h"
#include "rkv/v1alpha1/kv.pb.h"
#include "rocksdb/utilities/transaction.h"
#include "rocksdb/utilities/transaction_db.h"
#include "stout/cache.h"
#include "tl/expected.hpp"

////////////////////////////////////////////////////////////////////////

namespace rkv::storage {

////////////////////////////////////////////////////////////////////////

// Whether logging at 'verbosity' is enabled, i.e., whether
// `RANGEKV_STORAGE_LOG_VERBOSITY` is set to at least 'verbosity'.
// Nothing gets logged while it is unset.
inline bool RangekvStorageLogLevelEnabled(int verbosity) {
  static const char* variable = std::getenv("RANGEKV_STORAGE_LOG_VERBOSITY");
  static int chosen_verbosity = variable != nullptr ? atoi(variable) : 0;
  return chosen_verbosity >= verbosity;
}

#define RANGEKV_STORAGE_LOG(level) \
  LOG_IF(INFO, ::rkv::storage::RangekvStorageLogLevelEnabled(level))

////////////////////////////////////////////////////////////////////////

template <class T, class E = std::string>
using expected = tl::expected<T, E>;

using rkv::kv::Request;
using rkv::kv::Response;
using rkv::kv::Result;
using rkv::v1alpha1::RangeDescriptor;
using rkv::v1alpha1::RequestHeader;
using rkv::v1alpha1::Timestamp;
using rkv::v1alpha1::Transaction;

////////////////////////////////////////////////////////////////////////

// A single node key-value store on top of a rocksdb 'TransactionDB'.
//
// Writes of a transaction are buffered in a 'rocksdb::Transaction'
// until the transaction ends and are visible to other requests only
// as write intents, i.e., any other request for the same key fails
// with a 'WriteIntentError'. A request from a transaction with a
// higher priority than the holder of the intent (or the same priority
// but older) aborts the holder and fails with a _resolved_
// 'WriteIntentError' so that it can be retried immediately.
// Transactions that stop sending requests expire after
// 'kTxnExpiration'.
//
// Reads are remembered per key in a timestamp cache for
// 'kTimestampCacheWindow'. A write at or below the timestamp of a
// read by someone else (or the low-water mark of evicted reads) gets
// pushed above it. A pushed serializable transaction fails with a
// 'TransactionRetryError', a snapshot transaction just carries on at
// the pushed timestamp.
//
// Also maintains range descriptors and the addressing records for
// them, see 'AdminSplit', 'AdminMerge', and 'RangeLookup'.
//
// All requests are executed one at a time.
class Store final : public kv::KV {
 public:
  static expected<std::unique_ptr<Store>> Instantiate(
      const std::filesystem::path& state_directory);

  ~Store() override;

  Response Execute(Request request) override;

 private:
  Store(
      const std::filesystem::path& state_directory,
      std::unique_ptr<rocksdb::TransactionDB>&& db);

  // State of a transaction that has not yet ended.
  struct TxnState {
    // Our copy of the transaction record. Its 'timestamp' is only
    // ever changed by a push, 'orig_timestamp' is where the current
    // epoch started.
    Transaction record;

    std::unique_ptr<rocksdb::Transaction> txn;

    // Keys of the write intents of this transaction.
    std::set<std::string> intents;

    // Wall time of the most recent request of this transaction, see
    // 'kTxnExpiration'.
    int64_t last_active = 0;
  };

  // The most recent read of a key.
  struct ReadMark {
    Timestamp timestamp;
    // Empty if not read within a transaction.
    std::string txn_id;
  };

  // Writes the descriptor and addressing records of the very first
  // range unless already there.
  Result<void> Bootstrap();

  Response Dispatch(const Request& request);

  // Executes any of the methods that may be part of a transaction.
  Result<void> ExecuteKeyValue(
      const Request& request,
      Timestamp& timestamp,
      TxnState* state,
      Response& response);

  // Returns the state for 'txn' beginning a rocksdb transaction if
  // necessary. Fails if 'txn' has been aborted or is from an older
  // epoch. A newer epoch discards all writes of the previous epochs.
  Result<TxnState*> LookupOrBeginTransaction(const Transaction& txn);

  // Like 'LookupOrBeginTransaction()' but returns 'nullptr' rather
  // than beginning a transaction.
  Result<TxnState*> LookupTransaction(const Transaction& txn);

  Result<std::unique_ptr<rocksdb::Transaction>> BeginRocksDBTransaction();

  // Rolls back all writes of 'state' and releases its intents.
  Result<void> Rollback(TxnState& state);

  // Aborts the transaction with 'txn_id' on behalf of a pusher with
  // 'pusher_priority' and returns its final record.
  Result<Transaction> Abort(
      const std::string& txn_id,
      int32_t pusher_priority);

  // Evicts reads and aborted transactions older than
  // 'kTimestampCacheWindow' (raising 'low_water_' past them) and
  // aborts transactions idle for longer than 'kTxnExpiration'. Does
  // nothing if it already ran within the last window.
  Result<void> CollectGarbage();

  // Fails if someone other than 'state' (or a non-transactional
  // request if 'state' is 'nullptr') holds a write intent for 'key'.
  Result<void> CheckIntent(const std::string& key, TxnState* state);

  // Same as 'CheckIntent()' for every key in ['start_key', 'end_key').
  Result<void> CheckIntents(
      const std::string& start_key,
      const std::string& end_key,
      TxnState* state);

  // Remembers that 'key' was read at 'timestamp'.
  void MarkRead(
      const std::string& key,
      const Timestamp& timestamp,
      TxnState* state);

  // Checks for intents and pushes 'timestamp' above any later read
  // of 'key' by someone else.
  Result<void> PrepareWrite(
      const std::string& key,
      Timestamp& timestamp,
      TxnState* state);

  Result<std::optional<std::string>> Read(
      const std::string& key,
      TxnState* state);

  // Returns all rows in ['start_key', 'end_key') (at most
  // 'max_results' if positive) as seen by 'state'.
  Result<std::vector<rkv::v1alpha1::KeyValue>> ReadRange(
      const std::string& start_key,
      const std::string& end_key,
      int64_t max_results,
      TxnState* state);

  // Writes 'value' at 'key' (or deletes 'key' if 'value' is not set)
  // either as an intent of 'state' or directly.
  Result<void> Write(
      const std::string& key,
      const std::optional<std::string>& value,
      TxnState* state);

  Result<void> EndTransaction(const Request& request, Response& response);

  Result<void> RunBatch(
      const Request& request,
      Timestamp& timestamp,
      Response& response);

  Result<void> AdminSplit(const Request& request, Response& response);

  Result<void> AdminMerge(const Request& request, Response& response);

  // Returns the descriptor of the range containing 'key' by looking
  // up its addressing record.
  Result<RangeDescriptor> LookupRange(const std::string& key);

  // Returns a new unique range ID and adds the update of the
  // generator to 'batch'.
  Result<int64_t> AllocateRangeID(kv::Batch& batch);

  // Atomically applies 'batch' bypassing all transactions.
  Result<void> Apply(const rkv::v1alpha1::BatchRequest& batch);

  std::mutex mutex_;

  std::filesystem::path state_directory_;

  std::unique_ptr<rocksdb::TransactionDB> db_;

  hlc::Clock clock_;

  // Ongoing transactions indexed by their ID.
  std::map<std::string, TxnState> txns_;

  // Holder of each write intent.
  std::map<std::string, std::string> intents_;

  // Records of aborted transactions so that the next request of the
  // transaction learns about it. Evicted along with the reads, a
  // transaction below 'low_water_' can't begin anymore.
  std::map<std::string, Transaction> aborted_;

  std::map<std::string, ReadMark> read_marks_;

  // Every read at or below this has been evicted from 'read_marks_'.
  Timestamp low_water_;

  // Wall time of the last 'CollectGarbage()'.
  int64_t last_gc_ = 0;

  // Responses of mutating requests indexed by their 'ClientCmdID' so
  // that retried requests are not applied more than once.
  Cache<std::string, Response> responses_;
};

////////////////////////////////////////////////////////////////////////

}  // namespace rkv::storage

////////////////////////////////////////////////////////////////////////
