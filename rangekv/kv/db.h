#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "rangekv/hlc.h"
#include "rangekv/kv/batch.h"
#include "rangekv/kv/errors.h"
#include "rangekv/kv/kv.h"
#include "rkv/v1alpha1/kv.pb.h"

////////////////////////////////////////////////////////////////////////

namespace rkv::kv {

////////////////////////////////////////////////////////////////////////

using rkv::v1alpha1::AdminSplitResponse;
using rkv::v1alpha1::KeyValue;

struct TransactionOptions;

////////////////////////////////////////////////////////////////////////

// Client interface to a KV, e.g., a 'Store', a 'RemoteKV', or the
// 'TxnCoordinator' of a transaction (see 'RunTransaction()').
//
// Every request gets stamped with 'user' and, unless already set, a
// timestamp from 'clock'. Mutating requests also get a 'ClientCmdID'
// unless already set so that a store applies them at most once.
class DB final {
 public:
  DB(KV* kv, hlc::Clock* clock, std::string user);

  DB(const DB&) = delete;
  DB& operator=(const DB&) = delete;

  Response Execute(Request request);

  Result<bool> Contains(const std::string& key);

  Result<std::optional<std::string>> Get(const std::string& key);

  Result<void> Put(const std::string& key, const std::string& value);

  // Puts 'value' only if the current value is 'expected', where an
  // unset 'expected' means the key must not exist. Otherwise fails
  // with a 'ConditionFailedError' carrying the current value.
  Result<void> ConditionalPut(
      const std::string& key,
      const std::string& value,
      const std::optional<std::string>& expected);

  // Adds 'increment' to the integer stored at 'key' (a missing key
  // counts as 0) and returns the new value.
  Result<int64_t> Increment(const std::string& key, int64_t increment);

  Result<void> Delete(const std::string& key);

  // Deletes all keys in ['start_key', 'end_key') and returns how
  // many there were.
  Result<int64_t> DeleteRange(
      const std::string& start_key,
      const std::string& end_key);

  // Returns up to 'max_results' (zero means all) rows in
  // ['start_key', 'end_key') in key order.
  Result<std::vector<KeyValue>> Scan(
      const std::string& start_key,
      const std::string& end_key,
      int64_t max_results = 0);

  // Applies all of 'batch' atomically. Not available within a
  // transaction.
  Result<void> Run(const Batch& batch);

  // Splits the range containing 'key' so that 'key' starts the
  // right half.
  Result<AdminSplitResponse> AdminSplit(const std::string& key);

  // Merges the range containing 'key' with its right neighbour.
  Result<RangeDescriptor> AdminMerge(const std::string& key);

  // Returns the descriptor of the range containing 'key'.
  Result<RangeDescriptor> RangeLookup(const std::string& key);

  // See 'rkv::kv::RunTransaction()'.
  Result<void> RunTransaction(
      const TransactionOptions& options,
      const std::function<Result<void>(DB&)>& retryable);

  KV* kv() const {
    return kv_;
  }

  hlc::Clock* clock() const {
    return clock_;
  }

  const std::string& user() const {
    return user_;
  }

 private:
  // Executes 'request' and returns the response unless it carries an
  // error.
  Result<Response> Call(Request request);

  KV* const kv_;
  hlc::Clock* const clock_;
  const std::string user_;
};

////////////////////////////////////////////////////////////////////////

}  // namespace rkv::kv

////////////////////////////////////////////////////////////////////////
