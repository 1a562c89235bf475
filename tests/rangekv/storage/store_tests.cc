#include "rangekv/storage/store.h"

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "fmt/format.h"
#include "rangekv/keys.h"
#include "rangekv/kv/db.h"
#include "rangekv/kv/transaction.h"
#include "rangekv/kv/txn_db.h"
#include "rangekv/settings.h"
#include "stout/uuid.h"

////////////////////////////////////////////////////////////////////////

using id::UUID;

using rkv::keys::kKeyMax;
using rkv::keys::kKeyMin;
using rkv::keys::MakeMeta1Key;
using rkv::keys::MakeMeta2Key;
using rkv::keys::PrettyPrint;
using rkv::kv::DB;
using rkv::kv::TransactionOptions;
using rkv::v1alpha1::IsolationType;
using rkv::v1alpha1::KeyValue;

////////////////////////////////////////////////////////////////////////

namespace rkv::storage {
namespace {

////////////////////////////////////////////////////////////////////////

std::string Record(
    const std::string& key,
    const std::string& start_key,
    const std::string& end_key) {
  return fmt::format(
      "{} -> ['{}', '{}')",
      PrettyPrint(key),
      PrettyPrint(start_key),
      PrettyPrint(end_key));
}

// Executes every request twice, as if the first response got lost
// and the request was sent again.
class DuplicatingKV final : public kv::KV {
 public:
  explicit DuplicatingKV(kv::KV* kv) : kv_(kv) {}

  Response Execute(Request request) override {
    Response lost = kv_->Execute(request);
    return kv_->Execute(std::move(request));
  }

 private:
  kv::KV* kv_;
};

////////////////////////////////////////////////////////////////////////

class StoreTest : public ::testing::Test {
 protected:
  void SetUp() override {
    state_directory_ = std::filesystem::path(::testing::TempDir())
        / ("rangekv-store-" + UUID::random().toString());
    Open();
  }

  void TearDown() override {
    db_.reset();
    store_.reset();
    std::filesystem::remove_all(state_directory_);
  }

  // (Re)opens the store at 'state_directory_'.
  void Open() {
    db_.reset();
    store_.reset();

    expected<std::unique_ptr<Store>> store =
        Store::Instantiate(state_directory_);
    ASSERT_TRUE(store.has_value()) << store.error();

    store_ = std::move(*store);
    db_ = std::make_unique<DB>(store_.get(), &clock_, "root");
  }

  Transaction MakeTxn(
      const std::string& key,
      int32_t priority,
      IsolationType isolation = rkv::v1alpha1::SERIALIZABLE) {
    // A negative user priority is used verbatim.
    return kv::NewTransaction(key, -priority, isolation, clock_);
  }

  Request MakeRequest(
      const std::string& key,
      const Transaction* txn = nullptr) {
    Request request;
    request.mutable_header()->set_key(key);
    request.mutable_header()->set_user("root");
    if (txn != nullptr) {
      *request.mutable_header()->mutable_txn() = *txn;
      *request.mutable_header()->mutable_timestamp() = txn->timestamp();
    } else {
      *request.mutable_header()->mutable_timestamp() = clock_.Now();
    }
    return request;
  }

  Response Put(
      const std::string& key,
      const std::string& value,
      const Transaction* txn = nullptr) {
    Request request = MakeRequest(key, txn);
    request.mutable_put()->set_value(value);
    return store_->Execute(request);
  }

  Response Get(const std::string& key, const Transaction* txn = nullptr) {
    Request request = MakeRequest(key, txn);
    request.mutable_get();
    return store_->Execute(request);
  }

  Response EndTransaction(const Transaction& txn, bool commit) {
    Request request = MakeRequest(txn.key(), &txn);
    request.mutable_end_transaction()->set_commit(commit);
    return store_->Execute(request);
  }

  // Moves the clock of the store 'duration' ahead of ours by sending
  // it a request from the future. Returns the timestamp it was sent at.
  Timestamp AdvanceStoreClock(std::chrono::nanoseconds duration) {
    Request request = MakeRequest("clock");
    *request.mutable_header()->mutable_timestamp() =
        hlc::MakeTimestamp(clock_.Now().wall_time() + duration.count());
    request.mutable_get();
    Response response = store_->Execute(request);
    EXPECT_FALSE(response.header().has_error())
        << response.header().error().message();
    return request.header().timestamp();
  }

  // Returns all addressing records formatted by 'Record()'.
  std::vector<std::string> MetaRecords() {
    Result<std::vector<KeyValue>> rows =
        db_->Scan(keys::kMetaPrefix, keys::kMetaMax);
    EXPECT_TRUE(rows.has_value());

    std::vector<std::string> records;
    for (const KeyValue& row : rows.value_or(std::vector<KeyValue>())) {
      RangeDescriptor desc;
      EXPECT_TRUE(desc.ParseFromString(row.value()));
      records.push_back(Record(row.key(), desc.start_key(), desc.end_key()));
    }
    return records;
  }

  std::filesystem::path state_directory_;
  hlc::Clock clock_;
  std::unique_ptr<Store> store_;
  std::unique_ptr<DB> db_;
};

////////////////////////////////////////////////////////////////////////

TEST_F(StoreTest, Bootstrap) {
  Result<RangeDescriptor> range = db_->RangeLookup("a");
  ASSERT_TRUE(range.has_value()) << range.error().message();
  EXPECT_EQ(1, range->range_id());
  EXPECT_EQ(kKeyMin, range->start_key());
  EXPECT_EQ(kKeyMax, range->end_key());

  range = db_->RangeLookup(kKeyMin);
  ASSERT_TRUE(range.has_value()) << range.error().message();
  EXPECT_EQ(1, range->range_id());

  EXPECT_EQ(
      (std::vector<std::string>{
          Record(MakeMeta1Key(kKeyMax), kKeyMin, kKeyMax),
          Record(MakeMeta2Key(kKeyMax), kKeyMin, kKeyMax),
      }),
      MetaRecords());
}

////////////////////////////////////////////////////////////////////////

TEST_F(StoreTest, PutGetDelete) {
  ASSERT_TRUE(db_->Put("a", "1").has_value());

  Result<std::optional<std::string>> value = db_->Get("a");
  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(std::optional<std::string>("1"), *value);

  Result<bool> exists = db_->Contains("a");
  ASSERT_TRUE(exists.has_value());
  EXPECT_TRUE(*exists);

  value = db_->Get("b");
  ASSERT_TRUE(value.has_value());
  EXPECT_FALSE(value->has_value());

  ASSERT_TRUE(db_->Delete("a").has_value());

  exists = db_->Contains("a");
  ASSERT_TRUE(exists.has_value());
  EXPECT_FALSE(*exists);
}

////////////////////////////////////////////////////////////////////////

TEST_F(StoreTest, ConditionalPut) {
  // Only succeeds if the key doesn't exist.
  ASSERT_TRUE(db_->ConditionalPut("a", "1", std::nullopt).has_value());

  Result<void> put = db_->ConditionalPut("a", "2", std::nullopt);
  ASSERT_FALSE(put.has_value());
  ASSERT_TRUE(put.error().has_condition_failed());
  EXPECT_EQ("1", put.error().condition_failed().actual_value());

  ASSERT_TRUE(db_->ConditionalPut("a", "2", "1").has_value());

  put = db_->ConditionalPut("a", "3", "1");
  ASSERT_FALSE(put.has_value());
  ASSERT_TRUE(put.error().has_condition_failed());
  EXPECT_EQ("2", put.error().condition_failed().actual_value());

  put = db_->ConditionalPut("b", "1", "1");
  ASSERT_FALSE(put.has_value());
  ASSERT_TRUE(put.error().has_condition_failed());
  EXPECT_FALSE(put.error().condition_failed().has_actual_value());

  Result<std::optional<std::string>> value = db_->Get("a");
  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(std::optional<std::string>("2"), *value);
}

////////////////////////////////////////////////////////////////////////

TEST_F(StoreTest, Increment) {
  Result<int64_t> value = db_->Increment("n", 5);
  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(5, *value);

  value = db_->Increment("n", -2);
  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(3, *value);

  Result<std::optional<std::string>> stored = db_->Get("n");
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(std::optional<std::string>("3"), *stored);

  ASSERT_TRUE(db_->Put("s", "abc").has_value());
  EXPECT_FALSE(db_->Increment("s", 1).has_value());
}

////////////////////////////////////////////////////////////////////////

TEST_F(StoreTest, IncrementOverflow) {
  ASSERT_TRUE(db_->Put("max", "9223372036854775807").has_value());

  Result<int64_t> value = db_->Increment("max", 1);
  ASSERT_FALSE(value.has_value());
  EXPECT_NE(std::string::npos, value.error().message().find("overflows"))
      << value.error().message();

  ASSERT_TRUE(db_->Put("min", "-9223372036854775808").has_value());

  value = db_->Increment("min", -1);
  ASSERT_FALSE(value.has_value());
  EXPECT_NE(std::string::npos, value.error().message().find("overflows"))
      << value.error().message();

  // Nothing was written.
  Result<std::optional<std::string>> stored = db_->Get("max");
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(std::optional<std::string>("9223372036854775807"), *stored);

  // Moving away from the limit is fine.
  value = db_->Increment("max", -7);
  ASSERT_TRUE(value.has_value()) << value.error().message();
  EXPECT_EQ(9223372036854775800, *value);
}

////////////////////////////////////////////////////////////////////////

TEST_F(StoreTest, ScanAndDeleteRange) {
  for (const std::string key : {"a", "b", "c", "d"}) {
    ASSERT_TRUE(db_->Put(key, key + key).has_value());
  }

  Result<std::vector<KeyValue>> rows = db_->Scan("a", "d");
  ASSERT_TRUE(rows.has_value());
  ASSERT_EQ(3u, rows->size());
  EXPECT_EQ("a", (*rows)[0].key());
  EXPECT_EQ("aa", (*rows)[0].value());
  EXPECT_EQ("c", (*rows)[2].key());

  rows = db_->Scan("a", "d", 2);
  ASSERT_TRUE(rows.has_value());
  ASSERT_EQ(2u, rows->size());
  EXPECT_EQ("b", (*rows)[1].key());

  Result<int64_t> deleted = db_->DeleteRange("b", "d");
  ASSERT_TRUE(deleted.has_value());
  EXPECT_EQ(2, *deleted);

  rows = db_->Scan("a", "z");
  ASSERT_TRUE(rows.has_value());
  ASSERT_EQ(2u, rows->size());
  EXPECT_EQ("a", (*rows)[0].key());
  EXPECT_EQ("d", (*rows)[1].key());
}

////////////////////////////////////////////////////////////////////////

TEST_F(StoreTest, RunBatch) {
  ASSERT_TRUE(db_->Put("a", "1").has_value());

  kv::Batch batch;
  batch.Put("x", "1");
  batch.Put("y", "2");
  batch.Delete("a");

  ASSERT_TRUE(db_->Run(batch).has_value());

  Result<std::vector<KeyValue>> rows = db_->Scan("a", "z");
  ASSERT_TRUE(rows.has_value());
  ASSERT_EQ(2u, rows->size());
  EXPECT_EQ("x", (*rows)[0].key());
  EXPECT_EQ("y", (*rows)[1].key());

  // An empty batch is a noop.
  EXPECT_TRUE(db_->Run(kv::Batch()).has_value());
}

////////////////////////////////////////////////////////////////////////

TEST_F(StoreTest, WriteIntentBlocksOthers) {
  const Transaction txn1 = MakeTxn("a", 10);
  const Transaction txn2 = MakeTxn("a", 5);

  ASSERT_FALSE(Put("a", "1", &txn1).header().has_error());

  // The transaction sees its own write.
  Response response = Get("a", &txn1);
  ASSERT_FALSE(response.header().has_error());
  EXPECT_EQ("1", response.get().value());

  // Everyone else runs into the intent.
  response = Get("a");
  ASSERT_TRUE(response.header().error().has_write_intent());
  EXPECT_FALSE(response.header().error().write_intent().resolved());
  EXPECT_EQ(txn1.id(), response.header().error().write_intent().txn().id());

  response = Put("a", "2");
  ASSERT_TRUE(response.header().error().has_write_intent());

  // A lower priority transaction can't push.
  response = Put("a", "3", &txn2);
  ASSERT_TRUE(response.header().error().has_write_intent());
  EXPECT_FALSE(response.header().error().write_intent().resolved());

  response = EndTransaction(txn1, true);
  ASSERT_FALSE(response.header().has_error())
      << response.header().error().message();
  EXPECT_EQ(
      rkv::v1alpha1::COMMITTED,
      response.end_transaction().txn().status());

  Result<std::optional<std::string>> value = db_->Get("a");
  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(std::optional<std::string>("1"), *value);
}

////////////////////////////////////////////////////////////////////////

TEST_F(StoreTest, HigherPriorityAbortsHolder) {
  const Transaction txn1 = MakeTxn("a", 5);
  const Transaction txn2 = MakeTxn("b", 10);

  ASSERT_FALSE(Put("a", "1", &txn1).header().has_error());

  // Pushing aborts 'txn1', the error says we can retry right away.
  Response response = Get("a", &txn2);
  ASSERT_TRUE(response.header().error().has_write_intent());
  EXPECT_TRUE(response.header().error().write_intent().resolved());

  response = Get("a", &txn2);
  ASSERT_FALSE(response.header().has_error())
      << response.header().error().message();
  EXPECT_FALSE(response.get().has_value());

  // The next request of 'txn1' learns it was aborted, with a priority
  // that won't lose against 'txn2' again.
  response = Put("b", "1", &txn1);
  ASSERT_TRUE(response.header().error().has_transaction_aborted());
  EXPECT_EQ(
      9,
      response.header().error().transaction_aborted().txn().priority());

  response = EndTransaction(txn1, true);
  EXPECT_TRUE(response.header().error().has_transaction_aborted());

  // Aborting it again is fine though.
  response = EndTransaction(txn1, false);
  ASSERT_FALSE(response.header().has_error());
  EXPECT_EQ(rkv::v1alpha1::ABORTED, response.end_transaction().txn().status());
}

////////////////////////////////////////////////////////////////////////

TEST_F(StoreTest, OlderTransactionWinsPriorityTie) {
  const Transaction older = MakeTxn("a", 5);
  const Transaction younger = MakeTxn("b", 5);

  ASSERT_FALSE(Put("a", "1", &older).header().has_error());
  ASSERT_FALSE(Put("b", "2", &younger).header().has_error());

  // The younger one has to wait.
  Response response = Put("a", "2", &younger);
  ASSERT_TRUE(response.header().error().has_write_intent());
  EXPECT_FALSE(response.header().error().write_intent().resolved());

  // The older one pushes.
  response = Put("b", "1", &older);
  ASSERT_TRUE(response.header().error().has_write_intent());
  EXPECT_TRUE(response.header().error().write_intent().resolved());

  ASSERT_FALSE(Put("b", "1", &older).header().has_error());

  response = Get("a", &younger);
  EXPECT_TRUE(response.header().error().has_transaction_aborted());

  response = EndTransaction(older, true);
  ASSERT_FALSE(response.header().has_error())
      << response.header().error().message();

  Result<std::optional<std::string>> value = db_->Get("b");
  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(std::optional<std::string>("1"), *value);
}

////////////////////////////////////////////////////////////////////////

TEST_F(StoreTest, EqualPriorityTransactionsWritingEachOthersKeysFinish) {
  TransactionOptions options;
  options.user_priority = -5;
  options.retry_options.backoff = std::chrono::milliseconds(1);
  options.retry_options.max_backoff = std::chrono::milliseconds(10);

  std::promise<void> wrote_a;
  std::promise<void> wrote_b;

  // Writes 'first', waits for the other transaction to have written
  // its first key, then writes 'second'. Only the first run waits.
  auto Transfer = [&](
      const std::string& first,
      const std::string& second,
      std::promise<void>& wrote,
      std::future<void> other_wrote) {
    bool first_run = true;
    return db_->RunTransaction(
        options,
        [&](DB& txn) -> Result<void> {
          Result<void> put = txn.Put(first, "1");
          if (!put.has_value()) {
            return put;
          }
          if (first_run) {
            first_run = false;
            wrote.set_value();
            other_wrote.wait();
          }
          return txn.Put(second, "1");
        });
  };

  std::future<Result<void>> ab = std::async(
      std::launch::async,
      Transfer,
      "a",
      "b",
      std::ref(wrote_a),
      wrote_b.get_future());

  std::future<Result<void>> ba = std::async(
      std::launch::async,
      Transfer,
      "b",
      "a",
      std::ref(wrote_b),
      wrote_a.get_future());

  Result<void> result = ab.get();
  EXPECT_TRUE(result.has_value()) << result.error().message();

  result = ba.get();
  EXPECT_TRUE(result.has_value()) << result.error().message();

  for (const std::string key : {"a", "b"}) {
    Result<std::optional<std::string>> value = db_->Get(key);
    ASSERT_TRUE(value.has_value()) << value.error().message();
    EXPECT_EQ(std::optional<std::string>("1"), *value);
  }
}

////////////////////////////////////////////////////////////////////////

TEST_F(StoreTest, ExpiresIdleTransactions) {
  const Transaction txn = MakeTxn("a", 10);

  ASSERT_FALSE(Put("a", "1", &txn).header().has_error());
  ASSERT_TRUE(Get("a").header().error().has_write_intent());

  AdvanceStoreClock(kTxnExpiration + std::chrono::seconds(1));

  // The intent is gone and so is the write.
  Result<std::optional<std::string>> value = db_->Get("a");
  ASSERT_TRUE(value.has_value()) << value.error().message();
  EXPECT_FALSE(value->has_value());

  Response response = Put("b", "1", &txn);
  EXPECT_TRUE(response.header().error().has_transaction_aborted());

  response = EndTransaction(txn, true);
  EXPECT_TRUE(response.header().error().has_transaction_aborted());
}

////////////////////////////////////////////////////////////////////////

TEST_F(StoreTest, EvictsOldReadsAndAbortedTransactions) {
  const Transaction pending = MakeTxn("p", 10);
  ASSERT_FALSE(Put("p", "1", &pending).header().has_error());

  const Transaction aborted = MakeTxn("x", 5);
  const Transaction pusher = MakeTxn("y", 10);
  ASSERT_FALSE(Put("x", "1", &aborted).header().has_error());
  ASSERT_TRUE(
      Get("x", &pusher).header().error().write_intent().resolved());

  ASSERT_TRUE(db_->Get("k").has_value());

  const Timestamp future =
      AdvanceStoreClock(kTimestampCacheWindow + std::chrono::seconds(1));

  const Timestamp low_water = hlc::MakeTimestamp(
      future.wall_time()
      - std::chrono::nanoseconds(kTimestampCacheWindow).count());

  // A write below the forgotten reads gets pushed past all of them.
  Response response = Put("k", "v");
  ASSERT_FALSE(response.header().has_error())
      << response.header().error().message();
  EXPECT_TRUE(hlc::Less(low_water, response.header().timestamp()));

  // Which makes a pending serializable transaction retry.
  response = Put("q", "1", &pending);
  EXPECT_TRUE(response.header().error().has_transaction_retry());

  // A forgotten aborted transaction is still aborted.
  response = Put("z", "1", &aborted);
  EXPECT_TRUE(response.header().error().has_transaction_aborted());
}

////////////////////////////////////////////////////////////////////////

TEST_F(StoreTest, PushedSerializableTransactionMustRetry) {
  const Transaction txn = MakeTxn("k", 10);

  // A later read of the key.
  ASSERT_TRUE(db_->Get("k").has_value());

  Response response = Put("k", "v", &txn);
  ASSERT_TRUE(response.header().error().has_transaction_retry());

  const Transaction& pushed =
      response.header().error().transaction_retry().txn();
  EXPECT_EQ(txn.id(), pushed.id());
  EXPECT_TRUE(hlc::Less(txn.timestamp(), pushed.timestamp()));
}

////////////////////////////////////////////////////////////////////////

TEST_F(StoreTest, PushedSnapshotTransactionCommits) {
  const Transaction txn = MakeTxn("k", 10, rkv::v1alpha1::SNAPSHOT);

  ASSERT_TRUE(db_->Get("k").has_value());

  Response response = Put("k", "v", &txn);
  ASSERT_FALSE(response.header().has_error())
      << response.header().error().message();
  EXPECT_TRUE(hlc::Less(txn.timestamp(), response.header().timestamp()));

  response = EndTransaction(txn, true);
  ASSERT_FALSE(response.header().has_error())
      << response.header().error().message();
  EXPECT_TRUE(
      hlc::Less(txn.timestamp(), response.end_transaction().txn().timestamp()));

  Result<std::optional<std::string>> value = db_->Get("k");
  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(std::optional<std::string>("v"), *value);
}

////////////////////////////////////////////////////////////////////////

TEST_F(StoreTest, NewEpochDiscardsWrites) {
  Transaction txn = MakeTxn("a", 10);

  ASSERT_FALSE(Put("a", "1", &txn).header().has_error());
  ASSERT_FALSE(Put("b", "1", &txn).header().has_error());

  txn.set_epoch(1);

  ASSERT_FALSE(Put("a", "2", &txn).header().has_error());

  // Requests from an older epoch are rejected.
  Transaction stale = txn;
  stale.set_epoch(0);
  EXPECT_TRUE(Put("c", "1", &stale).header().has_error());

  Response response = EndTransaction(txn, true);
  ASSERT_FALSE(response.header().has_error())
      << response.header().error().message();

  Result<std::optional<std::string>> value = db_->Get("a");
  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(std::optional<std::string>("2"), *value);

  value = db_->Get("b");
  ASSERT_TRUE(value.has_value());
  EXPECT_FALSE(value->has_value());
}

////////////////////////////////////////////////////////////////////////

TEST_F(StoreTest, RejectsNonTransactionalMethodsWithinTransaction) {
  const Transaction txn = MakeTxn("a", 10);

  Request request = MakeRequest("a", &txn);
  request.mutable_admin_split();

  Response response = store_->Execute(request);
  ASSERT_TRUE(response.header().error().has_non_transactional_operation());
}

////////////////////////////////////////////////////////////////////////

TEST_F(StoreTest, ReplaysRetriedCommand) {
  Request request = MakeRequest("n");
  request.mutable_increment()->set_increment(1);
  request.mutable_header()->mutable_cmd_id()->set_wall_time(1);
  request.mutable_header()->mutable_cmd_id()->set_random(42);

  Response response = store_->Execute(request);
  ASSERT_FALSE(response.header().has_error());
  EXPECT_EQ(1, response.increment().new_value());

  // Same command, same response, applied once.
  response = store_->Execute(request);
  ASSERT_FALSE(response.header().has_error());
  EXPECT_EQ(1, response.increment().new_value());

  request.mutable_header()->mutable_cmd_id()->set_random(43);
  response = store_->Execute(request);
  ASSERT_FALSE(response.header().has_error());
  EXPECT_EQ(2, response.increment().new_value());
}

////////////////////////////////////////////////////////////////////////

TEST_F(StoreTest, AppliesResentCommandsOnce) {
  DuplicatingKV kv(store_.get());
  DB db(&kv, &clock_, "root");

  Result<int64_t> value = db.Increment("n", 1);
  ASSERT_TRUE(value.has_value()) << value.error().message();
  EXPECT_EQ(1, *value);

  Result<kv::AdminSplitResponse> split = db.AdminSplit("m");
  ASSERT_TRUE(split.has_value()) << split.error().message();
  EXPECT_EQ(2, split->right().range_id());

  // Reads need no command ID.
  Result<std::optional<std::string>> stored = db.Get("n");
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(std::optional<std::string>("1"), *stored);

  Result<RangeDescriptor> range = db.RangeLookup("z");
  ASSERT_TRUE(range.has_value());
  EXPECT_EQ(2, range->range_id());
}

////////////////////////////////////////////////////////////////////////

TEST_F(StoreTest, SplitLookupAndMerge) {
  Result<kv::AdminSplitResponse> split = db_->AdminSplit("m");
  ASSERT_TRUE(split.has_value()) << split.error().message();
  EXPECT_EQ(1, split->left().range_id());
  EXPECT_EQ("m", split->left().end_key());
  EXPECT_EQ(2, split->right().range_id());
  EXPECT_EQ("m", split->right().start_key());
  EXPECT_EQ(kKeyMax, split->right().end_key());

  Result<RangeDescriptor> range = db_->RangeLookup("a");
  ASSERT_TRUE(range.has_value());
  EXPECT_EQ(1, range->range_id());

  range = db_->RangeLookup("m");
  ASSERT_TRUE(range.has_value());
  EXPECT_EQ(2, range->range_id());

  range = db_->RangeLookup("z");
  ASSERT_TRUE(range.has_value());
  EXPECT_EQ(2, range->range_id());

  // Already a boundary.
  EXPECT_FALSE(db_->AdminSplit("m").has_value());

  // The level-1 range can't be split.
  split = db_->AdminSplit(MakeMeta1Key("a"));
  ASSERT_FALSE(split.has_value());
  EXPECT_TRUE(split.error().has_meta1_split());

  Result<RangeDescriptor> merged = db_->AdminMerge(kKeyMin);
  ASSERT_TRUE(merged.has_value()) << merged.error().message();
  EXPECT_EQ(1, merged->range_id());
  EXPECT_EQ(kKeyMin, merged->start_key());
  EXPECT_EQ(kKeyMax, merged->end_key());

  range = db_->RangeLookup("z");
  ASSERT_TRUE(range.has_value());
  EXPECT_EQ(1, range->range_id());

  // Nothing left to merge with.
  EXPECT_FALSE(db_->AdminMerge(kKeyMin).has_value());
}

////////////////////////////////////////////////////////////////////////

TEST_F(StoreTest, MaintainsAddressingRecords) {
  const std::string m2m = MakeMeta2Key("m");
  const std::string m2r = MakeMeta2Key("r");
  const std::string m2z = MakeMeta2Key("z");

  for (const std::string& key : {std::string("a"),
                                 std::string("z"),
                                 std::string("m"),
                                 m2m,
                                 m2z,
                                 m2r}) {
    Result<kv::AdminSplitResponse> split = db_->AdminSplit(key);
    ASSERT_TRUE(split.has_value())
        << PrettyPrint(key) << ": " << split.error().message();
  }

  EXPECT_EQ(
      (std::vector<std::string>{
          Record(MakeMeta1Key("m"), kKeyMin, m2m),
          Record(MakeMeta1Key("r"), m2m, m2r),
          Record(MakeMeta1Key("z"), m2r, m2z),
          Record(MakeMeta1Key(kKeyMax), m2z, "a"),
          Record(MakeMeta2Key("a"), m2z, "a"),
          Record(MakeMeta2Key("m"), "a", "m"),
          Record(MakeMeta2Key("z"), "m", "z"),
          Record(MakeMeta2Key(kKeyMax), "z", kKeyMax),
      }),
      MetaRecords());

  // Every key is found in the range that contains it.
  for (const std::string& key : {std::string("b"), MakeMeta2Key("q"), m2z}) {
    Result<RangeDescriptor> range = db_->RangeLookup(key);
    ASSERT_TRUE(range.has_value()) << range.error().message();
    EXPECT_LE(range->start_key(), key);
    EXPECT_LT(key, range->end_key());
  }

  // Merge everything back in reverse order, each time naming a key of
  // the left range.
  for (const std::string& key :
       {m2m, m2m, kKeyMin, std::string("a"), std::string("a"), kKeyMin}) {
    Result<RangeDescriptor> merged = db_->AdminMerge(key);
    ASSERT_TRUE(merged.has_value())
        << PrettyPrint(key) << ": " << merged.error().message();
  }

  EXPECT_EQ(
      (std::vector<std::string>{
          Record(MakeMeta1Key(kKeyMax), kKeyMin, kKeyMax),
          Record(MakeMeta2Key(kKeyMax), kKeyMin, kKeyMax),
      }),
      MetaRecords());
}

////////////////////////////////////////////////////////////////////////

TEST_F(StoreTest, RoutesKeysPastAddressingRecords) {
  const std::string split_key = keys::kMetaMax + "y";

  Result<kv::AdminSplitResponse> split = db_->AdminSplit(split_key);
  ASSERT_TRUE(split.has_value()) << split.error().message();
  EXPECT_EQ(2, split->right().range_id());

  Result<RangeDescriptor> range = db_->RangeLookup(keys::kMetaMax + "z");
  ASSERT_TRUE(range.has_value()) << range.error().message();
  EXPECT_EQ(2, range->range_id());

  range = db_->RangeLookup(keys::kMetaMax + "a");
  ASSERT_TRUE(range.has_value()) << range.error().message();
  EXPECT_EQ(1, range->range_id());

  range = db_->RangeLookup(MakeMeta2Key("q"));
  ASSERT_TRUE(range.has_value()) << range.error().message();
  EXPECT_EQ(1, range->range_id());

  range = db_->RangeLookup("a");
  ASSERT_TRUE(range.has_value()) << range.error().message();
  EXPECT_EQ(2, range->range_id());
}

////////////////////////////////////////////////////////////////////////

TEST_F(StoreTest, PersistsAcrossReopen) {
  ASSERT_TRUE(db_->Put("a", "1").has_value());
  ASSERT_TRUE(db_->AdminSplit("m").has_value());

  Open();

  Result<std::optional<std::string>> value = db_->Get("a");
  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(std::optional<std::string>("1"), *value);

  Result<RangeDescriptor> range = db_->RangeLookup("z");
  ASSERT_TRUE(range.has_value());
  EXPECT_EQ(2, range->range_id());

  // The range ID generator survived too.
  Result<kv::AdminSplitResponse> split = db_->AdminSplit("t");
  ASSERT_TRUE(split.has_value()) << split.error().message();
  EXPECT_EQ(3, split->right().range_id());
}

////////////////////////////////////////////////////////////////////////

}  // namespace
}  // namespace rkv::storage

////////////////////////////////////////////////////////////////////////
