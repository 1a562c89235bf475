#include "rangekv/kv/txn_db.h"

#include <gtest/gtest.h>

#include <chrono>
#include <vector>

#include "tests/rangekv/kv/fake_kv.h"

////////////////////////////////////////////////////////////////////////

namespace rkv::kv {
namespace {

////////////////////////////////////////////////////////////////////////

Response Success(const Request& request) {
  Response response;
  *response.mutable_header()->mutable_timestamp() =
      request.header().timestamp();
  if (request.has_end_transaction()) {
    Transaction txn = request.header().txn();
    txn.set_status(
        request.end_transaction().commit() ? rkv::v1alpha1::COMMITTED
                                           : rkv::v1alpha1::ABORTED);
    *response.mutable_end_transaction()->mutable_txn() = txn;
  }
  return response;
}

std::vector<Request> EndTransactions(const std::vector<Request>& requests) {
  std::vector<Request> ends;
  for (const Request& request : requests) {
    if (request.has_end_transaction()) {
      ends.push_back(request);
    }
  }
  return ends;
}

////////////////////////////////////////////////////////////////////////

class TxnDBTest : public ::testing::Test {
 protected:
  TransactionOptions MakeOptions() {
    TransactionOptions options;
    options.user_priority = -10;
    options.retry_options.sleep = [](std::chrono::milliseconds) {};
    return options;
  }

  hlc::Clock clock_;
};

////////////////////////////////////////////////////////////////////////

TEST_F(TxnDBTest, CommitsOnSuccess) {
  FakeKV kv(Success);
  DB db(&kv, &clock_, "bob");

  int runs = 0;
  Result<void> result = db.RunTransaction(
      MakeOptions(),
      [&](DB& txn) -> Result<void> {
        runs++;
        return txn.Put("a", "1");
      });

  ASSERT_TRUE(result.has_value()) << result.error().message();
  EXPECT_EQ(1, runs);

  std::vector<Request> requests = kv.requests();
  ASSERT_EQ(2u, requests.size());
  EXPECT_TRUE(requests[0].has_put());
  EXPECT_EQ("bob", requests[0].header().user());
  ASSERT_TRUE(requests[1].has_end_transaction());
  EXPECT_TRUE(requests[1].end_transaction().commit());
  EXPECT_EQ("bob", requests[1].header().user());
  EXPECT_EQ(requests[0].header().txn().id(), requests[1].header().txn().id());
}

////////////////////////////////////////////////////////////////////////

TEST_F(TxnDBTest, CommitsWithoutRequests) {
  FakeKV kv(Success);
  DB db(&kv, &clock_, "bob");

  Result<void> result = db.RunTransaction(
      MakeOptions(),
      [](DB&) -> Result<void> { return {}; });

  EXPECT_TRUE(result.has_value());
  EXPECT_TRUE(kv.requests().empty());
}

////////////////////////////////////////////////////////////////////////

TEST_F(TxnDBTest, RunsAgainOnOrderingConflict) {
  int puts = 0;
  FakeKV kv([&](const Request& request) {
    if (request.has_put() && puts++ == 0) {
      Transaction txn = request.header().txn();
      *txn.mutable_timestamp() = hlc::Next(txn.timestamp());
      return MakeErrorResponse(MakeTransactionRetryError(txn));
    }
    return Success(request);
  });

  DB db(&kv, &clock_, "bob");

  int runs = 0;
  Result<void> result = db.RunTransaction(
      MakeOptions(),
      [&](DB& txn) -> Result<void> {
        runs++;
        return txn.Put("a", "1");
      });

  ASSERT_TRUE(result.has_value()) << result.error().message();
  EXPECT_EQ(2, runs);

  std::vector<Request> requests = kv.requests();
  ASSERT_EQ(3u, requests.size());

  // Same transaction, next epoch.
  EXPECT_EQ(requests[0].header().txn().id(), requests[1].header().txn().id());
  EXPECT_EQ(0u, requests[0].header().txn().epoch());
  EXPECT_EQ(1u, requests[1].header().txn().epoch());

  ASSERT_TRUE(requests[2].has_end_transaction());
  EXPECT_TRUE(requests[2].end_transaction().commit());
  EXPECT_EQ(1u, requests[2].header().txn().epoch());
}

////////////////////////////////////////////////////////////////////////

TEST_F(TxnDBTest, RunsAgainOnAbortedConflict) {
  int puts = 0;
  FakeKV kv([&](const Request& request) {
    if (request.has_put() && puts++ == 0) {
      Transaction txn = request.header().txn();
      txn.set_status(rkv::v1alpha1::ABORTED);
      return MakeErrorResponse(MakeTransactionAbortedError(txn));
    }
    return Success(request);
  });

  DB db(&kv, &clock_, "bob");

  int runs = 0;
  Result<void> result = db.RunTransaction(
      MakeOptions(),
      [&](DB& txn) -> Result<void> {
        runs++;
        return txn.Put("a", "1");
      });

  ASSERT_TRUE(result.has_value()) << result.error().message();
  EXPECT_EQ(2, runs);

  std::vector<Request> requests = kv.requests();
  ASSERT_EQ(3u, requests.size());

  // A new transaction anchored at the same key.
  EXPECT_NE(requests[0].header().txn().id(), requests[1].header().txn().id());
  EXPECT_EQ("a", requests[1].header().txn().key());
  EXPECT_EQ(requests[1].header().txn().id(), requests[2].header().txn().id());
}

////////////////////////////////////////////////////////////////////////

TEST_F(TxnDBTest, AbortsOnOtherError) {
  FakeKV kv(Success);
  DB db(&kv, &clock_, "bob");

  int runs = 0;
  Result<void> result = db.RunTransaction(
      MakeOptions(),
      [&](DB& txn) -> Result<void> {
        runs++;
        Result<void> put = txn.Put("a", "1");
        if (!put.has_value()) {
          return put;
        }
        return tl::make_unexpected(MakeError("oops"));
      });

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ("oops", result.error().message());
  EXPECT_EQ(1, runs);

  std::vector<Request> ends = EndTransactions(kv.requests());
  ASSERT_EQ(1u, ends.size());
  EXPECT_FALSE(ends[0].end_transaction().commit());
}

////////////////////////////////////////////////////////////////////////

TEST_F(TxnDBTest, ReportsFailedAbort) {
  FakeKV kv([](const Request& request) {
    if (request.has_end_transaction()) {
      return MakeErrorResponse(MakeError("boom"));
    }
    return Success(request);
  });

  DB db(&kv, &clock_, "bob");

  Result<void> result = db.RunTransaction(
      MakeOptions(),
      [](DB& txn) -> Result<void> {
        Result<void> put = txn.Put("a", "1");
        if (!put.has_value()) {
          return put;
        }
        return tl::make_unexpected(MakeConditionFailedError("x"));
      });

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(
      "after error Unexpected value 'x'; failed abort: boom",
      result.error().message());

  // The detail of the original error is preserved.
  ASSERT_TRUE(result.error().has_condition_failed());
  EXPECT_EQ("x", result.error().condition_failed().actual_value());
}

////////////////////////////////////////////////////////////////////////

TEST_F(TxnDBTest, ReturnsCommitError) {
  FakeKV kv([](const Request& request) {
    if (request.has_end_transaction()) {
      return MakeErrorResponse(
          MakeTransactionRetryError(request.header().txn()));
    }
    return Success(request);
  });

  DB db(&kv, &clock_, "bob");

  int runs = 0;
  Result<void> result = db.RunTransaction(
      MakeOptions(),
      [&](DB& txn) -> Result<void> {
        runs++;
        return txn.Put("a", "1");
      });

  ASSERT_FALSE(result.has_value());
  EXPECT_TRUE(result.error().has_transaction_retry());
  EXPECT_EQ(1, runs);
}

////////////////////////////////////////////////////////////////////////

TEST_F(TxnDBTest, RejectsAdminSplitWithinTransaction) {
  FakeKV kv(Success);
  DB db(&kv, &clock_, "bob");

  Result<void> result = db.RunTransaction(
      MakeOptions(),
      [](DB& txn) -> Result<void> {
        Result<AdminSplitResponse> split = txn.AdminSplit("m");
        if (!split.has_value()) {
          return tl::make_unexpected(split.error());
        }
        return {};
      });

  ASSERT_FALSE(result.has_value());
  EXPECT_TRUE(result.error().has_non_transactional_operation());
  EXPECT_TRUE(kv.requests().empty());
}

////////////////////////////////////////////////////////////////////////

}  // namespace
}  // namespace rkv::kv

////////////////////////////////////////////////////////////////////////
