#include "rangekv/server/node.h"

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "grpcpp/create_channel.h"
#include "grpcpp/security/credentials.h"
#include "rangekv/kv/db.h"
#include "rangekv/kv/remote_kv.h"
#include "rangekv/kv/txn_db.h"
#include "stout/uuid.h"

////////////////////////////////////////////////////////////////////////

using id::UUID;

using rkv::kv::DB;
using rkv::kv::RemoteKV;
using rkv::kv::Result;
using rkv::kv::TransactionOptions;

////////////////////////////////////////////////////////////////////////

namespace rkv::server {
namespace {

////////////////////////////////////////////////////////////////////////

class NodeTest : public ::testing::Test {
 protected:
  void SetUp() override {
    state_directory_ = std::filesystem::path(::testing::TempDir())
        / ("rangekv-node-" + UUID::random().toString());

    tl::expected<std::unique_ptr<NodeServer>, std::string> server =
        NodeServer::Instantiate(state_directory_);
    ASSERT_TRUE(server.has_value()) << server.error();
    server_ = std::move(*server);
  }

  void TearDown() override {
    server_.reset();
    std::filesystem::remove_all(state_directory_);
  }

  std::filesystem::path state_directory_;
  hlc::Clock clock_;
  std::unique_ptr<NodeServer> server_;
};

////////////////////////////////////////////////////////////////////////

TEST_F(NodeTest, ExecutesOverNetwork) {
  EXPECT_NE(":0", server_->address().substr(server_->address().size() - 2));

  RemoteKV kv(
      grpc::CreateChannel(
          server_->address(),
          grpc::InsecureChannelCredentials()));

  DB db(&kv, &clock_, "root");

  ASSERT_TRUE(db.Put("a", "1").has_value());

  Result<std::optional<std::string>> value = db.Get("a");
  ASSERT_TRUE(value.has_value()) << value.error().message();
  EXPECT_EQ(std::optional<std::string>("1"), *value);

  // Errors of the store come back as errors, not RPC failures.
  Result<void> put = db.ConditionalPut("a", "2", std::nullopt);
  ASSERT_FALSE(put.has_value());
  EXPECT_TRUE(put.error().has_condition_failed());
}

////////////////////////////////////////////////////////////////////////

TEST_F(NodeTest, RunsTransactionInProcess) {
  RemoteKV kv(server_->InProcessChannel(grpc::ChannelArguments()));

  DB db(&kv, &clock_, "root");

  TransactionOptions options;
  options.user_priority = -10;

  Result<void> result = db.RunTransaction(
      options,
      [](DB& txn) -> Result<void> {
        Result<int64_t> n = txn.Increment("n", 1);
        if (!n.has_value()) {
          return tl::make_unexpected(n.error());
        }
        return txn.Put("copy", std::to_string(*n));
      });

  ASSERT_TRUE(result.has_value()) << result.error().message();

  Result<std::optional<std::string>> value = db.Get("copy");
  ASSERT_TRUE(value.has_value()) << value.error().message();
  EXPECT_EQ(std::optional<std::string>("1"), *value);

  value = db.Get("n");
  ASSERT_TRUE(value.has_value()) << value.error().message();
  EXPECT_EQ(std::optional<std::string>("1"), *value);
}

////////////////////////////////////////////////////////////////////////

TEST_F(NodeTest, ReportsUnreachableNode) {
  const std::string address = server_->address();
  server_->Shutdown();
  server_->Wait();

  rkv::RetryOptions retry_options = kv::DefaultRemoteKVRetryOptions();
  retry_options.max_attempts = 2;
  retry_options.sleep = [](std::chrono::milliseconds) {};

  RemoteKV kv(
      grpc::CreateChannel(address, grpc::InsecureChannelCredentials()),
      retry_options);

  DB db(&kv, &clock_, "root");

  Result<std::optional<std::string>> value = db.Get("a");
  ASSERT_FALSE(value.has_value());
  EXPECT_NE(
      std::string::npos,
      value.error().message().find("Failed to execute 'get' on node"));
}

////////////////////////////////////////////////////////////////////////

}  // namespace
}  // namespace rkv::server

////////////////////////////////////////////////////////////////////////
