#pragma once

#include <cstdlib>
#include <filesystem>
#include <memory>
#include <string>

#include "glog/logging.h"
#include "grpcpp/channel.h"
#include "grpcpp/server.h"
#include "grpcpp/support/channel_arguments.h"
#include "rangekv/storage/store.h"
#include "rkv/v1alpha1/kv.grpc.pb.h"
#include "tl/expected.hpp"

////////////////////////////////////////////////////////////////////////

namespace rkv::server {

////////////////////////////////////////////////////////////////////////

// Whether logging at 'verbosity' is enabled, i.e., whether
// `RANGEKV_NODE_LOG_VERBOSITY` is set to at least 'verbosity'.
// Nothing gets logged while it is unset.
inline bool RangekvNodeLogLevelEnabled(int verbosity) {
  static const char* variable = std::getenv("RANGEKV_NODE_LOG_VERBOSITY");
  static int chosen_verbosity = variable != nullptr ? atoi(variable) : 0;
  return chosen_verbosity >= verbosity;
}

#define RANGEKV_NODE_LOG(level) \
  LOG_IF(INFO, ::rkv::server::RangekvNodeLogLevelEnabled(level))

////////////////////////////////////////////////////////////////////////

// NOTE: there are two distinct "node" types: 'NodeService' and
// 'NodeServer'.
//
// 'NodeService' is the implementation of the gRPC service which
// executes every request against a 'Store'.
//
// 'NodeServer' is the combination of both the instantiated
// 'NodeService' and a gRPC server.

////////////////////////////////////////////////////////////////////////

class NodeService final : public rkv::v1alpha1::Node::Service {
 public:
  static tl::expected<std::unique_ptr<NodeService>, std::string> Instantiate(
      const std::filesystem::path& state_directory);

  grpc::Status Execute(
      grpc::ServerContext* context,
      const rkv::v1alpha1::Request* request,
      rkv::v1alpha1::Response* response) override;

 private:
  explicit NodeService(std::unique_ptr<storage::Store>&& store)
    : store_(std::move(store)) {}

  std::unique_ptr<storage::Store> store_;
};

////////////////////////////////////////////////////////////////////////

// Abstraction for encapsulating and running a node including the
// necessary gRPC server.
class NodeServer final {
 public:
  static tl::expected<std::unique_ptr<NodeServer>, std::string> Instantiate(
      const std::filesystem::path& state_directory,
      std::string address = "127.0.0.1:0");

  ~NodeServer() {
    Shutdown();
    Wait();
  }

  void Shutdown() {
    if (server_) {
      RANGEKV_NODE_LOG(1) << "Shutting down node gRPC server at " << address_;
      server_->Shutdown();
    }
  }

  void Wait() {
    if (server_) {
      RANGEKV_NODE_LOG(1) << "Waiting for node gRPC server at " << address_;
      server_->Wait();
      RANGEKV_NODE_LOG(1) << "Waited for node gRPC server at " << address_;
      server_.reset();
      service_.reset();
    }
  }

  auto InProcessChannel(const grpc::ChannelArguments& arguments) {
    return server_->InProcessChannel(arguments);
  }

  const std::string& address() const {
    return address_;
  }

 private:
  NodeServer(
      std::unique_ptr<NodeService>&& service,
      std::unique_ptr<grpc::Server>&& server,
      const std::string& address)
    : service_(std::move(service)),
      server_(std::move(server)),
      address_(address) {}

  std::unique_ptr<NodeService> service_;
  std::unique_ptr<grpc::Server> server_;
  const std::string address_;
};

////////////////////////////////////////////////////////////////////////

}  // namespace rkv::server

////////////////////////////////////////////////////////////////////////
