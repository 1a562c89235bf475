#include "rangekv/server/node.h"

#include <optional>

#include "absl/strings/match.h"
#include "absl/strings/strip.h"
#include "fmt/format.h"
#include "grpcpp/security/server_credentials.h"
#include "grpcpp/server_builder.h"
#include "rangekv/settings.h"

////////////////////////////////////////////////////////////////////////

template <class T, class E = std::string>
using expected = tl::expected<T, E>;

using tl::make_unexpected;

////////////////////////////////////////////////////////////////////////

namespace rkv::server {

////////////////////////////////////////////////////////////////////////

expected<std::unique_ptr<NodeService>> NodeService::Instantiate(
    const std::filesystem::path& state_directory) {
  expected<std::unique_ptr<storage::Store>> store =
      storage::Store::Instantiate(state_directory);

  if (!store.has_value()) {
    return make_unexpected(store.error());
  }

  return std::unique_ptr<NodeService>(new NodeService(std::move(*store)));
}

////////////////////////////////////////////////////////////////////////

grpc::Status NodeService::Execute(
    grpc::ServerContext* context,
    const rkv::v1alpha1::Request* request,
    rkv::v1alpha1::Response* response) {
  RANGEKV_NODE_LOG(2) << "Execute { " << request->ShortDebugString() << " }";

  // NOTE: errors from executing the request are part of the
  // response, the RPC itself always succeeds.
  *response = store_->Execute(*request);

  return grpc::Status::OK;
}

////////////////////////////////////////////////////////////////////////

expected<std::unique_ptr<NodeServer>> NodeServer::Instantiate(
    const std::filesystem::path& state_directory,
    std::string address) {
  grpc::ServerBuilder builder;

  builder.SetMaxReceiveMessageSize(kMaxNodeGrpcMessageSize);
  builder.SetMaxSendMessageSize(kMaxNodeGrpcMessageSize);

  std::optional<int> port;

  if (absl::EndsWith(address, ":0")) {
    port = 0;
    builder.AddListeningPort(
        address,
        grpc::InsecureServerCredentials(),
        &*port);
  } else {
    builder.AddListeningPort(address, grpc::InsecureServerCredentials());
  }

  expected<std::unique_ptr<NodeService>> service =
      NodeService::Instantiate(state_directory);

  if (!service.has_value()) {
    return make_unexpected(
        fmt::format("Failed to instantiate node service: {}", service.error()));
  }

  builder.RegisterService(service->get());

  std::unique_ptr<grpc::Server> server(builder.BuildAndStart());

  if (!server) {
    return make_unexpected(
        fmt::format("Failed to start gRPC server on {}", address));
  }

  // The port picked for ":0" is only known once the server started.
  if (port.has_value()) {
    address = fmt::format("{}:{}", absl::StripSuffix(address, ":0"), *port);
  }

  RANGEKV_NODE_LOG(1) << "node gRPC server listening on " << address;

  return std::unique_ptr<NodeServer>(new NodeServer(
      std::move(service.value()),
      std::move(server),
      address));
}

////////////////////////////////////////////////////////////////////////

}  // namespace rkv::server

////////////////////////////////////////////////////////////////////////
