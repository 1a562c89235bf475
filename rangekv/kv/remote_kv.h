#pragma once

#include <memory>
#include <string>

#include "grpcpp/channel.h"
#include "rangekv/kv/kv.h"
#include "rangekv/retry.h"
#include "rkv/v1alpha1/kv.grpc.pb.h"

////////////////////////////////////////////////////////////////////////

namespace rkv::kv {

////////////////////////////////////////////////////////////////////////

// Returns the options 'RemoteKV' uses by default.
RetryOptions DefaultRemoteKVRetryOptions();

////////////////////////////////////////////////////////////////////////

// A KV that executes requests on a node via gRPC.
//
// A request for which the node is unavailable is sent again as is,
// i.e., with the same 'ClientCmdID', so that it won't be applied more
// than once. Any other RPC failure is returned as an error.
class RemoteKV final : public KV {
 public:
  explicit RemoteKV(
      std::shared_ptr<grpc::Channel> channel,
      RetryOptions retry_options = DefaultRemoteKVRetryOptions());

  Response Execute(Request request) override;

 private:
  std::unique_ptr<rkv::v1alpha1::Node::Stub> stub_;
  const RetryOptions retry_options_;
};

////////////////////////////////////////////////////////////////////////

}  // namespace rkv::kv

////////////////////////////////////////////////////////////////////////
