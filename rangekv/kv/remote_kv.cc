#include "rangekv/kv/remote_kv.h"

#include "fmt/format.h"
#include "grpcpp/client_context.h"
#include "rangekv/kv/errors.h"
#include "rangekv/settings.h"

////////////////////////////////////////////////////////////////////////

namespace rkv::kv {

////////////////////////////////////////////////////////////////////////

RetryOptions DefaultRemoteKVRetryOptions() {
  RetryOptions options;
  options.tag = "sending request to node";
  options.backoff = kRemoteKVBackoff;
  options.max_backoff = kRemoteKVMaxBackoff;
  options.max_attempts = kRemoteKVMaxAttempts;
  return options;
}

////////////////////////////////////////////////////////////////////////

RemoteKV::RemoteKV(
    std::shared_ptr<grpc::Channel> channel,
    RetryOptions retry_options)
  : stub_(rkv::v1alpha1::Node::NewStub(channel)),
    retry_options_(std::move(retry_options)) {}

////////////////////////////////////////////////////////////////////////

Response RemoteKV::Execute(Request request) {
  Response response;
  grpc::Status status;

  tl::expected<void, std::string> retry = RetryWithBackoff(
      retry_options_,
      [&]() {
        grpc::ClientContext context;
        response.Clear();
        status = stub_->Execute(&context, request, &response);

        if (status.error_code() == grpc::StatusCode::UNAVAILABLE) {
          RANGEKV_KV_LOG(1) << "Node unavailable for " << MethodName(request)
                            << ": " << status.error_message();
          return RetryStatus::kContinue;
        }

        return RetryStatus::kBreak;
      });

  if (!retry.has_value() || !status.ok()) {
    return MakeErrorResponse(
        MakeError(
            fmt::format(
                "Failed to execute '{}' on node: {}{}",
                MethodName(request),
                status.error_message(),
                retry.has_value() ? "" : fmt::format(" ({})", retry.error()))));
  }

  return response;
}

////////////////////////////////////////////////////////////////////////

}  // namespace rkv::kv

////////////////////////////////////////////////////////////////////////
