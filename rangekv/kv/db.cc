#include "rangekv/kv/db.h"

#include <iterator>
#include <utility>

#include "rangekv/kv/transaction.h"
#include "rangekv/kv/txn_db.h"

////////////////////////////////////////////////////////////////////////

using tl::make_unexpected;

////////////////////////////////////////////////////////////////////////

namespace rkv::kv {

////////////////////////////////////////////////////////////////////////

namespace {

Request MakeRequest(const std::string& key) {
  Request request;
  request.mutable_header()->set_key(key);
  return request;
}

Request MakeRequest(const std::string& key, const std::string& end_key) {
  Request request = MakeRequest(key);
  request.mutable_header()->set_end_key(end_key);
  return request;
}

}  // namespace

////////////////////////////////////////////////////////////////////////

DB::DB(KV* kv, hlc::Clock* clock, std::string user)
  : kv_(CHECK_NOTNULL(kv)),
    clock_(CHECK_NOTNULL(clock)),
    user_(std::move(user)) {}

////////////////////////////////////////////////////////////////////////

Response DB::Execute(Request request) {
  auto* header = request.mutable_header();
  if (header->user().empty()) {
    header->set_user(user_);
  }
  if (hlc::IsZero(header->timestamp())) {
    *header->mutable_timestamp() = clock_->Now();
  }
  // Makes resending a mutating request (e.g., by a 'RemoteKV') safe.
  if (!header->has_cmd_id() && !IsReadOnly(request)) {
    header->mutable_cmd_id()->set_wall_time(clock_->Now().wall_time());
    header->mutable_cmd_id()->set_random(RandomInt63());
  }
  return kv_->Execute(std::move(request));
}

////////////////////////////////////////////////////////////////////////

Result<Response> DB::Call(Request request) {
  Response response = Execute(std::move(request));
  if (response.header().has_error()) {
    return make_unexpected(response.header().error());
  }
  return response;
}

////////////////////////////////////////////////////////////////////////

Result<bool> DB::Contains(const std::string& key) {
  Request request = MakeRequest(key);
  request.mutable_contains();

  Result<Response> response = Call(std::move(request));
  if (!response.has_value()) {
    return make_unexpected(response.error());
  }
  return response->contains().exists();
}

////////////////////////////////////////////////////////////////////////

Result<std::optional<std::string>> DB::Get(const std::string& key) {
  Request request = MakeRequest(key);
  request.mutable_get();

  Result<Response> response = Call(std::move(request));
  if (!response.has_value()) {
    return make_unexpected(response.error());
  }

  if (!response->get().has_value()) {
    return std::optional<std::string>();
  }
  return std::optional<std::string>(response->get().value());
}

////////////////////////////////////////////////////////////////////////

Result<void> DB::Put(const std::string& key, const std::string& value) {
  Request request = MakeRequest(key);
  request.mutable_put()->set_value(value);

  Result<Response> response = Call(std::move(request));
  if (!response.has_value()) {
    return make_unexpected(response.error());
  }
  return {};
}

////////////////////////////////////////////////////////////////////////

Result<void> DB::ConditionalPut(
    const std::string& key,
    const std::string& value,
    const std::optional<std::string>& expected) {
  Request request = MakeRequest(key);
  auto* conditional_put = request.mutable_conditional_put();
  conditional_put->set_value(value);
  if (expected.has_value()) {
    conditional_put->set_expected_value(*expected);
  }

  Result<Response> response = Call(std::move(request));
  if (!response.has_value()) {
    return make_unexpected(response.error());
  }
  return {};
}

////////////////////////////////////////////////////////////////////////

Result<int64_t> DB::Increment(const std::string& key, int64_t increment) {
  Request request = MakeRequest(key);
  request.mutable_increment()->set_increment(increment);

  Result<Response> response = Call(std::move(request));
  if (!response.has_value()) {
    return make_unexpected(response.error());
  }
  return response->increment().new_value();
}

////////////////////////////////////////////////////////////////////////

Result<void> DB::Delete(const std::string& key) {
  Request request = MakeRequest(key);
  request.mutable_delete_key();

  Result<Response> response = Call(std::move(request));
  if (!response.has_value()) {
    return make_unexpected(response.error());
  }
  return {};
}

////////////////////////////////////////////////////////////////////////

Result<int64_t> DB::DeleteRange(
    const std::string& start_key,
    const std::string& end_key) {
  Request request = MakeRequest(start_key, end_key);
  request.mutable_delete_range();

  Result<Response> response = Call(std::move(request));
  if (!response.has_value()) {
    return make_unexpected(response.error());
  }
  return response->delete_range().num_deleted();
}

////////////////////////////////////////////////////////////////////////

Result<std::vector<KeyValue>> DB::Scan(
    const std::string& start_key,
    const std::string& end_key,
    int64_t max_results) {
  Request request = MakeRequest(start_key, end_key);
  request.mutable_scan()->set_max_results(max_results);

  Result<Response> response = Call(std::move(request));
  if (!response.has_value()) {
    return make_unexpected(response.error());
  }

  auto* rows = response->mutable_scan()->mutable_rows();
  return std::vector<KeyValue>(
      std::make_move_iterator(rows->begin()),
      std::make_move_iterator(rows->end()));
}

////////////////////////////////////////////////////////////////////////

Result<void> DB::Run(const Batch& batch) {
  if (batch.empty()) {
    return {};
  }

  Request request = MakeRequest(batch.request().mutations(0).key());
  *request.mutable_batch() = batch.request();

  Result<Response> response = Call(std::move(request));
  if (!response.has_value()) {
    return make_unexpected(response.error());
  }
  return {};
}

////////////////////////////////////////////////////////////////////////

Result<AdminSplitResponse> DB::AdminSplit(const std::string& key) {
  Request request = MakeRequest(key);
  request.mutable_admin_split();

  Result<Response> response = Call(std::move(request));
  if (!response.has_value()) {
    return make_unexpected(response.error());
  }
  return std::move(*response->mutable_admin_split());
}

////////////////////////////////////////////////////////////////////////

Result<RangeDescriptor> DB::AdminMerge(const std::string& key) {
  Request request = MakeRequest(key);
  request.mutable_admin_merge();

  Result<Response> response = Call(std::move(request));
  if (!response.has_value()) {
    return make_unexpected(response.error());
  }
  return response->admin_merge().merged();
}

////////////////////////////////////////////////////////////////////////

Result<RangeDescriptor> DB::RangeLookup(const std::string& key) {
  Request request = MakeRequest(key);
  request.mutable_range_lookup();

  Result<Response> response = Call(std::move(request));
  if (!response.has_value()) {
    return make_unexpected(response.error());
  }
  return response->range_lookup().range();
}

////////////////////////////////////////////////////////////////////////

Result<void> DB::RunTransaction(
    const TransactionOptions& options,
    const std::function<Result<void>(DB&)>& retryable) {
  return kv::RunTransaction(*this, options, retryable);
}

////////////////////////////////////////////////////////////////////////

}  // namespace rkv::kv

////////////////////////////////////////////////////////////////////////
