#pragma once

#include <string_view>

#include "google/protobuf/message.h"
#include "rkv/v1alpha1/kv.pb.h"

////////////////////////////////////////////////////////////////////////

namespace rkv::kv {

////////////////////////////////////////////////////////////////////////

// Collects puts and deletes to be applied atomically, see 'DB::Run()'.
class Batch final {
 public:
  void Put(std::string_view key, std::string_view value);

  // Puts the serialized 'message'.
  void Put(std::string_view key, const google::protobuf::Message& message);

  void Delete(std::string_view key);

  bool empty() const {
    return request_.mutations().empty();
  }

  int size() const {
    return request_.mutations_size();
  }

  const rkv::v1alpha1::BatchRequest& request() const {
    return request_;
  }

 private:
  rkv::v1alpha1::BatchRequest request_;
};

////////////////////////////////////////////////////////////////////////

}  // namespace rkv::kv

////////////////////////////////////////////////////////////////////////
