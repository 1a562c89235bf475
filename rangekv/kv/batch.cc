#include "rangekv/kv/batch.h"

#include <string>

#include "glog/logging.h"

////////////////////////////////////////////////////////////////////////

namespace rkv::kv {

////////////////////////////////////////////////////////////////////////

void Batch::Put(std::string_view key, std::string_view value) {
  rkv::v1alpha1::Mutation* mutation = request_.add_mutations();
  mutation->set_key(std::string(key));
  mutation->set_value(std::string(value));
}

////////////////////////////////////////////////////////////////////////

void Batch::Put(
    std::string_view key,
    const google::protobuf::Message& message) {
  std::string value;
  CHECK(message.SerializeToString(&value))
      << "Failed to serialize " << message.ShortDebugString();
  Put(key, value);
}

////////////////////////////////////////////////////////////////////////

void Batch::Delete(std::string_view key) {
  rkv::v1alpha1::Mutation* mutation = request_.add_mutations();
  mutation->set_key(std::string(key));
  mutation->set_deletion(true);
}

////////////////////////////////////////////////////////////////////////

}  // namespace rkv::kv

////////////////////////////////////////////////////////////////////////
