#include "rangekv/kv/kv.h"

////////////////////////////////////////////////////////////////////////

namespace rkv::kv {

////////////////////////////////////////////////////////////////////////

std::string MethodName(const Request& request) {
  const google::protobuf::FieldDescriptor* field =
      Request::descriptor()->FindFieldByNumber(request.method_case());
  if (field == nullptr) {
    return "unset";
  }
  return field->name();
}

////////////////////////////////////////////////////////////////////////

bool IsTransactional(const Request& request) {
  switch (request.method_case()) {
    case Request::kContains:
    case Request::kGet:
    case Request::kPut:
    case Request::kConditionalPut:
    case Request::kIncrement:
    case Request::kDeleteKey:
    case Request::kDeleteRange:
    case Request::kScan:
      return true;
    case Request::kEndTransaction:
    case Request::kBatch:
    case Request::kAdminSplit:
    case Request::kAdminMerge:
    case Request::kRangeLookup:
    case Request::METHOD_NOT_SET:
      return false;
  }
  return false;
}

////////////////////////////////////////////////////////////////////////

bool IsReadOnly(const Request& request) {
  switch (request.method_case()) {
    case Request::kContains:
    case Request::kGet:
    case Request::kScan:
    case Request::kRangeLookup:
      return true;
    default:
      return false;
  }
}

////////////////////////////////////////////////////////////////////////

}  // namespace rkv::kv

////////////////////////////////////////////////////////////////////////
