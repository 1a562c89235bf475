#pragma once

#include <cstdlib>
#include <string>

#include "glog/logging.h"
#include "rkv/v1alpha1/kv.pb.h"

////////////////////////////////////////////////////////////////////////

namespace rkv::kv {

////////////////////////////////////////////////////////////////////////

// Whether logging at 'verbosity' is enabled, i.e., whether
// `RANGEKV_KV_LOG_VERBOSITY` is set to at least 'verbosity'.
// Nothing gets logged while it is unset.
inline bool RangekvKVLogLevelEnabled(int verbosity) {
  static const char* variable = std::getenv("RANGEKV_KV_LOG_VERBOSITY");
  static int chosen_verbosity = variable != nullptr ? atoi(variable) : 0;
  return chosen_verbosity >= verbosity;
}

#define RANGEKV_KV_LOG(level) \
  LOG_IF(INFO, ::rkv::kv::RangekvKVLogLevelEnabled(level))

////////////////////////////////////////////////////////////////////////

using rkv::v1alpha1::Request;
using rkv::v1alpha1::Response;

////////////////////////////////////////////////////////////////////////

// Something that executes requests against the key-value store, e.g.,
// a store, a remote node, or a transaction coordinator wrapping one of
// those.
//
// Errors are reported in the header of the returned response, never
// by throwing. Implementations must be safe to call from multiple
// threads.
class KV {
 public:
  virtual ~KV() = default;

  virtual Response Execute(Request request) = 0;
};

////////////////////////////////////////////////////////////////////////

// Returns the name of the method of 'request', e.g., "get".
std::string MethodName(const Request& request);

// Whether the method of 'request' may be executed as part of a
// transaction.
bool IsTransactional(const Request& request);

// Whether the method of 'request' never mutates any data.
bool IsReadOnly(const Request& request);

////////////////////////////////////////////////////////////////////////

}  // namespace rkv::kv

////////////////////////////////////////////////////////////////////////
