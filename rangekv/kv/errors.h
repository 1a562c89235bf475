#pragma once

#include <optional>
#include <string>
#include <variant>

#include "rkv/v1alpha1/data.pb.h"
#include "rkv/v1alpha1/kv.pb.h"
#include "tl/expected.hpp"

////////////////////////////////////////////////////////////////////////

namespace rkv::kv {

////////////////////////////////////////////////////////////////////////

using rkv::v1alpha1::Error;
using rkv::v1alpha1::RangeDescriptor;
using rkv::v1alpha1::Response;
using rkv::v1alpha1::Transaction;

template <class T>
using Result = tl::expected<T, Error>;

////////////////////////////////////////////////////////////////////////

Error MakeError(std::string message);

Error MakeWriteIntentError(
    const std::string& key,
    const Transaction& txn,
    bool resolved);

Error MakeTransactionRetryError(const Transaction& txn);

Error MakeTransactionAbortedError(const Transaction& txn);

Error MakeTransactionClosedError();

Error MakeNonTransactionalOperationError(const std::string& method);

Error MakeMeta1SplitError(const RangeDescriptor& desc);

Error MakeConditionFailedError(const std::optional<std::string>& actual);

// Returns an error reporting that aborting after 'error' failed with
// 'abort_error'. The detail of 'error' is preserved.
Error MakeAbortFailedError(const Error& error, const Error& abort_error);

////////////////////////////////////////////////////////////////////////

// Returns a response that carries 'error' and nothing else.
Response MakeErrorResponse(Error error);

////////////////////////////////////////////////////////////////////////

// Classification of the error of a response from the perspective of a
// transaction coordinator.
struct WriteIntentConflict {
  bool resolved = false;
  // Owner of the intent.
  Transaction txn;
};

struct OrderingConflict {
  Transaction txn;
};

struct AbortedConflict {
  Transaction txn;
};

// Success, or any error that is not a transaction conflict.
struct Other {};

using Conflict = std::
    variant<Other, WriteIntentConflict, OrderingConflict, AbortedConflict>;

Conflict ClassifyConflict(const Response& response);

// Whether 'error' requires the logic of a transaction to be run again,
// i.e., it is an ordering or aborted transaction conflict.
bool IsTransactionRestartError(const Error& error);

////////////////////////////////////////////////////////////////////////

}  // namespace rkv::kv

////////////////////////////////////////////////////////////////////////
