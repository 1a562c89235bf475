#pragma once

#include <cstdint>
#include <string>

#include "rangekv/hlc.h"
#include "rkv/v1alpha1/data.pb.h"

////////////////////////////////////////////////////////////////////////

namespace rkv::kv {

////////////////////////////////////////////////////////////////////////

using rkv::v1alpha1::IsolationType;
using rkv::v1alpha1::Transaction;

////////////////////////////////////////////////////////////////////////

// Returns a priority derived from 'user_priority'. A negative
// 'user_priority' is used verbatim (negated) so callers can pick an
// exact priority, otherwise the priority is random and scaled by
// 'user_priority' so higher user priorities tend to win conflicts.
int32_t MakePriority(int32_t user_priority);

// Raises the priority of 'txn' to 'priority' unless it is already
// higher. Priorities never decrease.
void UpgradePriority(Transaction& txn, int32_t priority);

// Returns a new pending transaction anchored at 'key' with a timestamp
// from 'clock'.
Transaction NewTransaction(
    const std::string& key,
    int32_t user_priority,
    IsolationType isolation,
    hlc::Clock& clock);

// Returns a random 63-bit number, e.g., for idempotency tokens.
int64_t RandomInt63();

////////////////////////////////////////////////////////////////////////

}  // namespace rkv::kv

////////////////////////////////////////////////////////////////////////
