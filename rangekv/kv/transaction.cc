#include "rangekv/kv/transaction.h"

#include <algorithm>
#include <limits>

#include "absl/random/random.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_replace.h"
#include "stout/uuid.h"

////////////////////////////////////////////////////////////////////////

using id::UUID;

////////////////////////////////////////////////////////////////////////

namespace rkv::kv {

////////////////////////////////////////////////////////////////////////

namespace {

// 'absl::BitGen' is not thread safe, give each thread its own.
absl::BitGen& ThreadLocalBitGen() {
  thread_local absl::BitGen bitgen;
  return bitgen;
}

}  // namespace

////////////////////////////////////////////////////////////////////////

int64_t RandomInt63() {
  return absl::Uniform<int64_t>(
      ThreadLocalBitGen(),
      0,
      std::numeric_limits<int64_t>::max());
}

////////////////////////////////////////////////////////////////////////

int32_t MakePriority(int32_t user_priority) {
  if (user_priority < 0) {
    if (user_priority == std::numeric_limits<int32_t>::min()) {
      return std::numeric_limits<int32_t>::max();
    }
    return -user_priority;
  }

  int64_t priority =
      absl::Uniform<int64_t>(absl::IntervalClosed, ThreadLocalBitGen(), 1, 0xffff)
      * std::max<int64_t>(user_priority, 1);

  return static_cast<int32_t>(
      std::min<int64_t>(priority, std::numeric_limits<int32_t>::max()));
}

////////////////////////////////////////////////////////////////////////

void UpgradePriority(Transaction& txn, int32_t priority) {
  if (priority > txn.priority()) {
    txn.set_priority(priority);
  }
}

////////////////////////////////////////////////////////////////////////

Transaction NewTransaction(
    const std::string& key,
    int32_t user_priority,
    IsolationType isolation,
    hlc::Clock& clock) {
  Transaction txn;
  txn.set_key(key);
  // NOTE: prefixing with the anchor key makes IDs easier to debug.
  txn.set_id(
      absl::StrCat(
          key,
          absl::StrReplaceAll(UUID::random().toString(), {{"-", ""}})));
  txn.set_priority(MakePriority(user_priority));
  txn.set_isolation(isolation);
  txn.set_status(rkv::v1alpha1::PENDING);
  txn.set_epoch(0);
  *txn.mutable_timestamp() = clock.Now();
  return txn;
}

////////////////////////////////////////////////////////////////////////

}  // namespace rkv::kv

////////////////////////////////////////////////////////////////////////
