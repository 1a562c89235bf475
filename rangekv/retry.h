#pragma once

#include <chrono>
#include <cstdlib>
#include <functional>
#include <string>

#include "glog/logging.h"
#include "rangekv/settings.h"
#include "tl/expected.hpp"

////////////////////////////////////////////////////////////////////////

namespace rkv {

////////////////////////////////////////////////////////////////////////

// Whether logging at 'verbosity' is enabled, i.e., whether
// `RANGEKV_RETRY_LOG_VERBOSITY` is set to at least 'verbosity'.
inline bool RangekvRetryLogLevelEnabled(int verbosity) {
  static const char* variable = std::getenv("RANGEKV_RETRY_LOG_VERBOSITY");
  static int chosen_verbosity = variable != nullptr ? atoi(variable) : 0;
  return chosen_verbosity >= verbosity;
}

#define RANGEKV_RETRY_LOG(level) \
  LOG_IF(INFO, ::rkv::RangekvRetryLogLevelEnabled(level))

////////////////////////////////////////////////////////////////////////

struct RetryOptions {
  // Included in log and error messages.
  std::string tag;

  std::chrono::milliseconds backoff = kTxnRetryBackoff;
  std::chrono::milliseconds max_backoff = kTxnMaxRetryBackoff;
  double multiplier = kTxnRetryBackoffMultiplier;

  // Zero means retry indefinitely.
  int max_attempts = kTxnRetryMaxAttempts;

  // Used to wait out the backoff, overridable for tests.
  std::function<void(std::chrono::milliseconds)> sleep;
};

////////////////////////////////////////////////////////////////////////

enum class RetryStatus {
  // Stop retrying.
  kBreak,
  // Retry immediately and start over with the initial backoff.
  kReset,
  // Retry after waiting out the current backoff.
  kContinue,
};

////////////////////////////////////////////////////////////////////////

// Calls 'f' until it returns 'RetryStatus::kBreak'. Returns an error
// only if 'options.max_attempts' attempts were made without 'f'
// returning 'RetryStatus::kBreak'.
tl::expected<void, std::string> RetryWithBackoff(
    const RetryOptions& options,
    const std::function<RetryStatus()>& f);

////////////////////////////////////////////////////////////////////////

}  // namespace rkv

////////////////////////////////////////////////////////////////////////
