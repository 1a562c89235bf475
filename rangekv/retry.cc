#include "rangekv/retry.h"

#include <algorithm>
#include <thread>

#include "fmt/format.h"

////////////////////////////////////////////////////////////////////////

namespace rkv {

////////////////////////////////////////////////////////////////////////

tl::expected<void, std::string> RetryWithBackoff(
    const RetryOptions& options,
    const std::function<RetryStatus()>& f) {
  CHECK_GE(options.multiplier, 1) << "Backoff must not shrink";

  std::chrono::milliseconds backoff = options.backoff;

  for (int attempt = 1;; attempt++) {
    RetryStatus status = f();

    if (status == RetryStatus::kBreak) {
      return {};
    }

    if (options.max_attempts > 0 && attempt >= options.max_attempts) {
      return tl::make_unexpected(
          fmt::format(
              "{} failed after {} attempts",
              options.tag.empty() ? "retry" : options.tag,
              attempt));
    }

    if (status == RetryStatus::kReset) {
      backoff = options.backoff;
      continue;
    }

    CHECK(status == RetryStatus::kContinue);

    RANGEKV_RETRY_LOG(2) << options.tag << ": attempt " << attempt
                         << " failed; retrying in " << backoff.count()
                         << "ms";

    if (options.sleep) {
      options.sleep(backoff);
    } else {
      std::this_thread::sleep_for(backoff);
    }

    backoff = std::min(
        options.max_backoff,
        std::chrono::milliseconds(static_cast<int64_t>(
            backoff.count() * options.multiplier)));
  }
}

////////////////////////////////////////////////////////////////////////

}  // namespace rkv

////////////////////////////////////////////////////////////////////////
