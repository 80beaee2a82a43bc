#include "fetch_limiter.hpp"

#include <algorithm>

namespace dedup::sync {

FetchLimiter::FetchLimiter(std::size_t permits) : available_(std::max<std::size_t>(permits, 1)) {
}

void FetchLimiter::Acquire() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return available_ > 0; });
  --available_;
}

void FetchLimiter::Release() {
  {
    std::lock_guard lock(mutex_);
    ++available_;
  }
  cv_.notify_one();
}

} // namespace dedup::sync
