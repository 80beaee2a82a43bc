#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace dedup::sync {

/*
  Counting semaphore bounding in-flight upstream fetches.
*/
class FetchLimiter {
 public:
  explicit FetchLimiter(std::size_t permits);

  // blocking wait
  void Acquire();

  void Release();

 private:
  std::mutex              mutex_;
  std::condition_variable cv_;
  std::size_t             available_;
};

// Holds one permit for its lifetime.
class FetchPermit {
 public:
  explicit FetchPermit(FetchLimiter& limiter) : limiter_(limiter) {
    limiter_.Acquire();
  }
  ~FetchPermit() {
    limiter_.Release();
  }

  FetchPermit(const FetchPermit&)            = delete;
  FetchPermit& operator=(const FetchPermit&) = delete;

 private:
  FetchLimiter& limiter_;
};

} // namespace dedup::sync
