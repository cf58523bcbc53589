// unique/counter.h - Lock-free allocator of token identity values
// Copyright © 2016 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#ifndef UNIQUE_COUNTER_H
#define UNIQUE_COUNTER_H

#include <atomic>
#include <cstdint>
#include <limits>

#include "unique/result.h"

namespace unique {
namespace internal {

// Counter hands out 64-bit identity values in increasing order.
//
// Every value is handed out at most once.  Values in [first, kLimit) are
// available; kLimit itself is never handed out, and once the counter
// reaches it every reservation fails with RESOURCE_EXHAUSTED.  The counter
// never wraps around.
//
// Counter is safe to use from any number of threads without locking.
class Counter {
 public:
  static constexpr uint64_t kLimit = std::numeric_limits<uint64_t>::max();

  constexpr explicit Counter(uint64_t first) noexcept : next_(first) {}

  // Counters are neither copyable nor moveable.
  Counter(const Counter&) = delete;
  Counter(Counter&&) = delete;
  Counter& operator=(const Counter&) = delete;
  Counter& operator=(Counter&&) = delete;

  // Atomically reserves the |n| values [*first, *first + n).
  // - If fewer than |n| values remain, returns RESOURCE_EXHAUSTED and
  //   reserves nothing.
  // - Reserving 0 values always succeeds and leaves the counter unchanged.
  Result reserve(uint64_t n, uint64_t* first);

 private:
  std::atomic<uint64_t> next_;
};

// Reserves a single value from |counter|.
// If none remain, logs at FATAL level and does not return.
uint64_t take_one(Counter& counter);

// Returns the process-wide counter that backs unique::next_token().
// It starts at 0 and is never reset.
Counter& process_counter() noexcept;

}  // namespace internal
}  // namespace unique

#endif  // UNIQUE_COUNTER_H
