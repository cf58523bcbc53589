// Copyright © 2016 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#include "unique/counter.h"

#include "unique/logging.h"

namespace unique {
namespace internal {

constexpr uint64_t Counter::kLimit;

Result Counter::reserve(uint64_t n, uint64_t* first) {
  CHECK_NOTNULL(first);
  uint64_t cur = next_.load(std::memory_order_relaxed);
  do {
    if (n > kLimit - cur) {
      return Result::resource_exhausted("token identities exhausted: ",
                                        kLimit - cur, " remaining, ", n,
                                        " requested");
    }
    if (n == 0) break;
  } while (!next_.compare_exchange_weak(cur, cur + n,
                                        std::memory_order_relaxed,
                                        std::memory_order_relaxed));
  *first = cur;
  return Result();
}

uint64_t take_one(Counter& counter) {
  uint64_t value = 0;
  auto result = counter.reserve(1, &value);
  if (!result) LOG(FATAL) << "unique::next_token: " << result;
  return value;
}

// Constant-initialized, so it is ready before any static constructor runs.
static Counter g_counter(0);

Counter& process_counter() noexcept { return g_counter; }

}  // namespace internal
}  // namespace unique
