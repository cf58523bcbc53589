// Copyright © 2016 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#include "unique/token.h"

#include <array>
#include <cinttypes>
#include <cstdio>
#include <new>
#include <stdexcept>

#include "unique/counter.h"
#include "unique/logging.h"

namespace unique {

void token_t::append_to(std::string* out) const {
  std::array<char, 19> buf;
  ::snprintf(buf.data(), buf.size(), "0x%016" PRIX64, value_);
  out->append(buf.data(), buf.size() - 1);
}

std::string token_t::as_string() const {
  std::string out;
  append_to(&out);
  return out;
}

token_t next_token() {
  return token_t(internal::take_one(internal::process_counter()));
}

Result next_tokens(std::vector<token_t>* out, std::size_t n) {
  CHECK_NOTNULL(out);
  if (n > out->max_size() - out->size()) {
    return Result::invalid_argument("unique::next_tokens: cannot hold ", n,
                                    " more tokens");
  }
  try {
    out->reserve(out->size() + n);
  } catch (const std::bad_alloc&) {
    return Result::resource_exhausted("unique::next_tokens: cannot allocate ",
                                      n, " more tokens");
  } catch (const std::length_error&) {
    return Result::invalid_argument("unique::next_tokens: cannot hold ", n,
                                    " more tokens");
  }

  uint64_t first = 0;
  auto result = internal::process_counter().reserve(n, &first);
  if (!result) return result;
  for (std::size_t i = 0; i < n; ++i) {
    out->push_back(token_t(first + i));
  }
  return result;
}

}  // namespace unique
