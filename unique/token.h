// unique/token.h - Value type representing a process-unique opaque token
// Copyright © 2016 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#ifndef UNIQUE_TOKEN_H
#define UNIQUE_TOKEN_H

#include <cstddef>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include <vector>

#include "unique/result.h"

namespace unique {

class token_t;

token_t next_token();
Result next_tokens(std::vector<token_t>* out, std::size_t n);

}  // namespace unique

namespace std {
template <>
struct hash<unique::token_t>;
}  // namespace std

namespace unique {

// token_t is an opaque identity.  Its only observable property is whether
// it compares equal to another token_t.
//
// Tokens come into existence in exactly two ways:
// - next_token() / next_tokens() mint tokens that are unequal to every
//   other token ever minted in this process;
// - copying a token (or calling duplicate()) produces a token that is equal
//   to the original, and to all of its other copies.
//
// There is no "null" token, and no way to build a token from an integer.
// Tokens are only meaningful within the process that minted them.
class token_t {
 public:
  constexpr token_t(const token_t&) noexcept = default;
  constexpr token_t(token_t&&) noexcept = default;
  token_t& operator=(const token_t&) noexcept = default;
  token_t& operator=(token_t&&) noexcept = default;

  // Renders the token for diagnostics, as "0x" and 16 uppercase hex digits.
  // There is no way to parse this back into a token.
  void append_to(std::string* out) const;
  std::string as_string() const;

  friend constexpr bool operator==(token_t a, token_t b) noexcept {
    return a.value_ == b.value_;
  }

 private:
  friend token_t next_token();
  friend Result next_tokens(std::vector<token_t>* out, std::size_t n);
  friend struct std::hash<token_t>;

  constexpr explicit token_t(uint64_t value) noexcept : value_(value) {}

  uint64_t value_;
};

inline constexpr bool operator!=(token_t a, token_t b) noexcept {
  return !(a == b);
}

// Returns true iff |a| and |b| are copies of the same minted token.
inline constexpr bool equals(token_t a, token_t b) noexcept { return a == b; }

// Returns a token equal to |t|.  Never allocates a new identity.
inline constexpr token_t duplicate(token_t t) noexcept { return t; }

inline std::ostream& operator<<(std::ostream& os, token_t t) {
  return (os << t.as_string());
}

// Returns a new token, unequal to every other token minted in this process.
//
// Thread-safe and lock-free.  The first token minted by a process has
// identity 0.
//
// Identities are 64 bits wide: minting one token per nanosecond would take
// almost six centuries to run out.  If it ever happens, this function logs
// at FATAL level rather than reuse an identity.
token_t next_token();

// Mints |n| new tokens and appends them to |out|.
//
// The identities are reserved in a single atomic step.  On failure, |out|
// is left unchanged and no identities are consumed.
// - INVALID_ARGUMENT if |n| exceeds what |out| can ever hold
// - RESOURCE_EXHAUSTED if memory for |n| more elements cannot be allocated
// - RESOURCE_EXHAUSTED if fewer than |n| identities remain
Result next_tokens(std::vector<token_t>* out, std::size_t n);

}  // namespace unique

namespace std {
template <>
struct hash<unique::token_t> {
  std::size_t operator()(unique::token_t t) const noexcept {
    return std::hash<uint64_t>()(t.value_);
  }
};
}  // namespace std

#endif  // UNIQUE_TOKEN_H
