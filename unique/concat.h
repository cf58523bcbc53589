// unique/concat.h - Concatenate strings and stringable objects
// Copyright © 2016 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#ifndef UNIQUE_CONCAT_H
#define UNIQUE_CONCAT_H

#include <sstream>
#include <string>
#include <type_traits>
#include <utility>

namespace unique {
namespace internal {

// has_append_to<T>::value is true iff |T| has a member function
// "void append_to(std::string*) const".
template <typename T>
struct has_append_to {
 private:
  template <typename U>
  static auto check(U*) -> typename std::is_void<decltype(
      std::declval<const U&>().append_to(std::declval<std::string*>()))>::type;
  template <typename>
  static std::false_type check(...);

 public:
  static constexpr bool value = decltype(check<T>(nullptr))::value;
};

// Appenders {{{

inline void append_one(std::string* out, const std::string& arg) {
  out->append(arg);
}

inline void append_one(std::string* out, const char* arg) { out->append(arg); }

inline void append_one(std::string* out, char arg) { out->push_back(arg); }

template <typename T>
typename std::enable_if<has_append_to<T>::value>::type append_one(
    std::string* out, const T& arg) {
  arg.append_to(out);
}

// Anything else goes through its operator<<.
template <typename T>
typename std::enable_if<!has_append_to<T>::value>::type append_one(
    std::string* out, const T& arg) {
  std::ostringstream os;
  os << std::boolalpha << arg;
  out->append(os.str());
}

// }}}

inline void concat_each(std::string*) {}

template <typename T, typename... Rest>
void concat_each(std::string* out, const T& first, const Rest&... rest) {
  append_one(out, first);
  concat_each(out, rest...);
}

}  // namespace internal

// concat_to stringifies each of |args| and appends them to |out|.
//
// An argument is stringified by its append_to(std::string*) member if it has
// one, or else by its operator<<.  Booleans render as "true" / "false".
template <typename... Args>
void concat_to(std::string* out, const Args&... args) {
  internal::concat_each(out, args...);
}

// concat stringifies each of |args| and returns the concatenation.
//
// Typical usage:
//    std::string msg = unique::concat("reserved ", n, " of ", total);
//
template <typename... Args>
std::string concat(const Args&... args) {
  std::string out;
  concat_to(&out, args...);
  return out;
}

}  // namespace unique

#endif  // UNIQUE_CONCAT_H
