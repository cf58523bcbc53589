// unique/result.h - Value type representing operation success or failure
// Copyright © 2016 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#ifndef UNIQUE_RESULT_H
#define UNIQUE_RESULT_H

#include <cstdint>
#include <memory>
#include <ostream>
#include <string>

#include "unique/concat.h"

namespace unique {

// ResultCode denotes the type of success/failure that a Result represents.
enum class ResultCode : uint8_t {
  // Success.
  OK = 0x00,

  // The operation failed because of an argument that doesn't make sense.
  INVALID_ARGUMENT = 0x01,

  // The operation failed because a finite resource ran out.
  // For example: no unused token identities remain.
  RESOURCE_EXHAUSTED = 0x02,
};

// Returns the string representation of a ResultCode.
const std::string& resultcode_name(ResultCode code) noexcept;

inline std::ostream& operator<<(std::ostream& os, ResultCode code) {
  return (os << resultcode_name(code));
}

namespace internal {
struct ResultRep {
  ResultCode code;
  std::string message;

  ResultRep(ResultCode code, std::string message) noexcept
      : code(code),
        message(std::move(message)) {}
};

const std::string& empty_string() noexcept;
}  // namespace internal

// Result represents the success or failure of an operation.
// Failures are further categorized by the type of failure.
//
// A successful Result holds no allocation; failures share an immutable
// representation, so copying a Result is cheap.
class Result {
 public:
  using Code = ResultCode;

  static const std::string& code_name(Code code) noexcept {
    return resultcode_name(code);
  }

 private:
  using Rep = internal::ResultRep;
  using RepPtr = std::shared_ptr<const Rep>;

  static RepPtr make(Code code, std::string message);

 public:
  // Constructors for fixed Code values {{{

  template <typename... Args>
  static Result invalid_argument(const Args&... args) {
    return Result(Code::INVALID_ARGUMENT, concat(args...));
  }

  template <typename... Args>
  static Result resource_exhausted(const Args&... args) {
    return Result(Code::RESOURCE_EXHAUSTED, concat(args...));
  }

  // }}}

  // Result is default constructible, copyable, and moveable.
  // The default-constructed value has code OK and message "".
  Result() noexcept = default;
  Result(const Result&) noexcept = default;
  Result(Result&&) noexcept = default;
  Result& operator=(const Result&) noexcept = default;
  Result& operator=(Result&&) noexcept = default;

  Result(Code code, std::string message = std::string())
      : rep_(make(code, std::move(message))) {}

  void swap(Result& other) noexcept { rep_.swap(other.rep_); }

  // Checks if the Result was successful.
  explicit operator bool() const noexcept { return !rep_; }

  // Returns the Code for this Result.
  Code code() const noexcept {
    if (rep_) return rep_->code;
    return Code::OK;
  }

  // Returns the message associated with this Result.
  const std::string& message() const noexcept {
    if (rep_) return rep_->message;
    return internal::empty_string();
  }

  // Stringifies this Result into a human-friendly form.
  // For example: "RESOURCE_EXHAUSTED(2): no identities remain"
  std::string as_string() const;
  void append_to(std::string* out) const;

 private:
  RepPtr rep_;
};

inline void swap(Result& a, Result& b) noexcept { a.swap(b); }

inline std::ostream& operator<<(std::ostream& os, const Result& arg) {
  return (os << arg.as_string());
}

}  // namespace unique

#endif  // UNIQUE_RESULT_H
