// unique/logging.h - Facility for logging error messages
// Copyright © 2016 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#ifndef UNIQUE_LOGGING_H
#define UNIQUE_LOGGING_H

#include <sys/time.h>
#include <sys/types.h>

#include <cstring>
#include <exception>
#include <memory>
#include <ostream>
#include <sstream>
#include <string>

#define LOG_LEVEL_INFO ::unique::level_t(1)
#define LOG_LEVEL_WARN ::unique::level_t(2)
#define LOG_LEVEL_ERROR ::unique::level_t(3)
#define LOG_LEVEL_DFATAL ::unique::level_t(4)
#define LOG_LEVEL_FATAL ::unique::level_t(5)
#define LOG_LEVEL(name) LOG_LEVEL_##name
#define VLOG_LEVEL(vlevel) ::unique::level_t(-(vlevel))

#define LOG(name) ::unique::Logger(__FILE__, __LINE__, LOG_LEVEL(name))
#define VLOG(vlevel) ::unique::Logger(__FILE__, __LINE__, VLOG_LEVEL(vlevel))

#define CHECK(x) ::unique::internal::log_check(__FILE__, __LINE__, #x, !!(x))
#define CHECK_OK(x) \
  ::unique::internal::log_check_ok(__FILE__, __LINE__, #x, (x))

#define CHECK_OP(op, x, y)                                                \
  ::unique::internal::log_check_op(__FILE__, __LINE__,                    \
                                   ::unique::internal::op(), #x, (x), #y, \
                                   (y))
#define CHECK_EQ(x, y) CHECK_OP(OpEQ, x, y)
#define CHECK_NE(x, y) CHECK_OP(OpNE, x, y)
#define CHECK_LT(x, y) CHECK_OP(OpLT, x, y)
#define CHECK_LE(x, y) CHECK_OP(OpLE, x, y)
#define CHECK_GT(x, y) CHECK_OP(OpGT, x, y)
#define CHECK_GE(x, y) CHECK_OP(OpGE, x, y)

#define CHECK_NOTNULL(ptr) \
  ::unique::internal::log_check_notnull(__FILE__, __LINE__, #ptr, (ptr))

namespace unique {

class Result;  // forward declaration

// level_t is the severity of a log message.
// Positive values are named levels; VLOG(n) logs at level -n.
class level_t {
 public:
  constexpr level_t() noexcept : value_(0) {}
  explicit constexpr level_t(signed char value) noexcept : value_(value) {}
  explicit constexpr operator signed char() const noexcept { return value_; }

 private:
  signed char value_;
};

inline constexpr bool operator==(level_t a, level_t b) noexcept {
  return static_cast<signed char>(a) == static_cast<signed char>(b);
}
inline constexpr bool operator!=(level_t a, level_t b) noexcept {
  return !(a == b);
}
inline constexpr bool operator<(level_t a, level_t b) noexcept {
  return static_cast<signed char>(a) < static_cast<signed char>(b);
}
inline constexpr bool operator>(level_t a, level_t b) noexcept {
  return (b < a);
}
inline constexpr bool operator<=(level_t a, level_t b) noexcept {
  return !(b < a);
}
inline constexpr bool operator>=(level_t a, level_t b) noexcept {
  return !(a < b);
}

// LogEntry represents a single log message.
struct LogEntry {
  struct timeval time;
  pid_t tid;
  const char* file;
  unsigned int line;
  level_t level;
  std::string message;

  LogEntry() noexcept : tid(0), file(nullptr), line(0) {
    ::memset(&time, 0, sizeof(time));
  }

  // Stamps the entry with the current time and thread ID.
  LogEntry(const char* file, unsigned int line, level_t level,
           std::string message) noexcept;

  explicit operator bool() const noexcept {
    return file != nullptr && line != 0;
  }

  // "[IWEFD]<mm><dd> <hh>:<mm>:<ss>.<uuuuuu>  <tid> <file>:<line>] <message>"
  void append_to(std::string* out) const;
  std::string as_string() const;
};

// Logger collects a single log message to be output.
// The message is logged when the Logger is destroyed.
class Logger {
 private:
  using BasicManip = std::ostream& (*)(std::ostream&);

 public:
  // A default-constructed Logger discards everything.
  Logger() : file_(nullptr), line_(0), level_(), ss_() {}

  Logger(const char* file, unsigned int line, level_t level);

  ~Logger() noexcept(false);

  // Logger is move-only.
  Logger(const Logger&) = delete;
  Logger(Logger&&) noexcept = default;
  Logger& operator=(const Logger&) = delete;
  Logger& operator=(Logger&&) noexcept = default;

  const char* file() const noexcept { return file_; }
  unsigned int line() const noexcept { return line_; }
  level_t level() const noexcept { return level_; }

  explicit operator bool() const noexcept { return !!ss_; }

  std::string message() const {
    if (ss_) return ss_->str();
    return std::string();
  }

  template <typename T>
  Logger& operator<<(const T& obj) {
    if (ss_) (*ss_) << obj;
    return *this;
  }

  Logger& operator<<(BasicManip obj) {
    if (ss_) (*ss_) << obj;
    return *this;
  }

  // Returns the LogEntry produced so far by this Logger.
  LogEntry entry() const {
    if (ss_) return LogEntry(file_, line_, level_, ss_->str());
    return LogEntry();
  }

 private:
  const char* file_;
  unsigned int line_;
  level_t level_;
  std::unique_ptr<std::ostringstream> ss_;
};

// LogTarget is a destination for log messages.
class LogTarget {
 protected:
  LogTarget() noexcept = default;

 public:
  virtual ~LogTarget() noexcept = default;
  virtual bool want(const char* file, unsigned int line,
                    level_t level) const = 0;
  virtual void log(const LogEntry& entry) = 0;
  virtual void flush() = 0;
};

// Returns true if a LogEntry with this metadata would be interesting.
bool want(const char* file, unsigned int line, level_t level);

// Logs a single LogEntry.  Terminates the process if the entry is FATAL, or
// if it is DFATAL and debug() is true.
void log(const LogEntry& entry);

// Flushes all log targets.
void log_flush();

// Set the threshold for automatic flushing.
void log_flush_set_level(level_t level);

// Set the threshold for logging to STDERR.
void log_stderr_set_level(level_t level);

// Debug mode makes DFATAL behave like FATAL.
// Defaults to true unless NDEBUG is defined.
bool debug() noexcept;
void set_debug(bool value) noexcept;

// Low-level functions for routing logs {{{

void log_target_add(LogTarget* target);
void log_target_remove(LogTarget* target);

// }}}
// Functions for mocking in tests {{{

using GetTidFunc = pid_t (*)();
using GetTimeOfDayFunc = int (*)(struct timeval*, struct timezone*);

void log_set_gettid(GetTidFunc func);
void log_set_gettimeofday(GetTimeOfDayFunc func);

// }}}

namespace internal {

Logger log_check(const char* file, unsigned int line, const char* expr,
                 bool cond);

Logger log_check_ok(const char* file, unsigned int line, const char* expr,
                    const Result& rslt);

template <typename T, typename U, typename Predicate>
Logger log_check_op(const char* file, unsigned int line, Predicate pred,
                    const char* lhsexpr, const T& lhs, const char* rhsexpr,
                    const U& rhs) {
  if (pred(lhs, rhs)) return Logger();
  const char* op = pred.name();
  Logger logger(file, line, LOG_LEVEL_DFATAL);
  logger << "CHECK FAILED: " << lhsexpr << " " << op << " " << rhsexpr << " "
         << "[" << lhs << " " << op << " " << rhs << "]";
  return logger;
}

struct OpEQ {
  template <typename T, typename U>
  bool operator()(const T& lhs, const U& rhs) const {
    return (lhs == rhs);
  }
  const char* name() const { return "=="; }
};
struct OpNE {
  template <typename T, typename U>
  bool operator()(const T& lhs, const U& rhs) const {
    return !(lhs == rhs);
  }
  const char* name() const { return "!="; }
};
struct OpLT {
  template <typename T, typename U>
  bool operator()(const T& lhs, const U& rhs) const {
    return (lhs < rhs);
  }
  const char* name() const { return "<"; }
};
struct OpGT {
  template <typename T, typename U>
  bool operator()(const T& lhs, const U& rhs) const {
    return (rhs < lhs);
  }
  const char* name() const { return ">"; }
};
struct OpLE {
  template <typename T, typename U>
  bool operator()(const T& lhs, const U& rhs) const {
    return !(rhs < lhs);
  }
  const char* name() const { return "<="; }
};
struct OpGE {
  template <typename T, typename U>
  bool operator()(const T& lhs, const U& rhs) const {
    return !(lhs < rhs);
  }
  const char* name() const { return ">="; }
};

// Logs at FATAL, so it never returns.
[[noreturn]] void log_null_pointer(const char* file, unsigned int line,
                                   const char* expr);

template <typename T>
T* log_check_notnull(const char* file, unsigned int line, const char* expr,
                     T* ptr) {
  if (!ptr) log_null_pointer(file, line, expr);
  return ptr;
}

}  // namespace internal

inline Logger::~Logger() noexcept(false) {
  if (ss_) log(entry());
}

}  // namespace unique

#endif  // UNIQUE_LOGGING_H
