// Copyright © 2016 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#include "unique/logging.h"

#include <sys/syscall.h>
#include <sys/time.h>
#include <sys/types.h>
#include <time.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <atomic>
#include <cstdio>
#include <mutex>
#include <vector>

#include "unique/concat.h"
#include "unique/result.h"

namespace unique {

static pid_t my_gettid() { return syscall(SYS_gettid); }

static int my_gettimeofday(struct timeval* tv, struct timezone*) {
  return ::gettimeofday(tv, nullptr);
}

static constexpr bool kDebugDefault =
#ifdef NDEBUG
    false
#else
    true
#endif
    ;

namespace {

using Lock = std::unique_lock<std::mutex>;
using Vec = std::vector<LogTarget*>;

std::atomic_bool g_debug(kDebugDefault);
std::mutex g_mu;
level_t g_flush = LOG_LEVEL_ERROR;          // protected by g_mu
level_t g_stderr = LOG_LEVEL_INFO;          // protected by g_mu
GetTidFunc g_gtid = my_gettid;              // protected by g_mu
GetTimeOfDayFunc g_gtod = my_gettimeofday;  // protected by g_mu

// Short writes are retried; a failed write drops the rest of the line.
void write_stderr(const std::string& str) {
  std::size_t done = 0;
  while (done < str.size()) {
    ssize_t n = ::write(2, str.data() + done, str.size() - done);
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) break;
    done += n;
  }
}

class LogSTDERR : public LogTarget {
 public:
  LogSTDERR() noexcept = default;
  bool want(const char* file, unsigned int line, level_t level) const override {
    // g_mu held by unique::want()
    return level >= g_stderr;
  }
  void log(const LogEntry& entry) override {
    // g_mu held by unique::log()
    write_stderr(entry.as_string());
  }
  void flush() override { ::fdatasync(2); }
};

// Never destroyed.
Vec& targets() {
  static Vec& ref = *new Vec{new LogSTDERR};
  return ref;
}

// Exceptions thrown by a target are reported on STDERR and otherwise ignored.
template <typename F>
void ignore_target_error(F func) {
  try {
    func();
  } catch (const std::exception& e) {
    write_stderr(concat("log target failed: ", e.what(), "\n"));
  }
}

void maybe_terminate(const LogEntry& entry) {
  if (entry.level >= LOG_LEVEL_FATAL) std::terminate();
  if (entry.level >= LOG_LEVEL_DFATAL && debug()) std::terminate();
}

}  // anonymous namespace

LogEntry::LogEntry(const char* file, unsigned int line, level_t level,
                   std::string message) noexcept : file(file),
                                                   line(line),
                                                   level(level),
                                                   message(std::move(message)) {
  Lock lock(g_mu);
  ::memset(&time, 0, sizeof(time));
  (*g_gtod)(&time, nullptr);
  tid = (*g_gtid)();
}

void LogEntry::append_to(std::string* out) const {
  char ch;
  if (level >= LOG_LEVEL_DFATAL) {
    ch = 'F';
  } else if (level >= LOG_LEVEL_ERROR) {
    ch = 'E';
  } else if (level >= LOG_LEVEL_WARN) {
    ch = 'W';
  } else if (level >= LOG_LEVEL_INFO) {
    ch = 'I';
  } else {
    ch = 'D';
  }

  struct tm tm;
  ::gmtime_r(&time.tv_sec, &tm);

  std::array<char, 32> buf;
  ::snprintf(buf.data(), buf.size(), "%c%02d%02d %02d:%02d:%02d.%06ld  ", ch,
             tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec,
             static_cast<long>(time.tv_usec));

  concat_to(out, buf.data(), tid, ' ', file, ':', line, "] ", message, '\n');
}

std::string LogEntry::as_string() const {
  std::string out;
  append_to(&out);
  return out;
}

static std::unique_ptr<std::ostringstream> make_ss(const char* file,
                                                   unsigned int line,
                                                   level_t level) {
  if (file == nullptr) std::terminate();
  if (line == 0) std::terminate();

  std::unique_ptr<std::ostringstream> ptr;
  if (want(file, line, level)) ptr.reset(new std::ostringstream);
  return ptr;
}

Logger::Logger(const char* file, unsigned int line, level_t level)
    : file_(file), line_(line), level_(level), ss_(make_ss(file, line, level)) {}

bool want(const char* file, unsigned int line, level_t level) {
  if (level >= LOG_LEVEL_DFATAL) return true;
  Lock lock(g_mu);
  bool result = false;
  for (const LogTarget* target : targets()) {
    ignore_target_error([file, line, level, target, &result] {
      result = target->want(file, line, level);
    });
    if (result) break;
  }
  return result;
}

void log(const LogEntry& entry) {
  {
    Lock lock(g_mu);
    if (entry) {
      for (LogTarget* target : targets()) {
        ignore_target_error([&entry, target] {
          if (target->want(entry.file, entry.line, entry.level)) {
            target->log(entry);
          }
        });
      }
    }
    if (entry.level >= g_flush) {
      for (LogTarget* target : targets()) {
        ignore_target_error([target] { target->flush(); });
      }
    }
  }
  maybe_terminate(entry);
}

void log_flush() {
  Lock lock(g_mu);
  for (LogTarget* target : targets()) {
    ignore_target_error([target] { target->flush(); });
  }
}

void log_flush_set_level(level_t level) {
  Lock lock(g_mu);
  g_flush = level;
}

void log_stderr_set_level(level_t level) {
  Lock lock(g_mu);
  g_stderr = level;
}

bool debug() noexcept { return g_debug.load(std::memory_order_relaxed); }

void set_debug(bool value) noexcept {
  g_debug.store(value, std::memory_order_relaxed);
}

void log_target_add(LogTarget* target) {
  Lock lock(g_mu);
  targets().push_back(target);
}

void log_target_remove(LogTarget* target) {
  Lock lock(g_mu);
  auto& v = targets();
  for (auto it = v.begin(), end = v.end(); it != end; ++it) {
    if (*it == target) {
      v.erase(it);
      break;
    }
  }
}

void log_set_gettid(GetTidFunc func) {
  Lock lock(g_mu);
  g_gtid = func ? func : my_gettid;
}

void log_set_gettimeofday(GetTimeOfDayFunc func) {
  Lock lock(g_mu);
  g_gtod = func ? func : my_gettimeofday;
}

namespace internal {

Logger log_check(const char* file, unsigned int line, const char* expr,
                 bool cond) {
  if (cond) return Logger();
  Logger logger(file, line, LOG_LEVEL_DFATAL);
  logger << "CHECK FAILED: " << expr;
  return logger;
}

Logger log_check_ok(const char* file, unsigned int line, const char* expr,
                    const Result& rslt) {
  if (rslt) return Logger();
  Logger logger(file, line, LOG_LEVEL_DFATAL);
  logger << "CHECK FAILED: " << expr << ": " << rslt.as_string();
  return logger;
}

void log_null_pointer(const char* file, unsigned int line, const char* expr) {
  {
    Logger logger(file, line, LOG_LEVEL_FATAL);
    logger << "CHECK FAILED: " << expr << " != nullptr";
  }
  std::terminate();
}

}  // namespace internal

}  // namespace unique
