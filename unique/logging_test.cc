// Copyright © 2016 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#include "gtest/gtest.h"

#include <string>

#include "re2/re2.h"
#include "unique/logging.h"
#include "unique/result.h"
#include "unique/token.h"

static pid_t my_gettid() { return 42; }

static int my_gettimeofday(struct timeval* tv, struct timezone* unused) {
  // Mon 2006 Jan 02 15:04:05.123456 -0700
  tv->tv_sec = 1136239445;
  tv->tv_usec = 123456;
  return 0;
}

namespace {
class LogCapture : public unique::LogTarget {
 public:
  explicit LogCapture(std::string* out) noexcept : out_(out), flushes_(0) {}

  bool want(const char* file, unsigned int line,
            unique::level_t level) const override {
    return level >= LOG_LEVEL_INFO;
  }

  // Called with the logging mutex held.
  void log(const unique::LogEntry& entry) override { entry.append_to(out_); }

  void flush() override { ++flushes_; }

  std::string* string() noexcept { return out_; }
  int flushes() const noexcept { return flushes_; }

 private:
  std::string* const out_;
  int flushes_;
};
}  // anonymous namespace

static void setup(LogCapture* target) {
  unique::log_set_gettid(my_gettid);
  unique::log_set_gettimeofday(my_gettimeofday);
  unique::log_target_add(target);
}

static void teardown(LogCapture* target) {
  unique::log_target_remove(target);
  unique::log_set_gettid(nullptr);
  unique::log_set_gettimeofday(nullptr);
  RE2::GlobalReplace(target->string(),
                     "\\S*(unique/logging_test\\.cc):[0-9]+\\] ", "\\1:XX] ");
}

TEST(LoggerDeathTest, EndToEnd) {
  std::string data;
  LogCapture target(&data);
  setup(&target);

  VLOG(0) << "who cares?";
  LOG(INFO) << "hello";
  LOG(WARN) << "uh oh";
  LOG(ERROR) << "oh no!";
  EXPECT_DEATH(LOG(FATAL) << "aaaah!", "aaaah!");

  teardown(&target);

  // The FATAL entry was logged by the death test's child process.
  std::string expected(
      "I0102 22:04:05.123456  42 unique/logging_test.cc:XX] hello\n"
      "W0102 22:04:05.123456  42 unique/logging_test.cc:XX] uh oh\n"
      "E0102 22:04:05.123456  42 unique/logging_test.cc:XX] oh no!\n");
  EXPECT_EQ(expected, data);
}

TEST(Logger, Tokens) {
  std::string data;
  LogCapture target(&data);
  setup(&target);

  unique::token_t t = unique::next_token();
  LOG(INFO) << "minted " << t;

  teardown(&target);

  EXPECT_TRUE(RE2::FullMatch(
      data,
      "I0102 22:04:05\\.123456  42 unique/logging_test\\.cc:XX\\] "
      "minted 0x[0-9A-F]{16}\n"))
      << data;
  EXPECT_NE(std::string::npos, data.find(t.as_string()));
}

TEST(Logger, Flush) {
  std::string data;
  LogCapture target(&data);
  setup(&target);

  LOG(INFO) << "no flush";
  EXPECT_EQ(0, target.flushes());
  LOG(ERROR) << "flush";
  EXPECT_EQ(1, target.flushes());

  unique::log_flush_set_level(LOG_LEVEL_WARN);
  LOG(WARN) << "flush";
  EXPECT_EQ(2, target.flushes());
  unique::log_flush_set_level(LOG_LEVEL_ERROR);

  unique::log_flush();
  EXPECT_EQ(3, target.flushes());

  teardown(&target);
}

TEST(Logger, StderrLevel) {
  EXPECT_TRUE(unique::want(__FILE__, __LINE__, LOG_LEVEL_INFO));
  EXPECT_FALSE(unique::want(__FILE__, __LINE__, VLOG_LEVEL(1)));

  unique::log_stderr_set_level(LOG_LEVEL_ERROR);
  EXPECT_FALSE(unique::want(__FILE__, __LINE__, LOG_LEVEL_WARN));
  EXPECT_TRUE(unique::want(__FILE__, __LINE__, LOG_LEVEL_ERROR));
  EXPECT_TRUE(unique::want(__FILE__, __LINE__, LOG_LEVEL_FATAL));

  unique::log_stderr_set_level(LOG_LEVEL_INFO);
  EXPECT_TRUE(unique::want(__FILE__, __LINE__, LOG_LEVEL_INFO));
}

TEST(Logger, Discarded) {
  unique::Logger logger;
  EXPECT_FALSE(logger);
  logger << "ignored";
  EXPECT_EQ("", logger.message());
  EXPECT_FALSE(logger.entry());
}

TEST(Check, Correct) {
  CHECK(true) << ": not used";
  CHECK_NE(0, 1) << ": not used";
  CHECK_LT(2, 3) << ": not used";
  CHECK_LE(2, 3) << ": not used";
  CHECK_LE(3, 3) << ": not used";
  CHECK_EQ(3, 3) << ": not used";
  CHECK_GE(3, 3) << ": not used";
  CHECK_GE(5, 3) << ": not used";
  CHECK_GT(5, 3) << ": not used";
  CHECK_OK(unique::Result()) << ": not used";

  unique::token_t t = unique::next_token();
  CHECK_EQ(t, unique::duplicate(t)) << ": not used";
  CHECK_NE(t, unique::next_token()) << ": not used";

  int x = 0;
  int* p = &x;
  EXPECT_EQ(p, CHECK_NOTNULL(p));
}

TEST(CheckDeathTest, Wrong) {
  unique::set_debug(true);

  const int p = 1, q = 2, r = 3, s = 5;

  EXPECT_DEATH(CHECK(false) << ": error #0", "CHECK FAILED: false: error #0");
  EXPECT_DEATH(CHECK_NE(p, p) << ": error #1", "p != p \\[1 != 1\\]");
  EXPECT_DEATH(CHECK_LE(s, r) << ": error #2", "s <= r \\[5 <= 3\\]");
  EXPECT_DEATH(CHECK_LT(s, r) << ": error #3", "s < r \\[5 < 3\\]");
  EXPECT_DEATH(CHECK_LT(r, r) << ": error #4", "error #4");
  EXPECT_DEATH(CHECK_EQ(p, r) << ": error #5", "p == r \\[1 == 3\\]");
  EXPECT_DEATH(CHECK_GT(r, r) << ": error #6", "error #6");
  EXPECT_DEATH(CHECK_GT(q, r) << ": error #7", "q > r \\[2 > 3\\]");
  EXPECT_DEATH(CHECK_GE(q, r) << ": error #8", "q >= r \\[2 >= 3\\]");
  EXPECT_DEATH(CHECK_OK(unique::Result::invalid_argument("bad")),
               "INVALID_ARGUMENT\\(1\\): bad");

  unique::token_t a = unique::next_token();
  unique::token_t b = unique::next_token();
  EXPECT_DEATH(CHECK_EQ(a, b), "a == b \\[0x[0-9A-F]{16} == 0x[0-9A-F]{16}\\]");
}

TEST(CheckDeathTest, NullPointer) {
  unique::set_debug(false);
  int* ptr = nullptr;
  EXPECT_DEATH(CHECK_NOTNULL(ptr), "CHECK FAILED: ptr != nullptr");
  unique::set_debug(true);
}

TEST(Check, WrongNDEBUG) {
  std::string data;
  LogCapture target(&data);
  setup(&target);
  unique::set_debug(false);

  const int p = 1, r = 3;
  EXPECT_NO_THROW(CHECK(false) << ": error #0");
  EXPECT_NO_THROW(CHECK_EQ(p, r) << ": error #1");
  EXPECT_NO_THROW(LOG(DFATAL) << "error #2");

  unique::set_debug(true);
  teardown(&target);

  std::string expected(
      "F0102 22:04:05.123456  42 unique/logging_test.cc:XX] "
      "CHECK FAILED: false: error #0\n"
      "F0102 22:04:05.123456  42 unique/logging_test.cc:XX] "
      "CHECK FAILED: p == r [1 == 3]: error #1\n"
      "F0102 22:04:05.123456  42 unique/logging_test.cc:XX] error #2\n");
  EXPECT_EQ(expected, data);
}
