// Copyright © 2016 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#include "unique/result.h"

#include <map>

using Code = unique::ResultCode;
using Rep = unique::internal::ResultRep;
using RepPtr = std::shared_ptr<const Rep>;

namespace unique {

namespace {

static const std::map<Code, std::string>& name_map() {
  static const auto& ref = *new std::map<Code, std::string>{
#define MAP(x) {Code::x, #x}
      MAP(OK),
      MAP(INVALID_ARGUMENT),
      MAP(RESOURCE_EXHAUSTED),
#undef MAP
  };
  return ref;
}

// Shared Reps for failures without a message.
static const std::map<Code, RepPtr>& memo_map() {
  static const auto& ref = *new std::map<Code, RepPtr>{
#define MAP(x) {Code::x, std::make_shared<const Rep>(Code::x, std::string())}
      MAP(INVALID_ARGUMENT),
      MAP(RESOURCE_EXHAUSTED),
#undef MAP
  };
  return ref;
}

}  // anonymous namespace

namespace internal {
const std::string& empty_string() noexcept {
  static const auto& ref = *new std::string;
  return ref;
}
}  // namespace internal

const std::string& resultcode_name(Code code) noexcept {
  const auto& map = name_map();
  auto it = map.find(code);
  if (it != map.end()) return it->second;
  return internal::empty_string();
}

RepPtr Result::make(Code code, std::string message) {
  if (code == Code::OK) return nullptr;
  if (message.empty()) {
    const auto& map = memo_map();
    auto it = map.find(code);
    if (it != map.end()) return it->second;
  }
  return std::make_shared<const Rep>(code, std::move(message));
}

void Result::append_to(std::string* out) const {
  if (!rep_) {
    out->append("OK(0)");
    return;
  }
  concat_to(out, code_name(rep_->code), '(',
            static_cast<unsigned int>(rep_->code), ')');
  if (!rep_->message.empty()) concat_to(out, ": ", rep_->message);
}

std::string Result::as_string() const {
  std::string out;
  append_to(&out);
  return out;
}

}  // namespace unique
