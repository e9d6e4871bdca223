#include "herald/culprit/culprit.hpp"

namespace herald::culprit {

culprit_t flatten(const types::value_c &value) {
  if (value.is_none()) {
    return {};
  }
  if (value.is_list()) {
    return value.as_list();
  }
  return {value};
}

std::string join(const culprit_t &culprit, std::string_view sep) {
  std::string result;
  bool first = true;
  for (const auto &entry : culprit) {
    if (entry.is_none()) {
      continue;
    }
    if (!first) {
      result += sep;
    }
    first = false;
    result += entry.to_string();
  }
  return result;
}

culprit_t culprit_stack_c::get(const types::value_c &extra) const {
  culprit_t result = entries_;
  for (auto &entry : flatten(extra)) {
    result.push_back(std::move(entry));
  }
  return result;
}

culprit_t culprit_stack_c::replace(const types::value_c &culprit) {
  culprit_t previous = entries_;
  entries_ = flatten(culprit);
  return previous;
}

culprit_t culprit_stack_c::append(const types::value_c &culprit) {
  culprit_t previous = entries_;
  for (auto &entry : flatten(culprit)) {
    entries_.push_back(std::move(entry));
  }
  return previous;
}

void culprit_stack_c::restore(culprit_t previous) {
  entries_ = std::move(previous);
}

culprit_guard_c::culprit_guard_c(culprit_stack_c &stack, culprit_t previous)
    : stack_(stack), previous_(std::move(previous)) {}

culprit_guard_c::~culprit_guard_c() { stack_.restore(std::move(previous_)); }

} // namespace herald::culprit
