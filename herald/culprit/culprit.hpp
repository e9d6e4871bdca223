#pragma once

#include "herald/types/value.hpp"
#include <string>
#include <string_view>

namespace herald::culprit {

using culprit_t = types::list_t;

// A list contributes its elements, none contributes nothing, anything else
// is a single entry.
culprit_t flatten(const types::value_c &value);

// Joins the rendered entries with sep, skipping none entries
std::string join(const culprit_t &culprit, std::string_view sep = ", ");

/*
    The culprit entries of one session. set / add hand back what they
    displaced so the caller can put it back; culprit_guard_c does that
    automatically when it leaves scope.
*/
class culprit_stack_c {
public:
  const culprit_t &entries() const { return entries_; }

  // The stacked entries followed by whatever `extra` flattens to
  culprit_t get(const types::value_c &extra = types::none()) const;

  culprit_t replace(const types::value_c &culprit);
  culprit_t append(const types::value_c &culprit);
  void restore(culprit_t previous);

private:
  culprit_t entries_;
};

class [[nodiscard]] culprit_guard_c {
public:
  culprit_guard_c(culprit_stack_c &stack, culprit_t previous);
  ~culprit_guard_c();

  culprit_guard_c(const culprit_guard_c &) = delete;
  culprit_guard_c(culprit_guard_c &&) = delete;
  culprit_guard_c &operator=(const culprit_guard_c &) = delete;
  culprit_guard_c &operator=(culprit_guard_c &&) = delete;

private:
  culprit_stack_c &stack_;
  culprit_t previous_;
};

} // namespace herald::culprit
