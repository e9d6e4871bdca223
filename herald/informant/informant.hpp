#pragma once

#include "herald/color/color.hpp"
#include "herald/compose/compose.hpp"
#include <functional>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace herald::session {
class informer_c;
}

namespace herald::informant {

/*
    A routing decision that is either fixed or computed from the active
    session (for example "output unless the session is muted").
*/
class predicate_c {
public:
  using fn_t = std::function<bool(const session::informer_c &)>;

  predicate_c(bool value = false) : rule_(value) {}

  template <typename F,
            std::enable_if_t<
                std::is_invocable_r_v<bool, F, const session::informer_c &> &&
                    !std::is_same_v<std::decay_t<F>, bool> &&
                    !std::is_same_v<std::decay_t<F>, predicate_c>,
                int> = 0>
  predicate_c(F fn) : rule_(fn_t(std::move(fn))) {}

  bool resolve(const session::informer_c &informer) const;

private:
  std::variant<bool, fn_t> rule_;
};

/*
    Whether dispatching ends the process. true means "exit with the
    session's error status", an integer is the literal exit status.
*/
class termination_c {
public:
  termination_c() = default;
  termination_c(bool enable) : enabled_(enable) {}
  termination_c(int status) : enabled_(true), status_(status) {}

  bool enabled() const { return enabled_; }
  bool uses_error_status() const { return enabled_ && !status_.has_value(); }
  int status() const { return status_.value_or(1); }

private:
  bool enabled_{false};
  std::optional<int> status_;
};

struct informant_s {
  std::string severity;
  bool is_error{false};
  predicate_c log{true};
  predicate_c output{true};
  predicate_c notify{false};
  termination_c terminate;
  bool is_continuation{false};
  std::optional<color::color_e> message_color;
  std::optional<color::color_e> header_color;
};

/*
    A message kind. Calling it with positional values, herald::kw named
    values and herald::opt options composes a message and dispatches it
    through the active session.

    Informants are plain values: copy one and adjust spec() to make a
    variant of it.
*/
class informant_c {
public:
  informant_c() = default;
  explicit informant_c(informant_s spec) : spec_(std::move(spec)) {}

  const informant_s &spec() const { return spec_; }
  informant_s &spec() { return spec_; }

  template <typename... Ts> void operator()(Ts &&...args) const {
    report(compose::make_message(std::forward<Ts>(args)...));
  }

  void report(const compose::message_s &msg) const;

private:
  informant_s spec_;
};

extern informant_c log;
extern informant_c comment;
extern informant_c codicil;
extern informant_c narrate;
extern informant_c display;
extern informant_c output;
extern informant_c notify;
extern informant_c debug;
extern informant_c warn;
extern informant_c error;
extern informant_c fatal;
extern informant_c panic;

// Looks a built-in informant up by name ("warn", "error", ...)
const informant_c *find(std::string_view name);

} // namespace herald::informant
