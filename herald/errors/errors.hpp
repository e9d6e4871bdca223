#pragma once

#include "herald/compose/compose.hpp"
#include "herald/culprit/culprit.hpp"
#include "herald/informant/informant.hpp"
#include "herald/types/value.hpp"
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace herald::errors {

// Binds the informant an error reports through (error by default)
struct report_as_s {
  informant::informant_c informant;
};

inline report_as_s report_as(informant::informant_c informant) {
  return report_as_s{std::move(informant)};
}

/*
    An exception that carries the same arguments an informant call takes.
    Nothing is composed until the error is rendered or reported, so a
    handler can still inspect the raw values or add culprits and codicils
    on the way up (reraise).

        throw herald::errors::error_c("file not found.",
                                      herald::opt::culprit(path));
        ...
        catch (const herald::errors::error_c &e) { e.report(); }
*/
class error_c : public std::exception {
public:
  error_c() = default;

  template <typename First, typename... Rest,
            std::enable_if_t<!(sizeof...(Rest) == 0 &&
                               std::is_base_of_v<error_c, std::decay_t<First>>),
                             int> = 0>
  explicit error_c(First &&first, Rest &&...rest) {
    auto collected = collect(std::forward<First>(first),
                             std::forward<Rest>(rest)...);
    message_ = std::move(collected.message);
    informant_ = std::move(collected.informant);
  }

  ~error_c() override = default;

  const compose::message_s &message() const { return message_; }
  const types::list_t &args() const { return message_.args; }
  const types::map_t &kwargs() const { return message_.kwargs; }
  const std::optional<informant::informant_c> &informant() const {
    return informant_;
  }

  // Named argument, or the none sentinel
  const types::value_c &get(const std::string &name) const;

  // Templates given here win over the message's own, which win over the
  // ones an error kind installs
  std::string get_message(const std::vector<std::string> &templates = {}) const;
  // "<culprit>: <message>", or just the message when there is no culprit
  std::string render(const std::vector<std::string> &templates = {}) const;

  culprit::culprit_t
  get_culprit(const types::value_c &extra = types::none()) const;
  std::vector<std::string>
  get_codicil(const std::vector<std::string> &extra = {}) const;

  const char *what() const noexcept override;

  template <typename... Ts> void report(Ts &&...overrides) const {
    report_with(collect(std::forward<Ts>(overrides)...));
  }

  // Reports and terminates, with the error status unless the bound
  // informant already terminates
  template <typename... Ts> void terminate(Ts &&...overrides) const {
    terminate_with(collect(std::forward<Ts>(overrides)...));
  }

  // Throws a copy of this error, of the same dynamic type, with the
  // overrides merged in
  template <typename... Ts> [[noreturn]] void reraise(Ts &&...overrides) const {
    reraise_with(collect(std::forward<Ts>(overrides)...));
  }

  virtual std::unique_ptr<error_c> clone() const;
  [[noreturn]] virtual void raise() const;

protected:
  // Used when the message itself carries no template
  void set_templates(std::vector<std::string> templates);

private:
  struct collected_s {
    compose::message_s message;
    std::optional<informant::informant_c> informant;
  };

  compose::message_s message_;
  std::optional<informant::informant_c> informant_;
  std::vector<std::string> templates_;
  mutable std::string what_;

  static void absorb(collected_s &into, report_as_s tag) {
    into.informant = std::move(tag.informant);
  }
  template <typename T> static void absorb(collected_s &into, T &&arg) {
    compose::apply(into.message, std::forward<T>(arg));
  }
  template <typename... Ts> static collected_s collect(Ts &&...args) {
    collected_s collected;
    (absorb(collected, std::forward<Ts>(args)), ...);
    return collected;
  }

  compose::message_s effective(const compose::message_s &overrides) const;
  void report_with(const collected_s &overrides) const;
  void terminate_with(const collected_s &overrides) const;
  [[noreturn]] void reraise_with(const collected_s &overrides) const;
};

/*
    Base for error kinds: supplies clone / raise so reraise keeps the
    derived type.

        class missing_key_c : public error_kind_c<missing_key_c> {
        public:
          explicit missing_key_c(std::string key)
              : error_kind_c(herald::kw("key", key)) {
            set_templates({"{key}: key not found."});
          }
        };
*/
template <typename Derived> class error_kind_c : public error_c {
public:
  using error_c::error_c;

  std::unique_ptr<error_c> clone() const override {
    return std::make_unique<Derived>(static_cast<const Derived &>(*this));
  }

  [[noreturn]] void raise() const override {
    throw static_cast<const Derived &>(*this);
  }
};

} // namespace herald::errors
