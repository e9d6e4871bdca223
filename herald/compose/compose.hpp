#pragma once

#include "herald/compose/template.hpp"
#include "herald/culprit/culprit.hpp"
#include "herald/text/text.hpp"
#include "herald/types/value.hpp"
#include <initializer_list>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace herald::compose {

/*
    Everything one informant call (or one exception) carries: the positional
    and named arguments plus the per-call options. Unset options fall back to
    the defaults of whoever composes the message.
*/
struct message_s {
  types::list_t args;
  types::map_t kwargs;

  std::optional<std::string> sep;
  std::optional<std::string> end;
  std::vector<std::string> templates;
  std::optional<remove_policy_c> remove;
  // 0 turns wrapping off
  std::optional<std::size_t> wrap;
  std::optional<culprit::culprit_t> culprit;
  std::vector<std::string> codicil;
  std::ostream *file{nullptr};
  std::optional<bool> flush;
  std::optional<std::string> urgency;
};

struct kw_s {
  std::string name;
  types::value_c value;
};

inline kw_s kw(std::string name, types::value_c value) {
  return kw_s{std::move(name), std::move(value)};
}

namespace opt {

struct sep_s {
  std::string value;
};
struct end_s {
  std::string value;
};
struct tmpl_s {
  std::vector<std::string> candidates;
};
struct remove_s {
  remove_policy_c policy;
};
struct wrap_s {
  std::size_t width;
};
struct culprit_s {
  culprit::culprit_t entries;
};
struct codicil_s {
  std::vector<std::string> lines;
};
struct file_s {
  std::ostream *stream;
};
struct flush_s {
  bool value;
};
struct urgency_s {
  std::string value;
};

inline sep_s sep(std::string value) { return sep_s{std::move(value)}; }
inline end_s end(std::string value) { return end_s{std::move(value)}; }

inline tmpl_s tmpl(std::string candidate) {
  return tmpl_s{{std::move(candidate)}};
}
inline tmpl_s tmpl(std::vector<std::string> candidates) {
  return tmpl_s{std::move(candidates)};
}
inline tmpl_s tmpl(std::initializer_list<std::string> candidates) {
  return tmpl_s{std::vector<std::string>(candidates)};
}

inline remove_s remove(remove_policy_c policy) {
  return remove_s{std::move(policy)};
}

inline wrap_s wrap(bool enable) {
  return wrap_s{enable ? text::DEFAULT_WRAP_WIDTH : 0};
}
template <typename T,
          std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>,
                           int> = 0>
wrap_s wrap(T width) {
  return wrap_s{width > 0 ? static_cast<std::size_t>(width) : 0};
}

inline culprit_s culprit(const types::value_c &value) {
  return culprit_s{culprit::flatten(value)};
}
inline culprit_s culprit(std::initializer_list<types::value_c> entries) {
  return culprit_s{culprit::culprit_t(entries)};
}

inline codicil_s codicil(std::string line) {
  return codicil_s{{std::move(line)}};
}
inline codicil_s codicil(std::vector<std::string> lines) {
  return codicil_s{std::move(lines)};
}
inline codicil_s codicil(std::initializer_list<std::string> lines) {
  return codicil_s{std::vector<std::string>(lines)};
}

inline file_s file(std::ostream &stream) { return file_s{&stream}; }
inline flush_s flush(bool value = true) { return flush_s{value}; }
inline urgency_s urgency(std::string value) {
  return urgency_s{std::move(value)};
}

} // namespace opt

void apply(message_s &msg, kw_s arg);
void apply(message_s &msg, opt::sep_s arg);
void apply(message_s &msg, opt::end_s arg);
void apply(message_s &msg, opt::tmpl_s arg);
void apply(message_s &msg, opt::remove_s arg);
void apply(message_s &msg, opt::wrap_s arg);
void apply(message_s &msg, opt::culprit_s arg);
void apply(message_s &msg, opt::codicil_s arg);
void apply(message_s &msg, opt::file_s arg);
void apply(message_s &msg, opt::flush_s arg);
void apply(message_s &msg, opt::urgency_s arg);

// Anything else becomes the next positional argument
template <typename T,
          std::enable_if_t<std::is_constructible_v<types::value_c, T>, int> = 0>
void apply(message_s &msg, T &&arg) {
  msg.args.emplace_back(std::forward<T>(arg));
}

template <typename... Ts> message_s make_message(Ts &&...args) {
  message_s msg;
  (apply(msg, std::forward<Ts>(args)), ...);
  return msg;
}

/*
    Folds `overrides` into `base`: culprit entries are prepended, codicil
    lines and positional arguments appended, named arguments replaced, and
    every option the override sets wins.
*/
void merge(message_s &base, const message_s &overrides);

// Drops the values the policy removes (falsy values by default)
types::list_t cull(const types::list_t &values,
                   const remove_policy_c &remove = {});

/*
    The message body: the positional arguments joined with sep, or the
    first usable template candidate (the last one, filled leniently, when
    none is usable). Wrapped when the message asks for it.
    Raises template_error_c for malformed templates.
*/
std::string join(const message_s &msg);

// The codicil lines of a message, wrapped like the body
std::vector<std::string> codicil_lines(const message_s &msg);

struct assembly_s {
  std::string header;
  std::string culprit;
  std::string body;
  std::vector<std::string> codicil;
  bool continuation{false};
  // indentation of a continuation, in stops of four spaces
  int stops{0};
};

struct assembled_s {
  std::string header;
  std::string body;

  std::string text() const { return header + body; }
};

assembled_s layout(const assembly_s &parts);

// Header-less composition: culprit, body, codicil lines and end.
// An explicit culprit on the message replaces `culprit`.
std::string compose(const message_s &msg,
                    const culprit::culprit_t &culprit = {},
                    std::string_view culprit_sep = ", ");

} // namespace herald::compose
