#pragma once

#include "herald/types/value.hpp"
#include <cstddef>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace herald::compose {

class template_error_c : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/*
    Decides which named values count as "unavailable" when choosing among
    template candidates. The default treats falsy values as unavailable;
    a predicate, a single literal or a set of literals may be given instead.
*/
class remove_policy_c {
public:
  using predicate_t = std::function<bool(const types::value_c &)>;

  remove_policy_c() = default;
  remove_policy_c(predicate_t predicate);
  remove_policy_c(types::value_c literal);
  remove_policy_c(std::vector<types::value_c> literals);

  bool removes(const types::value_c &value) const;

private:
  predicate_t predicate_;
  std::vector<types::value_c> literals_;
  bool uses_literals_{false};
};

struct accessor_s {
  enum class kind_e { ATTRIBUTE, INDEX };
  kind_e kind;
  std::string key;
};

struct field_s {
  std::optional<std::size_t> index;
  std::string name;
  std::vector<accessor_s> accessors;
  char conversion{0};
  std::string spec;

  bool is_positional() const { return index.has_value(); }
};

/*
    A parsed replacement template in the "{}" / "{0}" / "{name.attr[key]!r:>8}"
    style. Parsing happens once at construction and raises template_error_c
    for malformed text (stray braces, nested fields, mixed numbering).
*/
class template_c {
public:
  explicit template_c(std::string_view text);

  const std::string &text() const { return text_; }
  const std::vector<field_s> &fields() const { return fields_; }

  // Every referenced positional argument exists and every referenced named
  // argument is present, resolvable and not removed by the policy.
  bool is_usable(const types::list_t &args, const types::map_t &kwargs,
                 const remove_policy_c &remove) const;

  // Missing references render as empty text. A format spec that does not
  // suit its value raises template_error_c.
  std::string fill(const types::list_t &args,
                   const types::map_t &kwargs) const;

private:
  struct segment_s {
    std::string literal;
    std::optional<std::size_t> field;
  };

  std::string text_;
  std::vector<segment_s> segments_;
  std::vector<field_s> fields_;

  void parse();
  field_s parse_field(std::string_view body, std::size_t &next_auto,
                      int &numbering) const;
  const types::value_c *resolve(const field_s &field,
                                const types::list_t &args,
                                const types::map_t &kwargs) const;
};

} // namespace herald::compose
