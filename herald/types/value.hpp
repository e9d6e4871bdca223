#pragma once

#include <cstdint>
#include <filesystem>
#include <fmt/format.h>
#include <initializer_list>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace herald::types {

class value_c;

using list_t = std::vector<value_c>;
using map_t = std::map<std::string, value_c>;

enum class value_type_e {
  NONE = 0,
  BOOLEAN = 1,
  INTEGER = 2,
  REAL = 3,
  STRING = 4,
  LIST = 5,
  MAP = 6,
};

// Types that are not handled by a dedicated constructor but that fmt can
// render. std::conjunction keeps fmt::is_formattable from being instantiated
// for the excluded types (value_c itself among them).
template <typename T>
struct is_foreign_formattable
    : std::conjunction<
          std::negation<std::is_arithmetic<T>>, std::negation<std::is_pointer<T>>,
          std::negation<std::is_same<T, std::nullptr_t>>,
          std::negation<std::is_same<T, value_c>>,
          std::negation<std::is_same<T, list_t>>,
          std::negation<std::is_same<T, map_t>>,
          std::negation<std::is_same<T, std::filesystem::path>>,
          std::negation<std::is_convertible<const T &, std::string_view>>,
          fmt::is_formattable<T>> {};

/*
    A renderable value handed to an informant, a template or a culprit.

    Lists and maps are shared and immutable once built so copying a
    message (which happens on every reraise / report override) stays cheap.

    Anything fmt knows how to format can be turned into a value; it is
    rendered once, at construction, and kept as a string.
*/
class value_c {
public:
  value_c() = default;
  value_c(std::nullptr_t) {}
  value_c(bool value) : data_(value) {}
  value_c(char value) : data_(std::string(1, value)) {}

  template <typename T,
            std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool> &&
                                 !std::is_same_v<T, char>,
                             int> = 0>
  value_c(T value) {
    // unsigned values past INT64_MAX keep their digits as text
    if constexpr (std::is_unsigned_v<T> && sizeof(T) >= sizeof(std::int64_t)) {
      if (value > static_cast<T>(INT64_MAX)) {
        data_ = fmt::format("{}", value);
        return;
      }
    }
    data_ = static_cast<std::int64_t>(value);
  }

  template <typename T,
            std::enable_if_t<std::is_floating_point_v<T>, int> = 0>
  value_c(T value) : data_(static_cast<double>(value)) {}

  value_c(const char *value) : data_(std::string(value ? value : "")) {}
  value_c(std::string value) : data_(std::move(value)) {}
  value_c(std::string_view value) : data_(std::string(value)) {}
  value_c(const std::filesystem::path &value) : data_(value.string()) {}
  value_c(list_t value)
      : data_(std::make_shared<const list_t>(std::move(value))) {}
  value_c(map_t value)
      : data_(std::make_shared<const map_t>(std::move(value))) {}

  template <typename T,
            std::enable_if_t<is_foreign_formattable<std::decay_t<T>>::value,
                             int> = 0>
  value_c(const T &value) : data_(fmt::format("{}", value)) {}

  static value_c list(std::initializer_list<value_c> items);

  value_type_e type() const;
  bool is_none() const { return type() == value_type_e::NONE; }
  bool is_list() const { return type() == value_type_e::LIST; }
  bool is_map() const { return type() == value_type_e::MAP; }

  bool as_bool() const;
  std::int64_t as_int() const;
  double as_real() const;
  const std::string &as_string() const;
  const list_t &as_list() const;
  const map_t &as_map() const;

  // Truthiness: none, false, zero and empty containers are falsy
  bool truthy() const;

  // nullptr when the value is not a list or the index is out of range
  const value_c *element(std::size_t index) const;
  // nullptr when the value is not a map or the key is absent
  const value_c *member(const std::string &key) const;

  std::string to_string() const;
  std::string repr() const;

  // Applies a fmt format spec (the part after ':' in "{:>8}").
  // Throws fmt::format_error when the spec does not suit the value.
  std::string format(std::string_view spec) const;

  bool operator==(const value_c &other) const;
  bool operator!=(const value_c &other) const { return !(*this == other); }

private:
  std::variant<std::monostate, bool, std::int64_t, double, std::string,
               std::shared_ptr<const list_t>, std::shared_ptr<const map_t>>
      data_;
};

// The sentinel returned for absent attributes and keyword arguments
const value_c &none();

} // namespace herald::types
