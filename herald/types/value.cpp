#include "herald/types/value.hpp"
#include <stdexcept>

namespace herald::types {

namespace {

template <typename... Ts> struct overloaded_s : Ts... {
  using Ts::operator()...;
};
template <typename... Ts> overloaded_s(Ts...) -> overloaded_s<Ts...>;

std::string quote(const std::string &text) {
  std::string result = "'";
  for (char c : text) {
    switch (c) {
    case '\'':
      result += "\\'";
      break;
    case '\\':
      result += "\\\\";
      break;
    case '\n':
      result += "\\n";
      break;
    case '\t':
      result += "\\t";
      break;
    default:
      result += c;
    }
  }
  result += "'";
  return result;
}

} // namespace

value_c value_c::list(std::initializer_list<value_c> items) {
  return value_c(list_t(items));
}

value_type_e value_c::type() const {
  return std::visit(
      overloaded_s{
          [](const std::monostate &) { return value_type_e::NONE; },
          [](bool) { return value_type_e::BOOLEAN; },
          [](std::int64_t) { return value_type_e::INTEGER; },
          [](double) { return value_type_e::REAL; },
          [](const std::string &) { return value_type_e::STRING; },
          [](const std::shared_ptr<const list_t> &) {
            return value_type_e::LIST;
          },
          [](const std::shared_ptr<const map_t> &) {
            return value_type_e::MAP;
          },
      },
      data_);
}

bool value_c::as_bool() const {
  if (auto *v = std::get_if<bool>(&data_)) {
    return *v;
  }
  throw std::runtime_error("value is not a boolean: " + repr());
}

std::int64_t value_c::as_int() const {
  if (auto *v = std::get_if<std::int64_t>(&data_)) {
    return *v;
  }
  if (auto *v = std::get_if<bool>(&data_)) {
    return *v ? 1 : 0;
  }
  throw std::runtime_error("value is not an integer: " + repr());
}

double value_c::as_real() const {
  if (auto *v = std::get_if<double>(&data_)) {
    return *v;
  }
  if (auto *v = std::get_if<std::int64_t>(&data_)) {
    return static_cast<double>(*v);
  }
  throw std::runtime_error("value is not a number: " + repr());
}

const std::string &value_c::as_string() const {
  if (auto *v = std::get_if<std::string>(&data_)) {
    return *v;
  }
  throw std::runtime_error("value is not a string: " + repr());
}

const list_t &value_c::as_list() const {
  if (auto *v = std::get_if<std::shared_ptr<const list_t>>(&data_)) {
    return **v;
  }
  throw std::runtime_error("value is not a list: " + repr());
}

const map_t &value_c::as_map() const {
  if (auto *v = std::get_if<std::shared_ptr<const map_t>>(&data_)) {
    return **v;
  }
  throw std::runtime_error("value is not a map: " + repr());
}

bool value_c::truthy() const {
  return std::visit(
      overloaded_s{
          [](const std::monostate &) { return false; },
          [](bool v) { return v; },
          [](std::int64_t v) { return v != 0; },
          [](double v) { return v != 0.0; },
          [](const std::string &v) { return !v.empty(); },
          [](const std::shared_ptr<const list_t> &v) { return !v->empty(); },
          [](const std::shared_ptr<const map_t> &v) { return !v->empty(); },
      },
      data_);
}

const value_c *value_c::element(std::size_t index) const {
  auto *v = std::get_if<std::shared_ptr<const list_t>>(&data_);
  if (!v || index >= (*v)->size()) {
    return nullptr;
  }
  return &(**v)[index];
}

const value_c *value_c::member(const std::string &key) const {
  auto *v = std::get_if<std::shared_ptr<const map_t>>(&data_);
  if (!v) {
    return nullptr;
  }
  auto it = (*v)->find(key);
  if (it == (*v)->end()) {
    return nullptr;
  }
  return &it->second;
}

std::string value_c::to_string() const {
  return std::visit(
      overloaded_s{
          [](const std::monostate &) { return std::string(); },
          [](bool v) { return std::string(v ? "true" : "false"); },
          [](std::int64_t v) { return fmt::format("{}", v); },
          [](double v) { return fmt::format("{}", v); },
          [](const std::string &v) { return v; },
          [](const std::shared_ptr<const list_t> &v) {
            std::string result = "[";
            for (std::size_t i = 0; i < v->size(); i++) {
              if (i) {
                result += ", ";
              }
              result += (*v)[i].repr();
            }
            return result + "]";
          },
          [](const std::shared_ptr<const map_t> &v) {
            std::string result = "{";
            bool first = true;
            for (const auto &[key, item] : *v) {
              if (!first) {
                result += ", ";
              }
              first = false;
              result += quote(key) + ": " + item.repr();
            }
            return result + "}";
          },
      },
      data_);
}

std::string value_c::repr() const {
  switch (type()) {
  case value_type_e::NONE:
    return "none";
  case value_type_e::STRING:
    return quote(std::get<std::string>(data_));
  default:
    return to_string();
  }
}

std::string value_c::format(std::string_view spec) const {
  if (spec.empty()) {
    return to_string();
  }
  auto pattern = fmt::format("{{:{}}}", spec);
  switch (type()) {
  case value_type_e::BOOLEAN:
    return fmt::format(fmt::runtime(pattern), std::get<bool>(data_));
  case value_type_e::INTEGER:
    return fmt::format(fmt::runtime(pattern), std::get<std::int64_t>(data_));
  case value_type_e::REAL:
    return fmt::format(fmt::runtime(pattern), std::get<double>(data_));
  default:
    return fmt::format(fmt::runtime(pattern), to_string());
  }
}

bool value_c::operator==(const value_c &other) const {
  auto mine = type();
  auto theirs = other.type();
  bool mine_numeric =
      mine == value_type_e::INTEGER || mine == value_type_e::REAL;
  bool theirs_numeric =
      theirs == value_type_e::INTEGER || theirs == value_type_e::REAL;
  if (mine_numeric && theirs_numeric) {
    if (mine == value_type_e::INTEGER && theirs == value_type_e::INTEGER) {
      return as_int() == other.as_int();
    }
    return as_real() == other.as_real();
  }
  if (mine != theirs) {
    return false;
  }
  switch (mine) {
  case value_type_e::NONE:
    return true;
  case value_type_e::BOOLEAN:
    return as_bool() == other.as_bool();
  case value_type_e::STRING:
    return as_string() == other.as_string();
  case value_type_e::LIST:
    return as_list() == other.as_list();
  case value_type_e::MAP:
    return as_map() == other.as_map();
  default:
    return false;
  }
}

const value_c &none() {
  static const value_c sentinel;
  return sentinel;
}

} // namespace herald::types
