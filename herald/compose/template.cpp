#include "herald/compose/template.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <fmt/format.h>
#include <system_error>

namespace herald::compose {

namespace {

enum numbering_e { UNDECIDED = 0, AUTOMATIC = 1, MANUAL = 2 };

bool all_digits(std::string_view text) {
  return !text.empty() && std::all_of(text.begin(), text.end(), [](char c) {
    return std::isdigit(static_cast<unsigned char>(c));
  });
}

// nullopt when the digits do not fit in a size_t
std::optional<std::size_t> parse_index(std::string_view digits) {
  std::size_t index = 0;
  auto [end, ec] =
      std::from_chars(digits.data(), digits.data() + digits.size(), index);
  if (ec != std::errc() || end != digits.data() + digits.size()) {
    return std::nullopt;
  }
  return index;
}

} // namespace

remove_policy_c::remove_policy_c(predicate_t predicate)
    : predicate_(std::move(predicate)) {}

remove_policy_c::remove_policy_c(types::value_c literal)
    : literals_{std::move(literal)}, uses_literals_(true) {}

remove_policy_c::remove_policy_c(std::vector<types::value_c> literals)
    : literals_(std::move(literals)), uses_literals_(true) {}

bool remove_policy_c::removes(const types::value_c &value) const {
  if (predicate_) {
    return predicate_(value);
  }
  if (uses_literals_) {
    return std::find(literals_.begin(), literals_.end(), value) !=
           literals_.end();
  }
  return !value.truthy();
}

template_c::template_c(std::string_view text) : text_(text) { parse(); }

void template_c::parse() {
  std::size_t next_auto = 0;
  int numbering = UNDECIDED;
  std::string literal;
  std::size_t pos = 0;

  while (pos < text_.size()) {
    char c = text_[pos];
    if (c == '}') {
      if (pos + 1 < text_.size() && text_[pos + 1] == '}') {
        literal += '}';
        pos += 2;
        continue;
      }
      throw template_error_c(
          fmt::format("{}: single '}}' encountered in template.", text_));
    }
    if (c != '{') {
      literal += c;
      pos++;
      continue;
    }
    if (pos + 1 < text_.size() && text_[pos + 1] == '{') {
      literal += '{';
      pos += 2;
      continue;
    }

    // Find the closing brace, skipping over bracketed keys
    std::size_t end = pos + 1;
    bool in_brackets = false;
    for (; end < text_.size(); end++) {
      char d = text_[end];
      if (in_brackets) {
        if (d == ']') {
          in_brackets = false;
        }
        continue;
      }
      if (d == '[') {
        in_brackets = true;
      } else if (d == '{') {
        throw template_error_c(fmt::format(
            "{}: nested replacement fields are not supported.", text_));
      } else if (d == '}') {
        break;
      }
    }
    if (end >= text_.size()) {
      throw template_error_c(
          fmt::format("{}: expected '}}' before end of template.", text_));
    }

    fields_.push_back(parse_field(
        std::string_view(text_).substr(pos + 1, end - pos - 1), next_auto,
        numbering));
    segments_.push_back(segment_s{literal, fields_.size() - 1});
    literal.clear();
    pos = end + 1;
  }
  if (!literal.empty()) {
    segments_.push_back(segment_s{literal, std::nullopt});
  }
}

field_s template_c::parse_field(std::string_view body, std::size_t &next_auto,
                                int &numbering) const {
  field_s field;

  // Split off ":spec" and "!conversion", ignoring marks inside brackets
  std::size_t name_end = body.size();
  bool in_brackets = false;
  for (std::size_t i = 0; i < body.size(); i++) {
    char c = body[i];
    if (in_brackets) {
      in_brackets = c != ']';
      continue;
    }
    if (c == '[') {
      in_brackets = true;
    } else if (c == '!' || c == ':') {
      name_end = i;
      break;
    }
  }

  std::string_view rest = body.substr(name_end);
  if (!rest.empty() && rest.front() == '!') {
    if (rest.size() < 2 || (rest[1] != 's' && rest[1] != 'r')) {
      throw template_error_c(
          fmt::format("{}: unknown conversion in '{{{}}}'.", text_, body));
    }
    field.conversion = rest[1];
    rest.remove_prefix(2);
    if (!rest.empty() && rest.front() != ':') {
      throw template_error_c(fmt::format(
          "{}: expected ':' after conversion in '{{{}}}'.", text_, body));
    }
  }
  if (!rest.empty()) {
    field.spec = std::string(rest.substr(1));
  }

  std::string_view name = body.substr(0, name_end);
  std::size_t head_end = name.find_first_of(".[");
  std::string_view head = name.substr(0, head_end);

  if (head.empty()) {
    if (numbering == MANUAL) {
      throw template_error_c(fmt::format(
          "{}: cannot switch from manual field numbering to automatic.",
          text_));
    }
    numbering = AUTOMATIC;
    field.index = next_auto++;
  } else if (all_digits(head)) {
    if (numbering == AUTOMATIC) {
      throw template_error_c(fmt::format(
          "{}: cannot switch from automatic field numbering to manual.",
          text_));
    }
    numbering = MANUAL;
    field.index = parse_index(head);
    if (!field.index) {
      throw template_error_c(
          fmt::format("{}: field number out of range in '{{{}}}'.", text_,
                      body));
    }
  } else {
    field.name = std::string(head);
  }

  std::size_t pos = head_end;
  while (pos != std::string_view::npos && pos < name.size()) {
    if (name[pos] == '.') {
      auto next = name.find_first_of(".[", pos + 1);
      auto key = name.substr(pos + 1, next == std::string_view::npos
                                          ? std::string_view::npos
                                          : next - pos - 1);
      if (key.empty()) {
        throw template_error_c(
            fmt::format("{}: empty attribute in '{{{}}}'.", text_, body));
      }
      field.accessors.push_back(
          accessor_s{accessor_s::kind_e::ATTRIBUTE, std::string(key)});
      pos = next;
      continue;
    }
    if (name[pos] == '[') {
      auto close = name.find(']', pos + 1);
      if (close == std::string_view::npos || close == pos + 1) {
        throw template_error_c(
            fmt::format("{}: malformed index in '{{{}}}'.", text_, body));
      }
      field.accessors.push_back(
          accessor_s{accessor_s::kind_e::INDEX,
                     std::string(name.substr(pos + 1, close - pos - 1))});
      pos = close + 1;
      continue;
    }
    throw template_error_c(
        fmt::format("{}: malformed field '{{{}}}'.", text_, body));
  }
  return field;
}

const types::value_c *template_c::resolve(const field_s &field,
                                          const types::list_t &args,
                                          const types::map_t &kwargs) const {
  const types::value_c *value = nullptr;
  if (field.is_positional()) {
    if (*field.index >= args.size()) {
      return nullptr;
    }
    value = &args[*field.index];
  } else {
    auto it = kwargs.find(field.name);
    if (it == kwargs.end()) {
      return nullptr;
    }
    value = &it->second;
  }

  for (const auto &accessor : field.accessors) {
    if (accessor.kind == accessor_s::kind_e::INDEX && value->is_list() &&
        all_digits(accessor.key)) {
      auto index = parse_index(accessor.key);
      value = index ? value->element(*index) : nullptr;
    } else {
      value = value->member(accessor.key);
    }
    if (!value) {
      return nullptr;
    }
  }
  return value;
}

bool template_c::is_usable(const types::list_t &args,
                           const types::map_t &kwargs,
                           const remove_policy_c &remove) const {
  for (const auto &field : fields_) {
    auto *value = resolve(field, args, kwargs);
    if (!value) {
      return false;
    }
    if (!field.is_positional() && remove.removes(kwargs.at(field.name))) {
      return false;
    }
  }
  return true;
}

std::string template_c::fill(const types::list_t &args,
                             const types::map_t &kwargs) const {
  std::string result;
  for (const auto &segment : segments_) {
    result += segment.literal;
    if (!segment.field.has_value()) {
      continue;
    }
    const auto &field = fields_[*segment.field];
    auto *value = resolve(field, args, kwargs);
    if (!value) {
      continue;
    }
    try {
      switch (field.conversion) {
      case 's':
        result += types::value_c(value->to_string()).format(field.spec);
        break;
      case 'r':
        result += types::value_c(value->repr()).format(field.spec);
        break;
      default:
        result += value->format(field.spec);
      }
    } catch (const fmt::format_error &e) {
      throw template_error_c(fmt::format("{}: {}.", text_, e.what()));
    }
  }
  return result;
}

} // namespace herald::compose
