#include "herald/color/color.hpp"
#include <array>
#include <fmt/color.h>
#include <iostream>
#include <regex>
#include <unistd.h>

namespace herald::color {

namespace {

constexpr std::array<std::string_view, 8> color_names = {
    "black", "red", "green", "yellow", "blue", "magenta", "cyan", "white"};

fmt::terminal_color to_terminal_color(color_e color) {
  switch (color) {
  case color_e::BLACK:
    return fmt::terminal_color::black;
  case color_e::RED:
    return fmt::terminal_color::red;
  case color_e::GREEN:
    return fmt::terminal_color::green;
  case color_e::YELLOW:
    return fmt::terminal_color::yellow;
  case color_e::BLUE:
    return fmt::terminal_color::blue;
  case color_e::MAGENTA:
    return fmt::terminal_color::magenta;
  case color_e::CYAN:
    return fmt::terminal_color::cyan;
  case color_e::WHITE:
    return fmt::terminal_color::white;
  }
  return fmt::terminal_color::white;
}

} // namespace

std::optional<color_e> parse_color(std::string_view name) {
  for (std::size_t i = 0; i < color_names.size(); i++) {
    if (color_names[i] == name) {
      return static_cast<color_e>(i);
    }
  }
  return std::nullopt;
}

std::optional<colorscheme_e> parse_colorscheme(std::string_view name) {
  if (name == "none") {
    return colorscheme_e::NONE;
  }
  if (name == "light") {
    return colorscheme_e::LIGHT;
  }
  if (name == "dark") {
    return colorscheme_e::DARK;
  }
  return std::nullopt;
}

std::string_view to_string(colorscheme_e scheme) {
  switch (scheme) {
  case colorscheme_e::NONE:
    return "none";
  case colorscheme_e::LIGHT:
    return "light";
  case colorscheme_e::DARK:
    return "dark";
  }
  return "none";
}

std::string colorize(const std::string &text, std::optional<color_e> color,
                     colorscheme_e scheme) {
  if (!color.has_value() || scheme == colorscheme_e::NONE || text.empty()) {
    return text;
  }
  auto style = fmt::fg(to_terminal_color(*color));
  if (scheme == colorscheme_e::LIGHT) {
    style |= fmt::emphasis::bold;
  }
  return fmt::format(style, "{}", text);
}

std::string strip_colors(const std::string &text) {
  static const std::regex escapes("\x1b\\[[0-9;]*m");
  return std::regex_replace(text, escapes, "");
}

bool is_tty(const std::ostream &stream) {
  if (&stream == &std::cout) {
    return ::isatty(STDOUT_FILENO) == 1;
  }
  if (&stream == &std::cerr || &stream == &std::clog) {
    return ::isatty(STDERR_FILENO) == 1;
  }
  return false;
}

} // namespace herald::color
