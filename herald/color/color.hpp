#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace herald::color {

enum class color_e {
  BLACK = 0,
  RED = 1,
  GREEN = 2,
  YELLOW = 3,
  BLUE = 4,
  MAGENTA = 5,
  CYAN = 6,
  WHITE = 7,
};

/*
    NONE disables coloring entirely. DARK uses the normal ANSI colors
    (suits dark backgrounds), LIGHT the bold ones.
*/
enum class colorscheme_e {
  NONE = 0,
  LIGHT = 1,
  DARK = 2,
};

std::optional<color_e> parse_color(std::string_view name);
std::optional<colorscheme_e> parse_colorscheme(std::string_view name);
std::string_view to_string(colorscheme_e scheme);

// Wraps text in the escape sequences for the given color. Returns the text
// untouched if there is no color, the scheme is NONE or the text is empty.
std::string colorize(const std::string &text, std::optional<color_e> color,
                     colorscheme_e scheme);

std::string strip_colors(const std::string &text);

// Only the process stdout / stderr streams can be terminals
bool is_tty(const std::ostream &stream);

} // namespace herald::color
