#pragma once

#include "herald/color/color.hpp"
#include "herald/informant/informant.hpp"
#include "herald/session/session.hpp"
#include <iterator>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace herald::progress {

struct marker_s {
  std::string name;
  std::string glyph;
  std::optional<color::color_e> color;
};

struct options_s {
  double start{0};
  // logarithmic scale; start and stop must then be positive
  bool log{false};
  std::string prefix;
  // non-positive means the default of 70 cells
  int width{70};
  // earlier markers take priority over later ones
  std::vector<marker_s> markers;
  std::optional<informant::informant_c> informant;
};

/*
    A single line progress bar of `width` cells split into ten groups, the
    last cell of each group showing the count down digit 9 .. 0:

        ⋅⋅⋅⋅⋅⋅9⋅⋅⋅⋅⋅⋅8⋅⋅⋅⋅⋅⋅7⋅⋅⋅⋅⋅⋅6⋅⋅⋅⋅⋅⋅5⋅⋅⋅⋅⋅⋅4⋅⋅⋅⋅⋅⋅3⋅⋅⋅⋅⋅⋅2⋅⋅⋅⋅⋅⋅1⋅⋅⋅⋅⋅⋅0

    The bar attaches itself to the active session. A message written
    while the bar is drawing ends the partial line first; the next draw
    starts the bar again on a fresh line.

    Leaving scope normally completes an unfinished bar unless escape() was
    called. Leaving scope by exception leaves the bar as it was.
*/
class progress_bar_c : public session::interruptible_if {
public:
  enum class state_e { IDLE, DRAWING, DONE, ESCAPED, INTERRUPTED };

  // Raises std::invalid_argument when the range is empty or a logarithmic
  // range is not positive
  explicit progress_bar_c(double stop, options_s options = {});
  ~progress_bar_c() override;

  progress_bar_c(const progress_bar_c &) = delete;
  progress_bar_c &operator=(const progress_bar_c &) = delete;

  void draw(double value, const std::string &marker = "");
  void done();
  void escape();
  void interrupt() override;

  state_e state() const { return state_; }
  int width() const { return width_; }

private:
  session::informer_c &informer_;
  informant::informant_c informant_;
  options_s options_;
  double stop_;
  int width_;
  int drawn_{0};
  std::string printed_;
  std::optional<std::size_t> pending_marker_;
  state_e state_{state_e::IDLE};
  bool line_open_{false};
  bool redraw_{false};
  int uncaught_{0};

  int cells_for(double value) const;
  std::string cell(int index, const marker_s *marker) const;
  bool enabled() const;
  void emit(const std::string &text);
};

/*
    Calls fn on each element of a sized range, advancing a bar one step
    after each call. The bar runs from options.start to options.start plus
    the size of the range. An empty range draws nothing.
*/
template <typename Range, typename Fn>
void for_each(Range &&range, Fn &&fn, options_s options = {}) {
  auto count = std::size(range);
  if (count == 0) {
    return;
  }
  double step = options.start;
  progress_bar_c bar(options.start + static_cast<double>(count),
                     std::move(options));
  for (auto &&item : range) {
    fn(item);
    bar.draw(++step);
  }
}

} // namespace herald::progress
