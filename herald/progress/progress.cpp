#include "herald/progress/progress.hpp"
#include <algorithm>
#include <cmath>
#include <exception>
#include <stdexcept>

namespace herald::progress {

namespace {

constexpr int DEFAULT_WIDTH = 70;
constexpr int GROUPS = 10;
const std::string FILL_GLYPH = "⋅";

} // namespace

progress_bar_c::progress_bar_c(double stop, options_s options)
    : informer_(session::get_informer()),
      informant_(options.informant.value_or(informant::display)),
      options_(std::move(options)), stop_(stop),
      uncaught_(std::uncaught_exceptions()) {
  int width = options_.width > 0 ? options_.width : DEFAULT_WIDTH;
  width_ = std::max(GROUPS, width / GROUPS * GROUPS);

  if (stop_ == options_.start) {
    throw std::invalid_argument("progress bar: start and stop are equal");
  }
  if (options_.log && (options_.start <= 0 || stop_ <= 0)) {
    throw std::invalid_argument(
        "progress bar: a logarithmic scale needs a positive start and stop");
  }
  informer_.attach(*this);
}

progress_bar_c::~progress_bar_c() {
  if (std::uncaught_exceptions() > uncaught_) {
    if (line_open_) {
      emit("\n");
      line_open_ = false;
    }
    state_ = state_e::INTERRUPTED;
  } else if (state_ != state_e::DONE && state_ != state_e::ESCAPED) {
    done();
  }
  informer_.detach(*this);
}

int progress_bar_c::cells_for(double value) const {
  double fraction;
  if (options_.log) {
    if (value <= 0) {
      return 0;
    }
    fraction = std::log(value / options_.start) / std::log(stop_ / options_.start);
  } else {
    fraction = (value - options_.start) / (stop_ - options_.start);
  }
  fraction = std::clamp(fraction, 0.0, 1.0);
  return static_cast<int>(std::floor(fraction * width_));
}

std::string progress_bar_c::cell(int index, const marker_s *marker) const {
  int group = width_ / GROUPS;
  if ((index + 1) % group == 0) {
    return std::to_string(GROUPS - (index + 1) / group);
  }
  return marker ? marker->glyph : FILL_GLYPH;
}

bool progress_bar_c::enabled() const {
  return informant_.spec().output.resolve(informer_);
}

void progress_bar_c::emit(const std::string &text) {
  if (enabled()) {
    informer_.write_output(text);
  }
}

void progress_bar_c::draw(double value, const std::string &marker) {
  if (state_ == state_e::DONE || state_ == state_e::ESCAPED) {
    return;
  }

  if (!marker.empty()) {
    auto it = std::find_if(options_.markers.begin(), options_.markers.end(),
                           [&](const marker_s &m) { return m.name == marker; });
    if (it == options_.markers.end()) {
      throw std::invalid_argument("progress bar: unknown marker " + marker);
    }
    auto index = static_cast<std::size_t>(it - options_.markers.begin());
    if (!pending_marker_ || index < *pending_marker_) {
      pending_marker_ = index;
    }
  }

  int target = cells_for(value);
  std::string text;
  if (state_ == state_e::IDLE || redraw_) {
    text += options_.prefix + printed_;
    redraw_ = false;
  }
  state_ = state_e::DRAWING;

  if (target > drawn_) {
    const marker_s *active =
        pending_marker_ ? &options_.markers[*pending_marker_] : nullptr;
    std::string cells;
    for (int i = drawn_; i < target; i++) {
      cells += cell(i, active);
    }
    auto scheme = color::is_tty(informer_.out()) ? informer_.colorscheme()
                                                 : color::colorscheme_e::NONE;
    cells = color::colorize(cells, active ? active->color : std::nullopt,
                            scheme);
    printed_ += cells;
    text += cells;
    drawn_ = target;
    pending_marker_.reset();
  }

  if (drawn_ >= width_) {
    text += "\n";
    line_open_ = false;
    state_ = state_e::DONE;
  } else {
    line_open_ = !text.empty() || line_open_;
  }
  if (!text.empty()) {
    emit(text);
  }
}

void progress_bar_c::done() {
  if (state_ == state_e::DONE || state_ == state_e::ESCAPED) {
    return;
  }
  draw(stop_);
}

void progress_bar_c::escape() {
  if (line_open_) {
    emit("\n");
    line_open_ = false;
  }
  state_ = state_e::ESCAPED;
}

void progress_bar_c::interrupt() {
  if (line_open_) {
    emit("\n");
    line_open_ = false;
    redraw_ = true;
  }
}

} // namespace herald::progress
