#include "herald/informant/informant.hpp"
#include "herald/session/session.hpp"
#include <array>
#include <utility>

namespace herald::informant {

namespace {

bool unmuted(const session::informer_c &informer) { return !informer.mute(); }

bool chatty(const session::informer_c &informer) {
  return !informer.quiet() && !informer.mute();
}

} // namespace

bool predicate_c::resolve(const session::informer_c &informer) const {
  if (auto *value = std::get_if<bool>(&rule_)) {
    return *value;
  }
  return std::get<fn_t>(rule_)(informer);
}

void informant_c::report(const compose::message_s &msg) const {
  session::get_informer().report(*this, msg);
}

informant_c log({
    .log = true,
    .output = false,
});

informant_c comment({
    .log = true,
    .output =
        [](const session::informer_c &informer) {
          return informer.verbose() && !informer.mute();
        },
    .message_color = color::color_e::CYAN,
});

informant_c codicil({
    .is_continuation = true,
});

informant_c narrate({
    .log = true,
    .output =
        [](const session::informer_c &informer) {
          return informer.narrate() && !informer.mute();
        },
    .message_color = color::color_e::BLUE,
});

informant_c display({
    .log = true,
    .output = chatty,
});

informant_c output({
    .log = true,
    .output = unmuted,
});

informant_c notify({
    .log = true,
    .output = chatty,
    .notify = true,
});

informant_c debug({
    .severity = "DEBUG",
    .log = true,
    .output = true,
    .header_color = color::color_e::MAGENTA,
});

informant_c warn({
    .severity = "warning",
    .log = true,
    .output = chatty,
    .header_color = color::color_e::YELLOW,
});

informant_c error({
    .severity = "error",
    .is_error = true,
    .log = true,
    .output = unmuted,
    .header_color = color::color_e::RED,
});

informant_c fatal({
    .severity = "error",
    .is_error = true,
    .log = true,
    .output = unmuted,
    .terminate = true,
    .header_color = color::color_e::RED,
});

informant_c panic({
    .severity = "internal error (please report)",
    .is_error = true,
    .log = true,
    .output = true,
    .terminate = 3,
    .header_color = color::color_e::RED,
});

const informant_c *find(std::string_view name) {
  static const std::array<std::pair<std::string_view, const informant_c *>, 12>
      table = {{
          {"log", &log},
          {"comment", &comment},
          {"codicil", &codicil},
          {"narrate", &narrate},
          {"display", &display},
          {"output", &output},
          {"notify", &notify},
          {"debug", &debug},
          {"warn", &warn},
          {"error", &error},
          {"fatal", &fatal},
          {"panic", &panic},
      }};
  for (const auto &[key, informant] : table) {
    if (key == name) {
      return informant;
    }
  }
  return nullptr;
}

} // namespace herald::informant
