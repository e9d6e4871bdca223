#include "herald/notifier/notifier.hpp"
#include <fmt/format.h>
#include <spawn.h>
#include <sys/wait.h>
#include <vector>

extern char **environ;

namespace herald::notifier {

std::optional<urgency_e> parse_urgency(std::string_view name) {
  if (name == "low") {
    return urgency_e::LOW;
  }
  if (name == "normal") {
    return urgency_e::NORMAL;
  }
  if (name == "critical") {
    return urgency_e::CRITICAL;
  }
  return std::nullopt;
}

std::string_view to_string(urgency_e urgency) {
  switch (urgency) {
  case urgency_e::LOW:
    return "low";
  case urgency_e::NORMAL:
    return "normal";
  case urgency_e::CRITICAL:
    return "critical";
  }
  return "normal";
}

notify_send_c::notify_send_c(std::string program)
    : program_(std::move(program)) {}

bool notify_send_c::notify(const std::string &app_name,
                           const std::string &body, urgency_e urgency) {
  std::vector<std::string> args = {
      program_, fmt::format("--urgency={}", to_string(urgency))};
  if (!app_name.empty()) {
    args.push_back(fmt::format("--app-name={}", app_name));
    args.push_back(app_name);
  }
  args.push_back(body);

  std::vector<char *> argv;
  for (auto &arg : args) {
    argv.push_back(arg.data());
  }
  argv.push_back(nullptr);

  pid_t pid = 0;
  if (::posix_spawnp(&pid, program_.c_str(), nullptr, nullptr, argv.data(),
                     environ) != 0) {
    return false;
  }
  int status = 0;
  if (::waitpid(pid, &status, 0) < 0) {
    return false;
  }
  return WIFEXITED(status) && WEXITSTATUS(status) == 0;
}

} // namespace herald::notifier
