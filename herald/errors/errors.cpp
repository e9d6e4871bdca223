#include "herald/errors/errors.hpp"
#include <fmt/format.h>

namespace herald::errors {

const types::value_c &error_c::get(const std::string &name) const {
  auto it = message_.kwargs.find(name);
  if (it == message_.kwargs.end()) {
    return types::none();
  }
  return it->second;
}

std::string error_c::get_message(const std::vector<std::string> &templates) const {
  compose::message_s msg = message_;
  if (!templates.empty()) {
    msg.templates = templates;
  } else if (msg.templates.empty()) {
    msg.templates = templates_;
  }
  return compose::join(msg);
}

std::string error_c::render(const std::vector<std::string> &templates) const {
  auto culprit = culprit::join(get_culprit());
  auto message = get_message(templates);
  if (culprit.empty()) {
    return message;
  }
  return culprit + ": " + message;
}

culprit::culprit_t error_c::get_culprit(const types::value_c &extra) const {
  culprit::culprit_t result = culprit::flatten(extra);
  if (message_.culprit) {
    result.insert(result.end(), message_.culprit->begin(),
                  message_.culprit->end());
  }
  return result;
}

std::vector<std::string>
error_c::get_codicil(const std::vector<std::string> &extra) const {
  std::vector<std::string> result = message_.codicil;
  result.insert(result.end(), extra.begin(), extra.end());
  return result;
}

const char *error_c::what() const noexcept {
  try {
    what_ = render();
  } catch (const std::exception &e) {
    what_ = fmt::format("unrenderable error: {}", e.what());
  }
  return what_.c_str();
}

std::unique_ptr<error_c> error_c::clone() const {
  return std::make_unique<error_c>(*this);
}

void error_c::raise() const { throw *this; }

void error_c::set_templates(std::vector<std::string> templates) {
  templates_ = std::move(templates);
}

compose::message_s
error_c::effective(const compose::message_s &overrides) const {
  compose::message_s msg = message_;
  compose::merge(msg, overrides);
  if (msg.templates.empty()) {
    msg.templates = templates_;
  }
  return msg;
}

void error_c::report_with(const collected_s &overrides) const {
  auto informant = overrides.informant
                       ? *overrides.informant
                       : informant_.value_or(informant::error);
  informant.report(effective(overrides.message));
}

void error_c::terminate_with(const collected_s &overrides) const {
  auto informant = overrides.informant
                       ? *overrides.informant
                       : informant_.value_or(informant::fatal);
  if (!informant.spec().terminate.enabled()) {
    informant.spec().terminate = true;
  }
  informant.report(effective(overrides.message));
}

void error_c::reraise_with(const collected_s &overrides) const {
  auto copy = clone();
  compose::merge(copy->message_, overrides.message);
  if (overrides.informant) {
    copy->informant_ = overrides.informant;
  }
  copy->what_.clear();
  copy->raise();
}

} // namespace herald::errors
