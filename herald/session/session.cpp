#include "herald/session/session.hpp"
#include "herald/errors/errors.hpp"
#include "herald/text/text.hpp"
#include <algorithm>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fmt/chrono.h>
#include <fmt/format.h>
#include <iostream>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace herald::session {

namespace {

std::vector<informer_c *> &stack() {
  static std::vector<informer_c *> informers;
  return informers;
}

logger_t default_logger() {
  auto logger = spdlog::get("herald");
  if (!logger) {
    try {
      logger = spdlog::stderr_color_mt("herald");
      logger->set_level(spdlog::level::warn);
    } catch (const spdlog::spdlog_ex &) {
      logger = spdlog::get("herald");
    }
  }
  return logger;
}

std::string program_label(const std::string &prog_name) {
  return prog_name.empty() ? "program" : prog_name;
}

} // namespace

stream_policy_c::stream_policy_c(stream_policy_e policy) : rule_(policy) {}

stream_policy_c stream_policy_c::parse(std::string_view name) {
  if (name == "termination") {
    return stream_policy_e::TERMINATION;
  }
  if (name == "header") {
    return stream_policy_e::HEADER;
  }
  if (name == "errors") {
    return stream_policy_e::ERRORS;
  }
  if (name == "all") {
    return stream_policy_e::ALL;
  }
  throw errors::error_c("unknown stream policy.",
                        compose::opt::culprit(std::string(name)));
}

std::ostream &stream_policy_c::select(const informant::informant_c &informant,
                                      std::ostream &out,
                                      std::ostream &err) const {
  if (auto *fn = std::get_if<fn_t>(&rule_)) {
    return (*fn)(informant, out, err);
  }
  const auto &spec = informant.spec();
  switch (std::get<stream_policy_e>(rule_)) {
  case stream_policy_e::TERMINATION:
    return spec.terminate.enabled() ? err : out;
  case stream_policy_e::HEADER:
    return spec.severity.empty() ? out : err;
  case stream_policy_e::ERRORS:
    return spec.is_error ? err : out;
  case stream_policy_e::ALL:
    return err;
  }
  return out;
}

informer_c::informer_c(informer_options_s options) {
  configure(options);
  stack().push_back(this);
  connected_ = true;
  set_logfile(options.logfile);
}

informer_c::informer_c(sentinel_tag_s) {
  informer_options_s options;
  configure(options);
}

informer_c::~informer_c() { disconnect(); }

void informer_c::configure(informer_options_s &options) {
  mute_ = options.mute;
  quiet_ = options.quiet;
  verbose_ = options.quiet ? false : options.verbose;
  narrate_ = options.quiet ? false : options.narrate;

  argv_ = std::move(options.argv);
  if (options.prog_name) {
    prog_name_ = *options.prog_name;
  } else if (!argv_.empty()) {
    prog_name_ = std::filesystem::path(argv_.front()).filename().string();
  }
  output_prog_name_ = options.output_prog_name;

  version_ = std::move(options.version);
  error_status_ = options.error_status;
  termination_callback_ = std::move(options.termination_callback);
  colorscheme_ = options.colorscheme;
  flush_ = options.flush;
  stdout_ = options.stdout_stream ? options.stdout_stream : &std::cout;
  stderr_ = options.stderr_stream ? options.stderr_stream : &std::cerr;
  culprit_sep_ = std::move(options.culprit_sep);
  stream_policy_ = std::move(options.stream_policy);
  notify_if_no_tty_ = options.notify_if_no_tty;
  prev_logfile_suffix_ = std::move(options.prev_logfile_suffix);
  attributes_ = std::move(options.attributes);

  notifier_ = options.notifier ? std::move(options.notifier)
                               : std::make_shared<notifier::notify_send_c>();
  exit_handler_ = options.exit_handler
                      ? std::move(options.exit_handler)
                      : [](int status) { std::exit(status); };
  logger_ = options.logger ? std::move(options.logger) : default_logger();
}

const types::value_c &informer_c::attribute(const std::string &name) const {
  auto it = attributes_.find(name);
  if (it == attributes_.end()) {
    return types::none();
  }
  return it->second;
}

void informer_c::set_attribute(const std::string &name, types::value_c value) {
  attributes_.insert_or_assign(name, std::move(value));
}

culprit::culprit_guard_c informer_c::set_culprit(const types::value_c &culprit) {
  return culprit::culprit_guard_c(culprits_, culprits_.replace(culprit));
}

culprit::culprit_guard_c informer_c::add_culprit(const types::value_c &culprit) {
  return culprit::culprit_guard_c(culprits_, culprits_.append(culprit));
}

culprit::culprit_t informer_c::get_culprit(const types::value_c &extra) const {
  return culprits_.get(extra);
}

std::string informer_c::join_culprit(const culprit::culprit_t &culprit) const {
  return culprit::join(culprit, culprit_sep_);
}

std::string informer_c::header(const std::string &severity) const {
  if (severity.empty()) {
    return "";
  }
  if (output_prog_name_ && !prog_name_.empty()) {
    return fmt::format("{} {}: ", prog_name_, severity);
  }
  return fmt::format("{}: ", severity);
}

void informer_c::report(const informant::informant_c &informant,
                        const compose::message_s &msg) {
  const auto &spec = informant.spec();
  bool continuation = spec.is_continuation;

  record_s routing;
  if (continuation && last_) {
    routing = *last_;
  } else if (continuation) {
    // Nothing to continue; behaves like display
    routing.informant = informant::display;
    routing.output = informant::display.spec().output.resolve(*this);
    routing.log = informant::display.spec().log.resolve(*this);
    routing.stream = &stream_policy_.select(routing.informant, out(), err());
  } else {
    routing.informant = informant;
    routing.output = spec.output.resolve(*this);
    routing.log = spec.log.resolve(*this);
    routing.notify = spec.notify.resolve(*this);
    routing.stream = &stream_policy_.select(informant, out(), err());
    if (spec.is_error) {
      errors_++;
      if (notify_if_no_tty_ && !color::is_tty(out())) {
        routing.notify = true;
      }
    }
    routing.stops = spec.severity.empty() ? 0 : 1;
  }
  const auto &routed = routing.informant.spec();

  if (routing.output || routing.log || routing.notify) {
    compose::assembled_s assembled;
    try {
      compose::assembly_s parts;
      parts.header = continuation ? "" : header(spec.severity);
      parts.culprit =
          join_culprit(msg.culprit ? *msg.culprit : culprits_.entries());
      parts.body = compose::join(msg);
      parts.codicil = compose::codicil_lines(msg);
      parts.continuation = continuation;
      parts.stops = routing.stops;
      assembled = compose::layout(parts);
    } catch (const compose::template_error_c &e) {
      logger_->debug("[session] {}", e.what());
      report(informant::panic, compose::make_message(std::string(e.what())));
      return;
    }

    std::string end = msg.end ? *msg.end : "\n";
    std::ostream &stream = msg.file ? *msg.file : *routing.stream;

    if (routing.output) {
      if (drawing_) {
        drawing_->interrupt();
      }
      auto scheme =
          color::is_tty(stream) ? colorscheme_ : color::colorscheme_e::NONE;
      write(stream,
            color::colorize(assembled.header, routed.header_color, scheme) +
                color::colorize(assembled.body, routed.message_color,
                                scheme) +
                end,
            msg.flush.value_or(flush_));
    }

    if (routing.log) {
      auto entry = assembled.text() + end;
      if (!entry.empty() && entry.back() == '\n') {
        entry.pop_back();
      }
      write_log(color::strip_colors(entry));
    }

    if (routing.notify && notifier_) {
      auto urgency = routed.is_error ? notifier::urgency_e::CRITICAL
                                     : notifier::urgency_e::NORMAL;
      if (msg.urgency) {
        if (auto requested = notifier::parse_urgency(*msg.urgency)) {
          urgency = *requested;
        } else {
          logger_->warn("[session] unknown urgency '{}'", *msg.urgency);
        }
      }
      if (!notifier_->notify(prog_name_,
                             color::strip_colors(assembled.body), urgency)) {
        logger_->debug("[session] notifier could not deliver message");
      }
    }
  }

  if (!continuation) {
    last_ = routing;
  }

  if (!continuation && spec.terminate.enabled()) {
    terminate(spec.terminate.uses_error_status()
                  ? error_status_
                  : spec.terminate.status());
  }
}

void informer_c::write(std::ostream &stream, const std::string &text,
                       bool flush) {
  try {
    stream << text;
    if (flush) {
      stream.flush();
    }
  } catch (const std::ios_base::failure &e) {
    logger_->debug("[session] write failed: {}", e.what());
  }
  if (!stream) {
    stream.clear();
    logger_->debug("[session] write failed, stream cleared");
  }
}

void informer_c::write_log(const std::string &text) {
  if (logfile_) {
    logfile_->write(text);
  }
}

void informer_c::write_output(const std::string &text) {
  write(out(), text, true);
}

void informer_c::write_logfile_header() {
  if (!prog_name_.empty() && !version_.empty()) {
    write_log(fmt::format("{}: version {}", prog_name_, version_));
  }
  auto now = fmt::format("{:%A, %d %B %Y at %I:%M:%S %p}",
                         fmt::localtime(std::time(nullptr)));
  if (argv_.empty()) {
    write_log(fmt::format("Invoked on {}.", now));
  } else {
    write_log(fmt::format("Invoked as '{}' on {}.", fmt::join(argv_, " "),
                          now));
  }
}

void informer_c::set_logfile(const logfile::destination_c &destination) {
  logfile::logging_cache_t cache;
  if (logfile_) {
    logfile_->flush();
    cache = logfile_->cache();
  }
  logfile_.reset();

  try {
    logfile_ = logfile::logfile_c::open(destination, prog_name_,
                                        prev_logfile_suffix_);
  } catch (const std::filesystem::filesystem_error &e) {
    auto description = text::os_error(e);
    write(err(), description + "\n", true);
    logger_->debug("[session] cannot open logfile: {}", description);
    return;
  }
  if (!logfile_) {
    return;
  }

  if (cache && cache != logfile_->cache()) {
    for (const auto &line : cache->lines()) {
      logfile_->write(line);
    }
    cache->clear();
    return;
  }
  write_logfile_header();
}

void informer_c::flush_logfile() {
  if (logfile_) {
    logfile_->flush();
  }
}

void informer_c::close_logfile(std::optional<int> status) {
  if (!logfile_) {
    return;
  }
  if (status) {
    write_log(fmt::format("{}: terminates with status {}.",
                          program_label(prog_name_), *status));
  }
  logfile_->flush();
  logfile_.reset();
}

void informer_c::set_stream_policy(stream_policy_c policy) {
  stream_policy_ = std::move(policy);
}

void informer_c::set_stream_policy(std::string_view name) {
  stream_policy_ = stream_policy_c::parse(name);
}

int informer_c::finish(int status, const std::string &trailer, bool exit) {
  if (!terminating_) {
    terminating_ = true;
    if (termination_callback_) {
      try {
        termination_callback_();
      } catch (...) {
        terminating_ = false;
        throw;
      }
    }
    write_log(trailer);
    if (logfile_) {
      logfile_->flush();
      logfile_.reset();
    }
    terminating_ = false;
  }
  out().flush();
  err().flush();
  if (exit) {
    exit_handler_(status);
  }
  return status;
}

int informer_c::done(bool exit) {
  return finish(0,
                fmt::format("{}: terminates normally.",
                            program_label(prog_name_)),
                exit);
}

int informer_c::terminate(std::optional<int> status, bool exit) {
  int code = status.value_or(errors_ ? error_status_ : 0);
  return finish(code,
                fmt::format("{}: terminates with status {}.",
                            program_label(prog_name_), code),
                exit);
}

int informer_c::terminate(int status, bool exit) {
  return terminate(std::optional<int>(status), exit);
}

int informer_c::terminate(std::string_view message, bool exit) {
  write(err(), std::string(message) + "\n", true);
  return finish(error_status_,
                fmt::format("{}: terminates with status '{}'.",
                            program_label(prog_name_), message),
                exit);
}

std::optional<int> informer_c::terminate_if_errors(std::optional<int> status,
                                                   bool exit) {
  if (!errors_) {
    return std::nullopt;
  }
  return terminate(status.value_or(error_status_), exit);
}

unsigned informer_c::errors_accrued(bool reset) {
  unsigned count = errors_;
  if (reset) {
    errors_ = 0;
  }
  return count;
}

void informer_c::attach(interruptible_if &drawing) { drawing_ = &drawing; }

void informer_c::detach(interruptible_if &drawing) {
  if (drawing_ == &drawing) {
    drawing_ = nullptr;
  }
}

void informer_c::disconnect() {
  flush_logfile();
  if (!connected_) {
    return;
  }
  connected_ = false;
  auto &informers = stack();
  informers.erase(std::remove(informers.begin(), informers.end(), this),
                  informers.end());
}

informer_c &get_informer() {
  // The stack must outlive the sentinel
  auto &informers = stack();
  static informer_c sentinel{informer_c::sentinel_tag_s{}};
  if (informers.empty()) {
    return sentinel;
  }
  return *informers.back();
}

informer_c &set_informer(informer_c &informer) {
  informer_c &previous = get_informer();
  if (&previous == &informer) {
    return previous;
  }
  auto &informers = stack();
  informers.erase(std::remove(informers.begin(), informers.end(), &informer),
                  informers.end());
  informers.push_back(&informer);
  informer.connected_ = true;
  return previous;
}

int done(bool exit) { return get_informer().done(exit); }

int terminate(std::optional<int> status, bool exit) {
  return get_informer().terminate(status, exit);
}

int terminate(int status, bool exit) {
  return get_informer().terminate(status, exit);
}

int terminate(std::string_view message, bool exit) {
  return get_informer().terminate(message, exit);
}

std::optional<int> terminate_if_errors(std::optional<int> status, bool exit) {
  return get_informer().terminate_if_errors(status, exit);
}

unsigned errors_accrued(bool reset) {
  return get_informer().errors_accrued(reset);
}

const std::string &get_prog_name() { return get_informer().prog_name(); }

culprit::culprit_guard_c set_culprit(const types::value_c &culprit) {
  return get_informer().set_culprit(culprit);
}

culprit::culprit_guard_c add_culprit(const types::value_c &culprit) {
  return get_informer().add_culprit(culprit);
}

culprit::culprit_t get_culprit(const types::value_c &extra) {
  return get_informer().get_culprit(extra);
}

std::string join_culprit(const culprit::culprit_t &culprit) {
  return get_informer().join_culprit(culprit);
}

} // namespace herald::session
