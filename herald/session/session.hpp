#pragma once

#include "herald/color/color.hpp"
#include "herald/compose/compose.hpp"
#include "herald/culprit/culprit.hpp"
#include "herald/informant/informant.hpp"
#include "herald/logfile/logfile.hpp"
#include "herald/notifier/notifier.hpp"
#include "herald/types/value.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <ostream>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace herald::session {

typedef std::shared_ptr<spdlog::logger> logger_t;

enum class stream_policy_e {
  TERMINATION = 0, // stdout, except terminating messages which go to stderr
  HEADER = 1,      // messages with a severity go to stderr
  ERRORS = 2,      // error messages go to stderr
  ALL = 3,         // everything goes to stderr
};

class stream_policy_c {
public:
  using fn_t = std::function<std::ostream &(
      const informant::informant_c &, std::ostream &out, std::ostream &err)>;

  stream_policy_c(stream_policy_e policy = stream_policy_e::TERMINATION);

  template <typename F,
            std::enable_if_t<std::is_invocable_r_v<
                                 std::ostream &, F, const informant::informant_c &,
                                 std::ostream &, std::ostream &>,
                             int> = 0>
  stream_policy_c(F fn) : rule_(fn_t(std::move(fn))) {}

  // Raises errors::error_c for an unknown name
  static stream_policy_c parse(std::string_view name);

  std::ostream &select(const informant::informant_c &informant,
                       std::ostream &out, std::ostream &err) const;

private:
  std::variant<stream_policy_e, fn_t> rule_;
};

// Something drawing on the output line that must get out of the way of
// a message (the progress bar)
class interruptible_if {
public:
  virtual ~interruptible_if() = default;
  virtual void interrupt() = 0;
};

struct informer_options_s {
  bool mute{false};
  bool quiet{false};
  bool verbose{false};
  bool narrate{false};
  logfile::destination_c logfile;
  std::string prev_logfile_suffix;
  int error_status{1};
  // derived from argv[0] when not given
  std::optional<std::string> prog_name;
  bool output_prog_name{true};
  std::vector<std::string> argv;
  std::string version;
  std::function<void()> termination_callback;
  color::colorscheme_e colorscheme{color::colorscheme_e::DARK};
  bool flush{false};
  std::ostream *stdout_stream{nullptr};
  std::ostream *stderr_stream{nullptr};
  std::string culprit_sep{", "};
  stream_policy_c stream_policy;
  bool notify_if_no_tty{false};
  notifier::notifier_t notifier;
  std::function<void(int)> exit_handler;
  logger_t logger;
  types::map_t attributes;
};

/*
    An output session. Constructing one makes it the active session;
    destroying (or disconnecting) it hands control back to the session that
    was active before. A default session is always underneath.

    All informants dispatch through report().

    Failed writes to the output streams are absorbed and the stream is
    cleared. Writing to a closed pipe still raises SIGPIPE, so programs
    whose output may be piped should ignore that signal before the first
    message (the herald executable does so in main).
*/
class informer_c {
public:
  explicit informer_c(informer_options_s options = {});
  ~informer_c();

  informer_c(const informer_c &) = delete;
  informer_c(informer_c &&) = delete;
  informer_c &operator=(const informer_c &) = delete;
  informer_c &operator=(informer_c &&) = delete;

  bool mute() const { return mute_; }
  bool quiet() const { return quiet_; }
  bool verbose() const { return verbose_; }
  bool narrate() const { return narrate_; }
  void suppress_output(bool mute = true) { mute_ = mute; }

  const std::string &prog_name() const { return prog_name_; }
  bool output_prog_name() const { return output_prog_name_; }
  const std::string &version() const { return version_; }
  const std::vector<std::string> &argv() const { return argv_; }
  int error_status() const { return error_status_; }
  color::colorscheme_e colorscheme() const { return colorscheme_; }
  logger_t logger() const { return logger_; }

  std::ostream &out() const { return *stdout_; }
  std::ostream &err() const { return *stderr_; }

  // The none sentinel when the attribute was never set
  const types::value_c &attribute(const std::string &name) const;
  void set_attribute(const std::string &name, types::value_c value);

  culprit::culprit_guard_c set_culprit(const types::value_c &culprit);
  culprit::culprit_guard_c add_culprit(const types::value_c &culprit);
  culprit::culprit_t
  get_culprit(const types::value_c &extra = types::none()) const;
  std::string join_culprit(const culprit::culprit_t &culprit) const;

  void report(const informant::informant_c &informant,
              const compose::message_s &msg);

  void set_logfile(const logfile::destination_c &destination);
  void flush_logfile();
  // Writes the termination trailer first when a status is given
  void close_logfile(std::optional<int> status = std::nullopt);

  void set_stream_policy(stream_policy_c policy);
  void set_stream_policy(std::string_view name);

  /*
      The termination operations run the termination callback, log the
      trailer, close the logfile and then end the process through the exit
      handler. With exit == false everything but the last step happens and
      the status is returned.
  */
  int done(bool exit = true);
  int terminate(std::optional<int> status = std::nullopt, bool exit = true);
  int terminate(int status, bool exit = true);
  // The message goes to stderr and the exit status is the error status
  int terminate(std::string_view message, bool exit = true);
  std::optional<int> terminate_if_errors(std::optional<int> status = std::nullopt,
                                         bool exit = true);
  unsigned errors_accrued(bool reset = false);

  void attach(interruptible_if &drawing);
  void detach(interruptible_if &drawing);
  // Raw text to the output stream, for in-place drawing
  void write_output(const std::string &text);

  void disconnect();

private:
  struct sentinel_tag_s {};
  explicit informer_c(sentinel_tag_s);

  struct record_s {
    informant::informant_c informant;
    bool output{false};
    bool log{false};
    bool notify{false};
    std::ostream *stream{nullptr};
    int stops{0};
  };

  bool mute_{false};
  bool quiet_{false};
  bool verbose_{false};
  bool narrate_{false};
  std::string prog_name_;
  bool output_prog_name_{true};
  std::vector<std::string> argv_;
  std::string version_;
  int error_status_{1};
  std::function<void()> termination_callback_;
  color::colorscheme_e colorscheme_{color::colorscheme_e::DARK};
  bool flush_{false};
  std::ostream *stdout_{nullptr};
  std::ostream *stderr_{nullptr};
  std::string culprit_sep_{", "};
  stream_policy_c stream_policy_;
  bool notify_if_no_tty_{false};
  notifier::notifier_t notifier_;
  std::function<void(int)> exit_handler_;
  logger_t logger_;
  types::map_t attributes_;
  std::string prev_logfile_suffix_;

  std::unique_ptr<logfile::logfile_c> logfile_;
  culprit::culprit_stack_c culprits_;
  std::optional<record_s> last_;
  unsigned errors_{0};
  bool terminating_{false};
  bool connected_{false};
  interruptible_if *drawing_{nullptr};

  void configure(informer_options_s &options);
  std::string header(const std::string &severity) const;
  void write(std::ostream &stream, const std::string &text, bool flush);
  void write_log(const std::string &text);
  void write_logfile_header();
  int finish(int status, const std::string &trailer, bool exit);

  friend informer_c &get_informer();
  friend informer_c &set_informer(informer_c &informer);
};

// The active session
informer_c &get_informer();
// Makes informer the active session and returns the one it displaces
informer_c &set_informer(informer_c &informer);

int done(bool exit = true);
int terminate(std::optional<int> status = std::nullopt, bool exit = true);
int terminate(int status, bool exit = true);
int terminate(std::string_view message, bool exit = true);
std::optional<int> terminate_if_errors(std::optional<int> status = std::nullopt,
                                       bool exit = true);
unsigned errors_accrued(bool reset = false);
const std::string &get_prog_name();

culprit::culprit_guard_c set_culprit(const types::value_c &culprit);
culprit::culprit_guard_c add_culprit(const types::value_c &culprit);
culprit::culprit_t get_culprit(const types::value_c &extra = types::none());
std::string join_culprit(const culprit::culprit_t &culprit);

} // namespace herald::session
