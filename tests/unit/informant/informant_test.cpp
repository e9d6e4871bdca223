#include <herald/informant/informant.hpp>
#include <herald/session/session.hpp>
#include <snitch/snitch.hpp>
#include <sstream>
#include <string>
#include <vector>

using herald::informant::informant_c;
using herald::informant::informant_s;
using herald::informant::predicate_c;
using herald::informant::termination_c;
using herald::session::informer_c;
using herald::session::informer_options_s;

namespace {

struct exit_s {
  int status;
};

class silent_notifier_c : public herald::notifier::notifier_if {
public:
  bool notify(const std::string &, const std::string &,
              herald::notifier::urgency_e) override {
    return true;
  }
};

informer_options_s options_for(std::ostringstream &out,
                               std::ostringstream &err) {
  informer_options_s options;
  options.prog_name = "myprog";
  options.stdout_stream = &out;
  options.stderr_stream = &err;
  options.notifier = std::make_shared<silent_notifier_c>();
  options.exit_handler = [](int status) { throw exit_s{status}; };
  return options;
}

} // namespace

TEST_CASE("predicates", "[unit][informant][predicate]") {
  std::ostringstream out, err;
  auto options = options_for(out, err);
  options.verbose = true;
  informer_c informer(std::move(options));

  CHECK(predicate_c(true).resolve(informer));
  CHECK_FALSE(predicate_c(false).resolve(informer));
  CHECK_FALSE(predicate_c().resolve(informer));

  predicate_c verbose([](const informer_c &i) { return i.verbose(); });
  CHECK(verbose.resolve(informer));

  informer.suppress_output();
  predicate_c unmuted([](const informer_c &i) { return !i.mute(); });
  CHECK_FALSE(unmuted.resolve(informer));
}

TEST_CASE("termination", "[unit][informant][termination]") {
  CHECK_FALSE(termination_c().enabled());
  CHECK_FALSE(termination_c(false).enabled());

  termination_c with_error_status(true);
  CHECK(with_error_status.enabled());
  CHECK(with_error_status.uses_error_status());

  termination_c literal(3);
  CHECK(literal.enabled());
  CHECK_FALSE(literal.uses_error_status());
  CHECK(literal.status() == 3);
}

TEST_CASE("built-in informants", "[unit][informant][builtin]") {
  namespace inf = herald::informant;

  SECTION("severities and error flags") {
    CHECK(inf::warn.spec().severity == "warning");
    CHECK(inf::error.spec().severity == "error");
    CHECK(inf::fatal.spec().severity == "error");
    CHECK(inf::debug.spec().severity == "DEBUG");
    CHECK(inf::panic.spec().severity == "internal error (please report)");
    CHECK(inf::display.spec().severity.empty());

    CHECK(inf::error.spec().is_error);
    CHECK(inf::fatal.spec().is_error);
    CHECK(inf::panic.spec().is_error);
    CHECK_FALSE(inf::warn.spec().is_error);
  }

  SECTION("termination") {
    CHECK(inf::fatal.spec().terminate.uses_error_status());
    CHECK(inf::panic.spec().terminate.status() == 3);
    CHECK_FALSE(inf::error.spec().terminate.enabled());
    CHECK(inf::codicil.spec().is_continuation);
  }

  SECTION("routing follows the session flags") {
    std::ostringstream out, err;
    auto options = options_for(out, err);
    options.quiet = true;
    informer_c informer(std::move(options));

    CHECK_FALSE(inf::display.spec().output.resolve(informer));
    CHECK_FALSE(inf::warn.spec().output.resolve(informer));
    CHECK(inf::output.spec().output.resolve(informer));
    CHECK(inf::error.spec().output.resolve(informer));
    CHECK_FALSE(inf::log.spec().output.resolve(informer));
    CHECK(inf::log.spec().log.resolve(informer));
    CHECK(inf::notify.spec().notify.resolve(informer));
    CHECK_FALSE(inf::comment.spec().output.resolve(informer));

    informer.suppress_output();
    CHECK_FALSE(inf::error.spec().output.resolve(informer));
    CHECK(inf::panic.spec().output.resolve(informer));
    CHECK(inf::debug.spec().output.resolve(informer));
  }

  SECTION("lookup by name") {
    CHECK(inf::find("warn") == &inf::warn);
    CHECK(inf::find("panic") == &inf::panic);
    CHECK(inf::find("shout") == nullptr);
  }
}

TEST_CASE("custom informants", "[unit][informant][custom]") {
  std::ostringstream out, err;
  auto options = options_for(out, err);
  options.quiet = true;
  informer_c informer(std::move(options));

  SECTION("a copy can be adjusted without touching the built-in") {
    auto loud = herald::informant::warn;
    loud.spec().output = true;
    loud("disk nearly full.");
    herald::informant::warn("not shown.");
    CHECK(out.str() == "myprog warning: disk nearly full.\n");
    CHECK_FALSE(herald::informant::warn.spec().output.resolve(informer));
  }

  SECTION("a fresh informant") {
    informant_c note(informant_s{
        .severity = "note",
        .output = true,
    });
    note("check the cable.", herald::compose::opt::culprit("eth0"));
    CHECK(out.str() == "myprog note: eth0: check the cable.\n");
  }

  SECTION("a terminating informant exits with its status") {
    informant_c abort_run(informant_s{
        .severity = "abort",
        .output = true,
        .terminate = 7,
    });
    try {
      abort_run("giving up.");
      FAIL("informant did not terminate");
    } catch (const exit_s &e) {
      CHECK(e.status == 7);
    }
    CHECK(err.str() == "myprog abort: giving up.\n");
  }
}
