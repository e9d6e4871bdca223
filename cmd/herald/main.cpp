#include <csignal>
#include <herald/errors/errors.hpp>
#include <herald/informant/informant.hpp>
#include <herald/session/session.hpp>
#include <iostream>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace {

void usage(std::ostream &out, const char *program) {
  out << "Usage: " << program << " <kind> [options] [--] words..."
      << std::endl;
  out << "Kinds: log comment narrate display output notify debug warn error "
         "fatal panic"
      << std::endl;
  out << "Options:" << std::endl;
  out << "  -p, --prog-name <name>     Program name shown in headers"
      << std::endl;
  out << "  -c, --culprit <text>       Add a culprit (repeatable)" << std::endl;
  out << "  -C, --codicil <text>       Add a codicil line (repeatable)"
      << std::endl;
  out << "  -t, --template <text>      Add a template candidate (repeatable)"
      << std::endl;
  out << "  -k, --kw <name=value>      Add a named value (repeatable)"
      << std::endl;
  out << "  -w, --wrap <width>         Wrap the message" << std::endl;
  out << "  -l, --logfile <path>       Also log to path" << std::endl;
  out << "  -q, --quiet                Suppress normal output" << std::endl;
  out << "  -m, --mute                 Suppress all output" << std::endl;
  out << "  -v, --verbose              Output comments" << std::endl;
  out << "  -n, --narrate              Output narration" << std::endl;
  out << "      --colorscheme <name>   none, light or dark" << std::endl;
  out << "      --stream-policy <name> termination, header, errors or all"
      << std::endl;
}

} // namespace

int main(int argc, char **argv) {
  if (argc < 2) {
    usage(std::cerr, argv[0]);
    return 2;
  }

  std::string kind = argv[1];
  if (kind == "-h" || kind == "--help") {
    usage(std::cout, argv[0]);
    return 0;
  }
  const auto *informant = herald::informant::find(kind);
  if (!informant) {
    std::cerr << argv[0] << ": " << kind << ": unknown message kind."
              << std::endl;
    usage(std::cerr, argv[0]);
    return 2;
  }

  herald::session::informer_options_s options;
  herald::compose::message_s msg;
  bool words_only = false;

  for (int i = 2; i < argc; i++) {
    std::string arg = argv[i];
    if (words_only || arg.empty() || arg[0] != '-' || arg == "-") {
      msg.args.emplace_back(arg);
      continue;
    }
    if (arg == "--") {
      words_only = true;
      continue;
    }

    bool takes_value = arg == "-p" || arg == "--prog-name" || arg == "-c" ||
                       arg == "--culprit" || arg == "-C" ||
                       arg == "--codicil" || arg == "-t" ||
                       arg == "--template" || arg == "-k" || arg == "--kw" ||
                       arg == "-w" || arg == "--wrap" || arg == "-l" ||
                       arg == "--logfile" || arg == "--colorscheme" ||
                       arg == "--stream-policy";
    if (takes_value && i + 1 >= argc) {
      std::cerr << argv[0] << ": " << arg << ": missing value." << std::endl;
      return 2;
    }

    if (arg == "-p" || arg == "--prog-name") {
      options.prog_name = argv[++i];
    } else if (arg == "-c" || arg == "--culprit") {
      if (!msg.culprit) {
        msg.culprit.emplace();
      }
      msg.culprit->emplace_back(std::string(argv[++i]));
    } else if (arg == "-C" || arg == "--codicil") {
      msg.codicil.emplace_back(argv[++i]);
    } else if (arg == "-t" || arg == "--template") {
      msg.templates.emplace_back(argv[++i]);
    } else if (arg == "-k" || arg == "--kw") {
      std::string pair = argv[++i];
      auto eq = pair.find('=');
      if (eq == std::string::npos || eq == 0) {
        std::cerr << argv[0] << ": " << pair << ": expected name=value."
                  << std::endl;
        return 2;
      }
      msg.kwargs.insert_or_assign(pair.substr(0, eq), pair.substr(eq + 1));
    } else if (arg == "-w" || arg == "--wrap") {
      try {
        int width = std::stoi(argv[++i]);
        msg.wrap = width > 0 ? static_cast<std::size_t>(width) : 0;
      } catch (const std::exception &) {
        std::cerr << argv[0] << ": " << argv[i] << ": invalid width."
                  << std::endl;
        return 2;
      }
    } else if (arg == "-l" || arg == "--logfile") {
      options.logfile = std::string(argv[++i]);
    } else if (arg == "--colorscheme") {
      auto scheme = herald::color::parse_colorscheme(argv[++i]);
      if (!scheme) {
        std::cerr << argv[0] << ": " << argv[i] << ": unknown color scheme."
                  << std::endl;
        return 2;
      }
      options.colorscheme = *scheme;
    } else if (arg == "--stream-policy") {
      try {
        options.stream_policy =
            herald::session::stream_policy_c::parse(argv[++i]);
      } catch (const herald::errors::error_c &e) {
        std::cerr << argv[0] << ": " << e.what() << std::endl;
        return 2;
      }
    } else if (arg == "-q" || arg == "--quiet") {
      options.quiet = true;
    } else if (arg == "-m" || arg == "--mute") {
      options.mute = true;
    } else if (arg == "-v" || arg == "--verbose") {
      options.verbose = true;
    } else if (arg == "-n" || arg == "--narrate") {
      options.narrate = true;
    } else if (arg == "-h" || arg == "--help") {
      usage(std::cout, argv[0]);
      return 0;
    } else {
      std::cerr << argv[0] << ": " << arg << ": unknown option." << std::endl;
      usage(std::cerr, argv[0]);
      return 2;
    }
  }

  std::signal(SIGPIPE, SIG_IGN);

  auto logger = spdlog::stderr_color_mt("herald");
  logger->set_level(spdlog::level::warn);

  if (!options.prog_name) {
    options.output_prog_name = false;
  }
  options.argv.assign(argv, argv + argc);
  options.logger = logger;

  herald::session::informer_c informer(std::move(options));
  informant->report(msg);
  return informer.terminate(std::nullopt, false);
}
