#include "dailyops/cli/commands.hpp"

#include <charconv>
#include <cstdlib>
#include <optional>
#include <print>
#include <string>
#include <string_view>

namespace {

void print_usage(const char* prog) {
  std::println("dailyops - daily operations pipeline for building maintenance");
  std::println("Usage: {} <command> [OPTIONS]", prog);
  std::println("");
  std::println("Commands:");
  std::println("  serve       Run the daily trigger until SIGINT/SIGTERM");
  std::println("              (SIGUSR1 or SIGCONT forces a catch-up check)");
  std::println("  run         Run today's pipeline once");
  std::println("  migrate     Import the operational dataset if not done yet");
  std::println("  generate    Create the task instances due on a date");
  std::println("  sweep       Delete expired history");
  std::println("  status      Show migration state and table counts");
  std::println("  validate    Check the operational dataset");
  std::println("");
  std::println("Options:");
  std::println("  -c, --config <file>   Config file (YAML)");
  std::println("  --db <file>           Database file (overrides config)");
  std::println("  -d, --daemon          serve: run as daemon");
  std::println("  --log-file <file>     serve: log to file");
  std::println("  --force               run: ignore today's run marker");
  std::println("  --date <YYYY-MM-DD>   generate: target date (default today)");
  std::println("  --days <n>            sweep: retention horizon in days");
  std::println("  --dataset <file>      validate: dataset file (overrides config)");
  std::println("  -v, --version         Show version and exit");
  std::println("  -h, --help            Show this help message");
  std::println("");
  std::println("Examples:");
  std::println("  {} serve -c config/dailyops.yaml", prog);
  std::println("  {} generate -c config/dailyops.yaml --date 2025-03-03", prog);
}

void print_version() {
  std::println("dailyops v0.1.0");
}

struct Options {
  std::string command;
  dailyops::cli::CommonOptions common;
  bool daemon{false};
  bool force{false};
  std::optional<std::string> log_file;
  std::optional<std::string> date;
  std::optional<int> days;
  std::optional<std::string> dataset_file;
};

auto require_value(int& i, int argc, char* argv[], std::string_view flag)
    -> std::string {
  if (++i >= argc) {
    std::println(stderr, "Error: {} requires an argument", flag);
    std::exit(1);
  }
  return argv[i];
}

auto parse_args(int argc, char* argv[]) -> Options {
  Options opts;

  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      std::exit(0);
    } else if (arg == "-v" || arg == "--version") {
      print_version();
      std::exit(0);
    } else if (arg == "-c" || arg == "--config") {
      opts.common.config_file = require_value(i, argc, argv, arg);
    } else if (arg == "--db") {
      opts.common.db_file = require_value(i, argc, argv, arg);
    } else if (arg == "-d" || arg == "--daemon") {
      opts.daemon = true;
    } else if (arg == "--log-file") {
      opts.log_file = require_value(i, argc, argv, arg);
    } else if (arg == "--force") {
      opts.force = true;
    } else if (arg == "--date") {
      opts.date = require_value(i, argc, argv, arg);
    } else if (arg == "--dataset") {
      opts.dataset_file = require_value(i, argc, argv, arg);
    } else if (arg == "--days") {
      auto value = require_value(i, argc, argv, arg);
      int days = 0;
      auto [ptr, ec] =
          std::from_chars(value.data(), value.data() + value.size(), days);
      if (ec != std::errc{} || ptr != value.data() + value.size()) {
        std::println(stderr, "Error: --days expects an integer, got '{}'",
                     value);
        std::exit(1);
      }
      opts.days = days;
    } else if (!arg.starts_with('-') && opts.command.empty()) {
      opts.command = arg;
    } else {
      std::println(stderr, "Unknown option: {}", arg);
      print_usage(argv[0]);
      std::exit(1);
    }
  }

  return opts;
}

}  // namespace

int main(int argc, char* argv[]) {
  using namespace dailyops::cli;

  auto opts = parse_args(argc, argv);

  if (opts.command == "serve") {
    return cmd_serve({opts.common, opts.daemon, opts.log_file});
  }
  if (opts.command == "run") {
    return cmd_run({opts.common, opts.force});
  }
  if (opts.command == "migrate") {
    return cmd_migrate({opts.common});
  }
  if (opts.command == "generate") {
    return cmd_generate({opts.common, opts.date});
  }
  if (opts.command == "sweep") {
    return cmd_sweep({opts.common, opts.days});
  }
  if (opts.command == "status") {
    return cmd_status({opts.common});
  }
  if (opts.command == "validate") {
    return cmd_validate({opts.common, opts.dataset_file});
  }

  if (opts.command.empty()) {
    std::println(stderr, "Error: missing command");
  } else {
    std::println(stderr, "Unknown command: {}", opts.command);
  }
  print_usage(argv[0]);
  return 1;
}
