#include "critpath/cli/commands.hpp"

#include <cstdlib>
#include <print>
#include <string>
#include <string_view>

namespace {

void print_usage(const char* prog) {
  std::println("critpath - Critical path scheduling engine");
  std::println("Usage: {} <command> [OPTIONS]", prog);
  std::println("");
  std::println("Commands:");
  std::println("  schedule              Compute and print the project schedule");
  std::println("  validate              Check tasks and dependencies only");
  std::println("  phases                Show which phases are locked");
  std::println("");
  std::println("Options:");
  std::println("  -p, --project <file>  Project definition (YAML)");
  std::println("  -c, --config <file>   Engine config (YAML)");
  std::println("  --json                Print JSON instead of a table");
  std::println("  --no-level            Skip resource leveling (schedule)");
  std::println("  -v, --version         Show version and exit");
  std::println("  -h, --help            Show this help message");
  std::println("");
  std::println("Examples:");
  std::println("  {} schedule -p project.yaml -c critpath.yaml", prog);
  std::println("  {} validate -p project.yaml", prog);
  std::println("  {} phases -p project.yaml --json", prog);
}

void print_version() {
  std::println("critpath v0.1.0");
}

struct Options {
  std::string command;
  std::string project_file;
  std::string config_file;
  bool json = false;
  bool no_level = false;
};

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
    } else if (arg == "-p" || arg == "--project") {
      if (++i >= argc) {
        std::println(stderr, "Error: --project requires an argument");
        std::exit(1);
      }
      opts.project_file = argv[i];
    } else if (arg == "-c" || arg == "--config") {
      if (++i >= argc) {
        std::println(stderr, "Error: --config requires an argument");
        std::exit(1);
      }
      opts.config_file = argv[i];
    } else if (arg == "--json") {
      opts.json = true;
    } else if (arg == "--no-level") {
      opts.no_level = true;
    } else if (opts.command.empty() && !arg.starts_with('-')) {
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
  auto opts = parse_args(argc, argv);

  if (opts.command == "schedule") {
    return critpath::cli::cmd_schedule({opts.project_file, opts.config_file,
                                        opts.json, opts.no_level});
  }
  if (opts.command == "validate") {
    return critpath::cli::cmd_validate({opts.project_file, opts.config_file});
  }
  if (opts.command == "phases") {
    return critpath::cli::cmd_phases(
        {opts.project_file, opts.config_file, opts.json});
  }

  if (opts.command.empty()) {
    std::println(stderr, "Error: No command given");
  } else {
    std::println(stderr, "Unknown command: {}", opts.command);
  }
  print_usage(argv[0]);
  return 1;
}
