#include "taskrunner/config/config.hpp"
#include "taskrunner/engine/run_driver.hpp"
#include "taskrunner/executor/process_supervisor.hpp"
#include "taskrunner/util/log.hpp"

#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <optional>
#include <print>
#include <string>
#include <string_view>

namespace {

void print_usage(const char* prog) {
  std::println("taskrunner - run a directory of tasks in dependency order");
  std::println("Usage: {} [OPTIONS] [TASKDIR]", prog);
  std::println("");
  std::println("Options:");
  std::println("  -c, --config <file>     Config file (YAML)");
  std::println("  -g, --get <sec.option>  Print a configuration value and exit");
  std::println("  -n, --times <n>         Run this many times (default: forever)");
  std::println("  -q, --quiet             Only log warnings and errors");
  std::println("  -v, --verbose           Log debug messages");
  std::println("  -h, --help              Show this help message");
  std::println("");
  std::println("Task exit codes: 0 = ok, 2 = halt, anything else = retry");
}

enum class Verbosity { Default, Quiet, Verbose };

struct Options {
  std::string config_file;
  std::string get;
  std::string task_dir;
  std::optional<int> times;
  Verbosity verbosity{Verbosity::Default};
};

[[noreturn]] void usage_error(const char* prog, std::string_view message) {
  std::println(stderr, "Error: {}", message);
  std::println(stderr, "Try '{} --help' for more information.", prog);
  std::exit(1);
}

auto parse_int(std::string_view s) -> std::optional<int> {
  int value = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
  if (ec != std::errc{} || ptr != s.data() + s.size()) {
    return std::nullopt;
  }
  return value;
}

auto parse_args(int argc, char* argv[]) -> Options {
  Options opts;

  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      std::exit(0);
    } else if (arg == "-q" || arg == "--quiet") {
      opts.verbosity = Verbosity::Quiet;
    } else if (arg == "-v" || arg == "--verbose") {
      opts.verbosity = Verbosity::Verbose;
    } else if (arg == "-c" || arg == "--config") {
      if (++i >= argc) {
        usage_error(argv[0], "--config requires an argument");
      }
      opts.config_file = argv[i];
    } else if (arg == "-g" || arg == "--get") {
      if (++i >= argc) {
        usage_error(argv[0], "--get requires an argument");
      }
      opts.get = argv[i];
    } else if (arg == "-n" || arg == "--times") {
      if (++i >= argc) {
        usage_error(argv[0], "--times requires an argument");
      }
      auto times = parse_int(argv[i]);
      if (!times || *times < 0) {
        usage_error(argv[0], "--times expects a non-negative integer");
      }
      opts.times = *times;
    } else if (arg.starts_with('-') && arg.size() > 1) {
      usage_error(argv[0], std::format("unknown option: {}", arg));
    } else if (opts.task_dir.empty()) {
      opts.task_dir = argv[i];
    } else {
      usage_error(argv[0], std::format("unexpected argument: {}", arg));
    }
  }

  return opts;
}

void setup_logging(const Options& opts, std::string_view configured) {
  switch (opts.verbosity) {
    case Verbosity::Quiet:
      taskrunner::log::set_level(taskrunner::log::Level::Warn);
      break;
    case Verbosity::Verbose:
      taskrunner::log::set_level(taskrunner::log::Level::Debug);
      break;
    case Verbosity::Default:
      taskrunner::log::set_level(configured);
      break;
  }
}

auto run_get(const taskrunner::IConfigLookup& config, std::string_view key)
    -> int {
  taskrunner::log::debug("getting {}", key);
  auto dot = key.find('.');
  if (dot == std::string_view::npos) {
    std::println(stderr, "Error: --get expects section.option, got '{}'", key);
    return 1;
  }
  if (auto value = config.get(key.substr(0, dot), key.substr(dot + 1))) {
    std::println("{}", *value);
  }
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto opts = parse_args(argc, argv);
  setup_logging(opts, "info");

  taskrunner::RunConfig config;
  if (!opts.config_file.empty()) {
    auto loaded = taskrunner::ConfigLoader::load_from_file(opts.config_file);
    if (!loaded) {
      std::println(stderr, "Error: Failed to load config {}: {}",
                   opts.config_file, loaded.error().message());
      return 1;
    }
    config = std::move(*loaded);
  }
  setup_logging(opts, config.settings().log_level);

  if (!opts.get.empty()) {
    return run_get(config, opts.get);
  }
  if (opts.task_dir.empty()) {
    usage_error(argv[0], "taskdir required");
  }

  std::error_code ec;
  if (!std::filesystem::exists(opts.task_dir, ec)) {
    taskrunner::log::error("{} doesn't exist", opts.task_dir);
    return 1;
  }

  auto supervisor = taskrunner::create_process_supervisor();
  taskrunner::RunDriver driver(config.settings(), config, config.env_overlay(),
                               *supervisor);

  if (auto r = driver.run(opts.task_dir, opts.times); !r) {
    taskrunner::log::error("run failed in iteration {}: {}",
                           driver.iterations(), r.error().message());
    return 1;
  }
  return 0;
}
