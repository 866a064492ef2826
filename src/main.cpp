#include "cli/cli.hpp"
#include "config/settings.hpp"
#include "logger/logger.hpp"
#include "oplog/operation_log.hpp"
#include "store/file_record_store.hpp"
#include <iostream>
#include <string>
#include <unordered_set>

struct ProgramOptions {
  std::string config_path;
  std::string store_path;
  std::string log_file;
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " [-c <config>] [-d <store dir>] [-l <log file>]\n"
        << "Optional arguments:\n"
        << "  -c, --config    JSON settings file\n"
        << "  -d, --store     Record store directory (overrides settings)\n"
        << "  -l, --log-file  Process log file (overrides settings)\n"
        << "The encryption password may also be given in K7_ENCRYPTION_PASSWORD.\n"
        << "Example: " << program_name << " -c k7port.json -d ./k7_store\n";
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  const std::unordered_set<std::string> flags = {
    "-c", "--config", "-d", "--store", "-l", "--log-file"
  };

  ProgramOptions options;

  if (argc % 2 == 0) {
    std::cerr << "Error: Every flag needs a value\n";
    print_usage(argv[0]);
    return options;
  }

  for (int i = 1; i < argc - 1; i += 2) {
    const std::string flag(argv[i]);
    const std::string value(argv[i + 1]);

    if (flags.count(flag) == 0) {
      std::cerr << "Error: Unknown argument: " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }

    if (flag == "-c" || flag == "--config") {
      options.config_path = value;
    } else if (flag == "-d" || flag == "--store") {
      options.store_path = value;
    } else if (flag == "-l" || flag == "--log-file") {
      options.log_file = value;
    }
  }

  options.valid = true;
  return options;
}

bool run_shell(const ProgramOptions& options) {
  try {
    k7::config::Settings settings = options.config_path.empty()
        ? k7::config::Settings()
        : k7::config::Settings::load(options.config_path);
    settings.apply_environment();
    if (!options.store_path.empty()) {
      settings.store_path = options.store_path;
    }
    if (!options.log_file.empty()) {
      settings.log_file = options.log_file;
    }

    auto level = k7::logger::parse_severity(settings.log_level);
    k7::logger::init_logging(settings.log_file.string(), level.value_or(k7::logger::severity_level::info));

    if (settings.encryption_password.empty()) {
      std::cerr << "Warning: No encryption password configured, export and import will fail\n";
      K7_LOG_WARN << "Main: Encryption password is not set";
    }

    k7::store::FileRecordStore store(settings.store_path, settings.role_key);
    k7::oplog::OperationLog log(settings.last_log_path, settings.last_log_ttl);
    k7::cli::CLI cli(store, log, settings);

    cli.run();
    return true;
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to start k7port: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  if (const auto options = parse_command_line(argc, argv); !options.valid) {
    return 1;
  } else if (!run_shell(options)) {
    return 1;
  }
  return 0;
}
