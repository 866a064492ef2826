#include "cli/cli.hpp"
#include <fstream>
#include <iterator>
#include <sstream>
#include <boost/log/trivial.hpp>
#include "pipeline/export_run.hpp"
#include "pipeline/import_run.hpp"

namespace k7 {
namespace cli {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(store::RecordStore& store, oplog::OperationLog& log, const config::Settings& settings,
         std::istream& in, std::ostream& out)
  : running_(false)
  , store_(store)
  , log_(log)
  , settings_(settings)
  , in_(in)
  , out_(out) {
  BOOST_LOG_TRIVIAL(info) << "CLI initialized";
}


//==============================================
// STARTUP
//==============================================

void CLI::run() {
  running_ = true;
  std::string line;

  BOOST_LOG_TRIVIAL(info) << "Starting CLI loop";
  out_ << "K7_Shell> " << std::flush;

  while (running_ && std::getline(in_, line)) {
    std::istringstream iss(line);
    std::string command, filename;
    iss >> command >> filename;

    if (command == "quit") {
      running_ = false;
      continue;
    }
    if (!command.empty()) {
      process_command(command, filename);
    }

    if (running_) {
      out_ << "K7_Shell> " << std::flush;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "CLI loop ended";
}


//==============================================
// COMMAND PROCESSING
//==============================================

void CLI::process_command(const std::string& command, const std::string& filename) {
  BOOST_LOG_TRIVIAL(debug) << "Processing command: " << command << " with filename: " << filename;

  if (command == "export") {
    handle_export_command(filename);
  }
  else if ((command == "import" || command == "dryrun") && !filename.empty()) {
    handle_import_command(filename, command == "dryrun");
  }
  else if (command == "list" && filename.empty()) {
    handle_list_command();
  }
  else if (command == "log" && filename.empty()) {
    handle_log_command();
  }
  else if (command == "help" && filename.empty()) {
    handle_help_command();
  }
  else {
    out_ << "Unknown command or invalid arguments" << std::endl;
  }
}

void CLI::handle_export_command(const std::string& filename) {
  try {
    pipeline::ExportOptions options;
    options.filename_prefix = settings_.filename_prefix;
    pipeline::ExportRun run(store_, log_, options);
    pipeline::ExportResult result = run.run(settings_.encryption_password);

    const std::string target = filename.empty() ? result.filename : filename;
    std::ofstream file(target, std::ios::binary | std::ios::trunc);
    if (!file) {
      out_ << "Error opening file: " << target << std::endl;
      return;
    }
    file << result.archive;
    file.close();
    if (!file) {
      out_ << "Error writing file: " << target << std::endl;
      return;
    }

    out_ << "Exported " << result.record_count << " records to " << target << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error exporting records", e.what());
  }
}

void CLI::handle_import_command(const std::string& filename, bool dry_run) {
  std::ifstream file(filename, std::ios::binary);
  if (!file) {
    out_ << "Error opening file: " << filename << std::endl;
    return;
  }
  std::string archive((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

  try {
    pipeline::ImportOptions options;
    options.max_archive_bytes = settings_.max_archive_bytes;
    options.reconciler.role_key = settings_.role_key;
    pipeline::ImportRun run(store_, log_, options);

    pipeline::ImportRequest request;
    request.archive = std::move(archive);
    request.password = settings_.encryption_password;
    request.dry_run = dry_run;
    request.filename = filename;

    pipeline::ImportResult result = run.run(request);
    for (const auto& decision : result.decisions) {
      out_ << "  #" << decision.index << " " << (decision.key.empty() ? "(no key)" : decision.key) << ": "
           << reconcile::to_string(decision.kind);
      if (decision.reason) {
        out_ << " (" << reconcile::to_string(*decision.reason) << ")";
      }
      if (decision.id) {
        out_ << " [ID " << reconcile::to_string(*decision.id) << "]";
      }
      out_ << '\n';
    }
    out_ << result.message << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error importing records", e.what());
  }
}

void CLI::handle_list_command() {
  try {
    auto records = store_.list();
    out_ << "Stored records: " << records.size() << std::endl;
    for (const auto& stored : records) {
      out_ << "  [" << stored.id << "] " << stored.record.key << std::endl;
    }
  } catch (const std::exception& e) {
    log_and_display_error("Error listing records", e.what());
  }
}

void CLI::handle_log_command() {
  auto entries = log_.last_entries();
  if (entries.empty()) {
    out_ << "No log from the last run." << std::endl;
    return;
  }
  for (const auto& entry : entries) {
    out_ << entry.to_string() << '\n';
  }
  out_ << std::flush;
}

void CLI::handle_help_command() {
  out_ << "Available commands:" << std::endl;
  out_ << "  help              Display this help message" << std::endl;
  out_ << "  list              List stored records" << std::endl;
  out_ << "  export [file]     Export all records to a .k7 archive" << std::endl;
  out_ << "  import <file>     Import records from a .k7 archive" << std::endl;
  out_ << "  dryrun <file>     Show what importing <file> would change" << std::endl;
  out_ << "  log               Show the log of the last export or import" << std::endl;
  out_ << "  quit              Exit the K7 shell" << std::endl << std::endl;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << message << ": " << error;
  out_ << message << ": " << error << std::endl;
}

} // namespace cli
} // namespace k7
