#ifndef K7_CLI_HPP
#define K7_CLI_HPP

#include <iostream>
#include <string>
#include "config/settings.hpp"
#include "oplog/operation_log.hpp"
#include "store/record_store.hpp"

namespace k7 {
namespace cli {

class CLI {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    CLI(store::RecordStore& store, oplog::OperationLog& log, const config::Settings& settings,
        std::istream& in = std::cin, std::ostream& out = std::cout);


    // ---- STARTUP ----
    // Reads commands until "quit" or end of input
    void run();

private:
    // ---- PARAMETERS ----
    bool running_;
    // System components
    store::RecordStore& store_;
    oplog::OperationLog& log_;
    const config::Settings& settings_;
    std::istream& in_;
    std::ostream& out_;


    // ---- COMMAND PROCESSING ----
    void process_command(const std::string& command, const std::string& filename);
    void handle_export_command(const std::string& filename);
    void handle_import_command(const std::string& filename, bool dry_run);
    void handle_list_command();
    void handle_log_command();
    void handle_help_command();
    void log_and_display_error(const std::string& message, const std::string& error);
};

} // namespace cli
} // namespace k7

#endif // K7_CLI_HPP
