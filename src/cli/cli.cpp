#include "cli/cli.hpp"
#include "chunker/chunker_error.hpp"
#include <fstream>
#include <iostream>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace swarm {
namespace cli {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(dpa::DPA& dpa, store::ChunkStore& store, std::istream& input, std::ostream& output)
  : running_(false)
  , dpa_(dpa)
  , store_(store)
  , input_(input)
  , output_(output) {
  BOOST_LOG_TRIVIAL(info) << "CLI initialized";
}


//==============================================
// STARTUP
//==============================================

void CLI::run() {
  running_ = true;
  std::string line;

  BOOST_LOG_TRIVIAL(info) << "Starting CLI loop";
  output_ << "swarm> " << std::flush;

  while (running_ && std::getline(input_, line)) {
    std::istringstream iss(line);
    std::string command, argument, extra;
    iss >> command >> argument >> extra;

    if (command == "quit") {
      running_ = false;
      continue;
    }

    if (!command.empty()) {
      process_command(command, argument, extra);
    }

    if (running_) {
      output_ << "swarm> " << std::flush;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "CLI loop ended";
}


//==============================================
// COMMAND PROCESSING
//==============================================

void CLI::process_command(const std::string& command, const std::string& argument, const std::string& extra) {
  BOOST_LOG_TRIVIAL(debug) << "Processing command: " << command << " with argument: " << argument;

  if (command == "help") {
    handle_help_command();
  }
  else if (argument.empty()) {
    output_ << "Invalid input. Usage: <command> <argument>, try 'help'" << std::endl;
  }
  else if (command == "store") {
    handle_store_command(argument);
  }
  else if (command == "read") {
    handle_read_command(argument, extra);
  }
  else if (command == "has") {
    handle_has_command(argument);
  }
  else if (command == "size") {
    handle_size_command(argument);
  }
  else {
    output_ << "Unknown command: " << command << std::endl;
  }
}

void CLI::handle_store_command(const std::string& filename) {
  try {
    chunker::FileSectionReader reader(filename);
    chunker::Key key = dpa_.store(reader);
    output_ << key.to_hex() << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error storing file", e.what());
  }
}

void CLI::handle_read_command(const std::string& hex_key, const std::string& out_file) {
  try {
    chunker::Key key = chunker::Key::from_hex(hex_key);

    if (out_file.empty()) {
      dpa_.read(key, output_);
      output_ << std::endl;
      return;
    }

    std::ofstream file(out_file, std::ios::binary | std::ios::trunc);
    if (!file) {
      log_and_display_error("Error reading content", "cannot open " + out_file);
      return;
    }
    uint64_t written = dpa_.read(key, file);
    output_ << "Wrote " << written << " bytes to " << out_file << std::endl;
  } catch (const chunker::ChunkNotFoundError& e) {
    log_and_display_error("Content incomplete, missing chunk", e.key().to_hex());
  } catch (const std::exception& e) {
    log_and_display_error("Error reading content", e.what());
  }
}

void CLI::handle_has_command(const std::string& hex_key) {
  try {
    bool present = store_.get(chunker::Key::from_hex(hex_key)).has_value();
    output_ << (present ? "yes" : "no") << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error looking up key", e.what());
  }
}

void CLI::handle_size_command(const std::string& hex_key) {
  try {
    auto reader = dpa_.open(chunker::Key::from_hex(hex_key));
    output_ << reader->size() << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error reading size", e.what());
  }
}

void CLI::handle_help_command() {
  output_ << "Commands:\n"
          << "  store <file>            Store a file, prints its root key\n"
          << "  read <key> [out file]   Print content or write it to a file\n"
          << "  has <key>               Check whether a chunk is stored\n"
          << "  size <key>              Print the content length under a root key\n"
          << "  help                    Show this message\n"
          << "  quit                    Exit" << std::endl;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << message << ": " << error;
  output_ << message << ": " << error << std::endl;
}

} // namespace cli
} // namespace swarm
