#include "cli/cli.hpp"
#include "dpa/dpa.hpp"
#include "logger/logger.hpp"
#include "store/disk_store.hpp"
#include "store/local_store.hpp"
#include "store/mem_store.hpp"
#include <boost/log/trivial.hpp>
#include <iostream>
#include <stdexcept>
#include <string>
#include <unordered_set>

struct ProgramOptions {
  std::string store_dir{"swarm_store"};
  std::string hash_name{swarm::chunker::EvpHasher::DEFAULT_DIGEST};
  std::string log_file{"swarm.log"};
  std::size_t branches{swarm::chunker::TreeChunker::DEFAULT_BRANCHES};
  swarm::logging::severity_level log_level{swarm::logging::severity_level::info};
  bool level_set{false};
  bool verbose{false};
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " [-d <dir>] [-b <branches>] [-a <digest>] [-l <log file>] [-L <level>] [-v]\n"
        << "Optional arguments:\n"
        << "  -d, --dir        Chunk store directory (default swarm_store)\n"
        << "  -b, --branches   Branching factor of the chunk tree (default 128)\n"
        << "  -a, --hash       OpenSSL digest name (default SHA256)\n"
        << "  -l, --log        Log file (default swarm.log)\n"
        << "  -L, --level      Minimum log level: trace, debug, info, warning, error, fatal (default info)\n"
        << "  -v, --verbose    Echo the log to the console, at debug level unless -L is given\n"
        << "Example: " << program_name << " -d /tmp/swarm -b 128\n";
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  const std::unordered_set<std::string> value_flags = {
    "-d", "--dir", "-b", "--branches", "-a", "--hash", "-l", "--log", "-L", "--level"
  };

  ProgramOptions options;

  for (int i = 1; i < argc; ++i) {
    const std::string flag(argv[i]);

    if (flag == "-v" || flag == "--verbose") {
      options.verbose = true;
      continue;
    }

    if (value_flags.count(flag) == 0) {
      std::cerr << "Error: Unknown argument: " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }

    if (i + 1 >= argc) {
      std::cerr << "Error: Missing value for " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }
    const std::string value(argv[++i]);

    if (flag == "-d" || flag == "--dir") {
      options.store_dir = value;
    } else if (flag == "-a" || flag == "--hash") {
      options.hash_name = value;
    } else if (flag == "-l" || flag == "--log") {
      options.log_file = value;
    } else if (flag == "-L" || flag == "--level") {
      try {
        options.log_level = swarm::logging::parse_severity(value);
        options.level_set = true;
      } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << '\n';
        print_usage(argv[0]);
        return options;
      }
    } else if (flag == "-b" || flag == "--branches") {
      try {
        options.branches = static_cast<std::size_t>(std::stoul(value));
      } catch (const std::exception&) {
        std::cerr << "Error: Invalid branch count: " << value << '\n';
        print_usage(argv[0]);
        return options;
      }
    }
  }

  options.valid = true;
  return options;
}

// Runs the shell until it quits, true if every durable write succeeded
bool serve(const ProgramOptions& options) {
  swarm::chunker::ChunkerConfig config;
  config.branches = options.branches;
  config.hash_name = options.hash_name;
  swarm::chunker::TreeChunker chunker(config);

  swarm::store::MemStore mem_store;
  swarm::store::DiskStore disk_store(options.store_dir);
  swarm::store::LocalStore local_store(mem_store, disk_store);

  swarm::dpa::DPA dpa(chunker, local_store);
  swarm::cli::CLI cli(dpa, local_store);
  cli.run();

  local_store.flush();
  BOOST_LOG_TRIVIAL(info) << "Shell exiting, " << local_store.failed_writes() << " failed durable writes";
  return local_store.failed_writes() == 0;
}

bool run_shell(const ProgramOptions& options) {
  bool clean = false;
  try {
    const auto level = (options.verbose && !options.level_set)
      ? swarm::logging::severity_level::debug : options.log_level;
    swarm::logging::init_logging(options.log_file, level, options.verbose);

    // Stores are gone by the time the sinks are removed
    clean = serve(options);
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to start shell: " << e.what() << '\n';
  }
  swarm::logging::shutdown_logging();
  return clean;
}

int main(int argc, char* argv[]) {
  if (const auto options = parse_command_line(argc, argv); !options.valid) {
    return 1;
  } else if (!run_shell(options)) {
    return 1;
  }
  return 0;
}
