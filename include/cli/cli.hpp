#pragma once

#include <iostream>
#include <istream>
#include <ostream>
#include <string>
#include "dpa/dpa.hpp"
#include "store/chunk_store.hpp"

namespace swarm {
namespace cli {

class CLI {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    CLI(dpa::DPA& dpa, store::ChunkStore& store,
        std::istream& input = std::cin, std::ostream& output = std::cout);


    // ---- STARTUP ----
    // Reads commands until "quit" or end of input
    void run();

private:
    // ---- PARAMETERS ----
    bool running_;
    // System components
    dpa::DPA& dpa_;
    store::ChunkStore& store_;
    std::istream& input_;
    std::ostream& output_;


    // ---- COMMAND PROCESSING ----
    void process_command(const std::string& command, const std::string& argument, const std::string& extra);
    void handle_store_command(const std::string& filename);
    void handle_read_command(const std::string& hex_key, const std::string& out_file);
    void handle_has_command(const std::string& hex_key);
    void handle_size_command(const std::string& hex_key);
    void handle_help_command();
    void log_and_display_error(const std::string& message, const std::string& error);
};

} // namespace cli
} // namespace swarm
