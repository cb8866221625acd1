#pragma once

#include <cstdint>
#include <iostream>
#include <sstream>
#include <string>
#include "store/chunk_store.hpp"
#include "store/reader.hpp"

namespace crunch {
namespace cli {

// Parses a decimal count. Rejects signs, blanks, trailing junk and overflow.
bool parse_unsigned(const std::string& text, uint64_t& value);

class CLI {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    CLI(const store::Reader& reader, const store::ChunkStore& chunk_store,
        std::istream& in = std::cin, std::ostream& out = std::cout);


    // ---- STARTUP ----
    void run();

    // Runs a single command line, returns false once the user asked to quit
    bool execute(const std::string& line);

private:
    // ---- PARAMETERS ----
    bool running_;
    // System components
    const store::Reader& reader_;
    const store::ChunkStore& chunk_store_;
    std::istream& in_;
    std::ostream& out_;


    // ---- COMMAND PROCESSING ----
    void handle_list_command();
    void handle_stats_command();
    void handle_size_command(const std::string& filename);
    void handle_read_command(const std::string& filename, std::istringstream& args);
    void handle_help_command();
    void log_and_display_error(const std::string& message, const std::string& error);
};

} // namespace cli
} // namespace crunch
