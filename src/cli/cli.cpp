#include "cli/cli.hpp"
#include <cctype>
#include <sstream>
#include <stdexcept>
#include <boost/log/trivial.hpp>

namespace crunch {
namespace cli {

bool parse_unsigned(const std::string& text, uint64_t& value) {
  // stoull would accept a sign and wrap "-1" to the maximum
  if (text.empty()) {
    return false;
  }
  for (char c : text) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      return false;
    }
  }
  try {
    value = std::stoull(text);
  } catch (const std::out_of_range&) {
    return false;
  }
  return true;
}

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(const store::Reader& reader, const store::ChunkStore& chunk_store,
         std::istream& in, std::ostream& out)
  : running_(false)
  , reader_(reader)
  , chunk_store_(chunk_store)
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
  out_ << "crunch> " << std::flush;

  while (running_ && std::getline(in_, line)) {
    running_ = execute(line);
    if (running_) {
      out_ << "crunch> " << std::flush;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "CLI loop ended";
}


//==============================================
// COMMAND PROCESSING
//==============================================

bool CLI::execute(const std::string& line) {
  std::istringstream iss(line);
  std::string command, filename;
  iss >> command;

  BOOST_LOG_TRIVIAL(debug) << "Processing command: " << line;

  if (command.empty()) {
    return true;
  }
  if (command == "quit") {
    return false;
  }

  if (command == "help") {
    handle_help_command();
  }
  else if (command == "ls") {
    handle_list_command();
  }
  else if (command == "stats") {
    handle_stats_command();
  }
  else if ((command == "size" || command == "read") && !(iss >> filename)) {
    out_ << "Invalid input. Usage: " << command << " <file>" << std::endl;
  }
  else if (command == "size") {
    handle_size_command(filename);
  }
  else if (command == "read") {
    handle_read_command(filename, iss);
  }
  else {
    out_ << "Unknown command or invalid arguments" << std::endl;
  }
  return true;
}

void CLI::handle_list_command() {
  for (const auto& path : reader_.list()) {
    out_ << "  " << path << std::endl;
  }
}

void CLI::handle_stats_command() {
  store::ChunkStoreStats stats = chunk_store_.stats();
  out_ << "Files:         " << reader_.list().size() << std::endl;
  out_ << "Chunks:        " << stats.chunks << std::endl;
  out_ << "Stored bytes:  " << stats.stored_bytes << std::endl;
  out_ << "Chunk puts:    " << stats.puts << std::endl;
  out_ << "Dedup hits:    " << stats.dedup_hits << std::endl;
}

void CLI::handle_size_command(const std::string& filename) {
  try {
    out_ << reader_.size(filename) << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error reading size", e.what());
  }
}

void CLI::handle_read_command(const std::string& filename, std::istringstream& args) {
  uint64_t offset = 0;
  uint64_t length = 0;
  bool ranged = false;

  std::string offset_text;
  std::string length_text;
  if (args >> offset_text) {
    if (!(args >> length_text) || !parse_unsigned(offset_text, offset) ||
        !parse_unsigned(length_text, length)) {
      out_ << "Invalid input. Usage: read <file> [offset length]" << std::endl;
      return;
    }
    ranged = true;
  }

  try {
    if (!ranged) {
      out_ << reader_.read_all(filename) << std::endl;
      return;
    }
    for (const auto& fragment : reader_.read(filename, offset, length)) {
      out_ << fragment;
    }
    out_ << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error reading file", e.what());
  }
}

void CLI::handle_help_command() {
  out_ << "Available commands:" << std::endl;
  out_ << "  help                          Display this help message" << std::endl;
  out_ << "  ls                            List stored files" << std::endl;
  out_ << "  stats                         Show chunk store statistics" << std::endl;
  out_ << "  size <file>                   Print the size of <file> in bytes" << std::endl;
  out_ << "  read <file> [offset length]   Print <file>, or the given byte range of it" << std::endl;
  out_ << "  quit                          Exit the shell" << std::endl;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << message << ": " << error;
  out_ << message << ": " << error << std::endl;
}

} // namespace cli
} // namespace crunch
