#include "chunker/file_chunker.hpp"
#include "cli/cli.hpp"
#include "logger/logger.hpp"
#include "store/chunk_store.hpp"
#include "store/file_registry.hpp"
#include "store/reader.hpp"
#include "walker/directory_walker.hpp"
#include <iostream>
#include <limits>
#include <sstream>
#include <string>
#include <unordered_set>
#include <vector>

struct ProgramOptions {
  std::string root;
  std::vector<std::string> extensions;
  size_t sector_size{crunch::chunker::SECTOR_SIZE};
  std::string log_file;
  bool verbose{false};
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " -d <dir> [-e <ext,ext>] [-s <sector>] [-l <log>] [-v]\n"
        << "Required arguments:\n"
        << "  -d, --dir       Directory to crunch\n"
        << "Optional arguments:\n"
        << "  -e, --ext       Comma separated extensions to include (default: all)\n"
        << "  -s, --sector    Chunk size in bytes (default: 4096)\n"
        << "  -l, --log       Also write log records to this file\n"
        << "  -v, --verbose   Log debug records\n"
        << "Example: " << program_name << " -d htdocs -e html,css,js\n";
}

std::vector<std::string> split_extensions(const std::string& value) {
  std::vector<std::string> extensions;
  std::istringstream iss(value);
  std::string ext;
  while (std::getline(iss, ext, ',')) {
    if (!ext.empty()) {
      extensions.push_back(ext);
    }
  }
  return extensions;
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  const std::unordered_set<std::string> value_flags = {
    "-d", "--dir", "-e", "--ext", "-s", "--sector", "-l", "--log"
  };

  ProgramOptions options;

  for (int i = 1; i < argc; ++i) {
    const std::string flag(argv[i]);

    if (flag == "-v" || flag == "--verbose") {
      options.verbose = true;
      continue;
    }

    if (value_flags.count(flag) == 0 || i + 1 >= argc) {
      std::cerr << "Error: Unknown or incomplete argument: " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }

    const std::string value(argv[++i]);
    if (flag == "-d" || flag == "--dir") {
      options.root = value;
    } else if (flag == "-e" || flag == "--ext") {
      options.extensions = split_extensions(value);
    } else if (flag == "-l" || flag == "--log") {
      options.log_file = value;
    } else if (flag == "-s" || flag == "--sector") {
      uint64_t sector = 0;
      if (!crunch::cli::parse_unsigned(value, sector) || sector == 0 ||
          sector > std::numeric_limits<size_t>::max()) {
        std::cerr << "Error: Invalid sector size\n";
        print_usage(argv[0]);
        return options;
      }
      options.sector_size = static_cast<size_t>(sector);
    }
  }

  if (options.root.empty()) {
    std::cerr << "Error: A directory is required\n";
    print_usage(argv[0]);
    return options;
  }

  options.valid = true;
  return options;
}

bool run_crunch(const ProgramOptions& options) {
  try {
    crunch::logging::init(options.log_file,
      options.verbose ? boost::log::trivial::debug : boost::log::trivial::info);

    crunch::store::ChunkStore chunk_store;
    crunch::store::FileRegistry registry;
    crunch::chunker::FileChunker chunker(chunk_store, registry, {options.sector_size});

    crunch::walker::DirectoryWalker walker(options.root, options.extensions);
    size_t files = walker.walk([&chunker](const std::string& path, std::string_view bytes) {
      chunker.chunk_file(path, bytes);
    });

    crunch::store::ChunkStoreStats stats = chunk_store.stats();
    std::cout << "Crunched " << files << " files into " << stats.chunks << " chunks ("
              << stats.stored_bytes << " bytes, " << stats.dedup_hits << " dedup hits)\n";

    crunch::store::Reader reader(chunk_store, registry);
    crunch::cli::CLI cli(reader, chunk_store);
    cli.run();
    return true;
  } catch (const std::exception& e) {
    std::cerr << "Error: Build failed: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  if (const auto options = parse_command_line(argc, argv); !options.valid) {
    return 1;
  } else if (!run_crunch(options)) {
    return 1;
  }
  return 0;
}
