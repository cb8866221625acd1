#include "walker/directory_walker.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace crunch {
namespace walker {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

DirectoryWalker::DirectoryWalker(const std::string& root, std::vector<std::string> extensions)
  : root_(root) {
  for (auto& ext : extensions) {
    if (!ext.empty() && ext.front() == '.') {
      ext.erase(0, 1);
    }
    if (!ext.empty()) {
      extensions_.push_back(std::move(ext));
    }
  }
  BOOST_LOG_TRIVIAL(debug) << "DirectoryWalker: Root " << root_.string() << " with "
                           << extensions_.size() << " extension filters";
}


//==============================================
// TRAVERSAL
//==============================================

std::vector<std::string> DirectoryWalker::discover() const {
  std::error_code ec;
  if (!std::filesystem::is_directory(root_, ec)) {
    BOOST_LOG_TRIVIAL(error) << "DirectoryWalker: Not a directory: " << root_.string();
    throw WalkError("DirectoryWalker: Not a directory: " + root_.string());
  }

  std::vector<std::string> paths;
  try {
    for (const auto& entry : std::filesystem::recursive_directory_iterator(root_)) {
      if (!entry.is_regular_file() || !admits(entry.path())) {
        continue;
      }
      paths.push_back(std::filesystem::relative(entry.path(), root_).generic_string());
    }
  } catch (const std::filesystem::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "DirectoryWalker: Traversal failed: " << e.what();
    throw WalkError("DirectoryWalker: Traversal failed: " + std::string(e.what()));
  }

  // Directory iteration order is unspecified, sort for reproducible builds
  std::sort(paths.begin(), paths.end());
  BOOST_LOG_TRIVIAL(info) << "DirectoryWalker: Discovered " << paths.size() << " files under " << root_.string();
  return paths;
}

size_t DirectoryWalker::walk(const Visitor& visitor) const {
  std::vector<std::string> paths = discover();
  for (const auto& path : paths) {
    std::string bytes = read_file(root_ / path);
    visitor(path, bytes);
  }
  return paths.size();
}


//==============================================
// FILTERING
//==============================================

bool DirectoryWalker::admits(const std::filesystem::path& file) const {
  if (extensions_.empty()) {
    return true;
  }
  // extension() is empty for "name" and for dotfiles such as ".profile"
  std::string ext = file.extension().string();
  if (ext.empty()) {
    return true;
  }
  ext.erase(0, 1);
  return std::find(extensions_.begin(), extensions_.end(), ext) != extensions_.end();
}


//==============================================
// UTILITY METHODS
//==============================================

std::string DirectoryWalker::read_file(const std::filesystem::path& file) const {
  // Binary mode so the bytes are stored exactly as on disk
  std::ifstream input(file, std::ios::binary);
  if (!input) {
    BOOST_LOG_TRIVIAL(error) << "DirectoryWalker: Failed to open file: " << file.string();
    throw WalkError("DirectoryWalker: Failed to open file: " + file.string());
  }

  std::ostringstream buffer;
  buffer << input.rdbuf();
  if (input.bad()) {
    throw WalkError("DirectoryWalker: Failed to read file: " + file.string());
  }
  return buffer.str();
}

} // namespace walker
} // namespace crunch
