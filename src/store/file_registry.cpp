#include "store/file_registry.hpp"
#include <boost/log/trivial.hpp>

namespace crunch {
namespace store {

//==============================================
// REGISTRATION
//==============================================

void FileRegistry::reserve_path(const std::string& path) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (index_.count(path) != 0 || !reserved_.insert(path).second) {
    BOOST_LOG_TRIVIAL(error) << "FileRegistry: Path already registered or in progress: " << path;
    throw DuplicatePathError(path);
  }
  BOOST_LOG_TRIVIAL(debug) << "FileRegistry: Reserved " << path;
}

void FileRegistry::release_path(const std::string& path) {
  std::lock_guard<std::mutex> lock(mutex_);
  reserved_.erase(path);
}

void FileRegistry::register_file(FileEntry entry) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (index_.count(entry.path) != 0) {
    BOOST_LOG_TRIVIAL(error) << "FileRegistry: Duplicate registration of path: " << entry.path;
    throw DuplicatePathError(entry.path);
  }
  reserved_.erase(entry.path);

  BOOST_LOG_TRIVIAL(debug) << "FileRegistry: Registered " << entry.path << " (" << entry.size
                           << " bytes, " << entry.chunks.size() << " chunks)";
  index_.emplace(entry.path, entries_.size());
  entries_.push_back(std::move(entry));
}


//==============================================
// QUERY OPERATIONS
//==============================================

std::optional<FileEntry> FileRegistry::lookup(const std::string& path) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = index_.find(path);
  if (it == index_.end()) {
    return std::nullopt;
  }
  return entries_[it->second];
}

std::optional<uint64_t> FileRegistry::size_of(const std::string& path) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = index_.find(path);
  if (it == index_.end()) {
    return std::nullopt;
  }
  return entries_[it->second].size;
}

bool FileRegistry::contains(const std::string& path) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return index_.count(path) != 0;
}

std::set<std::string> FileRegistry::list_paths() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::set<std::string> paths;
  for (const auto& entry : entries_) {
    paths.insert(entry.path);
  }
  return paths;
}

size_t FileRegistry::file_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

void FileRegistry::for_each_file(const std::function<void(const FileEntry&)>& visitor) const {
  // Copy under the lock so the visitor may query this registry
  std::vector<FileEntry> snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    snapshot = entries_;
  }
  for (const auto& entry : snapshot) {
    visitor(entry);
  }
}

} // namespace store
} // namespace crunch
