#ifndef CRUNCH_DIRECTORY_WALKER_HPP
#define CRUNCH_DIRECTORY_WALKER_HPP

#include <filesystem>
#include <functional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace crunch {
namespace walker {

class WalkError : public std::runtime_error {
public:
  explicit WalkError(const std::string& message) : std::runtime_error(message) {}
};

// Recursively discovers files under a root directory and hands each one's
// root-relative path and contents to a visitor.
class DirectoryWalker {
public:
  using Visitor = std::function<void(const std::string& path, std::string_view bytes)>;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // An empty extension list admits every file. Otherwise only files whose
  // extension is listed, plus files with no extension at all, are admitted.
  explicit DirectoryWalker(const std::string& root, std::vector<std::string> extensions = {});


  // ---- TRAVERSAL ----
  // Admitted files as '/'-separated root-relative paths, sorted
  std::vector<std::string> discover() const;
  // Reads every discovered file and passes it to visitor, in discover() order
  size_t walk(const Visitor& visitor) const;


  // ---- FILTERING ----
  bool admits(const std::filesystem::path& file) const;

private:
  // ---- PARAMETERS ----
  std::filesystem::path root_;
  std::vector<std::string> extensions_;  // stored without the leading dot

  std::string read_file(const std::filesystem::path& file) const;
};

} // namespace walker
} // namespace crunch

#endif // CRUNCH_DIRECTORY_WALKER_HPP
