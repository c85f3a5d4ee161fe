#ifndef UTIL_FILE_HPP
#define UTIL_FILE_HPP
#include <cstdint>
#include <string>
#include <system_error>

namespace util {

class file_not_found : public std::system_error {
 public:
  explicit file_not_found(const std::string& msg)
      : std::system_error(ENOENT, std::system_category(), msg) {}
};

class File {
 public:
  // Reads at most max_bytes bytes of the file specified by path. If the file
  // is longer, truncated is set to true (when not null).
  static std::string Read(const std::string& path, int64_t max_bytes,
                          bool* truncated = nullptr);

  // Writes contents to the file specified by path, replacing it.
  static void Write(const std::string& path, const std::string& contents);

  // Creates all the folder that are needed to write the specified file
  // or, if path is a directory, creates all the folders.
  static void MakeDirs(const std::string& path);

  // Recursively removes a tree.
  static void RemoveTree(const std::string& path);

  // Joins two paths.
  static std::string JoinPath(const std::string& first,
                              const std::string& second);

  // Computes the last component of a path.
  static std::string BaseName(const std::string& path);

  // Checks whether something exists at the given path.
  static bool Exists(const std::string& path);

  // Checks whether path is a regular file the current user can execute.
  static bool IsExecutable(const std::string& path);
};

// A uniquely named directory, removed with its content on destruction.
// Removal failures are logged and otherwise ignored.
class TempDir {
 public:
  // Creates base/<prefix>XXXXXX. Throws std::system_error on failure.
  explicit TempDir(const std::string& base, const std::string& prefix = "");
  const std::string& Path() const { return path_; }
  void Keep() { keep_ = true; }
  ~TempDir();

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;
  TempDir(TempDir&&) = delete;
  TempDir& operator=(TempDir&&) = delete;

 private:
  std::string path_;
  bool keep_ = false;
};

}  // namespace util

#endif
