#include "util/file.hpp"

#include <errno.h>
#include <stdlib.h>
#include <string.h>

#include <fstream>
#include <memory>

#include "glog/logging.h"

#if defined(__unix__) || defined(__linux__) || defined(__APPLE__)
#include <fcntl.h>
#include <ftw.h>
#include <sys/stat.h>
#include <unistd.h>

namespace {

static const constexpr char* kPathSeparators = "/";

bool MkDir(const std::string& dir) {
  return mkdir(dir.c_str(), S_IRWXU | S_IRWXG | S_IXOTH) != -1 ||
         errno == EEXIST;
}

bool OsRemoveTree(const std::string& path) {
  return nftw(path.c_str(),
              [](const char* fpath, const struct stat* /*sb*/,
                 int /*typeflags*/, struct FTW* /*ftwbuf*/) {
                return remove(fpath);
              },
              64, FTW_DEPTH | FTW_PHYS | FTW_MOUNT) != -1;
}

// Creates a directory named after the template prefix followed by a random
// suffix.
std::string OsTempDir(const std::string& prefix) {
  std::string tmp = prefix + "XXXXXX";
  std::unique_ptr<char[]> data{strdup(tmp.c_str())};
  if (mkdtemp(data.get()) == nullptr) {
    return "";
  }
  return data.get();
}

}  // namespace
#endif

namespace util {

std::string File::Read(const std::string& path, int64_t max_bytes,
                       bool* truncated) {
  std::ifstream fin(path, std::ios::binary);
  if (!fin) throw file_not_found("Cannot open " + path);
  std::string contents;
  contents.resize(max_bytes);
  fin.read(&contents[0], max_bytes);
  contents.resize(fin.gcount());
  if (truncated) {
    *truncated = fin && fin.peek() != std::char_traits<char>::eof();
  }
  return contents;
}

void File::Write(const std::string& path, const std::string& contents) {
  std::ofstream fout(path, std::ios::binary | std::ios::trunc);
  if (!fout) throw std::system_error(errno, std::system_category(), path);
  fout << contents;
  if (!fout) throw std::system_error(errno, std::system_category(), path);
}

void File::MakeDirs(const std::string& path) {
  uint64_t pos = 0;
  while (pos != std::string::npos) {
    pos = path.find_first_of(kPathSeparators, pos + 1);
    if (!MkDir(path.substr(0, pos))) {
      throw std::system_error(errno, std::system_category(), "mkdir");
    }
  }
}

void File::RemoveTree(const std::string& path) {
  if (!OsRemoveTree(path))
    throw std::system_error(errno, std::system_category(), "removetree");
}

std::string File::JoinPath(const std::string& first,
                           const std::string& second) {
  if (!second.empty() && strchr(kPathSeparators, second[0])) return second;
  if (first.empty()) return second;
  return first + kPathSeparators[0] + second;
}

std::string File::BaseName(const std::string& path) {
  return path.substr(path.find_last_of(kPathSeparators) + 1);
}

bool File::Exists(const std::string& path) {
  struct stat buffer {};
  return lstat(path.c_str(), &buffer) == 0;
}

bool File::IsExecutable(const std::string& path) {
  struct stat buffer {};
  if (stat(path.c_str(), &buffer) != 0) return false;
  return S_ISREG(buffer.st_mode) && access(path.c_str(), X_OK) == 0;
}

TempDir::TempDir(const std::string& base, const std::string& prefix) {
  File::MakeDirs(base);
  path_ = OsTempDir(File::JoinPath(base, prefix));
  if (path_ == "")
    throw std::system_error(errno, std::system_category(), "mkdtemp");
}

TempDir::~TempDir() {
  if (keep_) {
    LOG(INFO) << "Keeping " << path_;
    return;
  }
  try {
    File::RemoveTree(path_);
  } catch (const std::system_error& exc) {
    LOG(WARNING) << "Cannot remove " << path_ << ": " << exc.what();
  }
}

}  // namespace util
