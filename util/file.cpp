#include "util/file.hpp"

#include <errno.h>
#include <fcntl.h>
#include <ftw.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cstdint>
#include <fstream>
#include <memory>
#include <sstream>

#include "glog/logging.h"

namespace {

static const constexpr char* kPathSeparators = "/";

bool MkDir(const std::string& dir) {
  return mkdir(dir.c_str(), S_IRWXU | S_IRWXG | S_IXOTH) != -1 ||
         errno == EEXIST;
}

bool OsRemoveTree(const std::string& path) {
  return nftw(path.c_str(),
              [](const char* fpath, const struct stat* /*sb*/,
                 int /*typeflags*/,
                 struct FTW* /*ftwbuf*/) { return remove(fpath); },
              64, FTW_DEPTH | FTW_PHYS | FTW_MOUNT) != -1;
}

std::string OsTempDir(const std::string& path) {
  std::string tmp = util::File::JoinPath(path, "XXXXXX");
  std::unique_ptr<char, decltype(&free)> data{strdup(tmp.c_str()), &free};
  if (mkdtemp(data.get()) == nullptr) {
    return "";
  }
  return data.get();
}

int OsTempFile(const std::string& path, std::string* tmp) {
  *tmp = path + ".XXXXXX";
  std::unique_ptr<char, decltype(&free)> data{strdup(tmp->c_str()), &free};
  int fd = mkostemp(data.get(), O_CLOEXEC);
  *tmp = data.get();
  return fd;
}

// Returns errno, or 0 on success.
int OsWrite(const std::string& path, const std::string& contents) {
  std::string temp_file;
  int fd = OsTempFile(path, &temp_file);
  if (fd == -1) return errno;
  size_t pos = 0;
  while (pos < contents.size()) {
    ssize_t written = write(fd, contents.data() + pos, contents.size() - pos);
    if (written == -1 && errno == EINTR) continue;
    if (written == -1) {
      int error = errno;
      close(fd);
      remove(temp_file.c_str());
      return error;
    }
    pos += written;
  }
  if (fchmod(fd, S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH) == -1 ||
      close(fd) == -1) {
    int error = errno;
    remove(temp_file.c_str());
    return error;
  }
  if (rename(temp_file.c_str(), path.c_str()) == -1) return errno;
  return 0;
}

}  // namespace

namespace util {

std::string File::Read(const std::string& path) {
  std::ifstream fin(path, std::ios::binary);
  if (!fin) {
    throw std::system_error(errno, std::system_category(), "Read " + path);
  }
  std::ostringstream contents;
  contents << fin.rdbuf();
  return contents.str();
}

void File::Write(const std::string& path, const std::string& contents) {
  MakeDirs(BaseDir(path));
  int err = OsWrite(path, contents);
  if (err) throw std::system_error(err, std::system_category(), path);
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

std::string File::JoinPath(const std::string& first,
                           const std::string& second) {
  if (second.empty()) return first;
  if (strchr(kPathSeparators, second[0])) return second;
  if (!first.empty() && first.back() == kPathSeparators[0])
    return first + second;
  return first + kPathSeparators[0] + second;
}

std::string File::BaseDir(const std::string& path) {
  size_t pos = path.find_last_of(kPathSeparators);
  if (pos == std::string::npos) return ".";
  if (pos == 0) return kPathSeparators;
  return path.substr(0, pos);
}

TempDir::TempDir(const std::string& base) {
  File::MakeDirs(base);
  path_ = OsTempDir(base);
  if (path_ == "")
    throw std::system_error(errno, std::system_category(), "mkdtemp");
}
const std::string& TempDir::Path() const { return path_; }
TempDir::~TempDir() {
  if (path_.empty()) return;
  if (!OsRemoveTree(path_)) {
    LOG(WARNING) << "Could not remove " << path_ << ": " << strerror(errno);
  }
}

}  // namespace util
