#ifndef UTIL_FILE_HPP
#define UTIL_FILE_HPP

#include <string>
#include <system_error>

namespace util {

class File {
 public:
  // Reads the whole file specified by path.
  static std::string Read(const std::string& path);

  // Writes contents to path, creating the needed folders. The file is written
  // to a temporary file first and then moved in place.
  static void Write(const std::string& path, const std::string& contents);

  // Creates all the folder that are needed to write the specified file
  // or, if path is a directory, creates all the folders.
  static void MakeDirs(const std::string& path);

  // Joins two paths.
  static std::string JoinPath(const std::string& first,
                              const std::string& second);

  // Computes the directory name for a path
  static std::string BaseDir(const std::string& path);
};

class TempDir {
 public:
  explicit TempDir(const std::string& base);
  const std::string& Path() const;
  ~TempDir();

  TempDir(TempDir&&) = default;
  TempDir& operator=(TempDir&&) = default;
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

 private:
  std::string path_;
};

}  // namespace util

#endif
