#ifndef UTIL_FILE_HPP
#define UTIL_FILE_HPP

#include <string>
#include <system_error>
#include <vector>

namespace util {

class File {
 public:
  // Reads at most limit bytes of the file specified by path. If truncated is
  // not null, it is set to whether the file was longer than limit.
  static std::string Read(const std::string& path, size_t limit,
                          bool* truncated = nullptr);

  // Writes contents to path, replacing it atomically if it already exists.
  static void Write(const std::string& path, const std::string& contents,
                    int mode = 0600);

  // Creates all the folder that are needed to write the specified file
  // or, if path is a directory, creates all the folders.
  static void MakeDirs(const std::string& path);

  // Lists the entries of a directory, without . and ..
  static std::vector<std::string> ListDir(const std::string& path);

  // Removes a file.
  static void Remove(const std::string& path);

  // Recursively removes a tree.
  static void RemoveTree(const std::string& path);

  // Changes the permission bits of path.
  static void SetMode(const std::string& path, int mode);

  // Joins two paths.
  static std::string JoinPath(const std::string& first,
                              const std::string& second);

  // Computes the directory name for a path
  static std::string BaseDir(const std::string& path);

  // Computes the file name for a path
  static std::string BaseName(const std::string& path);

  // Computes a file's size. Returns a negative number in case of errors.
  static int64_t Size(const std::string& path);

  static bool Exists(const std::string& path) { return Size(path) >= 0; }
};

// Creates a temporary directory in a given folder. The folder will be
// (recursively) removed on destruction.
class TempDir {
 public:
  // base is the directory in which the temporary directory will be created.
  explicit TempDir(const std::string& base);

  // Returns the path of the temporary folder.
  const std::string& Path() const;

  // Disables automatic deletion of the folder.
  void Keep();

  ~TempDir();

  TempDir(TempDir&& other) noexcept { *this = std::move(other); }
  TempDir& operator=(TempDir&& other) noexcept {
    path_ = std::move(other.path_);
    keep_ = other.keep_;
    other.moved_ = true;
    return *this;
  }
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

 private:
  std::string path_;
  bool keep_ = false;
  bool moved_ = false;
};

}  // namespace util

#endif
