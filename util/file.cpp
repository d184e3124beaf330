#include "util/file.hpp"

#include <dirent.h>
#include <errno.h>
#include <fcntl.h>
#include <ftw.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <unistd.h>

#include <memory>

#include "glog/logging.h"

namespace {

static const constexpr char* kPathSeparators = "/";
static const constexpr size_t kChunkSize = 32 * 1024;

bool MkDir(const std::string& dir) {
  return mkdir(dir.c_str(), S_IRWXU | S_IRWXG | S_IXOTH) != -1 ||
         errno == EEXIST;
}

bool OsRemoveTree(const std::string& path) {
  return nftw(path.c_str(),
              [](const char* fpath, const struct stat* sb, int typeflags,
                 struct FTW* ftwbuf) { return remove(fpath); },
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
int OsWriteAll(int fd, const std::string& contents) {
  size_t pos = 0;
  while (pos < contents.size()) {
    ssize_t written = write(fd, contents.data() + pos, contents.size() - pos);
    if (written == -1 && errno == EINTR) continue;
    if (written == -1) return errno;
    pos += written;
  }
  return 0;
}

}  // namespace

namespace util {

std::string File::Read(const std::string& path, size_t limit,
                       bool* truncated) {
  int fd = open(path.c_str(), O_CLOEXEC | O_RDONLY);
  if (fd == -1) {
    throw std::system_error(errno, std::system_category(), "Read " + path);
  }
  std::string contents;
  char buf[kChunkSize];
  ssize_t amount = 0;
  bool more = false;
  while ((amount = read(fd, buf, kChunkSize)) != 0) {
    if (amount == -1 && errno == EINTR) continue;
    if (amount == -1) break;
    size_t room = limit - contents.size();
    if (static_cast<size_t>(amount) > room) {
      contents.append(buf, room);
      more = true;
      break;
    }
    contents.append(buf, amount);
  }
  if (amount == -1) {
    int error = errno;
    close(fd);
    throw std::system_error(error, std::system_category(), "Read " + path);
  }
  close(fd);
  if (truncated != nullptr) *truncated = more;
  return contents;
}

void File::Write(const std::string& path, const std::string& contents,
                 int mode) {
  MakeDirs(BaseDir(path));
  std::string temp_file;
  int fd = OsTempFile(path, &temp_file);
  if (fd == -1) {
    throw std::system_error(errno, std::system_category(), "Write " + path);
  }
  int err = OsWriteAll(fd, contents);
  if (err == 0 && fchmod(fd, mode) == -1) err = errno;
  if (close(fd) == -1 && err == 0) err = errno;
  if (err == 0 && rename(temp_file.c_str(), path.c_str()) == -1) err = errno;
  if (err != 0) {
    unlink(temp_file.c_str());
    throw std::system_error(err, std::system_category(), "Write " + path);
  }
}

void File::MakeDirs(const std::string& path) {
  if (path.empty()) return;
  uint64_t pos = 0;
  while (pos != std::string::npos) {
    pos = path.find_first_of(kPathSeparators, pos + 1);
    if (!MkDir(path.substr(0, pos))) {
      throw std::system_error(errno, std::system_category(), "mkdir " + path);
    }
  }
}

std::vector<std::string> File::ListDir(const std::string& path) {
  std::unique_ptr<DIR, decltype(&closedir)> dir{opendir(path.c_str()),
                                                &closedir};
  if (!dir) {
    throw std::system_error(errno, std::system_category(), "opendir " + path);
  }
  std::vector<std::string> entries;
  while (struct dirent* entry = readdir(dir.get())) {
    std::string name = entry->d_name;
    if (name == "." || name == "..") continue;
    entries.push_back(std::move(name));
  }
  return entries;
}

void File::Remove(const std::string& path) {
  if (remove(path.c_str()) == -1)
    throw std::system_error(errno, std::system_category(), "remove " + path);
}

void File::RemoveTree(const std::string& path) {
  if (!OsRemoveTree(path))
    throw std::system_error(errno, std::system_category(),
                            "removetree " + path);
}

void File::SetMode(const std::string& path, int mode) {
  if (chmod(path.c_str(), mode) == -1)
    throw std::system_error(errno, std::system_category(), "chmod " + path);
}

std::string File::JoinPath(const std::string& first,
                           const std::string& second) {
  if (!second.empty() && strchr(kPathSeparators, second[0])) return second;
  return first + kPathSeparators[0] + second;
}

std::string File::BaseDir(const std::string& path) {
  if (path.find_last_of(kPathSeparators) == std::string::npos) return "";
  return path.substr(0, path.find_last_of(kPathSeparators));
}

std::string File::BaseName(const std::string& path) {
  return path.substr(path.find_last_of(kPathSeparators) + 1);
}

int64_t File::Size(const std::string& path) {
  struct stat st {};
  if (stat(path.c_str(), &st) != 0) {
    return -1;
  }
  return st.st_size;
}

TempDir::TempDir(const std::string& base) {
  File::MakeDirs(base);
  path_ = OsTempDir(base);
  if (path_.empty())
    throw std::system_error(errno, std::system_category(), "mkdtemp");
}
void TempDir::Keep() { keep_ = true; }
const std::string& TempDir::Path() const { return path_; }
TempDir::~TempDir() {
  if (keep_ || moved_) return;
  try {
    File::RemoveTree(path_);
  } catch (const std::system_error& e) {
    LOG(ERROR) << "Leaking temporary directory " << path_ << ": " << e.what();
  }
}

}  // namespace util
