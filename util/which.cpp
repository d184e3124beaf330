#include "util/which.hpp"

#include <cstdlib>
#include <unordered_map>
#include <vector>

#include "absl/strings/str_split.h"
#include "util/file.hpp"

namespace {
std::unordered_map<std::string, std::string> cmd_cache;
}  // namespace

namespace util {

std::string which(const std::string& cmd, bool use_cache) {
  if (cmd.find('/') != std::string::npos) {
    return File::Exists(cmd) ? cmd : "";
  }
  if (use_cache && cmd_cache.count(cmd) > 0) return cmd_cache[cmd];

  const char* path = std::getenv("PATH");
  if (path == nullptr) return "";
  std::vector<std::string> dirs = absl::StrSplit(path, ':', absl::SkipEmpty());
  for (const std::string& dir : dirs) {
    std::string fullpath = File::JoinPath(dir, cmd);
    if (File::Exists(fullpath)) return cmd_cache[cmd] = fullpath;
  }
  return "";
}

}  // namespace util
