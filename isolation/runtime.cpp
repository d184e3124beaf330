#include "isolation/runtime.hpp"

#include "util/file.hpp"
#include "util/flags.hpp"

namespace isolation {

std::string ReadCapturedOutput(const std::string& path) {
  bool truncated = false;
  std::string output =
      util::File::Read(path, int64_t{FLAGS_output_limit_kb} * 1024, &truncated);
  if (truncated) output += "\n[output truncated]";
  return output;
}

}  // namespace isolation
