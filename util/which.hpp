#ifndef UTIL_WHICH_HPP
#define UTIL_WHICH_HPP

#include <string>

namespace util {

// Equivalent to the command-line utility which. A cmd that contains a slash is
// returned as-is if it exists. Successful lookups are cached unless use_cache
// is false; the cache is not thread-safe, so lookups should happen during
// initialization.
std::string which(const std::string& cmd, bool use_cache = true);

}  // namespace util

#endif
