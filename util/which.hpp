#ifndef UTIL_WHICH_HPP
#define UTIL_WHICH_HPP

#include <string>

namespace util {

// Equivalent to the command-line utility which. Returns cmd itself if it
// contains a slash, the full path of the first executable named cmd in one
// of the directories of PATH otherwise, or an empty string if there is none.
// Uses caching to speed up lookups, unless explicitly disabled.
std::string which(const std::string& cmd, bool use_cache = true);

}  // namespace util

#endif
