#ifndef UTIL_WHICH_HPP
#define UTIL_WHICH_HPP

#include <string>

namespace util {

// Equivalent to the command-line utility which. Uses caching to speed up
// lookups, unless explicitly disabled.
// A command that already contains a slash is returned as is when it names an
// executable file, so configured absolute paths go through unchanged.
// Returns an empty string when nothing is found, and throws if PATH is not
// set at all.
std::string which(const std::string& cmd, bool use_cache = true);

}  // namespace util

#endif
