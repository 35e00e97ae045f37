#ifndef UTIL_WHICH_HPP
#define UTIL_WHICH_HPP

#include <string>

namespace util {

// Searches a colon separated list of directories for an executable regular
// file called cmd and returns the first match, or an empty string. Empty
// entries are skipped.
std::string FindInSearchPath(const std::string& cmd,
                             const std::string& search_path);

// Like the which command: FindInSearchPath over $PATH. Throws if PATH is not
// set.
std::string which(const std::string& cmd);

}  // namespace util

#endif
