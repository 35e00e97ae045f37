#ifndef UTIL_MISC_HPP
#define UTIL_MISC_HPP
#include <functional>
#include <sstream>
#include <string>
#include <vector>

#include <kj/string.h>

namespace util {

template <typename Out>
void split(const std::string& s, char delim, Out result) {
  std::stringstream ss(s);
  std::string item;
  while (std::getline(ss, item, delim)) {
    if (!item.empty()) *(result++) = item;
  }
}
std::vector<std::string> split(const std::string& s, char delim);

// Callbacks for kj::MainBuilder options that store the parsed value.
std::function<bool()> setBool(bool* var);
std::function<bool(kj::StringPtr)> setString(std::string* var);
std::function<bool(kj::StringPtr)> addString(std::vector<std::string>* var);
std::function<bool(kj::StringPtr)> setInt(int32_t* var);
std::function<bool(kj::StringPtr)> setUint(uint32_t* var);

// Removes the leading whitespace that is common to every non-blank line, the
// same way Python's textwrap.dedent does. Lines made only of whitespace are
// emptied.
std::string dedent(const std::string& text);

// Returns a copy of text where every byte sequence that is not valid UTF-8 is
// replaced by U+FFFD.
std::string sanitizeUtf8(const std::string& text);

}  // namespace util
#endif
