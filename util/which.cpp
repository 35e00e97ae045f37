#include "util/which.hpp"

#include <sys/stat.h>
#include <unistd.h>
#include <cstdlib>
#include <stdexcept>

#include "util/file.hpp"
#include "util/misc.hpp"

namespace util {

namespace {
bool IsExecutableFile(const std::string& path) {
  struct stat st {};
  if (stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) return false;
  return access(path.c_str(), X_OK) == 0;
}
}  // namespace

std::string FindInSearchPath(const std::string& cmd,
                             const std::string& search_path) {
  if (cmd.empty() || cmd.find('/') != std::string::npos) return "";
  for (const std::string& dir : split(search_path, ':')) {
    if (dir.empty()) continue;
    std::string candidate = File::JoinPath(dir, cmd);
    if (IsExecutableFile(candidate)) return candidate;
  }
  return "";
}

std::string which(const std::string& cmd) {
  const char* search_path = std::getenv("PATH");
  if (search_path == nullptr) throw std::runtime_error("PATH is not set");
  return FindInSearchPath(cmd, search_path);
}

}  // namespace util
