#include "util/daemon.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <cerrno>
#include <cstdlib>
#include <initializer_list>
#include <system_error>

#include "util/file.hpp"
#include "util/flags.hpp"

namespace util {

namespace {
// The parent leaves without running destructors or atexit handlers.
void ForkAndLeaveParent() {
  pid_t pid = fork();
  if (pid == -1) throw std::system_error(errno, std::system_category(), "fork");
  if (pid != 0) _Exit(0);
}
}  // namespace

void daemonize(const std::string& name, const std::string& pidfile) {
  std::string path = pidfile.empty()
                         ? File::JoinPath(Flags::temp_directory, name + ".pid")
                         : pidfile;
  ForkAndLeaveParent();
  if (setsid() == -1) {
    throw std::system_error(errno, std::system_category(), "setsid");
  }
  // Not a session leader anymore: no terminal can be acquired again.
  ForkAndLeaveParent();
  umask(S_IWGRP | S_IWOTH);

  int null_fd = open("/dev/null", O_RDWR | O_CLOEXEC);
  if (null_fd == -1) {
    throw std::system_error(errno, std::system_category(), "open /dev/null");
  }
  for (int fd : {STDIN_FILENO, STDOUT_FILENO, STDERR_FILENO}) {
    if (dup2(null_fd, fd) == -1) {
      throw std::system_error(errno, std::system_category(), "dup2");
    }
  }
  close(null_fd);

  File::WriteContent(path, std::to_string(getpid()) + "\n",
                     /*overwrite=*/true);
}

}  // namespace util
