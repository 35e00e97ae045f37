#ifndef SANDBOX_UNIX_HPP
#define SANDBOX_UNIX_HPP
#include <sys/types.h>
#include <vector>
#include "sandbox/sandbox.hpp"

namespace sandbox {

// Runs the program as a forked child leading its own session, so the whole
// process group is killed when the execution ends. The child gets resource
// limits, only the given environment, /dev/null as stdin and pipes for
// stdout and stderr. On Linux it can also be moved to new user and network
// namespaces.
class Unix : public Sandbox {
 public:
  static Sandbox* Create() { return new Unix(); }
  static int Score() { return 2; }

 private:
  Unix() = default;

  bool ExecuteInternal(const ExecutionOptions& options, ExecutionInfo* info,
                       std::string* error_msg) override;

  // Builds argv and envp and opens the pipes.
  bool Setup(std::string* error_msg);
  bool Spawn(std::string* error_msg);

  // Runs in the forked child up to execve. Failures are written to the error
  // pipe; nothing here may allocate.
  [[noreturn]] void Child();

  // Collects the output until the child exits or the wall limit expires, then
  // kills what is left of the process group and reaps the child.
  bool Wait(ExecutionInfo* info, std::string* error_msg);

  void CloseAll();

  int pipe_fds_[2] = {-1, -1};
  int stdout_fds_[2] = {-1, -1};
  int stderr_fds_[2] = {-1, -1};
  pid_t child_pid_ = 0;
  pid_t parent_pid_ = 0;
  const ExecutionOptions* options_ = nullptr;

  std::vector<std::vector<char>> args_;
  std::vector<char*> argsp_;
  std::vector<std::vector<char>> env_;
  std::vector<char*> envp_;
};

}  // namespace sandbox
#endif
