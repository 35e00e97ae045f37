#ifndef SANDBOX_SANDBOX_HPP
#define SANDBOX_SANDBOX_HPP

#include <cstdint>
#include <functional>
#include <initializer_list>
#include <memory>
#include <string>
#include <vector>

namespace sandbox {

// What to run and under which limits. Zero limits are not applied.
struct ExecutionOptions {
  // Resource limits.
  int64_t cpu_limit_millis = 0;
  int64_t wall_limit_millis = 0;
  int64_t memory_limit_kb = 0;
  int32_t max_procs = 0;
  int32_t max_files = 0;
  int64_t max_file_size_kb = 0;
  int64_t max_stack_kb = 0;

  // Maximum number of bytes kept for each of stdout and stderr. Output beyond
  // this amount is read and discarded. 0 means no limit.
  size_t max_output_bytes = 0;

  // Run the program in new user and network namespaces, so that it has no
  // network interface other than an unconfigured loopback.
  bool disable_network = false;
  // Fail the execution instead of running without isolation when the host
  // does not allow the namespaces to be created.
  bool require_isolation = false;

  // The complete environment of the program, as KEY=VALUE strings.
  std::vector<std::string> env;

  std::vector<std::string> args;

  // Required values
  std::string root;
  std::string executable;

  ExecutionOptions(std::string root_, std::string executable_)
      : root(std::move(root_)), executable(std::move(executable_)) {}

  template <typename T>
  void SetArgs(const T& a_) {
    args.clear();
    for (const auto& s : a_) args.emplace_back(s);
  }
  void SetArgs(const std::initializer_list<const char*>& a_) {
    args.clear();
    for (const char* s : a_) args.emplace_back(s);
  }
};

// What happened to a program that was started.
struct ExecutionInfo {
  int64_t cpu_time_millis = 0;
  int64_t sys_time_millis = 0;
  int64_t wall_time_millis = 0;
  int64_t memory_usage_kb = 0;
  int32_t status_code = 0;
  int32_t signal = 0;
  // The program was killed by the sandbox or by a resource limit.
  bool killed = false;
  // The program was killed because it exceeded the wall time limit.
  bool timed_out = false;
  std::string stdout_data;
  std::string stderr_data;
  bool stdout_truncated = false;
  bool stderr_truncated = false;
  std::string message;
};

// A backend that runs one program at a time under resource limits.
//
// Backends add themselves to a process-wide registry from a static
// initializer, e.g. `Sandbox::Register<Unix> registration("unix");`. T must
// provide `static Sandbox* Create()` and `static int Score()`. Create() picks
// the backend with the highest positive score; a backend that cannot work on
// this host returns a negative one.
class Sandbox {
 public:
  struct Backend {
    std::string name;
    std::function<Sandbox*()> create;
    std::function<int()> score;
  };

  // Returns nullptr if no registered backend is usable.
  static std::unique_ptr<Sandbox> Create();

  // Names of the registered backends, in registration order.
  static std::vector<std::string> Backends();

  // Starts the program described by options and waits for it. On success
  // fills info and returns true. If the program could not be started returns
  // false with the reason in error_msg. Not safe to call concurrently on the
  // same instance.
  bool Execute(const ExecutionOptions& options, ExecutionInfo* info,
               std::string* error_msg) {
    return ExecuteInternal(options, info, error_msg);
  }

  Sandbox() = default;
  virtual ~Sandbox() = default;
  Sandbox(const Sandbox&) = delete;
  Sandbox(Sandbox&&) = delete;
  Sandbox& operator=(const Sandbox&) = delete;
  Sandbox& operator=(Sandbox&&) = delete;

  template <typename T>
  class Register {
   public:
    explicit Register(const char* name) {
      Sandbox::AddBackend({name, &T::Create, &T::Score});
    }
  };

 protected:
  virtual bool ExecuteInternal(const ExecutionOptions& options,
                               ExecutionInfo* info, std::string* error_msg) = 0;

 private:
  static std::vector<Backend>& Registry();
  static void AddBackend(Backend backend);
};

}  // namespace sandbox

#endif
