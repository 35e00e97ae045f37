#ifndef RUNNER_CONFIG_HPP
#define RUNNER_CONFIG_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "runner/language.hpp"

namespace runner {

// Process-wide settings of the runner. Built once at startup and passed by
// const reference afterwards.
struct Config {
  // Directory where the workspaces are created.
  std::string workspace_base = "/tmp/code-runner";

  size_t max_code_bytes = 64 * 1024;
  int64_t execution_timeout_millis = 10000;
  // Per stream, never 0.
  size_t max_output_bytes = 64 * 1024;
  size_t max_concurrent_executions = 1;

  int64_t memory_limit_kb = 512 * 1024;
  // 0 means the same as the execution timeout.
  int64_t cpu_limit_millis = 0;
  int32_t max_files = 64;
  int32_t max_procs = 0;
  int64_t max_file_size_kb = 16 * 1024;

  bool allow_network = false;
  bool require_isolation = false;

  // Names of the variables copied from the server environment to the program
  // one, in addition to the fixed ones.
  std::vector<std::string> pass_env;

  LanguageTable languages;

  // Builds the configuration from the command line flags. Throws if an
  // interpreter cannot be found or a value is invalid.
  static Config FromFlags();
};

}  // namespace runner

#endif
