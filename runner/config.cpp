#include "runner/config.hpp"

#include <algorithm>
#include <thread>

#include <kj/debug.h>

#include "util/flags.hpp"

namespace runner {

Config Config::FromFlags() {
  Config config;
  config.workspace_base = Flags::temp_directory;
  config.max_code_bytes = Flags::max_code_bytes;
  config.execution_timeout_millis = Flags::execution_timeout_millis;
  config.max_output_bytes = Flags::max_output_bytes;
  if (Flags::max_concurrent_executions > 0) {
    config.max_concurrent_executions = Flags::max_concurrent_executions;
  } else {
    config.max_concurrent_executions =
        std::max(std::thread::hardware_concurrency(), 1U);
  }
  config.memory_limit_kb = static_cast<int64_t>(Flags::memory_limit_mb) * 1024;
  config.cpu_limit_millis = Flags::cpu_limit_millis;
  config.max_files = Flags::max_files;
  config.max_procs = Flags::max_procs;
  config.max_file_size_kb = Flags::max_file_size_kb;
  config.allow_network = Flags::allow_network;
  config.require_isolation = Flags::require_isolation;
  config.pass_env = Flags::pass_env;

  KJ_REQUIRE(!config.workspace_base.empty(), "Empty temporary directory");
  KJ_REQUIRE(config.max_code_bytes > 0, "The code size limit must be positive");
  KJ_REQUIRE(config.execution_timeout_millis > 0,
             "The execution timeout must be positive");
  KJ_REQUIRE(config.max_output_bytes > 0,
             "The output cap must be positive: output is never unbounded");
  KJ_REQUIRE(config.max_files >= 0 && config.max_procs >= 0,
             "Limits must not be negative");

  if (!Flags::interpreter.empty()) {
    config.languages.Add(
        MakeLanguage("python", ResolveInterpreter(Flags::interpreter)));
  }
  for (const std::string& value : Flags::languages) {
    config.languages.AddFromFlag(value);
  }
  KJ_REQUIRE(!config.languages.Empty(), "No language is enabled");
  return config;
}

}  // namespace runner
