#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP

#include <cstdint>
#include <string>
#include <vector>

struct Flags {
  // Common flags
  static std::string log_file;
  static std::string temp_directory;

  // Execution limits
  static uint32_t max_code_bytes;
  static uint32_t execution_timeout_millis;
  static uint32_t max_output_bytes;
  static int32_t max_concurrent_executions;
  static uint32_t memory_limit_mb;
  static uint32_t cpu_limit_millis;
  static int32_t max_files;
  static int32_t max_procs;
  static uint32_t max_file_size_kb;
  static bool allow_network;
  static bool require_isolation;

  // Interpreters and environment
  static std::string interpreter;
  static std::vector<std::string> languages;
  static std::vector<std::string> pass_env;

  // Server-only flags
  static bool daemon;
  static std::string pidfile;
  static std::string listen_address;
  static int32_t port;
  static std::string api_key_file;

  // Run-only flags
  static std::string language;
};

#endif
