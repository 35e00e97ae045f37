#include "util/flags.hpp"

std::string Flags::log_file;
std::string Flags::temp_directory = "/tmp/code-runner";

uint32_t Flags::max_code_bytes = 64 * 1024;
uint32_t Flags::execution_timeout_millis = 10000;
uint32_t Flags::max_output_bytes = 64 * 1024;
int32_t Flags::max_concurrent_executions = 0;
uint32_t Flags::memory_limit_mb = 512;
uint32_t Flags::cpu_limit_millis = 0;
int32_t Flags::max_files = 64;
int32_t Flags::max_procs = 0;
uint32_t Flags::max_file_size_kb = 16 * 1024;
bool Flags::allow_network = false;
bool Flags::require_isolation = false;

std::string Flags::interpreter = "python3";
std::vector<std::string> Flags::languages;
std::vector<std::string> Flags::pass_env;

bool Flags::daemon = false;
std::string Flags::pidfile;
std::string Flags::listen_address = "0.0.0.0";
int32_t Flags::port = 8080;
std::string Flags::api_key_file;

std::string Flags::language = "python";
