#include "runner/options.hpp"

#include "util/flags.hpp"
#include "util/misc.hpp"

namespace runner {

void AddExecutionOptions(kj::MainBuilder* builder) {
  builder
      ->addOptionWithArg({'T', "temp-dir"},
                         util::setString(&Flags::temp_directory), "<DIR>",
                         "Path where the workspaces should be created")
      .addOptionWithArg({'i', "interpreter"},
                        util::setString(&Flags::interpreter), "<PATH>",
                        "Python interpreter, looked up in PATH if it is not a "
                        "path. Empty to disable python")
      .addOptionWithArg({"add-language"}, util::addString(&Flags::languages),
                        "<NAME=PATH>",
                        "Allow programs in language NAME, run by the "
                        "interpreter PATH. Can be repeated")
      .addOptionWithArg({"max-code-bytes"},
                        util::setUint(&Flags::max_code_bytes), "<BYTES>",
                        "Maximum size of the submitted code")
      .addOptionWithArg({'t', "timeout"},
                        util::setUint(&Flags::execution_timeout_millis),
                        "<MILLIS>", "Wall time limit of every execution")
      .addOptionWithArg({"max-output-bytes"},
                        util::setUint(&Flags::max_output_bytes), "<BYTES>",
                        "Maximum amount of stdout and of stderr kept, "
                        "at least 1")
      .addOptionWithArg({'j', "max-concurrent"},
                        util::setInt(&Flags::max_concurrent_executions), "<N>",
                        "Maximum number of executions at the same time. 0 "
                        "means the number of cores")
      .addOptionWithArg({'m', "memory-limit"},
                        util::setUint(&Flags::memory_limit_mb), "<MIB>",
                        "Address space limit of the programs. 0 means "
                        "unlimited")
      .addOptionWithArg({"cpu-limit"}, util::setUint(&Flags::cpu_limit_millis),
                        "<MILLIS>",
                        "CPU time limit of the programs. 0 means the same as "
                        "the timeout")
      .addOptionWithArg({"max-files"}, util::setInt(&Flags::max_files), "<N>",
                        "Maximum number of open files of the programs")
      .addOptionWithArg({"max-procs"}, util::setInt(&Flags::max_procs), "<N>",
                        "Maximum number of processes of the user running the "
                        "programs. 0 means unlimited")
      .addOptionWithArg({"max-file-size"},
                        util::setUint(&Flags::max_file_size_kb), "<KIB>",
                        "Maximum size of a file written by the programs")
      .addOptionWithArg({"pass-env"}, util::addString(&Flags::pass_env),
                        "<NAME>",
                        "Pass the variable NAME to the programs. Can be "
                        "repeated")
      .addOption({"allow-network"}, util::setBool(&Flags::allow_network),
                 "Do not isolate the programs from the network")
      .addOption({"require-isolation"},
                 util::setBool(&Flags::require_isolation),
                 "Fail the executions that cannot be isolated from the "
                 "network instead of running them anyway");
}

}  // namespace runner
