#ifndef RUNNER_OPTIONS_HPP
#define RUNNER_OPTIONS_HPP
#include <kj/main.h>

namespace runner {

// Adds to builder the command line options that fill the execution settings
// of Flags, shared by the commands that run programs.
void AddExecutionOptions(kj::MainBuilder* builder);

}  // namespace runner
#endif
