#include "runner/coordinator.hpp"

#include <cstdlib>
#include <exception>

#include <kj/debug.h>

namespace runner {

namespace {
const constexpr char* kPath = "PATH=/usr/local/bin:/usr/bin:/bin";
const constexpr char* kLang = "LANG=C.UTF-8";
}  // namespace

Coordinator::Coordinator(const Config& config, WorkspaceManager* workspaces,
                         SandboxFactory sandbox_factory)
    : config_(config),
      workspaces_(workspaces),
      sandbox_factory_(std::move(sandbox_factory)),
      limiter_(config.max_concurrent_executions) {
  KJ_REQUIRE(config_.max_output_bytes > 0, "The output cap must be positive");
  for (const std::string& name : config_.pass_env) {
    const char* value = getenv(name.c_str());
    if (value != nullptr) passed_env_.push_back(name + "=" + value);
  }
}

kj::OneOf<Outcome, Coordinator::Ticket> Coordinator::Admit(
    ExecutionRequest request) {
  const Language* language = config_.languages.Find(request.language);
  if (language == nullptr) {
    KJ_LOG(INFO, "Rejected request", "unsupported language");
    return Outcome::Rejected("unsupported language: " + request.language);
  }
  if (request.code.empty()) {
    KJ_LOG(INFO, "Rejected request", "empty code");
    return Outcome::Rejected("code must not be empty");
  }
  if (request.code.size() > config_.max_code_bytes) {
    KJ_LOG(INFO, "Rejected request", "code too long", request.code.size());
    return Outcome::Rejected("code exceeds the limit of " +
                             std::to_string(config_.max_code_bytes) +
                             " bytes");
  }
  if (request.code.find('\0') != std::string::npos) {
    KJ_LOG(INFO, "Rejected request", "NUL byte in code");
    return Outcome::Rejected("code must not contain NUL bytes");
  }
  kj::Maybe<ExecutionLimiter::Slot> maybe_slot = limiter_.TryAcquire();
  KJ_IF_MAYBE(slot, maybe_slot) {
    return Ticket(std::move(request), language, kj::mv(*slot));
  }
  KJ_LOG(WARNING, "Too many concurrent executions", limiter_.Capacity());
  return Outcome::Overloaded();
}

Outcome Coordinator::Run(Ticket ticket) {
  const Language& language = ticket.GetLanguage();
  kj::Own<Workspace> workspace;
  try {
    workspace = workspaces_->Stage(language, ticket.Request().code);
  } catch (const std::exception& exc) {
    KJ_LOG(ERROR, "Cannot stage the source", exc.what());
    return Outcome::InternalError("cannot stage the source");
  } catch (const kj::Exception& exc) {
    KJ_LOG(ERROR, "Cannot stage the source", exc);
    return Outcome::InternalError("cannot stage the source");
  }
  KJ_DEFER(ReleaseWorkspace(workspace.get()));
  try {
    return RunIn(*workspace, language);
  } catch (const std::exception& exc) {
    KJ_LOG(ERROR, "Execution failed", exc.what());
    return Outcome::InternalError("execution failed");
  } catch (const kj::Exception& exc) {
    KJ_LOG(ERROR, "Execution failed", exc);
    return Outcome::InternalError("execution failed");
  }
}

Outcome Coordinator::Execute(ExecutionRequest request) {
  auto admitted = Admit(std::move(request));
  if (admitted.is<Outcome>()) return kj::mv(admitted.get<Outcome>());
  return Run(kj::mv(admitted.get<Ticket>()));
}

sandbox::ExecutionOptions Coordinator::MakeOptions(
    const Workspace& workspace, const Language& language) const {
  sandbox::ExecutionOptions options(workspace.Path(), language.interpreter);
  std::vector<std::string> args = language.args;
  args.push_back(workspace.SourcePath());
  options.SetArgs(args);

  options.wall_limit_millis = config_.execution_timeout_millis;
  options.cpu_limit_millis = config_.cpu_limit_millis != 0
                                 ? config_.cpu_limit_millis
                                 : config_.execution_timeout_millis;
  options.memory_limit_kb = config_.memory_limit_kb;
  options.max_files = config_.max_files;
  options.max_procs = config_.max_procs;
  options.max_file_size_kb = config_.max_file_size_kb;
  options.max_output_bytes = config_.max_output_bytes;
  options.disable_network = !config_.allow_network;
  options.require_isolation = config_.require_isolation;

  options.env = {kPath, "HOME=" + workspace.Path(),
                 "TMPDIR=" + workspace.Path(), kLang};
  options.env.insert(options.env.end(), passed_env_.begin(),
                     passed_env_.end());
  return options;
}

Outcome Coordinator::RunIn(const Workspace& workspace,
                           const Language& language) {
  std::unique_ptr<sandbox::Sandbox> sandbox = sandbox_factory_();
  if (!sandbox) return Outcome::InternalError("no sandbox available");

  sandbox::ExecutionOptions options = MakeOptions(workspace, language);
  sandbox::ExecutionInfo info;
  std::string error_msg;
  if (!sandbox->Execute(options, &info, &error_msg)) {
    KJ_LOG(ERROR, "Cannot launch the interpreter", language.interpreter,
           error_msg);
    return Outcome::InternalError("cannot launch the interpreter");
  }

  ExecutionResult result;
  result.stdout_data = std::move(info.stdout_data);
  result.stderr_data = std::move(info.stderr_data);
  result.truncated = info.stdout_truncated || info.stderr_truncated;
  result.signaled = info.signal != 0;
  result.exit_code = info.status_code;
  result.signal = info.signal;
  result.wall_time_millis = info.wall_time_millis;
  result.cpu_time_millis = info.cpu_time_millis + info.sys_time_millis;
  result.memory_usage_kb = info.memory_usage_kb;

  if (info.timed_out) {
    KJ_LOG(INFO, "Execution timed out", language.name, result.wall_time_millis,
           result.cpu_time_millis, result.memory_usage_kb);
    return Outcome::TimedOut(std::move(result));
  }
  KJ_LOG(INFO, "Execution completed", language.name, result.exit_code,
         result.signal, result.wall_time_millis, result.cpu_time_millis,
         result.memory_usage_kb, result.truncated);
  return Outcome::Completed(std::move(result));
}

void Coordinator::ReleaseWorkspace(Workspace* workspace) {
  try {
    workspaces_->Release(workspace);
  } catch (const std::exception& exc) {
    KJ_LOG(ERROR, "Cannot remove the workspace", workspace->Path(),
           exc.what());
  } catch (const kj::Exception& exc) {
    KJ_LOG(ERROR, "Cannot remove the workspace", workspace->Path(), exc);
  }
}

}  // namespace runner
