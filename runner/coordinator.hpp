#ifndef RUNNER_COORDINATOR_HPP
#define RUNNER_COORDINATOR_HPP

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <kj/one-of.h>

#include "runner/config.hpp"
#include "runner/limiter.hpp"
#include "runner/outcome.hpp"
#include "runner/workspace.hpp"
#include "sandbox/sandbox.hpp"

namespace runner {

// Runs execution requests: validation, capacity reservation, staging,
// execution in the sandbox, and cleanup of the workspace. Every request ends
// with exactly one Outcome, whatever happens to the program or to the host
// resources. Thread-safe: Run may be called from many threads at once.
class Coordinator {
 public:
  using SandboxFactory = std::function<std::unique_ptr<sandbox::Sandbox>()>;

  // A request that passed validation and holds an execution slot. The slot is
  // given back when the ticket is destroyed.
  class Ticket {
   public:
    const ExecutionRequest& Request() const { return request_; }
    const Language& GetLanguage() const { return *language_; }

   private:
    friend class Coordinator;
    Ticket(ExecutionRequest request, const Language* language,
           ExecutionLimiter::Slot slot)
        : request_(std::move(request)),
          language_(language),
          slot_(std::move(slot)) {}

    ExecutionRequest request_;
    const Language* language_;
    ExecutionLimiter::Slot slot_;
  };

  // config and workspaces must outlive the coordinator.
  Coordinator(const Config& config, WorkspaceManager* workspaces,
              SandboxFactory sandbox_factory = &sandbox::Sandbox::Create);

  // Validates the request and reserves a slot for it, without touching the
  // filesystem or creating processes. Returns either the final outcome
  // (rejected or overloaded) or a ticket to pass to Run.
  kj::OneOf<Outcome, Ticket> Admit(ExecutionRequest request);

  // Stages and executes an admitted request. Blocks until the program is done
  // and its workspace is removed.
  Outcome Run(Ticket ticket);

  // Admit followed by Run.
  Outcome Execute(ExecutionRequest request);

  const ExecutionLimiter& Limiter() const { return limiter_; }

  KJ_DISALLOW_COPY(Coordinator);

 private:
  Outcome RunIn(const Workspace& workspace, const Language& language);
  void ReleaseWorkspace(Workspace* workspace);
  sandbox::ExecutionOptions MakeOptions(const Workspace& workspace,
                                        const Language& language) const;

  const Config& config_;
  WorkspaceManager* workspaces_;
  SandboxFactory sandbox_factory_;
  ExecutionLimiter limiter_;
  // The variables of the server environment that programs may see, captured
  // once at construction.
  std::vector<std::string> passed_env_;
};

}  // namespace runner

#endif
