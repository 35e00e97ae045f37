#ifndef RUNNER_WORKSPACE_HPP
#define RUNNER_WORKSPACE_HPP

#include <string>

#include <kj/common.h>
#include <kj/memory.h>

#include "runner/language.hpp"
#include "util/file.hpp"

namespace runner {

// A private directory holding the staged source of one execution. The
// directory is removed by Release, or on destruction at the latest.
class Workspace {
 public:
  Workspace(util::TempDir dir, std::string source_path)
      : dir_(std::move(dir)), source_path_(std::move(source_path)) {}

  const std::string& Path() const { return dir_.Path(); }
  const std::string& SourcePath() const { return source_path_; }
  // Name of the source file relative to Path().
  std::string SourceName() const { return util::File::BaseName(source_path_); }
  bool Released() const { return dir_.Removed(); }

  // Removes the directory and everything in it. Calling it again is a no-op.
  void Release() { dir_.Remove(); }

  KJ_DISALLOW_COPY(Workspace);

 private:
  util::TempDir dir_;
  std::string source_path_;
};

// Creates and removes workspaces under a base directory.
class WorkspaceManager {
 public:
  static const constexpr char* kPrefix = "ws-";

  explicit WorkspaceManager(std::string base) : base_(std::move(base)) {}
  virtual ~WorkspaceManager() = default;

  // Creates a workspace with a unique name and writes code to it, under the
  // file name of the language. Throws std::system_error if the directory or
  // the file cannot be created.
  virtual kj::Own<Workspace> Stage(const Language& language,
                                   const std::string& code);

  // Removes the workspace. Idempotent.
  virtual void Release(Workspace* workspace);

  // Removes every workspace left under the base directory, for example by a
  // previous instance that was killed. Returns the number of removed
  // workspaces. Must not be called while executions are running.
  size_t Sweep();

  const std::string& Base() const { return base_; }

  KJ_DISALLOW_COPY(WorkspaceManager);

 private:
  std::string base_;
};

}  // namespace runner

#endif
