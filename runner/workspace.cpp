#include "runner/workspace.hpp"

#include <cstring>
#include <system_error>

#include <kj/debug.h>

#include "util/misc.hpp"

namespace runner {

kj::Own<Workspace> WorkspaceManager::Stage(const Language& language,
                                           const std::string& code) {
  util::TempDir dir(base_, kPrefix);
  std::string source_path = util::File::JoinPath(dir.Path(), language.file_name);
  util::File::WriteContent(source_path,
                           language.dedent ? util::dedent(code) : code);
  util::File::MakeImmutable(source_path);
  return kj::heap<Workspace>(std::move(dir), std::move(source_path));
}

void WorkspaceManager::Release(Workspace* workspace) { workspace->Release(); }

size_t WorkspaceManager::Sweep() {
  size_t removed = 0;
  for (const std::string& entry : util::File::ListEntries(base_)) {
    std::string name = util::File::BaseName(entry);
    if (name.compare(0, strlen(kPrefix), kPrefix) != 0) continue;
    try {
      util::File::RemoveTree(entry);
      removed++;
    } catch (const std::system_error& exc) {
      KJ_LOG(WARNING, "Cannot remove stale workspace", entry, exc.what());
    }
  }
  return removed;
}

}  // namespace runner
