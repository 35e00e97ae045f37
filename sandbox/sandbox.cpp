#include "sandbox/sandbox.hpp"

#include <kj/debug.h>

namespace sandbox {

std::vector<Sandbox::Backend>& Sandbox::Registry() {
  // Leaked on purpose: backends register from static initializers of other
  // translation units.
  static auto* registry = new std::vector<Backend>;
  return *registry;
}

void Sandbox::AddBackend(Backend backend) {
  Registry().push_back(std::move(backend));
}

std::vector<std::string> Sandbox::Backends() {
  std::vector<std::string> names;
  for (const Backend& backend : Registry()) names.push_back(backend.name);
  return names;
}

std::unique_ptr<Sandbox> Sandbox::Create() {
  static const Backend* chosen = []() -> const Backend* {
    const Backend* best = nullptr;
    int best_score = 0;
    for (const Backend& backend : Registry()) {
      int score = backend.score();
      if (score > best_score) {
        best_score = score;
        best = &backend;
      }
    }
    if (best != nullptr) KJ_LOG(INFO, "Using sandbox backend", best->name);
    return best;
  }();
  if (chosen == nullptr) {
    KJ_LOG(ERROR, "No usable sandbox backend is registered",
           Backends().size());
    return nullptr;
  }
  return std::unique_ptr<Sandbox>(chosen->create());
}

}  // namespace sandbox
