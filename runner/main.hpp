#ifndef RUNNER_MAIN_HPP
#define RUNNER_MAIN_HPP
#include <string>

#include <kj/main.h>

namespace runner {

class Main {
 public:
  explicit Main(kj::ProcessContext* context) : context(*context) {}
  kj::MainBuilder::Validity Run();
  kj::MainFunc getMain();

 private:
  kj::MainBuilder::Validity SetSource(kj::StringPtr path);

  kj::ProcessContext& context;
  std::string source_path_;
};
}  // namespace runner
#endif
