#ifndef GATEWAY_MAIN_HPP
#define GATEWAY_MAIN_HPP
#include <kj/main.h>

namespace gateway {

class Main {
 public:
  explicit Main(kj::ProcessContext* context) : context(*context) {}
  kj::MainBuilder::Validity Run();
  kj::MainFunc getMain();

 private:
  kj::ProcessContext& context;
};
}  // namespace gateway
#endif
