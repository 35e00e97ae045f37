#include "gateway/main.hpp"
#include "runner/main.hpp"
#include "util/version.hpp"

class CodeRunnerMain {
 public:
  // NOLINTNEXTLINE(google-runtime-references)
  explicit CodeRunnerMain(kj::ProcessContext& context)
      : context(context), gm(&context), rm(&context) {}
  kj::MainFunc getMain() {
    static const std::string title = "Code Runner (" + util::version + ")";
    return kj::MainBuilder(context, title,
                           "Runs untrusted programs in a sandbox")
        .addSubCommand("server", KJ_BIND_METHOD(gm, getMain),
                       "serve executions over HTTP")
        .addSubCommand("run", KJ_BIND_METHOD(rm, getMain),
                       "run a single program")
        .build();
  }

 private:
  kj::ProcessContext& context;
  gateway::Main gm;
  runner::Main rm;
};

KJ_MAIN(CodeRunnerMain);
