#include "runner/main.hpp"

#include <unistd.h>

#include <kj/debug.h>
#include <kj/io.h>

#include "gateway/json.hpp"
#include "runner/config.hpp"
#include "runner/coordinator.hpp"
#include "runner/options.hpp"
#include "runner/workspace.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"
#include "util/log_manager.hpp"
#include "util/misc.hpp"
#include "util/version.hpp"

namespace runner {

namespace {
std::string ReadSource(const std::string& path) {
  if (path == "-") {
    kj::FdInputStream in(STDIN_FILENO);
    kj::String text = in.readAllText();
    return std::string(text.cStr(), text.size());
  }
  std::string content;
  auto producer = util::File::Read(path);
  for (auto chunk = producer(); chunk.size() != 0; chunk = producer()) {
    content.append(chunk.asChars().begin(), chunk.size());
  }
  return content;
}
}  // namespace

kj::MainBuilder::Validity Main::SetSource(kj::StringPtr path) {
  source_path_ = path;
  return true;
}

kj::MainBuilder::Validity Main::Run() {
  util::LogManager log_manager(&context);
  Config config = Config::FromFlags();
  config.max_concurrent_executions = 1;
  WorkspaceManager workspaces(config.workspace_base);
  Coordinator coordinator(config, &workspaces);

  ExecutionRequest request;
  request.language = Flags::language;
  request.code = ReadSource(source_path_);
  Outcome outcome = coordinator.Execute(std::move(request));
  KJ_LOG(INFO, "Execution done", KindName(outcome.GetKind()));

  std::string body = gateway::EncodeOutcome(outcome) + "\n";
  kj::FdOutputStream out(STDOUT_FILENO);
  out.write(body.data(), body.size());
  return true;
}

kj::MainFunc Main::getMain() {
  static const std::string title = "Code Runner (" + util::version + ")";
  kj::MainBuilder builder(context, title,
                          "Runs a single program and prints its outcome as "
                          "JSON");
  builder.addOptionWithArg({'x', "language"}, util::setString(&Flags::language),
                           "<LANGUAGE>", "Language of the program")
      .addOptionWithArg({'L', "logfile"}, util::setString(&Flags::log_file),
                        "<LOGFILE>", "Path where the log file should be stored");
  AddExecutionOptions(&builder);
  return builder.expectArg("<FILE>", KJ_BIND_METHOD(*this, SetSource))
      .callAfterParsing(KJ_BIND_METHOD(*this, Run))
      .build();
}
}  // namespace runner
