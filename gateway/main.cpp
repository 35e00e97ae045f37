#include "gateway/main.hpp"

#include <csignal>
#include <cstdlib>
#include <cstring>
#include <string>

#include <kj/async-io.h>
#include <kj/async-unix.h>
#include <kj/compat/http.h>
#include <kj/debug.h>

#include "gateway/http_service.hpp"
#include "runner/config.hpp"
#include "runner/coordinator.hpp"
#include "runner/options.hpp"
#include "runner/workspace.hpp"
#include "util/daemon.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"
#include "util/log_manager.hpp"
#include "util/misc.hpp"
#include "util/version.hpp"

namespace gateway {

namespace {
const constexpr char* kApiKeyVariable = "CODE_RUNNER_API_KEY";

// Reads the API key from the file given on the command line, or from the
// environment. Surrounding whitespace is dropped.
std::string LoadApiKey() {
  std::string key;
  if (!Flags::api_key_file.empty()) {
    auto producer = util::File::Read(Flags::api_key_file);
    for (auto chunk = producer(); chunk.size() != 0; chunk = producer()) {
      key.append(chunk.asChars().begin(), chunk.size());
    }
  } else if (const char* value = getenv(kApiKeyVariable)) {
    key = value;
  }
  const char* kSpaces = " \t\r\n";
  size_t begin = key.find_first_not_of(kSpaces);
  if (begin == std::string::npos) return "";
  size_t end = key.find_last_not_of(kSpaces);
  return key.substr(begin, end - begin + 1);
}

}  // namespace

kj::MainBuilder::Validity Main::Run() {
  if (Flags::daemon) {
    util::daemonize("code-runner", Flags::pidfile);
  }
  util::LogManager log_manager(&context);

  std::string api_key = LoadApiKey();
  if (api_key.empty()) {
    return kj::str("No API key: use --api-key-file or ", kApiKeyVariable);
  }
  runner::Config config = runner::Config::FromFlags();

  runner::WorkspaceManager workspaces(config.workspace_base);
  util::File::MakeDirs(config.workspace_base);
  size_t stale = workspaces.Sweep();
  if (stale > 0) {
    KJ_LOG(WARNING, "Removed workspaces of a previous run", stale);
  }
  runner::Coordinator coordinator(config, &workspaces);

  // Signals must be captured before any thread is started.
  kj::UnixEventPort::captureSignal(SIGINT);
  kj::UnixEventPort::captureSignal(SIGTERM);
  signal(SIGPIPE, SIG_IGN);
  auto io = kj::setupAsyncIo();

  kj::HttpHeaderTable::Builder header_builder;
  HttpService service(header_builder, &coordinator, std::move(api_key),
                      MaxRequestBytes(config));
  auto header_table = header_builder.build();
  kj::HttpServer server(io.provider->getTimer(), *header_table, service);

  auto address = io.provider->getNetwork()
                     .parseAddress(Flags::listen_address, Flags::port)
                     .wait(io.waitScope);
  auto listener = address->listen();
  KJ_LOG(INFO, "Listening", Flags::listen_address, listener->getPort(),
         config.max_concurrent_executions, config.languages.Names().size());

  auto stop = io.unixEventPort.onSignal(SIGINT)
                  .exclusiveJoin(io.unixEventPort.onSignal(SIGTERM))
                  .then([](siginfo_t info) {
                    KJ_LOG(INFO, "Stopping", strsignal(info.si_signo));
                  });
  server.listenHttp(*listener).exclusiveJoin(kj::mv(stop)).wait(io.waitScope);
  server.drain().wait(io.waitScope);
  service.WaitForThreads();
  return true;
}

kj::MainFunc Main::getMain() {
  static const std::string title =
      "Code Runner Server (" + util::version + ")";
  kj::MainBuilder builder(context, title,
                          "Runs untrusted programs received over HTTP");
  builder
      .addOptionWithArg({'L', "logfile"}, util::setString(&Flags::log_file),
                        "<LOGFILE>", "Path where the log file should be stored")
      .addOption({'d', "daemon"}, util::setBool(&Flags::daemon),
                 "Become a daemon")
      .addOptionWithArg({'P', "pidfile"}, util::setString(&Flags::pidfile),
                        "<PIDFILE>", "Path where the pidfile should be stored")
      .addOptionWithArg({'l', "address"},
                        util::setString(&Flags::listen_address), "<ADDRESS>",
                        "Address to listen on")
      .addOptionWithArg({'p', "port"}, util::setInt(&Flags::port), "<PORT>",
                        "Port to listen on")
      .addOptionWithArg({'k', "api-key-file"},
                        util::setString(&Flags::api_key_file), "<FILE>",
                        "File containing the key clients must present. "
                        "Defaults to the CODE_RUNNER_API_KEY variable");
  runner::AddExecutionOptions(&builder);
  return builder.callAfterParsing(KJ_BIND_METHOD(*this, Run)).build();
}
}  // namespace gateway
