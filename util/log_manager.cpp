#include "util/log_manager.hpp"

#include <sys/time.h>
#include <unistd.h>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <iostream>
#include <mutex>
#include <string>

#include <kj/debug.h>

#include "util/file.hpp"
#include "util/flags.hpp"

namespace util {
namespace {

struct SeverityStyle {
  char letter;
  const char* color;
};

// Indexed by kj::LogSeverity.
const SeverityStyle kStyles[] = {
    {'I', "\e[0;32m"},  // INFO
    {'W', "\e[0;33m"},  // WARNING
    {'E', "\e[0;31m"},  // ERROR
    {'F', "\e[7;31m"},  // FATAL
    {'D', "\e[0;35m"},  // DBG
};
static_assert(static_cast<int>(kj::LogSeverity::DBG) == 4,
              "kStyles does not match kj::LogSeverity");

const char* kReset = "\e[m";
const char* kDim = "\e[0;36m";

std::ostream& Sink() {
  if (Flags::log_file.empty()) return std::cerr;
  static std::ofstream file(Flags::log_file, std::ios::app);
  return file;
}

std::mutex& SinkMutex() {
  static std::mutex mutex;
  return mutex;
}

// 2026-01-31 12:00:00.123
std::string Timestamp() {
  struct timeval now {};
  gettimeofday(&now, nullptr);
  struct tm tm {};
  localtime_r(&now.tv_sec, &tm);
  char buf[32];
  size_t len = strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
  snprintf(buf + len, sizeof(buf) - len, ".%03ld",
           static_cast<long>(now.tv_usec / 1000));  // NOLINT
  return buf;
}

}  // namespace

LogManager::LogManager()
    : out(Sink()), colors_(Flags::log_file.empty() && isatty(STDERR_FILENO)) {}

LogManager::LogManager(kj::ProcessContext* context) : LogManager() {
  if (!out) context->exitError("Cannot open the log file");
  sh_ = std::make_unique<backward::SignalHandling>();
}

void LogManager::logMessage(kj::LogSeverity severity, const char* file,
                            int line, int /*contextDepth*/, kj::String&& text) {
  const SeverityStyle& style = kStyles[static_cast<int>(severity)];
  std::string where = File::BaseName(file) + ":" + std::to_string(line);
  if (where.size() < 28) where.resize(28, ' ');
  std::lock_guard<std::mutex> lock(SinkMutex());
  if (colors_) {
    out << kDim << Timestamp() << kReset << ' ' << style.color << style.letter
        << kReset << ' ' << kDim << where << kReset;
  } else {
    out << Timestamp() << ' ' << style.letter << ' ' << where;
  }
  out << ' ' << text.cStr() << std::endl;
}

void LogManager::onRecoverableException(kj::Exception&& exception) {
  logMessage(kj::LogSeverity::WARNING, exception.getFile(), exception.getLine(),
             0, kj::str(exception.getDescription()));
  PrintStackTrace();
  next.onRecoverableException(kj::mv(exception));
}

void LogManager::onFatalException(kj::Exception&& exception) {
  logMessage(kj::LogSeverity::FATAL, exception.getFile(), exception.getLine(),
             0, kj::str(exception.getDescription()));
  PrintStackTrace();
  next.onFatalException(kj::mv(exception));
}

void LogManager::PrintStackTrace() {
  if (!kj::_::Debug::shouldLog(kj::LogSeverity::INFO)) return;
  backward::StackTrace trace;
  trace.load_here();
  backward::Printer printer;
  printer.color_mode =
      colors_ ? backward::ColorMode::always : backward::ColorMode::never;
  std::lock_guard<std::mutex> lock(SinkMutex());
  printer.print(trace, out);
}

}  // namespace util
