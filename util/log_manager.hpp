#ifndef UTIL_LOG_MANAGER_HPP
#define UTIL_LOG_MANAGER_HPP
#include <kj/exception.h>
#include <kj/main.h>
#include <memory>
#include <ostream>
#include "backward.hpp"

namespace util {

// Formats KJ log records and exceptions for the current thread. KJ exception
// callbacks are per-thread, so every thread that logs should create its own
// LogManager; only the one created with the process context installs the
// crash handlers.
class LogManager : public kj::ExceptionCallback {
 public:
  explicit LogManager(kj::ProcessContext* context);
  LogManager();
  void logMessage(kj::LogSeverity severity, const char* file, int line,
                  int contextDepth, kj::String&& text) override;
  void onRecoverableException(kj::Exception&& exception) override;
  void onFatalException(kj::Exception&& exception) override;
  StackTraceMode stackTraceMode() override { return StackTraceMode::NONE; }

 private:
  void PrintStackTrace();

  std::ostream& out;
  bool colors_;
  std::unique_ptr<backward::SignalHandling> sh_;  // Overrides kj's handling.
};
}  // namespace util

#endif
