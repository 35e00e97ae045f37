#ifndef UTIL_DAEMON_HPP
#define UTIL_DAEMON_HPP

#include <string>

namespace util {

// Detaches from the controlling terminal with the usual double fork and sends
// the standard streams to /dev/null. Only the final process returns. Its PID
// is written to pidfile, which defaults to <temp_directory>/<name>.pid.
void daemonize(const std::string& name, const std::string& pidfile = "");

}  // namespace util

#endif
