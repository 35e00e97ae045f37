#ifndef GATEWAY_HTTP_SERVICE_HPP
#define GATEWAY_HTTP_SERVICE_HPP

#include <atomic>
#include <string>

#include <kj/async.h>
#include <kj/compat/http.h>

#include "runner/config.hpp"
#include "runner/coordinator.hpp"

namespace gateway {

// HTTP front of the coordinator:
//   POST /execute  runs a program, requires "Authorization: Bearer <key>"
//   GET  /healthz  health check, no authentication
// Admitted executions run on their own thread; the event loop only waits for
// their outcome. An execution goes on until its end even when the client
// goes away.
class HttpService final : public kj::HttpService {
 public:
  // coordinator must outlive the service and every execution it started.
  HttpService(kj::HttpHeaderTable::Builder& headers,
              runner::Coordinator* coordinator, std::string api_key,
              size_t max_body_bytes);

  kj::Promise<void> request(kj::HttpMethod method, kj::StringPtr url,
                            const kj::HttpHeaders& headers,
                            kj::AsyncInputStream& requestBody,
                            Response& response) override;

  // Execution threads that have not finished yet, including the teardown of
  // their logging and of the channel back to the event loop.
  size_t RunningThreads() const { return running_threads_.load(); }

  // Blocks until RunningThreads() is 0. The service must not be destroyed
  // before this returns.
  void WaitForThreads() const;

 private:
  kj::Promise<void> Execute(kj::AsyncInputStream& requestBody,
                            Response& response);
  kj::Promise<void> RunAdmitted(runner::Coordinator::Ticket ticket,
                                Response& response);
  kj::Promise<void> Send(Response& response, unsigned status,
                         std::string body);
  bool Authorized(const kj::HttpHeaders& headers) const;

  const kj::HttpHeaderTable& table_;
  kj::HttpHeaderId authorization_;
  runner::Coordinator* coordinator_;
  const std::string api_key_;
  const size_t max_body_bytes_;
  std::atomic<size_t> running_threads_{0};
};

// Largest request body accepted: the longest code, with every byte escaped
// in JSON, plus room for the rest of the request.
size_t MaxRequestBytes(const runner::Config& config);

// Compares two strings in a time that does not depend on where they differ.
bool ConstantTimeEquals(const std::string& a, const std::string& b);

}  // namespace gateway

#endif
