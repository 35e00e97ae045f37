#include "gateway/http_service.hpp"

#include <algorithm>
#include <chrono>
#include <cstring>
#include <thread>

#include <kj/debug.h>
#include <kj/thread.h>

#include "gateway/json.hpp"
#include "util/log_manager.hpp"

namespace gateway {

namespace {
const constexpr char* kBearer = "Bearer ";

kj::StringPtr StatusText(unsigned status) {
  switch (status) {
    case 200:
      return "OK";
    case 400:
      return "Bad Request";
    case 401:
      return "Unauthorized";
    case 404:
      return "Not Found";
    case 405:
      return "Method Not Allowed";
    case 429:
      return "Too Many Requests";
    default:
      return "Internal Server Error";
  }
}
}  // namespace

size_t MaxRequestBytes(const runner::Config& config) {
  return config.max_code_bytes * 6 + 4096;
}

bool ConstantTimeEquals(const std::string& a, const std::string& b) {
  size_t size = std::max(a.size(), b.size());
  unsigned char diff = a.size() == b.size() ? 0 : 1;
  for (size_t i = 0; i < size; i++) {
    unsigned char ca = i < a.size() ? a[i] : 0;
    unsigned char cb = i < b.size() ? b[i] : 0;
    diff |= ca ^ cb;
  }
  return diff == 0;
}

HttpService::HttpService(kj::HttpHeaderTable::Builder& headers,
                         runner::Coordinator* coordinator, std::string api_key,
                         size_t max_body_bytes)
    : table_(headers.getFutureTable()),
      authorization_(headers.add("Authorization")),
      coordinator_(coordinator),
      api_key_(std::move(api_key)),
      max_body_bytes_(max_body_bytes) {
  KJ_REQUIRE(!api_key_.empty(), "The API key must not be empty");
}

kj::Promise<void> HttpService::request(kj::HttpMethod method,
                                       kj::StringPtr url,
                                       const kj::HttpHeaders& headers,
                                       kj::AsyncInputStream& requestBody,
                                       Response& response) {
  std::string path(url.cStr(), url.size());
  path = path.substr(0, path.find('?'));
  if (path == "/healthz") {
    if (method != kj::HttpMethod::GET) {
      return Send(response, 405, EncodeError("method not allowed"));
    }
    return Send(response, 200, EncodeHealth());
  }
  if (path != "/execute") {
    return Send(response, 404, EncodeError("not found"));
  }
  if (method != kj::HttpMethod::POST) {
    return Send(response, 405, EncodeError("method not allowed"));
  }
  if (!Authorized(headers)) {
    KJ_LOG(WARNING, "Unauthorized request");
    return Send(response, 401, EncodeError("unauthorized"));
  }
  return Execute(requestBody, response);
}

bool HttpService::Authorized(const kj::HttpHeaders& headers) const {
  std::string value;
  kj::Maybe<kj::StringPtr> maybe_header = headers.get(authorization_);
  KJ_IF_MAYBE(header, maybe_header) {
    value = std::string(header->cStr(), header->size());
  }
  if (value.compare(0, strlen(kBearer), kBearer) != 0) return false;
  return ConstantTimeEquals(value.substr(strlen(kBearer)), api_key_);
}

kj::Promise<void> HttpService::Execute(kj::AsyncInputStream& requestBody,
                                       Response& response) {
  return requestBody.readAllText(max_body_bytes_)
      .then(
          [this, &response](kj::String body) -> kj::Promise<void> {
            runner::ExecutionRequest request;
            std::string error_msg;
            if (!DecodeRequest(body.asArray(), &request, &error_msg)) {
              KJ_LOG(INFO, "Rejected request", error_msg);
              return Send(response, 400, EncodeError(error_msg));
            }
            auto admitted = coordinator_->Admit(std::move(request));
            if (admitted.is<runner::Outcome>()) {
              const runner::Outcome& outcome = admitted.get<runner::Outcome>();
              return Send(response, HttpStatus(outcome),
                          EncodeOutcome(outcome));
            }
            return RunAdmitted(
                kj::mv(admitted.get<runner::Coordinator::Ticket>()),
                response);
          },
          [this, &response](kj::Exception&& exc) -> kj::Promise<void> {
            KJ_LOG(INFO, "Cannot read the request body", exc.getDescription());
            return Send(response, 400, EncodeError("invalid request body"));
          });
}

kj::Promise<void> HttpService::RunAdmitted(runner::Coordinator::Ticket ticket,
                                           Response& response) {
  auto paf = kj::newPromiseAndCrossThreadFulfiller<runner::Outcome>();
  running_threads_++;
  KJ_ON_SCOPE_FAILURE(running_threads_--);
  kj::Thread thread([coordinator = coordinator_, ticket = kj::mv(ticket),
                     fulfiller = kj::mv(paf.fulfiller),
                     running = &running_threads_]() mutable {
    // Declared first, so it runs after every other local is destroyed.
    // Nothing of this thread may touch the service afterwards.
    KJ_DEFER((*running)--);
    util::LogManager log_manager;
    auto done = kj::mv(fulfiller);
    done->fulfill(coordinator->Run(kj::mv(ticket)));
  });
  thread.detach();
  return paf.promise.then(
      [this, &response](runner::Outcome&& outcome) {
        return Send(response, HttpStatus(outcome), EncodeOutcome(outcome));
      },
      [this, &response](kj::Exception&& exc) {
        KJ_LOG(ERROR, "Execution thread failed", exc);
        return Send(response, 500, EncodeError("execution failed"));
      });
}

void HttpService::WaitForThreads() const {
  while (running_threads_.load() > 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
}

kj::Promise<void> HttpService::Send(Response& response, unsigned status,
                                    std::string body) {
  kj::HttpHeaders headers(table_);
  headers.set(kj::HttpHeaderId::CONTENT_TYPE, "application/json");
  auto content = kj::heap<std::string>(std::move(body));
  auto stream =
      response.send(status, StatusText(status), headers, content->size());
  auto promise = stream->write(content->data(), content->size());
  return promise.attach(kj::mv(stream), kj::mv(content));
}

}  // namespace gateway
