#include "gateway/json.hpp"

#include <capnp/compat/json.h>
#include <capnp/message.h>
#include <kj/debug.h>

#include "capnp/runner.capnp.h"
#include "util/misc.hpp"

namespace gateway {

namespace {
capnp::Text::Reader ToText(const std::string& s) {
  return capnp::Text::Reader(s.c_str(), s.size());
}

std::string ToString(const kj::String& s) {
  return std::string(s.cStr(), s.size());
}

template <typename T>
void FillOutput(const runner::ExecutionResult& result, T builder) {
  builder.setStdout(ToText(util::sanitizeUtf8(result.stdout_data)));
  builder.setStderr(ToText(util::sanitizeUtf8(result.stderr_data)));
  builder.setTruncated(result.truncated);
}
}  // namespace

unsigned HttpStatus(const runner::Outcome& outcome) {
  switch (outcome.GetKind()) {
    case runner::Outcome::Kind::COMPLETED:
    case runner::Outcome::Kind::TIMED_OUT:
      return 200;
    case runner::Outcome::Kind::REJECTED:
      return 400;
    case runner::Outcome::Kind::OVERLOADED:
      return 429;
    case runner::Outcome::Kind::INTERNAL_ERROR:
      return 500;
  }
  KJ_UNREACHABLE;
}

std::string EncodeOutcome(const runner::Outcome& outcome) {
  capnp::MallocMessageBuilder message;
  capnp::JsonCodec codec;
  switch (outcome.GetKind()) {
    case runner::Outcome::Kind::COMPLETED: {
      const runner::ExecutionResult& result = outcome.Result();
      auto response = message.initRoot<capnproto::CompletedResponse>();
      FillOutput(result, response);
      if (result.signaled) {
        response.setSignal(result.signal);
      } else {
        response.setExitCode(result.exit_code);
      }
      return ToString(codec.encode(response.asReader()));
    }
    case runner::Outcome::Kind::TIMED_OUT: {
      auto response = message.initRoot<capnproto::TimedOutResponse>();
      FillOutput(outcome.Result(), response);
      response.setTimedOut(true);
      return ToString(codec.encode(response.asReader()));
    }
    case runner::Outcome::Kind::REJECTED:
    case runner::Outcome::Kind::OVERLOADED:
    case runner::Outcome::Kind::INTERNAL_ERROR:
      return EncodeError(outcome.Reason());
  }
  KJ_UNREACHABLE;
}

std::string EncodeError(const std::string& error) {
  capnp::MallocMessageBuilder message;
  capnp::JsonCodec codec;
  auto response = message.initRoot<capnproto::ErrorResponse>();
  response.setError(ToText(util::sanitizeUtf8(error)));
  return ToString(codec.encode(response.asReader()));
}

std::string EncodeHealth() {
  capnp::MallocMessageBuilder message;
  capnp::JsonCodec codec;
  auto response = message.initRoot<capnproto::HealthResponse>();
  response.setStatus("ok");
  return ToString(codec.encode(response.asReader()));
}

bool DecodeRequest(kj::ArrayPtr<const char> body,
                   runner::ExecutionRequest* request, std::string* error_msg) {
  capnp::MallocMessageBuilder message;
  capnp::JsonCodec codec;
  auto builder = message.initRoot<capnproto::ExecuteRequest>();
  kj::Maybe<kj::Exception> maybe_exception =
      kj::runCatchingExceptions([&]() { codec.decode(body, builder); });
  KJ_IF_MAYBE(exception, maybe_exception) {
    *error_msg = "malformed request: " +
                 std::string(exception->getDescription().cStr());
    return false;
  }
  auto reader = builder.asReader();
  request->language =
      std::string(reader.getLanguage().cStr(), reader.getLanguage().size());
  request->code = std::string(reader.getCode().cStr(), reader.getCode().size());
  return true;
}

}  // namespace gateway
