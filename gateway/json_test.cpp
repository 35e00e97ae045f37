#include "gateway/json.hpp"
#include <capnp/compat/json.h>
#include <capnp/message.h>
#include "capnp/runner.capnp.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::HasSubstr;
using ::testing::Not;

using runner::ExecutionResult;
using runner::Outcome;

kj::ArrayPtr<const char> Body(const std::string& s) {
  return kj::ArrayPtr<const char>(s.data(), s.size());
}

template <typename T>
void Parse(const std::string& json, capnp::MallocMessageBuilder* message) {
  capnp::JsonCodec codec;
  codec.decode(Body(json), message->initRoot<T>());
}

ExecutionResult Result(const std::string& out, const std::string& err) {
  ExecutionResult result;
  result.stdout_data = out;
  result.stderr_data = err;
  return result;
}

// NOLINTNEXTLINE
TEST(Json, HttpStatus) {
  EXPECT_EQ(gateway::HttpStatus(Outcome::Completed(Result("", ""))), 200);
  EXPECT_EQ(gateway::HttpStatus(Outcome::TimedOut(Result("", ""))), 200);
  EXPECT_EQ(gateway::HttpStatus(Outcome::Rejected("bad")), 400);
  EXPECT_EQ(gateway::HttpStatus(Outcome::Overloaded()), 429);
  EXPECT_EQ(gateway::HttpStatus(Outcome::InternalError("oops")), 500);
}

// NOLINTNEXTLINE
TEST(Json, EncodeCompletedWithExitCode) {
  ExecutionResult result = Result("hello\n", "");
  result.exit_code = 3;
  std::string json = gateway::EncodeOutcome(Outcome::Completed(result));
  EXPECT_THAT(json, HasSubstr("\"exitCode\""));
  EXPECT_THAT(json, Not(HasSubstr("\"signal\"")));
  EXPECT_THAT(json, Not(HasSubstr("\"timedOut\"")));

  capnp::MallocMessageBuilder message;
  Parse<capnproto::CompletedResponse>(json, &message);
  auto response = message.getRoot<capnproto::CompletedResponse>().asReader();
  EXPECT_EQ(response.getStdout(), "hello\n");
  EXPECT_EQ(response.getStderr(), "");
  EXPECT_FALSE(response.getTruncated());
  ASSERT_EQ(response.which(), capnproto::CompletedResponse::EXIT_CODE);
  EXPECT_EQ(response.getExitCode(), 3);
}

// NOLINTNEXTLINE
TEST(Json, EncodeCompletedWithSignal) {
  ExecutionResult result = Result("", "");
  result.signaled = true;
  result.signal = 9;
  result.truncated = true;
  std::string json = gateway::EncodeOutcome(Outcome::Completed(result));
  EXPECT_THAT(json, Not(HasSubstr("\"exitCode\"")));

  capnp::MallocMessageBuilder message;
  Parse<capnproto::CompletedResponse>(json, &message);
  auto response = message.getRoot<capnproto::CompletedResponse>().asReader();
  ASSERT_EQ(response.which(), capnproto::CompletedResponse::SIGNAL);
  EXPECT_EQ(response.getSignal(), 9);
  EXPECT_TRUE(response.getTruncated());
}

// NOLINTNEXTLINE
TEST(Json, EncodeTimedOut) {
  std::string json =
      gateway::EncodeOutcome(Outcome::TimedOut(Result("started\n", "")));
  EXPECT_THAT(json, HasSubstr("\"timedOut\":true"));
  EXPECT_THAT(json, Not(HasSubstr("\"exitCode\"")));

  capnp::MallocMessageBuilder message;
  Parse<capnproto::TimedOutResponse>(json, &message);
  auto response = message.getRoot<capnproto::TimedOutResponse>().asReader();
  EXPECT_TRUE(response.getTimedOut());
  EXPECT_EQ(response.getStdout(), "started\n");
  EXPECT_EQ(response.getStderr(), "");
}

// NOLINTNEXTLINE
TEST(Json, EncodeErrors) {
  EXPECT_EQ(gateway::EncodeOutcome(Outcome::Overloaded()),
            "{\"error\":\"overloaded\"}");
  EXPECT_EQ(gateway::EncodeError("unauthorized"),
            "{\"error\":\"unauthorized\"}");
  EXPECT_EQ(gateway::EncodeOutcome(Outcome::Rejected("code must not be empty")),
            "{\"error\":\"code must not be empty\"}");
  EXPECT_EQ(gateway::EncodeHealth(), "{\"status\":\"ok\"}");
}

// NOLINTNEXTLINE
TEST(Json, EncodeInvalidUtf8Output) {
  std::string json =
      gateway::EncodeOutcome(Outcome::Completed(Result("a\xff" "b", "")));
  capnp::MallocMessageBuilder message;
  Parse<capnproto::CompletedResponse>(json, &message);
  auto response = message.getRoot<capnproto::CompletedResponse>().asReader();
  EXPECT_EQ(response.getStdout(), "a\xef\xbf\xbd" "b");
}

// NOLINTNEXTLINE
TEST(Json, DecodeRequest) {
  runner::ExecutionRequest request;
  std::string error;
  ASSERT_TRUE(gateway::DecodeRequest(
      Body("{\"language\":\"python\",\"code\":\"print(1)\\n\"}"), &request,
      &error));
  EXPECT_EQ(request.language, "python");
  EXPECT_EQ(request.code, "print(1)\n");
}

// NOLINTNEXTLINE
TEST(Json, DecodeRequestWithMissingFields) {
  runner::ExecutionRequest request;
  std::string error;
  ASSERT_TRUE(gateway::DecodeRequest(Body("{\"language\":\"sh\"}"), &request,
                                     &error));
  EXPECT_EQ(request.language, "sh");
  EXPECT_EQ(request.code, "");
}

// NOLINTNEXTLINE
TEST(Json, DecodeMalformedRequest) {
  for (const std::string body :
       {"", "{", "not json", "[1, 2]", "{\"language\": 3}"}) {
    runner::ExecutionRequest request;
    std::string error;
    EXPECT_FALSE(gateway::DecodeRequest(Body(body), &request, &error)) << body;
    EXPECT_THAT(error, HasSubstr("malformed request")) << body;
  }
}

}  // namespace
