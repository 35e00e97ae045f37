#include "runner/outcome.hpp"

#include <kj/debug.h>

namespace runner {

Outcome Outcome::Completed(ExecutionResult result) {
  return Outcome(Kind::COMPLETED, std::move(result), "");
}

Outcome Outcome::TimedOut(ExecutionResult result) {
  return Outcome(Kind::TIMED_OUT, std::move(result), "");
}

Outcome Outcome::Rejected(std::string reason) {
  return Outcome(Kind::REJECTED, ExecutionResult(), std::move(reason));
}

Outcome Outcome::Overloaded() {
  return Outcome(Kind::OVERLOADED, ExecutionResult(), "overloaded");
}

Outcome Outcome::InternalError(std::string reason) {
  return Outcome(Kind::INTERNAL_ERROR, ExecutionResult(), std::move(reason));
}

const ExecutionResult& Outcome::Result() const {
  KJ_REQUIRE(kind_ == Kind::COMPLETED || kind_ == Kind::TIMED_OUT,
             "Outcome has no result", KindName(kind_));
  return result_;
}

const std::string& Outcome::Reason() const {
  KJ_REQUIRE(kind_ != Kind::COMPLETED && kind_ != Kind::TIMED_OUT,
             "Outcome has no reason", KindName(kind_));
  return reason_;
}

const char* KindName(Outcome::Kind kind) {
  switch (kind) {
    case Outcome::Kind::COMPLETED:
      return "completed";
    case Outcome::Kind::REJECTED:
      return "rejected";
    case Outcome::Kind::TIMED_OUT:
      return "timed out";
    case Outcome::Kind::OVERLOADED:
      return "overloaded";
    case Outcome::Kind::INTERNAL_ERROR:
      return "internal error";
  }
  KJ_UNREACHABLE;
}

}  // namespace runner
