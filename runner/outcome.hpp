#ifndef RUNNER_OUTCOME_HPP
#define RUNNER_OUTCOME_HPP

#include <cstdint>
#include <string>

namespace runner {

struct ExecutionRequest {
  std::string language;
  std::string code;
};

// What a program did. Either it exited with exit_code, or it was terminated by
// signal: signaled tells which one applies.
struct ExecutionResult {
  std::string stdout_data;
  std::string stderr_data;
  // Some output was discarded because of the output cap.
  bool truncated = false;
  bool signaled = false;
  int32_t exit_code = 0;
  int32_t signal = 0;
  int64_t wall_time_millis = 0;
  int64_t cpu_time_millis = 0;
  int64_t memory_usage_kb = 0;
};

// The single answer to one execution request. Immutable once built.
class Outcome {
 public:
  enum class Kind { COMPLETED, REJECTED, TIMED_OUT, OVERLOADED, INTERNAL_ERROR };

  static Outcome Completed(ExecutionResult result);
  // result holds the output captured before the deadline.
  static Outcome TimedOut(ExecutionResult result);
  static Outcome Rejected(std::string reason);
  static Outcome Overloaded();
  static Outcome InternalError(std::string reason);

  Kind GetKind() const { return kind_; }
  // Only valid for COMPLETED and TIMED_OUT outcomes.
  const ExecutionResult& Result() const;
  // Only valid for the other outcomes.
  const std::string& Reason() const;

 private:
  Outcome(Kind kind, ExecutionResult result, std::string reason)
      : kind_(kind), result_(std::move(result)), reason_(std::move(reason)) {}

  Kind kind_;
  ExecutionResult result_;
  std::string reason_;
};

const char* KindName(Outcome::Kind kind);

}  // namespace runner

#endif
