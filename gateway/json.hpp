#ifndef GATEWAY_JSON_HPP
#define GATEWAY_JSON_HPP

#include <string>

#include <kj/array.h>
#include <kj/string.h>

#include "runner/outcome.hpp"

namespace gateway {

// HTTP status code used to report an outcome.
unsigned HttpStatus(const runner::Outcome& outcome);

// JSON body used to report an outcome. Captured output is made valid UTF-8.
std::string EncodeOutcome(const runner::Outcome& outcome);

std::string EncodeError(const std::string& error);

std::string EncodeHealth();

// Decodes the body of an execution request. Returns false and sets error_msg
// if the body is not a valid JSON request.
bool DecodeRequest(kj::ArrayPtr<const char> body,
                   runner::ExecutionRequest* request, std::string* error_msg);

}  // namespace gateway

#endif
