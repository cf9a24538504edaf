#pragma once

#include "runclaw/common/result.hpp"
#include "runclaw/protocol/execution.hpp"

#include <chrono>

namespace runclaw::runner {

struct ExecutionOutcome {
  protocol::ExecutionResult result;
  std::chrono::milliseconds duration{0};
  bool timed_out = false;
  bool truncated = false;
};

/// Runs one request in an isolated subprocess. A failed Result means the subprocess never ran
/// (sandbox preparation, serialization or spawn failed); anything the subprocess itself did,
/// including timing out, comes back as a successful Result.
class IExecutionRunner {
public:
  virtual ~IExecutionRunner() = default;

  [[nodiscard]] virtual common::Result<ExecutionOutcome>
  run(const protocol::ExecutionRequest &request, std::chrono::milliseconds timeout) = 0;
};

} // namespace runclaw::runner
