#include "runclaw/runner/sandbox_runner.hpp"

#include "runclaw/common/fs.hpp"
#include "runclaw/observability/global.hpp"
#include "runclaw/protocol/output_parser.hpp"
#include "runclaw/runner/transcript.hpp"
#include "runclaw/sandbox/container.hpp"
#include "runclaw/sandbox/handoff.hpp"

#include <algorithm>

namespace runclaw::runner {

namespace {

constexpr std::chrono::milliseconds kContainerCleanupTimeout{10'000};

} // namespace

SandboxExecutionRunner::SandboxExecutionRunner(config::ContainerConfig container,
                                               config::RuntimePaths paths,
                                               std::shared_ptr<sandbox::IProcessLauncher> launcher)
    : container_(std::move(container)), paths_(std::move(paths)), launcher_(std::move(launcher)) {}

std::chrono::milliseconds
SandboxExecutionRunner::effective_timeout(const std::chrono::milliseconds requested) const {
  if (container_.timeout_ms == 0) {
    return requested;
  }
  const auto ceiling = std::chrono::milliseconds(static_cast<std::int64_t>(container_.timeout_ms));
  return std::min(requested, ceiling);
}

common::Result<ExecutionOutcome> SandboxExecutionRunner::run(const protocol::ExecutionRequest &request,
                                                             const std::chrono::milliseconds timeout) {
  if (!launcher_) {
    return common::Result<ExecutionOutcome>::failure("process launcher unavailable");
  }

  const std::string serialized = protocol::serialize_request(request);
  auto bundle = sandbox::write_handoff(paths_, request, serialized);
  if (!bundle.ok()) {
    return common::Result<ExecutionOutcome>::failure("sandbox preparation failed: " +
                                                     bundle.error());
  }

  const std::string container_name =
      sandbox::container_name_for(request.group_folder, bundle.value().session_key);
  const auto budget = effective_timeout(timeout);
  auto spec = sandbox::build_process_spec(container_, bundle.value(), container_name, serialized,
                                          budget);
  if (!spec.ok()) {
    sandbox::remove_request_file(bundle.value());
    return common::Result<ExecutionOutcome>::failure(spec.error());
  }

  auto launched = launcher_->run(spec.value());
  sandbox::remove_request_file(bundle.value());
  if (!launched.ok()) {
    return common::Result<ExecutionOutcome>::failure(launched.error());
  }

  const auto &output = launched.value();
  if (output.timed_out && container_.runtime == "docker") {
    remove_container(container_name);
  }

  std::string captured = output.stdout_text;
  if (output.truncated) {
    captured += TRUNCATION_MARKER;
  }

  ExecutionOutcome outcome;
  outcome.result = protocol::parse_output(captured, output.exited_successfully());
  outcome.duration = output.duration;
  outcome.timed_out = output.timed_out;
  outcome.truncated = output.truncated;

  if (output.timed_out) {
    outcome.result.status = protocol::STATUS_ERROR;
    if (!outcome.result.error.has_value() ||
        *outcome.result.error == protocol::GENERIC_FAILURE_MESSAGE) {
      outcome.result.error =
          "Container execution timed out after " + std::to_string(budget.count()) + "ms";
    }
  }

  if (outcome.result.is_success()) {
    auto transcript = write_run_transcript(paths_, request, outcome.result,
                                           std::chrono::system_clock::now());
    if (!transcript.ok()) {
      observability::record_error("runner", "could not write run transcript: " +
                                                transcript.error());
    }
  }

  return common::Result<ExecutionOutcome>::success(std::move(outcome));
}

void SandboxExecutionRunner::remove_container(const std::string &name) {
  sandbox::ProcessSpec cleanup;
  cleanup.argv = {container_.binary, "rm", "-f", name};
  cleanup.timeout = kContainerCleanupTimeout;
  cleanup.max_output_bytes = 64 * 1024;
  auto removed = launcher_->run(cleanup);
  if (!removed.ok()) {
    observability::record_error("runner", "could not remove container " + name + ": " +
                                              removed.error());
    return;
  }
  if (removed.value().exit_code != 0) {
    observability::record_error("runner", "could not remove container " + name + ": " +
                                              common::trim(removed.value().stderr_text));
  }
}

} // namespace runclaw::runner
