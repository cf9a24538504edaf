#pragma once

#include "runclaw/config/config.hpp"
#include "runclaw/runner/execution_runner.hpp"
#include "runclaw/sandbox/process.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace runclaw::runner {

inline constexpr std::string_view TRUNCATION_MARKER = "\n[OUTPUT TRUNCATED - exceeded max size]";

class SandboxExecutionRunner final : public IExecutionRunner {
public:
  SandboxExecutionRunner(config::ContainerConfig container, config::RuntimePaths paths,
                         std::shared_ptr<sandbox::IProcessLauncher> launcher =
                             std::make_shared<sandbox::PosixProcessLauncher>());

  [[nodiscard]] common::Result<ExecutionOutcome> run(const protocol::ExecutionRequest &request,
                                                     std::chrono::milliseconds timeout) override;

  /// Budget actually applied to a call asked to finish within `requested`.
  [[nodiscard]] std::chrono::milliseconds effective_timeout(std::chrono::milliseconds requested) const;

private:
  void remove_container(const std::string &name);

  config::ContainerConfig container_;
  config::RuntimePaths paths_;
  std::shared_ptr<sandbox::IProcessLauncher> launcher_;
};

} // namespace runclaw::runner
