#pragma once

#include "runclaw/common/result.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace runclaw::sandbox {

struct ProcessSpec {
  std::vector<std::string> argv;
  /// Written to the child's stdin, which is then closed.
  std::string stdin_text;
  std::filesystem::path working_dir;
  /// Added to (or replacing entries of) the inherited environment.
  std::vector<std::pair<std::string, std::string>> env;
  std::chrono::milliseconds timeout{300'000};
  /// Per stream; anything beyond is read and discarded.
  std::size_t max_output_bytes = 10 * 1024 * 1024;
};

struct ProcessOutput {
  int exit_code = -1;
  std::string stdout_text;
  std::string stderr_text;
  bool timed_out = false;
  bool truncated = false;
  std::chrono::milliseconds duration{0};

  [[nodiscard]] bool exited_successfully() const { return !timed_out && exit_code == 0; }
};

class IProcessLauncher {
public:
  virtual ~IProcessLauncher() = default;

  /// Fails only when the process could not be started. A non-zero exit or a timeout is
  /// reported through ProcessOutput.
  [[nodiscard]] virtual common::Result<ProcessOutput> run(const ProcessSpec &spec) = 0;
};

/// fork/exec launcher. The child gets its own process group, which is killed as a whole on
/// timeout.
class PosixProcessLauncher final : public IProcessLauncher {
public:
  [[nodiscard]] common::Result<ProcessOutput> run(const ProcessSpec &spec) override;
};

} // namespace runclaw::sandbox
