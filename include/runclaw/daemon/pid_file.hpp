#pragma once

#include "runclaw/common/result.hpp"

#include <filesystem>

namespace runclaw::daemon {

/// Holds `<config dir>/daemon.pid` while a daemon runs. A file naming a dead process is stale
/// and gets replaced.
class PidFile {
public:
  explicit PidFile(std::filesystem::path path);
  ~PidFile();

  PidFile(const PidFile &) = delete;
  PidFile &operator=(const PidFile &) = delete;

  [[nodiscard]] common::Status acquire();
  void release();
  [[nodiscard]] bool acquired() const { return acquired_; }
  [[nodiscard]] const std::filesystem::path &path() const { return path_; }

  [[nodiscard]] static bool is_process_running(int pid);

private:
  std::filesystem::path path_;
  bool acquired_ = false;
};

} // namespace runclaw::daemon
