#include "runclaw/daemon/pid_file.hpp"

#include <cerrno>
#include <fstream>
#include <signal.h>
#include <unistd.h>

namespace runclaw::daemon {

PidFile::PidFile(std::filesystem::path path) : path_(std::move(path)) {}

PidFile::~PidFile() { release(); }

common::Status PidFile::acquire() {
  if (acquired_) {
    return common::Status::success();
  }

  std::error_code ec;
  if (path_.has_parent_path()) {
    std::filesystem::create_directories(path_.parent_path(), ec);
    if (ec) {
      return common::Status::error("failed to create pid directory: " + ec.message());
    }
  }

  if (std::filesystem::exists(path_, ec)) {
    std::ifstream in(path_);
    int existing_pid = 0;
    in >> existing_pid;
    if (existing_pid > 0 && existing_pid != static_cast<int>(getpid()) &&
        is_process_running(existing_pid)) {
      return common::Status::error("daemon already running with pid " +
                                   std::to_string(existing_pid));
    }
    std::filesystem::remove(path_, ec);
  }

  std::ofstream out(path_, std::ios::trunc);
  if (!out) {
    return common::Status::error("failed to write pid file " + path_.string());
  }
  out << static_cast<int>(getpid()) << "\n";
  acquired_ = true;
  return common::Status::success();
}

void PidFile::release() {
  if (!acquired_) {
    return;
  }
  std::error_code ec;
  std::filesystem::remove(path_, ec);
  acquired_ = false;
}

bool PidFile::is_process_running(const int pid) {
  if (pid <= 0) {
    return false;
  }
  // EPERM still means the process exists
  return kill(pid, 0) == 0 || errno == EPERM;
}

} // namespace runclaw::daemon
