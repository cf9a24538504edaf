#include "runclaw/sandbox/process.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

namespace runclaw::sandbox {

namespace {

constexpr int kPollIntervalMs = 50;

void set_non_blocking(const int fd) {
  const int flags = fcntl(fd, F_GETFL, 0);
  if (flags >= 0) {
    (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
  }
}

void close_fd(int &fd) {
  if (fd >= 0) {
    close(fd);
    fd = -1;
  }
}

struct PipePair {
  int read = -1;
  int write = -1;

  bool open() {
    int fds[2] = {-1, -1};
    if (pipe2(fds, O_CLOEXEC) != 0) {
      return false;
    }
    read = fds[0];
    write = fds[1];
    return true;
  }

  void close_both() {
    close_fd(read);
    close_fd(write);
  }
};

/// Reads everything currently available. Keeps at most `limit` bytes; returns false on EOF.
bool read_capped(const int fd, std::string &buffer, const std::size_t limit, bool &truncated) {
  std::array<char, 4096> chunk{};
  while (true) {
    const ssize_t bytes = read(fd, chunk.data(), chunk.size());
    if (bytes > 0) {
      const auto size = static_cast<std::size_t>(bytes);
      const std::size_t room = buffer.size() < limit ? limit - buffer.size() : 0;
      if (size > room) {
        truncated = true;
      }
      buffer.append(chunk.data(), std::min(size, room));
      continue;
    }
    if (bytes == 0) {
      return false;
    }
    if (errno == EINTR) {
      continue;
    }
    // EAGAIN or a read error; either way nothing more to take right now
    return errno == EAGAIN || errno == EWOULDBLOCK;
  }
}

std::vector<std::string> build_environment(const std::vector<std::pair<std::string, std::string>> &extra) {
  std::vector<std::string> out;
  for (char **entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
    const std::string value(*entry);
    const auto eq = value.find('=');
    const std::string name = eq == std::string::npos ? value : value.substr(0, eq);
    bool overridden = false;
    for (const auto &pair : extra) {
      if (pair.first == name) {
        overridden = true;
        break;
      }
    }
    if (!overridden) {
      out.push_back(value);
    }
  }
  for (const auto &pair : extra) {
    out.push_back(pair.first + "=" + pair.second);
  }
  return out;
}

std::vector<char *> to_pointers(std::vector<std::string> &values) {
  std::vector<char *> out;
  out.reserve(values.size() + 1);
  for (auto &value : values) {
    out.push_back(value.data());
  }
  out.push_back(nullptr);
  return out;
}

[[noreturn]] void child_fail(const int error_fd) {
  const int code = errno;
  (void)!write(error_fd, &code, sizeof(code));
  _exit(127);
}

} // namespace

common::Result<ProcessOutput> PosixProcessLauncher::run(const ProcessSpec &spec) {
  if (spec.argv.empty() || spec.argv.front().empty()) {
    return common::Result<ProcessOutput>::failure("process command is empty");
  }

  // Everything the child touches is prepared before fork.
  std::vector<std::string> args = spec.argv;
  std::vector<char *> argv = to_pointers(args);
  std::vector<std::string> env_entries = build_environment(spec.env);
  std::vector<char *> envp = to_pointers(env_entries);
  const std::string working_dir = spec.working_dir.string();

  PipePair stdin_pipe;
  PipePair stdout_pipe;
  PipePair stderr_pipe;
  PipePair error_pipe;
  if (!stdin_pipe.open() || !stdout_pipe.open() || !stderr_pipe.open() || !error_pipe.open()) {
    const std::string reason = std::strerror(errno);
    stdin_pipe.close_both();
    stdout_pipe.close_both();
    stderr_pipe.close_both();
    error_pipe.close_both();
    return common::Result<ProcessOutput>::failure("failed to create pipes: " + reason);
  }

  const auto started = std::chrono::steady_clock::now();
  const pid_t pid = fork();
  if (pid < 0) {
    const std::string reason = std::strerror(errno);
    stdin_pipe.close_both();
    stdout_pipe.close_both();
    stderr_pipe.close_both();
    error_pipe.close_both();
    return common::Result<ProcessOutput>::failure("failed to fork process: " + reason);
  }

  if (pid == 0) {
    (void)setpgid(0, 0);
    (void)signal(SIGPIPE, SIG_DFL);
    if (dup2(stdin_pipe.read, STDIN_FILENO) < 0 || dup2(stdout_pipe.write, STDOUT_FILENO) < 0 ||
        dup2(stderr_pipe.write, STDERR_FILENO) < 0) {
      child_fail(error_pipe.write);
    }
    if (!working_dir.empty() && chdir(working_dir.c_str()) != 0) {
      child_fail(error_pipe.write);
    }
    execvpe(argv[0], argv.data(), envp.data());
    child_fail(error_pipe.write);
  }

  // Mirror the child's setpgid so a kill issued right away still reaches the group.
  (void)setpgid(pid, pid);

  close_fd(stdin_pipe.read);
  close_fd(stdout_pipe.write);
  close_fd(stderr_pipe.write);
  close_fd(error_pipe.write);

  int exec_errno = 0;
  ssize_t error_bytes = 0;
  do {
    error_bytes = read(error_pipe.read, &exec_errno, sizeof(exec_errno));
  } while (error_bytes < 0 && errno == EINTR);
  close_fd(error_pipe.read);
  if (error_bytes == static_cast<ssize_t>(sizeof(exec_errno))) {
    int ignored = 0;
    (void)waitpid(pid, &ignored, 0);
    stdin_pipe.close_both();
    stdout_pipe.close_both();
    stderr_pipe.close_both();
    return common::Result<ProcessOutput>::failure("failed to launch " + spec.argv.front() + ": " +
                                                  std::strerror(exec_errno));
  }

  set_non_blocking(stdin_pipe.write);
  set_non_blocking(stdout_pipe.read);
  set_non_blocking(stderr_pipe.read);

  ProcessOutput output;
  std::size_t stdin_offset = 0;
  if (spec.stdin_text.empty()) {
    close_fd(stdin_pipe.write);
  }

  int status = 0;
  bool stdout_open = true;
  bool stderr_open = true;
  bool lost_child = false;

  while (true) {
    if (stdin_pipe.write >= 0) {
      while (stdin_offset < spec.stdin_text.size()) {
        const ssize_t written = write(stdin_pipe.write, spec.stdin_text.data() + stdin_offset,
                                      spec.stdin_text.size() - stdin_offset);
        if (written > 0) {
          stdin_offset += static_cast<std::size_t>(written);
          continue;
        }
        if (written < 0 && errno == EINTR) {
          continue;
        }
        if (written < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
          break;
        }
        // EPIPE: the child stopped reading
        stdin_offset = spec.stdin_text.size();
      }
      if (stdin_offset >= spec.stdin_text.size()) {
        close_fd(stdin_pipe.write);
      }
    }

    if (stdout_open) {
      stdout_open = read_capped(stdout_pipe.read, output.stdout_text, spec.max_output_bytes,
                                output.truncated);
    }
    if (stderr_open) {
      bool ignored = false;
      stderr_open =
          read_capped(stderr_pipe.read, output.stderr_text, spec.max_output_bytes, ignored);
    }

    const pid_t waited = waitpid(pid, &status, WNOHANG);
    if (waited == pid) {
      break;
    }
    if (waited < 0 && errno != EINTR) {
      lost_child = true;
      break;
    }

    const auto elapsed = std::chrono::steady_clock::now() - started;
    if (elapsed > spec.timeout) {
      output.timed_out = true;
      (void)kill(-pid, SIGKILL);
      (void)kill(pid, SIGKILL);
      (void)waitpid(pid, &status, 0);
      break;
    }

    struct pollfd poll_fds[3] = {
        {.fd = stdout_open ? stdout_pipe.read : -1, .events = POLLIN, .revents = 0},
        {.fd = stderr_open ? stderr_pipe.read : -1, .events = POLLIN, .revents = 0},
        {.fd = stdin_pipe.write, .events = POLLOUT, .revents = 0},
    };
    (void)poll(poll_fds, 3, kPollIntervalMs);
  }

  if (!output.timed_out) {
    if (stdout_open) {
      (void)read_capped(stdout_pipe.read, output.stdout_text, spec.max_output_bytes,
                        output.truncated);
    }
    if (stderr_open) {
      bool ignored = false;
      (void)read_capped(stderr_pipe.read, output.stderr_text, spec.max_output_bytes, ignored);
    }
  }
  close_fd(stdin_pipe.write);
  close_fd(stdout_pipe.read);
  close_fd(stderr_pipe.read);

  output.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  output.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
  if (output.timed_out || lost_child) {
    output.exit_code = -1;
  }
  return common::Result<ProcessOutput>::success(std::move(output));
}

} // namespace runclaw::sandbox
