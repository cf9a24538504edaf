#pragma once

#include <optional>
#include <string>

namespace runclaw::protocol {

/// Instruction handed to an execution runner for a single run.
struct ExecutionRequest {
  std::string prompt;
  std::optional<std::string> session_id;
  std::string group_folder;
  std::string chat_jid;
  bool is_main = false;
  bool is_scheduled_task = false;
};

/// Structured outcome reported by the agent subprocess (or synthesized for it).
struct ExecutionResult {
  std::string status;
  std::optional<std::string> result;
  std::optional<std::string> new_session_id;
  std::optional<std::string> error;

  [[nodiscard]] bool is_success() const { return status == "success"; }
};

inline constexpr const char *STATUS_SUCCESS = "success";
inline constexpr const char *STATUS_ERROR = "error";

/// Single-line JSON document written to the subprocess input channel.
[[nodiscard]] std::string serialize_request(const ExecutionRequest &request);

/// JSON document in the same shape the subprocess uses to report results.
[[nodiscard]] std::string serialize_result(const ExecutionResult &result);

} // namespace runclaw::protocol
