#pragma once

#include "runclaw/common/result.hpp"
#include "runclaw/config/config.hpp"
#include "runclaw/protocol/execution.hpp"

#include <filesystem>
#include <string>

namespace runclaw::sandbox {

/// Files written for one execution before the subprocess starts. The subprocess reads them
/// once; nothing is exchanged through them while it runs.
struct HandoffBundle {
  std::string group;
  /// `<groups_dir>/<group>`, the subprocess working directory.
  std::filesystem::path group_dir;
  /// `<data_dir>/ipc/<group>`, holding current_tasks.json and available_groups.json.
  std::filesystem::path ipc_dir;
  /// `<data_dir>/tmp/input_<session>.json`
  std::filesystem::path request_file;
  std::string session_key;
};

/// Group identifiers become path components, so anything that could escape is refused.
[[nodiscard]] common::Status validate_group_folder(const std::string &group);

/// Keys made only of `[A-Za-z0-9._-]` are kept verbatim; others become a slug plus hash.
[[nodiscard]] std::string file_component(const std::string &key);

/// Session id of the request, or `interactive` for calls without one.
[[nodiscard]] std::string handoff_session_key(const protocol::ExecutionRequest &request);

[[nodiscard]] std::string current_tasks_document(const protocol::ExecutionRequest &request);
[[nodiscard]] std::string available_groups_document(const std::string &group);

[[nodiscard]] common::Result<HandoffBundle> write_handoff(const config::RuntimePaths &paths,
                                                          const protocol::ExecutionRequest &request,
                                                          const std::string &serialized_request);

/// Best effort; a failure is logged and otherwise ignored.
void remove_request_file(const HandoffBundle &bundle);

} // namespace runclaw::sandbox
