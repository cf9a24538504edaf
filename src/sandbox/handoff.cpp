#include "runclaw/sandbox/handoff.hpp"

#include "runclaw/common/fs.hpp"
#include "runclaw/common/json_util.hpp"
#include "runclaw/observability/global.hpp"
#include "runclaw/sandbox/container.hpp"

#include <initializer_list>
#include <sstream>

namespace runclaw::sandbox {

std::string file_component(const std::string &key) {
  for (const char ch : key) {
    const bool safe = (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') ||
                      (ch >= '0' && ch <= '9') || ch == '.' || ch == '_' || ch == '-';
    if (!safe) {
      return slugify(key) + "-" + short_hash_hex(key);
    }
  }
  return key;
}

common::Status validate_group_folder(const std::string &group) {
  if (common::trim(group).empty()) {
    return common::Status::error("group folder is empty");
  }
  if (group == "." || group == "..") {
    return common::Status::error("group folder is not a directory name: " + group);
  }
  if (group.find('/') != std::string::npos || group.find('\\') != std::string::npos ||
      group.find('\0') != std::string::npos) {
    return common::Status::error("group folder must not contain path separators: " + group);
  }
  return common::Status::success();
}

std::string handoff_session_key(const protocol::ExecutionRequest &request) {
  if (request.session_id.has_value() && !common::trim(*request.session_id).empty()) {
    return *request.session_id;
  }
  return "interactive";
}

std::string current_tasks_document(const protocol::ExecutionRequest &request) {
  std::ostringstream out;
  out << "{\"tasks\":[{\"id\":" << common::json_quote(handoff_session_key(request))
      << ",\"prompt\":" << common::json_quote(request.prompt)
      << ",\"is_scheduled\":" << (request.is_scheduled_task ? "true" : "false") << "}]}";
  return out.str();
}

std::string available_groups_document(const std::string &group) {
  std::ostringstream out;
  out << "{\"groups\":{" << common::json_quote(group) << ":{\"name\":" << common::json_quote(group)
      << ",\"registered\":true}}}";
  return out.str();
}

common::Result<HandoffBundle> write_handoff(const config::RuntimePaths &paths,
                                            const protocol::ExecutionRequest &request,
                                            const std::string &serialized_request) {
  if (auto valid = validate_group_folder(request.group_folder); !valid.ok()) {
    return common::Result<HandoffBundle>::failure(valid.error());
  }

  HandoffBundle bundle;
  bundle.group = request.group_folder;
  bundle.group_dir = paths.groups_dir / request.group_folder;
  bundle.ipc_dir = paths.ipc_dir() / request.group_folder;
  bundle.session_key = handoff_session_key(request);

  if (!common::is_subpath(bundle.group_dir, paths.groups_dir)) {
    return common::Result<HandoffBundle>::failure("group folder escapes the groups directory: " +
                                                  request.group_folder);
  }

  for (const auto &dir : {bundle.group_dir, bundle.ipc_dir, paths.temp_dir()}) {
    auto created = common::ensure_dir(dir);
    if (!created.ok()) {
      return common::Result<HandoffBundle>::failure("failed to prepare " + dir.string() + ": " +
                                                    created.error());
    }
  }

  if (auto written =
          common::write_text_file(bundle.ipc_dir / "current_tasks.json", current_tasks_document(request));
      !written.ok()) {
    return common::Result<HandoffBundle>::failure(written.error());
  }
  if (auto written = common::write_text_file(bundle.ipc_dir / "available_groups.json",
                                             available_groups_document(request.group_folder));
      !written.ok()) {
    return common::Result<HandoffBundle>::failure(written.error());
  }

  bundle.request_file = paths.temp_dir() / ("input_" + file_component(bundle.session_key) + ".json");
  if (auto written = common::write_text_file(bundle.request_file, serialized_request);
      !written.ok()) {
    return common::Result<HandoffBundle>::failure(written.error());
  }
  return common::Result<HandoffBundle>::success(std::move(bundle));
}

void remove_request_file(const HandoffBundle &bundle) {
  if (bundle.request_file.empty()) {
    return;
  }
  std::error_code ec;
  std::filesystem::remove(bundle.request_file, ec);
  if (ec) {
    observability::record_error("handoff", "could not remove " + bundle.request_file.string() +
                                               ": " + ec.message());
  }
}

} // namespace runclaw::sandbox
