#include "runclaw/runner/transcript.hpp"

#include "runclaw/common/fs.hpp"
#include "runclaw/common/json_util.hpp"
#include "runclaw/sandbox/handoff.hpp"

#include <optional>
#include <sstream>

namespace runclaw::runner {

namespace {

std::string optional_json(const std::optional<std::string> &value) {
  return value.has_value() ? common::json_quote(*value) : "null";
}

} // namespace

std::string transcript_document(const protocol::ExecutionRequest &request,
                                const protocol::ExecutionResult &result,
                                const common::TimePoint finished_at) {
  std::ostringstream out;
  out << "{\n";
  out << "  \"timestamp\": " << common::json_quote(common::format_rfc3339(finished_at)) << ",\n";
  out << "  \"group\": " << common::json_quote(request.group_folder) << ",\n";
  out << "  \"chat_jid\": " << common::json_quote(request.chat_jid) << ",\n";
  out << "  \"session\": " << common::json_quote(sandbox::handoff_session_key(request)) << ",\n";
  out << "  \"is_scheduled_task\": " << (request.is_scheduled_task ? "true" : "false") << ",\n";
  out << "  \"status\": " << common::json_quote(result.status) << ",\n";
  out << "  \"result\": " << optional_json(result.result) << ",\n";
  out << "  \"error\": " << optional_json(result.error) << ",\n";
  out << "  \"new_session_id\": " << optional_json(result.new_session_id) << "\n";
  out << "}\n";
  return out.str();
}

common::Result<std::filesystem::path>
write_run_transcript(const config::RuntimePaths &paths, const protocol::ExecutionRequest &request,
                     const protocol::ExecutionResult &result, const common::TimePoint finished_at) {
  if (auto valid = sandbox::validate_group_folder(request.group_folder); !valid.ok()) {
    return common::Result<std::filesystem::path>::failure(valid.error());
  }

  const auto dir = paths.transcript_dir() / request.group_folder;
  const std::string name = "run_" +
                           sandbox::file_component(sandbox::handoff_session_key(request)) + "_" +
                           common::format_compact_utc(finished_at) + ".json";
  const auto path = dir / name;
  if (auto written = common::write_text_file(path, transcript_document(request, result, finished_at));
      !written.ok()) {
    return common::Result<std::filesystem::path>::failure(written.error());
  }
  return common::Result<std::filesystem::path>::success(path);
}

} // namespace runclaw::runner
