#include "runclaw/protocol/execution.hpp"

#include "runclaw/common/json_util.hpp"

#include <sstream>

namespace runclaw::protocol {

namespace {

void write_optional(std::ostringstream &out, const char *key,
                    const std::optional<std::string> &value) {
  out << ",\"" << key << "\":";
  if (value.has_value()) {
    out << common::json_quote(*value);
  } else {
    out << "null";
  }
}

} // namespace

std::string serialize_request(const ExecutionRequest &request) {
  std::ostringstream out;
  out << "{\"prompt\":" << common::json_quote(request.prompt);
  write_optional(out, "session_id", request.session_id);
  out << ",\"group_folder\":" << common::json_quote(request.group_folder);
  out << ",\"chat_jid\":" << common::json_quote(request.chat_jid);
  out << ",\"is_main\":" << (request.is_main ? "true" : "false");
  out << ",\"is_scheduled_task\":" << (request.is_scheduled_task ? "true" : "false");
  out << "}";
  return out.str();
}

std::string serialize_result(const ExecutionResult &result) {
  std::ostringstream out;
  out << "{\"status\":" << common::json_quote(result.status);
  write_optional(out, "result", result.result);
  write_optional(out, "new_session_id", result.new_session_id);
  write_optional(out, "error", result.error);
  out << "}";
  return out.str();
}

} // namespace runclaw::protocol
