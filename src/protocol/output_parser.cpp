#include "runclaw/protocol/output_parser.hpp"

#include "runclaw/common/fs.hpp"
#include "runclaw/common/json_util.hpp"

#include <initializer_list>

namespace runclaw::protocol {

namespace {

// Reads an optional text member. Returns false when the member has a non-text type.
bool read_optional_text(const common::JsonObject &object, std::initializer_list<const char *> keys,
                        std::optional<std::string> &out) {
  out.reset();
  for (const char *key : keys) {
    const auto it = object.find(key);
    if (it == object.end()) {
      continue;
    }
    switch (it->second.kind) {
    case common::JsonValue::Kind::Null:
      out.reset();
      return true;
    case common::JsonValue::Kind::String:
      out = it->second.text;
      return true;
    default:
      return false;
    }
  }
  return true;
}

} // namespace

std::optional<std::string> extract_marked_output(const std::string &output) {
  const auto start = output.find(OUTPUT_START_MARKER);
  if (start == std::string::npos) {
    return std::nullopt;
  }
  const auto content_begin = start + OUTPUT_START_MARKER.size();
  // Only the first end marker counts; one ahead of the start marker leaves no pair.
  const auto end = output.find(OUTPUT_END_MARKER);
  if (end == std::string::npos || end < content_begin) {
    return std::nullopt;
  }
  return output.substr(content_begin, end - content_begin);
}

std::optional<std::string> last_non_blank_line(const std::string &output) {
  std::size_t line_end = output.size();
  while (line_end > 0) {
    const auto newline = output.rfind('\n', line_end - 1);
    const std::size_t line_begin = newline == std::string::npos ? 0 : newline + 1;
    std::string line = common::trim(output.substr(line_begin, line_end - line_begin));
    if (!line.empty()) {
      return line;
    }
    if (newline == std::string::npos) {
      break;
    }
    line_end = newline;
  }
  return std::nullopt;
}

std::optional<ExecutionResult> parse_result_record(const std::string &text) {
  auto parsed = common::json_parse_object(text);
  if (!parsed.ok()) {
    return std::nullopt;
  }
  const auto &object = parsed.value();

  const auto status = object.find("status");
  if (status == object.end() || status->second.kind != common::JsonValue::Kind::String) {
    return std::nullopt;
  }

  ExecutionResult result;
  result.status = status->second.text;
  if (!read_optional_text(object, {"result"}, result.result) ||
      !read_optional_text(object, {"new_session_id", "newSessionId"}, result.new_session_id) ||
      !read_optional_text(object, {"error"}, result.error)) {
    return std::nullopt;
  }
  return result;
}

ExecutionResult parse_output(const std::string &output, const bool exited_successfully) {
  if (const auto marked = extract_marked_output(output); marked.has_value()) {
    if (auto record = parse_result_record(*marked); record.has_value()) {
      return std::move(*record);
    }
  }

  if (const auto line = last_non_blank_line(output); line.has_value()) {
    if (auto record = parse_result_record(*line); record.has_value()) {
      return std::move(*record);
    }
  }

  if (exited_successfully) {
    return ExecutionResult{.status = STATUS_SUCCESS, .result = output};
  }
  return ExecutionResult{.status = STATUS_ERROR,
                         .error = std::string(GENERIC_FAILURE_MESSAGE)};
}

} // namespace runclaw::protocol
