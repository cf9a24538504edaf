#pragma once

#include "runclaw/protocol/execution.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace runclaw::protocol {

inline constexpr std::string_view OUTPUT_START_MARKER = "---RUNCLAW_OUTPUT_START---";
inline constexpr std::string_view OUTPUT_END_MARKER = "---RUNCLAW_OUTPUT_END---";
inline constexpr std::string_view GENERIC_FAILURE_MESSAGE = "Container execution failed";

/// Text strictly between the first start marker and the first end marker, when the end marker
/// follows the start marker.
[[nodiscard]] std::optional<std::string> extract_marked_output(const std::string &output);

/// Last line of `output` that contains something other than whitespace, trimmed.
[[nodiscard]] std::optional<std::string> last_non_blank_line(const std::string &output);

/// Decodes one result record: a JSON object with a string `status` and optional string/null
/// `result`, `new_session_id` (or `newSessionId`) and `error` members.
[[nodiscard]] std::optional<ExecutionResult> parse_result_record(const std::string &text);

/// Turns captured subprocess output into a result. Tries the marked block, then the last
/// non-blank line, and otherwise synthesizes a result from the exit signal.
[[nodiscard]] ExecutionResult parse_output(const std::string &output, bool exited_successfully);

} // namespace runclaw::protocol
