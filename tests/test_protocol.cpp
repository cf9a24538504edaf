#include "test_framework.hpp"

#include "runclaw/common/json_util.hpp"
#include "runclaw/protocol/execution.hpp"
#include "runclaw/protocol/output_parser.hpp"

#include <string>

namespace {

using runclaw::protocol::OUTPUT_END_MARKER;
using runclaw::protocol::OUTPUT_START_MARKER;

std::string start_marker() { return std::string(OUTPUT_START_MARKER); }
std::string end_marker() { return std::string(OUTPUT_END_MARKER); }

} // namespace

void register_protocol_tests(std::vector<runclaw::tests::TestCase> &tests) {
  using runclaw::tests::require;
  namespace protocol = runclaw::protocol;

  tests.push_back({"protocol_marked_block_wins_over_noise", [] {
                     const std::string output = "prefix\n" + start_marker() +
                                                "\n{\"status\":\"success\",\"result\":\"ok\"}\n" +
                                                end_marker() + "\nsuffix";
                     const auto result = protocol::parse_output(output, true);
                     require(result.status == "success", "status mismatch");
                     require(result.result == std::optional<std::string>("ok"), "result mismatch");
                     require(!result.error.has_value(), "error should be null");
                   }});

  tests.push_back({"protocol_marked_block_ignores_exit_signal", [] {
                     const std::string output =
                         start_marker() + "{\"status\":\"error\",\"error\":\"boom\"}" + end_marker() +
                         "\n{\"status\":\"success\",\"result\":\"later\"}\n";
                     const auto result = protocol::parse_output(output, true);
                     require(result.status == "error", "marked block must come first");
                     require(result.error == std::optional<std::string>("boom"), "error mismatch");
                   }});

  tests.push_back({"protocol_end_before_start_is_not_a_pair", [] {
                     const std::string output = "noise\n" + end_marker() + "\n" + start_marker() +
                                                "\n{\"status\":\"success\",\"result\":\"tail\"}";
                     require(!protocol::extract_marked_output(output).has_value(),
                             "reversed markers must not match");
                     const auto result = protocol::parse_output(output, false);
                     require(result.status == "success", "last line should be used");
                     require(result.result == std::optional<std::string>("tail"), "result mismatch");
                   }});

  tests.push_back({"protocol_leading_end_marker_voids_later_block", [] {
                     const std::string output =
                         end_marker() + "\n" + start_marker() +
                         "{\"status\":\"error\",\"error\":\"A\"}" + end_marker() + "\n" +
                         "{\"status\":\"success\",\"result\":\"B\"}\n";
                     require(!protocol::extract_marked_output(output).has_value(),
                             "only the first end marker may close the block");
                     const auto result = protocol::parse_output(output, true);
                     require(result.status == "success", "last line should be used");
                     require(result.result == std::optional<std::string>("B"), "result mismatch");
                     require(!result.error.has_value(), "no error expected");
                   }});

  tests.push_back({"protocol_marked_block_with_bad_json_falls_through", [] {
                     const std::string output = start_marker() + "not json" + end_marker() + "\n" +
                                                "{\"status\":\"success\",\"result\":\"fallback\"}\n\n";
                     const auto result = protocol::parse_output(output, false);
                     require(result.status == "success", "fallback status");
                     require(result.result == std::optional<std::string>("fallback"),
                             "fallback result");
                   }});

  tests.push_back({"protocol_empty_output_success", [] {
                     const auto result = protocol::parse_output("", true);
                     require(result.status == "success", "status mismatch");
                     require(result.result == std::optional<std::string>(""), "empty result");
                     require(!result.error.has_value(), "error should be null");
                   }});

  tests.push_back({"protocol_empty_output_failure", [] {
                     const auto result = protocol::parse_output("", false);
                     require(result.status == "error", "status mismatch");
                     require(!result.result.has_value(), "result should be null");
                     require(result.error == std::optional<std::string>(std::string(
                                                 protocol::GENERIC_FAILURE_MESSAGE)),
                             "generic failure expected");
                   }});

  tests.push_back({"protocol_unstructured_success_keeps_raw_output", [] {
                     const auto result = protocol::parse_output("hello\nworld\n", true);
                     require(result.status == "success", "status mismatch");
                     require(result.result == std::optional<std::string>("hello\nworld\n"),
                             "raw output expected");
                   }});

  tests.push_back({"protocol_record_requires_string_status", [] {
                     require(!protocol::parse_result_record("{\"result\":\"x\"}").has_value(),
                             "missing status");
                     require(!protocol::parse_result_record("{\"status\":1}").has_value(),
                             "numeric status");
                     require(!protocol::parse_result_record("{\"status\":\"success\",\"result\":3}")
                                  .has_value(),
                             "non-text result");
                     const auto record = protocol::parse_result_record(
                         "{\"status\":\"success\",\"newSessionId\":\"s-2\",\"error\":null}");
                     require(record.has_value(), "valid record rejected");
                     require(record->new_session_id == std::optional<std::string>("s-2"),
                             "session mismatch");
                     const auto snake = protocol::parse_result_record(
                         "{\"status\":\"success\",\"new_session_id\":\"s-3\"}");
                     require(snake.has_value() &&
                                 snake->new_session_id == std::optional<std::string>("s-3"),
                             "snake_case session key");
                   }});

  tests.push_back({"protocol_last_non_blank_line", [] {
                     require(protocol::last_non_blank_line("a\n  b  \n \n\t\n") ==
                                 std::optional<std::string>("b"),
                             "trimmed last line");
                     require(!protocol::last_non_blank_line(" \n\n").has_value(),
                             "blank output has no line");
                   }});

  tests.push_back({"protocol_serialize_request_shape", [] {
                     protocol::ExecutionRequest request;
                     request.prompt = "say \"hi\"";
                     request.group_folder = "main";
                     request.chat_jid = "chat@example";
                     request.is_scheduled_task = true;
                     const std::string json = protocol::serialize_request(request);
                     auto parsed = runclaw::common::json_parse_object(json);
                     require(parsed.ok(), parsed.error());
                     require(parsed.value().at("prompt").text == "say \"hi\"", "prompt mismatch");
                     require(parsed.value().at("group_folder").text == "main", "group mismatch");
                     require(parsed.value().at("chat_jid").text == "chat@example", "chat mismatch");
                     require(parsed.value().at("is_main").text == "false", "main flag mismatch");
                     require(parsed.value().at("is_scheduled_task").text == "true", "flag mismatch");
                     require(parsed.value().at("session_id").kind ==
                                 runclaw::common::JsonValue::Kind::Null,
                             "absent session is null");
                     for (const char *camel : {"sessionId", "groupFolder", "chatJid", "isMain",
                                               "isScheduledTask"}) {
                       require(!parsed.value().contains(camel),
                               std::string("unexpected key ") + camel);
                     }
                     require(json.find('\n') == std::string::npos, "request must be one line");
                   }});

  tests.push_back({"protocol_serialized_result_parses_back", [] {
                     protocol::ExecutionResult result;
                     result.status = protocol::STATUS_ERROR;
                     result.error = "line one\nline two";
                     const auto parsed =
                         protocol::parse_result_record(protocol::serialize_result(result));
                     require(parsed.has_value(), "serialized result must parse");
                     require(parsed->error == result.error, "error mismatch");
                     require(!parsed->result.has_value(), "null result");
                   }});
}
