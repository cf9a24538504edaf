#pragma once

#include "runclaw/common/result.hpp"

#include <cstddef>
#include <string>
#include <unordered_map>

namespace runclaw::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Unescape the body of a JSON string literal (\uXXXX sequences are encoded as UTF-8).
[[nodiscard]] std::string json_unescape(const std::string &raw);

/// Quote and escape a value as a JSON string literal.
[[nodiscard]] std::string json_quote(const std::string &value);

/// Skip whitespace starting at pos, returning the first non-whitespace position.
[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);

struct JsonValue {
  enum class Kind { Null, Bool, Number, String, Object, Array };

  Kind kind = Kind::Null;
  /// Unescaped contents for strings, raw JSON text for everything else.
  std::string text;
};

using JsonObject = std::unordered_map<std::string, JsonValue>;

/// Strictly parse a document that must consist of exactly one JSON object. Member values are
/// validated recursively; nested objects and arrays are kept as raw text.
[[nodiscard]] Result<JsonObject> json_parse_object(const std::string &json);

} // namespace runclaw::common
