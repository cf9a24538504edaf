#include "runclaw/common/json_util.hpp"

#include <cctype>
#include <cstdint>
#include <cstdio>

namespace runclaw::common {

namespace {

constexpr std::size_t kMaxNestingDepth = 64;

void append_utf8(std::string &out, const std::uint32_t code_point) {
  if (code_point < 0x80) {
    out.push_back(static_cast<char>(code_point));
  } else if (code_point < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (code_point >> 6)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else if (code_point < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (code_point >> 12)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (code_point >> 18)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  }
}

bool parse_hex4(const std::string &text, const std::size_t pos, std::uint32_t &out) {
  if (pos + 4 > text.size()) {
    return false;
  }
  std::uint32_t value = 0;
  for (std::size_t i = pos; i < pos + 4; ++i) {
    const char ch = text[i];
    value <<= 4;
    if (ch >= '0' && ch <= '9') {
      value |= static_cast<std::uint32_t>(ch - '0');
    } else if (ch >= 'a' && ch <= 'f') {
      value |= static_cast<std::uint32_t>(ch - 'a' + 10);
    } else if (ch >= 'A' && ch <= 'F') {
      value |= static_cast<std::uint32_t>(ch - 'A' + 10);
    } else {
      return false;
    }
  }
  out = value;
  return true;
}

// Decodes the escape sequence whose backslash sits at text[pos]. On success appends the
// decoded bytes and returns the index of the last consumed character.
bool decode_escape(const std::string &text, const std::size_t pos, std::string &out,
                   std::size_t &last) {
  if (pos + 1 >= text.size()) {
    return false;
  }
  switch (text[pos + 1]) {
  case '"':
  case '\\':
  case '/':
    out.push_back(text[pos + 1]);
    last = pos + 1;
    return true;
  case 'b':
    out.push_back('\b');
    last = pos + 1;
    return true;
  case 'f':
    out.push_back('\f');
    last = pos + 1;
    return true;
  case 'n':
    out.push_back('\n');
    last = pos + 1;
    return true;
  case 'r':
    out.push_back('\r');
    last = pos + 1;
    return true;
  case 't':
    out.push_back('\t');
    last = pos + 1;
    return true;
  case 'u': {
    std::uint32_t unit = 0;
    if (!parse_hex4(text, pos + 2, unit)) {
      return false;
    }
    if (unit >= 0xDC00 && unit <= 0xDFFF) {
      return false;
    }
    if (unit >= 0xD800 && unit <= 0xDBFF) {
      std::uint32_t low = 0;
      if (pos + 7 >= text.size() || text[pos + 6] != '\\' || text[pos + 7] != 'u' ||
          !parse_hex4(text, pos + 8, low) || low < 0xDC00 || low > 0xDFFF) {
        return false;
      }
      append_utf8(out, 0x10000 + ((unit - 0xD800) << 10) + (low - 0xDC00));
      last = pos + 11;
      return true;
    }
    append_utf8(out, unit);
    last = pos + 5;
    return true;
  }
  default:
    return false;
  }
}

Status parse_string_token(const std::string &text, std::size_t &pos, std::string &out) {
  if (pos >= text.size() || text[pos] != '"') {
    return Status::error("expected string at offset " + std::to_string(pos));
  }
  out.clear();
  for (std::size_t i = pos + 1; i < text.size(); ++i) {
    const char ch = text[i];
    if (ch == '"') {
      pos = i + 1;
      return Status::success();
    }
    if (static_cast<unsigned char>(ch) < 0x20) {
      return Status::error("control character in string at offset " + std::to_string(i));
    }
    if (ch == '\\') {
      std::size_t last = i;
      if (!decode_escape(text, i, out, last)) {
        return Status::error("invalid escape at offset " + std::to_string(i));
      }
      i = last;
      continue;
    }
    out.push_back(ch);
  }
  return Status::error("unterminated string");
}

bool is_digit(const char ch) { return ch >= '0' && ch <= '9'; }

Status parse_number_token(const std::string &text, std::size_t &pos) {
  std::size_t i = pos;
  if (i < text.size() && text[i] == '-') {
    ++i;
  }
  if (i >= text.size() || !is_digit(text[i])) {
    return Status::error("invalid number at offset " + std::to_string(pos));
  }
  if (text[i] == '0') {
    ++i;
  } else {
    while (i < text.size() && is_digit(text[i])) {
      ++i;
    }
  }
  if (i < text.size() && text[i] == '.') {
    ++i;
    if (i >= text.size() || !is_digit(text[i])) {
      return Status::error("invalid fraction at offset " + std::to_string(i));
    }
    while (i < text.size() && is_digit(text[i])) {
      ++i;
    }
  }
  if (i < text.size() && (text[i] == 'e' || text[i] == 'E')) {
    ++i;
    if (i < text.size() && (text[i] == '+' || text[i] == '-')) {
      ++i;
    }
    if (i >= text.size() || !is_digit(text[i])) {
      return Status::error("invalid exponent at offset " + std::to_string(i));
    }
    while (i < text.size() && is_digit(text[i])) {
      ++i;
    }
  }
  pos = i;
  return Status::success();
}

Status parse_value(const std::string &text, std::size_t &pos, std::size_t depth, JsonValue &out);

Status parse_object_body(const std::string &text, std::size_t &pos, const std::size_t depth,
                         JsonObject *members) {
  if (depth > kMaxNestingDepth) {
    return Status::error("JSON nesting too deep");
  }
  ++pos; // opening brace
  pos = json_skip_ws(text, pos);
  if (pos < text.size() && text[pos] == '}') {
    ++pos;
    return Status::success();
  }

  while (true) {
    pos = json_skip_ws(text, pos);
    std::string key;
    auto key_status = parse_string_token(text, pos, key);
    if (!key_status.ok()) {
      return key_status;
    }
    pos = json_skip_ws(text, pos);
    if (pos >= text.size() || text[pos] != ':') {
      return Status::error("expected ':' at offset " + std::to_string(pos));
    }
    ++pos;

    JsonValue value;
    auto value_status = parse_value(text, pos, depth + 1, value);
    if (!value_status.ok()) {
      return value_status;
    }
    if (members != nullptr) {
      (*members)[key] = std::move(value);
    }

    pos = json_skip_ws(text, pos);
    if (pos >= text.size()) {
      return Status::error("unterminated object");
    }
    if (text[pos] == ',') {
      ++pos;
      continue;
    }
    if (text[pos] == '}') {
      ++pos;
      return Status::success();
    }
    return Status::error("expected ',' or '}' at offset " + std::to_string(pos));
  }
}

Status parse_array_body(const std::string &text, std::size_t &pos, const std::size_t depth) {
  if (depth > kMaxNestingDepth) {
    return Status::error("JSON nesting too deep");
  }
  ++pos; // opening bracket
  pos = json_skip_ws(text, pos);
  if (pos < text.size() && text[pos] == ']') {
    ++pos;
    return Status::success();
  }

  while (true) {
    JsonValue element;
    auto status = parse_value(text, pos, depth + 1, element);
    if (!status.ok()) {
      return status;
    }
    pos = json_skip_ws(text, pos);
    if (pos >= text.size()) {
      return Status::error("unterminated array");
    }
    if (text[pos] == ',') {
      ++pos;
      continue;
    }
    if (text[pos] == ']') {
      ++pos;
      return Status::success();
    }
    return Status::error("expected ',' or ']' at offset " + std::to_string(pos));
  }
}

Status parse_literal(const std::string &text, std::size_t &pos, const std::string &literal) {
  if (text.compare(pos, literal.size(), literal) != 0) {
    return Status::error("invalid literal at offset " + std::to_string(pos));
  }
  pos += literal.size();
  return Status::success();
}

Status parse_value(const std::string &text, std::size_t &pos, const std::size_t depth,
                   JsonValue &out) {
  pos = json_skip_ws(text, pos);
  if (pos >= text.size()) {
    return Status::error("unexpected end of JSON");
  }

  const std::size_t start = pos;
  Status status = Status::success();
  switch (text[pos]) {
  case '"':
    out.kind = JsonValue::Kind::String;
    return parse_string_token(text, pos, out.text);
  case '{':
    out.kind = JsonValue::Kind::Object;
    status = parse_object_body(text, pos, depth, nullptr);
    break;
  case '[':
    out.kind = JsonValue::Kind::Array;
    status = parse_array_body(text, pos, depth);
    break;
  case 't':
    out.kind = JsonValue::Kind::Bool;
    status = parse_literal(text, pos, "true");
    break;
  case 'f':
    out.kind = JsonValue::Kind::Bool;
    status = parse_literal(text, pos, "false");
    break;
  case 'n':
    out.kind = JsonValue::Kind::Null;
    status = parse_literal(text, pos, "null");
    break;
  default:
    out.kind = JsonValue::Kind::Number;
    status = parse_number_token(text, pos);
    break;
  }

  if (!status.ok()) {
    return status;
  }
  out.text = text.substr(start, pos - start);
  return Status::success();
}

} // namespace

std::string json_escape(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 8);
  for (const char ch : value) {
    switch (ch) {
    case '"':
      escaped += "\\\"";
      break;
    case '\\':
      escaped += "\\\\";
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\r':
      escaped += "\\r";
      break;
    case '\t':
      escaped += "\\t";
      break;
    case '\b':
      escaped += "\\b";
      break;
    case '\f':
      escaped += "\\f";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20) {
        char buffer[8];
        std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned>(ch));
        escaped += buffer;
      } else {
        escaped.push_back(ch);
      }
      break;
    }
  }
  return escaped;
}

std::string json_unescape(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    const char ch = raw[i];
    if (ch != '\\') {
      out.push_back(ch);
      continue;
    }
    std::size_t last = i;
    if (decode_escape(raw, i, out, last)) {
      i = last;
    } else if (i + 1 < raw.size()) {
      // unknown escape: keep the escaped character
      out.push_back(raw[i + 1]);
      ++i;
    }
  }
  return out;
}

std::string json_quote(const std::string &value) { return "\"" + json_escape(value) + "\""; }

std::size_t json_skip_ws(const std::string &text, std::size_t pos) {
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }
  return pos;
}

Result<JsonObject> json_parse_object(const std::string &json) {
  std::size_t pos = json_skip_ws(json, 0);
  if (pos >= json.size() || json[pos] != '{') {
    return Result<JsonObject>::failure("expected a JSON object");
  }

  JsonObject members;
  auto status = parse_object_body(json, pos, 0, &members);
  if (!status.ok()) {
    return Result<JsonObject>::failure(status.error());
  }
  pos = json_skip_ws(json, pos);
  if (pos != json.size()) {
    return Result<JsonObject>::failure("trailing characters after JSON object");
  }
  return Result<JsonObject>::success(std::move(members));
}

} // namespace runclaw::common
