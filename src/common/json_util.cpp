#include "skyhost/common/json_util.hpp"

#include "skyhost/common/fs.hpp"

#include <cctype>

namespace skyhost::common {

namespace {

bool is_value_terminator(const char ch) {
  return ch == ',' || ch == '}' || ch == ']' || std::isspace(static_cast<unsigned char>(ch)) != 0;
}

constexpr int kMaxJsonDepth = 64;

bool skip_value(const std::string &text, std::size_t &pos, int depth);

bool skip_string(const std::string &text, std::size_t &pos) {
  if (pos >= text.size() || text[pos] != '"') {
    return false;
  }
  const auto end = json_find_string_end(text, pos);
  if (end == std::string::npos) {
    return false;
  }
  pos = end + 1;
  return true;
}

// true, false, null or a number.
bool skip_scalar(const std::string &text, std::size_t &pos) {
  const std::size_t start = pos;
  while (pos < text.size() && !is_value_terminator(text[pos]) && text[pos] != ':' &&
         text[pos] != '"' && text[pos] != '{' && text[pos] != '[') {
    ++pos;
  }
  const std::string token = text.substr(start, pos - start);
  if (token == "true" || token == "false" || token == "null") {
    return true;
  }
  if (token.empty() || (token.front() != '-' && std::isdigit(static_cast<unsigned char>(
                                                    token.front())) == 0)) {
    return false;
  }
  return token.find_first_not_of("0123456789+-.eE") == std::string::npos;
}

bool skip_object(const std::string &text, std::size_t &pos, const int depth) {
  ++pos;
  pos = json_skip_ws(text, pos);
  if (pos < text.size() && text[pos] == '}') {
    ++pos;
    return true;
  }
  while (true) {
    if (!skip_string(text, pos)) {
      return false;
    }
    pos = json_skip_ws(text, pos);
    if (pos >= text.size() || text[pos] != ':') {
      return false;
    }
    pos = json_skip_ws(text, pos + 1);
    if (!skip_value(text, pos, depth + 1)) {
      return false;
    }
    pos = json_skip_ws(text, pos);
    if (pos >= text.size()) {
      return false;
    }
    if (text[pos] == '}') {
      ++pos;
      return true;
    }
    if (text[pos] != ',') {
      return false;
    }
    pos = json_skip_ws(text, pos + 1);
  }
}

bool skip_array(const std::string &text, std::size_t &pos, const int depth) {
  ++pos;
  pos = json_skip_ws(text, pos);
  if (pos < text.size() && text[pos] == ']') {
    ++pos;
    return true;
  }
  while (true) {
    if (!skip_value(text, pos, depth + 1)) {
      return false;
    }
    pos = json_skip_ws(text, pos);
    if (pos >= text.size()) {
      return false;
    }
    if (text[pos] == ']') {
      ++pos;
      return true;
    }
    if (text[pos] != ',') {
      return false;
    }
    pos = json_skip_ws(text, pos + 1);
  }
}

bool skip_value(const std::string &text, std::size_t &pos, const int depth) {
  if (depth > kMaxJsonDepth || pos >= text.size()) {
    return false;
  }
  switch (text[pos]) {
  case '{':
    return skip_object(text, pos, depth);
  case '[':
    return skip_array(text, pos, depth);
  case '"':
    return skip_string(text, pos);
  default:
    return skip_scalar(text, pos);
  }
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
    default:
      escaped.push_back(ch);
      break;
    }
  }
  return escaped;
}

std::string json_unescape(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  bool escaped = false;
  for (const char ch : raw) {
    if (!escaped) {
      if (ch == '\\') {
        escaped = true;
      } else {
        out.push_back(ch);
      }
      continue;
    }
    switch (ch) {
    case 'n':
      out.push_back('\n');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 't':
      out.push_back('\t');
      break;
    default:
      out.push_back(ch);
      break;
    }
    escaped = false;
  }
  return out;
}

std::size_t json_skip_ws(const std::string &text, std::size_t pos) {
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }
  return pos;
}

std::size_t json_find_string_end(const std::string &json, const std::size_t quote_pos) {
  bool escaped = false;
  for (std::size_t i = quote_pos + 1; i < json.size(); ++i) {
    const char ch = json[i];
    if (escaped) {
      escaped = false;
      continue;
    }
    if (ch == '\\') {
      escaped = true;
      continue;
    }
    if (ch == '"') {
      return i;
    }
  }
  return std::string::npos;
}

std::size_t json_find_matching_token(const std::string &json, const std::size_t open_pos,
                                      const char open_ch, const char close_ch) {
  if (open_pos >= json.size() || json[open_pos] != open_ch) {
    return std::string::npos;
  }
  std::size_t depth = 0;
  for (std::size_t i = open_pos; i < json.size(); ++i) {
    const char ch = json[i];
    if (ch == '"') {
      const auto end = json_find_string_end(json, i);
      if (end == std::string::npos) {
        return std::string::npos;
      }
      i = end;
      continue;
    }
    if (ch == open_ch) {
      ++depth;
    } else if (ch == close_ch) {
      --depth;
      if (depth == 0) {
        return i;
      }
    }
  }
  return std::string::npos;
}

bool json_is_valid(const std::string &text) {
  const std::string trimmed = trim(text);
  std::size_t pos = 0;
  if (!skip_value(trimmed, pos, 0)) {
    return false;
  }
  return json_skip_ws(trimmed, pos) == trimmed.size();
}

bool json_is_object(const std::string &text) {
  const std::string trimmed = trim(text);
  return !trimmed.empty() && trimmed.front() == '{' && json_is_valid(trimmed);
}

JsonFlatMap json_parse_flat(const std::string &json) {
  JsonFlatMap result;
  if (json.size() < 2 || json.front() != '{') {
    return result;
  }

  std::size_t pos = 1;
  while (pos < json.size()) {
    pos = json_skip_ws(json, pos);
    if (pos >= json.size() || json[pos] == '}') {
      break;
    }
    if (json[pos] == ',') {
      ++pos;
      continue;
    }
    if (json[pos] != '"') {
      break;
    }

    const auto key_end = json_find_string_end(json, pos);
    if (key_end == std::string::npos) {
      break;
    }
    const std::string key = json_unescape(json.substr(pos + 1, key_end - pos - 1));
    pos = json_skip_ws(json, key_end + 1);
    if (pos >= json.size() || json[pos] != ':') {
      break;
    }
    pos = json_skip_ws(json, pos + 1);
    if (pos >= json.size()) {
      break;
    }

    if (json[pos] == '"') {
      const auto value_end = json_find_string_end(json, pos);
      if (value_end == std::string::npos) {
        break;
      }
      result[key] = json_unescape(json.substr(pos + 1, value_end - pos - 1));
      pos = value_end + 1;
    } else if (json[pos] == '{' || json[pos] == '[') {
      const char open = json[pos];
      const auto end = json_find_matching_token(json, pos, open, open == '{' ? '}' : ']');
      if (end == std::string::npos) {
        break;
      }
      result[key] = json.substr(pos, end - pos + 1);
      pos = end + 1;
    } else {
      const std::size_t start = pos;
      while (pos < json.size() && !is_value_terminator(json[pos])) {
        ++pos;
      }
      result[key] = json.substr(start, pos - start);
    }
  }

  return result;
}

std::vector<std::string> json_parse_string_array(const std::string &array_json) {
  std::vector<std::string> out;
  if (array_json.size() < 2 || array_json.front() != '[') {
    return out;
  }

  std::size_t pos = 1;
  while (pos < array_json.size()) {
    pos = json_skip_ws(array_json, pos);
    if (pos >= array_json.size() || array_json[pos] == ']') {
      break;
    }
    if (array_json[pos] != '"') {
      ++pos;
      continue;
    }
    const auto end = json_find_string_end(array_json, pos);
    if (end == std::string::npos) {
      break;
    }
    out.push_back(json_unescape(array_json.substr(pos + 1, end - pos - 1)));
    pos = end + 1;
  }
  return out;
}

std::vector<std::string> json_split_top_level_objects(const std::string &array_json) {
  std::vector<std::string> out;
  const std::string trimmed = trim(array_json);
  if (trimmed.size() < 2 || trimmed.front() != '[' || trimmed.back() != ']') {
    return out;
  }

  std::size_t pos = 1;
  while (pos + 1 < trimmed.size()) {
    pos = json_skip_ws(trimmed, pos);
    if (pos >= trimmed.size() || trimmed[pos] == ']') {
      break;
    }
    if (trimmed[pos] != '{') {
      ++pos;
      continue;
    }
    const auto end = json_find_matching_token(trimmed, pos, '{', '}');
    if (end == std::string::npos) {
      break;
    }
    out.push_back(trimmed.substr(pos, end - pos + 1));
    pos = end + 1;
  }
  return out;
}

} // namespace skyhost::common
