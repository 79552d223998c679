#include "ragvix/common/toml.hpp"

#include "ragvix/common/fs.hpp"

#include <algorithm>
#include <charconv>
#include <sstream>

namespace ragvix::common {

namespace {

Result<TomlDocument> line_error(const std::string &what, const std::size_t line_number) {
  return Result<TomlDocument>::failure(ErrorCode::InvalidConfiguration,
                                       what + " at line " + std::to_string(line_number));
}

// Drops a trailing '#' comment unless the '#' sits inside a basic string.
std::string without_comment(const std::string &line) {
  bool quoted = false;
  for (std::size_t i = 0; i < line.size(); ++i) {
    if (quoted && line[i] == '\\') {
      ++i;
    } else if (line[i] == '"') {
      quoted = !quoted;
    } else if (!quoted && line[i] == '#') {
      return line.substr(0, i);
    }
  }
  return line;
}

std::string decode_basic_string(const std::string &body) {
  std::string out;
  out.reserve(body.size());
  for (std::size_t i = 0; i < body.size(); ++i) {
    if (body[i] != '\\' || i + 1 == body.size()) {
      out.push_back(body[i]);
      continue;
    }
    switch (const char next = body[++i]) {
    case 'n':
      out.push_back('\n');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'r':
      out.push_back('\r');
      break;
    default:
      out.push_back(next);
    }
  }
  return out;
}

} // namespace

bool TomlDocument::has(const std::string &key) const { return values.contains(key); }

std::vector<std::string> TomlDocument::keys() const {
  std::vector<std::string> out;
  out.reserve(values.size());
  for (const auto &entry : values) {
    out.push_back(entry.first);
  }
  std::sort(out.begin(), out.end());
  return out;
}

std::string TomlDocument::get_string(const std::string &key, const std::string &fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  const std::string raw = trim(it->second);
  if (raw.size() < 2 || raw.front() != '"' || raw.back() != '"') {
    return raw;
  }
  return decode_basic_string(raw.substr(1, raw.size() - 2));
}

std::optional<bool> TomlDocument::try_bool(const std::string &key) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return std::nullopt;
  }
  const std::string raw = to_lower(trim(it->second));
  if (raw == "true" || raw == "false") {
    return raw == "true";
  }
  return std::nullopt;
}

std::optional<std::uint64_t> TomlDocument::try_u64(const std::string &key) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return std::nullopt;
  }
  // TOML allows '_' between digits as a visual separator.
  std::string digits;
  for (const char ch : trim(it->second)) {
    if (ch != '_') {
      digits.push_back(ch);
    }
  }
  std::uint64_t value = 0;
  const char *end = digits.data() + digits.size();
  const auto [ptr, ec] = std::from_chars(digits.data(), end, value);
  if (digits.empty() || ec != std::errc() || ptr != end) {
    return std::nullopt;
  }
  return value;
}

Result<TomlDocument> parse_toml(const std::string &content) {
  TomlDocument document;
  std::istringstream stream(content);
  std::string section;
  std::string line;
  for (std::size_t line_number = 1; std::getline(stream, line); ++line_number) {
    const std::string text = trim(without_comment(line));
    if (text.empty()) {
      continue;
    }

    if (text.front() == '[') {
      if (text.back() != ']') {
        return line_error("Unterminated table header", line_number);
      }
      section = trim(text.substr(1, text.size() - 2));
      if (section.empty()) {
        return line_error("Invalid empty section", line_number);
      }
      continue;
    }

    const auto equals = text.find('=');
    if (equals == std::string::npos) {
      return line_error("Invalid key/value", line_number);
    }
    const std::string key = trim(text.substr(0, equals));
    if (key.empty()) {
      return line_error("Missing key", line_number);
    }
    const std::string full_key = section.empty() ? key : section + "." + key;
    const auto [slot, inserted] = document.values.emplace(full_key, trim(text.substr(equals + 1)));
    if (!inserted) {
      return line_error("Duplicate key '" + full_key + "'", line_number);
    }
  }
  return Result<TomlDocument>::success(std::move(document));
}

std::string quote_toml_string(const std::string &value) {
  std::string out = "\"";
  for (const char ch : value) {
    switch (ch) {
    case '"':
    case '\\':
      out.push_back('\\');
      out.push_back(ch);
      break;
    case '\n':
      out += "\\n";
      break;
    case '\t':
      out += "\\t";
      break;
    case '\r':
      out += "\\r";
      break;
    default:
      out.push_back(ch);
    }
  }
  out.push_back('"');
  return out;
}

} // namespace ragvix::common
