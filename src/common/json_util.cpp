#include "ragvix/common/json_util.hpp"

#include <cctype>
#include <charconv>
#include <cstdint>
#include <cstdlib>

namespace ragvix::common {

namespace {

constexpr std::size_t npos = std::string::npos;

// Walks raw JSON text. Positions are byte offsets into `text`.
class Scanner {
public:
  explicit Scanner(const std::string &text) : text_(text) {}

  [[nodiscard]] std::size_t skip_ws(std::size_t pos) const {
    while (pos < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos])) != 0) {
      ++pos;
    }
    return pos;
  }

  /// Position of the quote closing the string opened at `quote`.
  [[nodiscard]] std::size_t string_end(const std::size_t quote) const {
    for (std::size_t i = quote + 1; i < text_.size(); ++i) {
      if (text_[i] == '\\') {
        ++i;
      } else if (text_[i] == '"') {
        return i;
      }
    }
    return npos;
  }

  /// Position one past the value starting at `pos`: a string, a balanced object or array,
  /// or a bare scalar.
  [[nodiscard]] std::size_t value_end(std::size_t pos) const {
    if (pos >= text_.size()) {
      return npos;
    }
    const char first = text_[pos];
    if (first == '"') {
      const auto end = string_end(pos);
      return end == npos ? npos : end + 1;
    }
    if (first == '{' || first == '[') {
      std::size_t depth = 0;
      for (std::size_t i = pos; i < text_.size(); ++i) {
        const char ch = text_[i];
        if (ch == '"') {
          i = string_end(i);
          if (i == npos) {
            return npos;
          }
        } else if (ch == '{' || ch == '[') {
          ++depth;
        } else if (ch == '}' || ch == ']') {
          if (--depth == 0) {
            return i + 1;
          }
        }
      }
      return npos;
    }
    while (pos < text_.size() && text_[pos] != ',' && text_[pos] != '}' && text_[pos] != ']' &&
           std::isspace(static_cast<unsigned char>(text_[pos])) == 0) {
      ++pos;
    }
    return pos;
  }

  /// Calls `fn(begin, end)` for each element of the array or member value of the object
  /// opened at `open`; for objects `key` is set to the member name first.
  template <typename Fn> bool for_each(std::size_t open, std::string *key, Fn &&fn) const {
    const char close = text_[open] == '{' ? '}' : ']';
    std::size_t pos = open + 1;
    while (true) {
      pos = skip_ws(pos);
      if (pos >= text_.size()) {
        return false;
      }
      if (text_[pos] == close) {
        return true;
      }
      if (text_[pos] == ',') {
        ++pos;
        continue;
      }
      if (key != nullptr) {
        if (text_[pos] != '"') {
          return false;
        }
        const auto key_end = string_end(pos);
        if (key_end == npos) {
          return false;
        }
        *key = json_unescape(text_.substr(pos + 1, key_end - pos - 1));
        pos = skip_ws(key_end + 1);
        if (pos >= text_.size() || text_[pos] != ':') {
          return false;
        }
        pos = skip_ws(pos + 1);
      }
      const auto end = value_end(pos);
      if (end == npos || end == pos) {
        return false;
      }
      fn(pos, end);
      pos = end;
    }
  }

private:
  const std::string &text_;
};

void append_utf8(std::string &out, const std::uint32_t cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
    return;
  }
  if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
  }
  out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
}

bool read_hex4(const std::string &raw, const std::size_t pos, std::uint32_t &out) {
  if (pos + 4 > raw.size()) {
    return false;
  }
  const auto [ptr, ec] = std::from_chars(raw.data() + pos, raw.data() + pos + 4, out, 16);
  return ec == std::errc() && ptr == raw.data() + pos + 4;
}

char simple_unescape(const char ch) {
  switch (ch) {
  case 'n':
    return '\n';
  case 'r':
    return '\r';
  case 't':
    return '\t';
  case 'b':
    return '\b';
  case 'f':
    return '\f';
  default:
    return ch;
  }
}

} // namespace

std::string json_escape(const std::string &value) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(value.size() + 8);
  for (const char ch : value) {
    const auto byte = static_cast<unsigned char>(ch);
    switch (ch) {
    case '"':
    case '\\':
      out.push_back('\\');
      out.push_back(ch);
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    case '\b':
      out += "\\b";
      break;
    case '\f':
      out += "\\f";
      break;
    default:
      if (byte < 0x20) {
        out += "\\u00";
        out.push_back(kHex[byte >> 4]);
        out.push_back(kHex[byte & 0xF]);
      } else {
        out.push_back(ch);
      }
    }
  }
  return out;
}

std::string json_unescape(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    if (raw[i] != '\\' || i + 1 >= raw.size()) {
      out.push_back(raw[i]);
      continue;
    }
    const char kind = raw[++i];
    std::uint32_t cp = 0;
    if (kind != 'u' || !read_hex4(raw, i + 1, cp)) {
      out.push_back(simple_unescape(kind));
      continue;
    }
    i += 4;
    std::uint32_t low = 0;
    if (cp >= 0xD800 && cp <= 0xDBFF && raw.compare(i + 1, 2, "\\u") == 0 &&
        read_hex4(raw, i + 3, low) && low >= 0xDC00 && low <= 0xDFFF) {
      cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
      i += 6;
    }
    append_utf8(out, cp);
  }
  return out;
}

JsonFlatMap json_parse_flat(const std::string &json) {
  JsonFlatMap members;
  const Scanner scanner(json);
  const auto open = scanner.skip_ws(0);
  if (open >= json.size() || json[open] != '{') {
    return members;
  }
  std::string key;
  (void)scanner.for_each(open, &key, [&](const std::size_t begin, const std::size_t end) {
    if (json[begin] == '"') {
      members[key] = json_unescape(json.substr(begin + 1, end - begin - 2));
    } else {
      members[key] = json.substr(begin, end - begin);
    }
  });
  return members;
}

std::vector<std::string> json_parse_string_array(const std::string &array_json) {
  std::vector<std::string> out;
  const Scanner scanner(array_json);
  const auto open = scanner.skip_ws(0);
  if (open >= array_json.size() || array_json[open] != '[') {
    return out;
  }
  (void)scanner.for_each(open, nullptr, [&](const std::size_t begin, const std::size_t end) {
    if (array_json[begin] == '"') {
      out.push_back(json_unescape(array_json.substr(begin + 1, end - begin - 2)));
    }
  });
  return out;
}

bool json_parse_float_array(const std::string &array_json, std::vector<float> &out) {
  out.clear();
  const Scanner scanner(array_json);
  const auto open = scanner.skip_ws(0);
  if (open >= array_json.size() || array_json[open] != '[') {
    return false;
  }
  bool numeric = true;
  std::size_t previous_end = open;
  const bool closed =
      scanner.for_each(open, nullptr, [&](const std::size_t begin, const std::size_t end) {
        // Two commas in a row leave an empty element between values.
        const auto between = array_json.substr(previous_end, begin - previous_end);
        if (between.find(',') != between.rfind(',')) {
          numeric = false;
        }
        previous_end = end;
        const std::string item = array_json.substr(begin, end - begin);
        char *parse_end = nullptr;
        const float value = std::strtof(item.c_str(), &parse_end);
        if (parse_end != item.c_str() + item.size()) {
          numeric = false;
          return;
        }
        out.push_back(value);
      });
  return closed && numeric;
}

std::vector<std::string> json_split_top_level_objects(const std::string &array_json) {
  std::vector<std::string> out;
  const Scanner scanner(array_json);
  const auto open = scanner.skip_ws(0);
  if (open >= array_json.size() || array_json[open] != '[') {
    return out;
  }
  (void)scanner.for_each(open, nullptr, [&](const std::size_t begin, const std::size_t end) {
    if (array_json[begin] == '{') {
      out.push_back(array_json.substr(begin, end - begin));
    }
  });
  return out;
}

} // namespace ragvix::common
