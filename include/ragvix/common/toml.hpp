#pragma once

#include "ragvix/common/result.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace ragvix::common {

/// Flat view of a TOML file: "section.key" -> raw value text. Only tables, bare keys and
/// scalar values are understood, which is all the config file uses.
struct TomlDocument {
  std::unordered_map<std::string, std::string> values;

  [[nodiscard]] bool has(const std::string &key) const;
  /// Sorted.
  [[nodiscard]] std::vector<std::string> keys() const;
  /// Basic string value with escapes decoded; an unquoted value is returned trimmed.
  [[nodiscard]] std::string get_string(const std::string &key,
                                       const std::string &fallback = "") const;

  // nullopt when the key is missing or its value is malformed.
  [[nodiscard]] std::optional<bool> try_bool(const std::string &key) const;
  [[nodiscard]] std::optional<std::uint64_t> try_u64(const std::string &key) const;
};

/// Fails with InvalidConfiguration, naming the line, on a malformed table header, a line
/// without '=', an empty key or a key defined twice.
[[nodiscard]] Result<TomlDocument> parse_toml(const std::string &content);

/// `value` as a TOML basic string, quotes included.
[[nodiscard]] std::string quote_toml_string(const std::string &value);

} // namespace ragvix::common
