#pragma once

#include <string>
#include <unordered_map>
#include <vector>

namespace ragvix::common {

/// Minimal JSON helpers for the line-oriented records ragvix reads and writes. Values are
/// handed around as raw JSON text and decoded on demand.

[[nodiscard]] std::string json_escape(const std::string &value);

/// Decodes the standard escapes; \uXXXX (including surrogate pairs) becomes UTF-8.
[[nodiscard]] std::string json_unescape(const std::string &raw);

/// Top-level members of one JSON object. String values are unescaped; numbers, literals,
/// objects and arrays are kept as raw JSON text. Malformed input yields the members read
/// before the error.
using JsonFlatMap = std::unordered_map<std::string, std::string>;
[[nodiscard]] JsonFlatMap json_parse_flat(const std::string &json);

/// String elements of an array such as ["a","b"]. Other elements are skipped.
[[nodiscard]] std::vector<std::string> json_parse_string_array(const std::string &array_json);

/// Numbers of an array such as [0.1, -2e-3]. False on any element that is not a number.
[[nodiscard]] bool json_parse_float_array(const std::string &array_json, std::vector<float> &out);

/// The object elements of an array, each as raw JSON text.
[[nodiscard]] std::vector<std::string> json_split_top_level_objects(const std::string &array_json);

} // namespace ragvix::common
