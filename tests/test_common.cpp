#include "test_framework.hpp"

#include "ragvix/common/fs.hpp"
#include "ragvix/common/json_util.hpp"
#include "ragvix/common/result.hpp"
#include "ragvix/common/toml.hpp"

#include <string>
#include <vector>

void register_common_tests(std::vector<ragvix::tests::TestCase> &tests) {
  using ragvix::tests::require;
  namespace common = ragvix::common;

  tests.push_back({"common_status_describe_names_code", [] {
                     const auto status =
                         common::Status::error(common::ErrorCode::CorruptIndex, "bad header");
                     require(!status.ok(), "error status should not be ok");
                     require(status.describe() == "CorruptIndex: bad header",
                             "unexpected describe: " + status.describe());
                     require(common::Status::success().describe() == "Ok", "success describe");
                   }});

  tests.push_back({"common_result_value_on_failure_throws", [] {
                     auto failed = common::Result<int>::failure(common::ErrorCode::IoError, "x");
                     bool threw = false;
                     try {
                       (void)failed.value();
                     } catch (const std::logic_error &) {
                       threw = true;
                     }
                     require(threw, "value() on failure should throw");
                     require(failed.status().code() == common::ErrorCode::IoError,
                             "status should carry code");
                   }});

  tests.push_back({"json_escape_and_unescape_control_characters", [] {
                     const std::string raw = "line\n\"quoted\"\t\x01";
                     const std::string escaped = common::json_escape(raw);
                     require(escaped == "line\\n\\\"quoted\\\"\\t\\u0001",
                             "unexpected escape: " + escaped);
                     require(common::json_unescape(escaped) == raw, "unescape should invert");
                   }});

  tests.push_back({"json_unescape_decodes_surrogate_pairs", [] {
                     require(common::json_unescape("caf\\u00e9") == "caf\xC3\xA9",
                             "BMP escape should decode to UTF-8");
                     require(common::json_unescape("\\ud83d\\ude00") == "\xF0\x9F\x98\x80",
                             "surrogate pair should decode to one code point");
                   }});

  tests.push_back({"json_parse_flat_keeps_nested_values_raw", [] {
                     const auto map = common::json_parse_flat(
                         R"({"id": "2101.00001", "n": 3, "authors": ["A", "B"], "meta": {"x": 1}})");
                     require(map.at("id") == "2101.00001", "string value");
                     require(map.at("n") == "3", "number kept raw");
                     require(map.at("authors") == R"(["A", "B"])", "array kept raw");
                     require(map.at("meta") == R"({"x": 1})", "object kept raw");
                     const auto authors = common::json_parse_string_array(map.at("authors"));
                     require(authors.size() == 2 && authors[1] == "B", "string array parse");
                   }});

  tests.push_back({"json_parse_float_array_rejects_garbage", [] {
                     std::vector<float> values;
                     require(common::json_parse_float_array("[0.5, -1e-2, 3]", values),
                             "valid array should parse");
                     require(values.size() == 3 && values[0] == 0.5F, "parsed values");
                     require(common::json_parse_float_array("[]", values) && values.empty(),
                             "empty array should parse");
                     require(!common::json_parse_float_array("[1, \"two\"]", values),
                             "string element should fail");
                     require(!common::json_parse_float_array("[1,,2]", values),
                             "empty element should fail");
                   }});

  tests.push_back({"json_split_top_level_objects_ignores_braces_in_strings", [] {
                     const auto objects =
                         common::json_split_top_level_objects(R"([{"a":"}"},{"b":{"c":1}}])");
                     require(objects.size() == 2, "expected two objects");
                     require(objects[0] == R"({"a":"}"})", "first object");
                   }});

  tests.push_back({"toml_parses_sections_and_typed_values", [] {
                     const auto parsed = common::parse_toml("# comment\n"
                                                            "[index]\n"
                                                            "location = \"/tmp/idx\" # trailing\n"
                                                            "allow_empty = true\n"
                                                            "[embedding]\n"
                                                            "batch_size = 1_024\n");
                     require(parsed.ok(), parsed.error());
                     const auto &doc = parsed.value();
                     require(doc.get_string("index.location") == "/tmp/idx", "string value");
                     require(doc.try_bool("index.allow_empty").value_or(false), "bool value");
                     require(doc.try_u64("embedding.batch_size").value_or(0) == 1024, "u64 value");
                     require(!doc.try_u64("index.location").has_value(),
                             "string is not an integer");
                     require(doc.keys().front() == "embedding.batch_size", "keys sorted");
                   }});

  tests.push_back({"toml_string_escapes_survive_quoting", [] {
                     const std::string raw = "C:\\papers \"draft\"\n";
                     const auto parsed =
                         common::parse_toml("path = " + common::quote_toml_string(raw) + "\n");
                     require(parsed.ok(), parsed.error());
                     require(parsed.value().get_string("path") == raw, "escaped string round trip");
                   }});

  tests.push_back({"toml_rejects_line_without_equals", [] {
                     const auto parsed = common::parse_toml("[index]\nlocation\n");
                     require(!parsed.ok(), "missing '=' should fail");
                     require(parsed.code() == common::ErrorCode::InvalidConfiguration,
                             "expected InvalidConfiguration");
                   }});

  tests.push_back({"fs_trim_and_lower", [] {
                     require(common::trim("  \tabc \n") == "abc", "trim");
                     require(common::to_lower("CoSiNe") == "cosine", "to_lower");
                     require(common::starts_with("--config=x", "--config="), "starts_with");
                   }});

  tests.push_back({"fs_read_file_missing_is_io_error", [] {
                     const auto result = common::read_file("/nonexistent/ragvix/file.txt");
                     require(!result.ok(), "missing file should fail");
                     require(result.code() == common::ErrorCode::IoError, "expected IoError");
                   }});
}
