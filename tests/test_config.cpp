#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "ragvix/config/config.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace {

struct ConfigOverrideGuard {
  std::optional<std::filesystem::path> old_override;

  explicit ConfigOverrideGuard(std::optional<std::filesystem::path> next = std::nullopt) {
    old_override = ragvix::config::config_path_override();
    if (next.has_value()) {
      ragvix::config::set_config_path_override(*next);
    } else {
      ragvix::config::clear_config_path_override();
    }
  }

  ~ConfigOverrideGuard() {
    if (old_override.has_value()) {
      ragvix::config::set_config_path_override(*old_override);
    } else {
      ragvix::config::clear_config_path_override();
    }
  }
};

} // namespace

void register_config_tests(std::vector<ragvix::tests::TestCase> &tests) {
  using ragvix::tests::require;
  namespace config = ragvix::config;
  namespace common = ragvix::common;
  using ragvix::testing::EnvGuard;
  using ragvix::testing::TempWorkspace;

  tests.push_back({"config_defaults_are_valid", [] {
                     const config::Config cfg;
                     require(cfg.chunking.window_size == 1200, "default window");
                     require(cfg.chunking.overlap == 120, "default overlap");
                     require(cfg.index.distance_metric == "cosine", "default metric");
                     const auto validated = config::validate_config(cfg);
                     require(validated.ok(), validated.error());
                     require(validated.value().empty(), "defaults should not warn");
                   }});

  tests.push_back({"config_parse_reads_every_section", [] {
                     const auto parsed = config::parse_config("[chunking]\n"
                                                              "window_size = 300\n"
                                                              "overlap = 30\n"
                                                              "unit = \"tokens\"\n"
                                                              "[embedding]\n"
                                                              "provider = \"openai\"\n"
                                                              "model_id = \"text-embedding-3-small\"\n"
                                                              "batch_size = 16\n"
                                                              "[index]\n"
                                                              "location = \"/tmp/papers\"\n"
                                                              "distance_metric = \"l2\"\n"
                                                              "on_duplicate = \"reject\"\n"
                                                              "allow_empty = true\n"
                                                              "[retrieval]\n"
                                                              "max_chunks_per_document = 2\n"
                                                              "[observability]\n"
                                                              "backend = \"none\"\n");
                     require(parsed.ok(), parsed.error());
                     const auto &cfg = parsed.value();
                     require(cfg.chunking.window_size == 300 && cfg.chunking.overlap == 30,
                             "chunking values");
                     require(cfg.chunking.unit == "tokens", "unit");
                     require(cfg.embedding.provider == "openai", "provider");
                     require(cfg.embedding.batch_size == 16, "batch size");
                     require(cfg.index.location == "/tmp/papers", "location");
                     require(cfg.index.distance_metric == "l2", "metric");
                     require(cfg.index.on_duplicate == "reject", "duplicate policy");
                     require(cfg.index.allow_empty, "allow_empty");
                     require(cfg.retrieval.max_chunks_per_document == 2, "dedup cap");
                     require(cfg.observability.backend == "none", "observability");
                   }});

  tests.push_back({"config_parse_reports_all_bad_keys", [] {
                     const auto parsed = config::parse_config("[chunking]\n"
                                                              "window_size = big\n"
                                                              "unit = chars\n"
                                                              "[index]\n"
                                                              "shards = 4\n");
                     require(!parsed.ok(), "malformed config should fail");
                     require(parsed.code() == common::ErrorCode::InvalidConfiguration,
                             "expected InvalidConfiguration");
                     require(parsed.error().find("chunking.window_size") != std::string::npos,
                             "window_size error missing: " + parsed.error());
                     require(parsed.error().find("chunking.unit") != std::string::npos,
                             "unquoted string error missing");
                     require(parsed.error().find("unknown option: index.shards") !=
                                 std::string::npos,
                             "unknown key error missing");
                   }});

  tests.push_back({"config_validate_rejects_overlap_not_below_window", [] {
                     config::Config cfg;
                     cfg.chunking.window_size = 100;
                     cfg.chunking.overlap = 100;
                     const auto validated = config::validate_config(cfg);
                     require(!validated.ok(), "overlap == window should fail");
                     require(validated.code() == common::ErrorCode::InvalidConfiguration,
                             "expected InvalidConfiguration");

                     cfg.chunking.overlap = 0;
                     require(config::validate_config(cfg).ok(), "zero overlap is allowed");
                   }});

  tests.push_back({"config_validate_rejects_unknown_enums", [] {
                     config::Config cfg;
                     cfg.index.distance_metric = "manhattan";
                     require(!config::validate_config(cfg).ok(), "unknown metric");
                     cfg = config::Config{};
                     cfg.embedding.provider = "bert";
                     require(!config::validate_config(cfg).ok(), "unknown provider");
                     cfg = config::Config{};
                     cfg.index.on_duplicate = "overwrite";
                     require(!config::validate_config(cfg).ok(), "unknown policy");
                     cfg = config::Config{};
                     cfg.embedding.batch_size = 0;
                     require(!config::validate_config(cfg).ok(), "zero batch size");
                   }});

  tests.push_back({"config_validate_accepts_every_spelling_the_index_accepts", [] {
                     config::Config cfg;
                     for (const char *metric : {" Dot ", "euclidean", "IP", "Cosine "}) {
                       cfg.index.distance_metric = metric;
                       const auto validated = config::validate_config(cfg);
                       require(validated.ok(), validated.error());
                     }
                     cfg = config::Config{};
                     cfg.index.on_duplicate = " Reject";
                     require(config::validate_config(cfg).ok(), "padded policy");
                     cfg = config::Config{};
                     cfg.chunking.unit = "characters";
                     require(config::validate_config(cfg).ok(), "characters unit");
                     cfg.chunking.unit = "sentences";
                     require(!config::validate_config(cfg).ok(), "unknown unit");
                   }});

  tests.push_back({"config_validate_rejects_default_k_beyond_int_range", [] {
                     config::Config cfg;
                     cfg.retrieval.default_k = 4294967297ULL;
                     const auto validated = config::validate_config(cfg);
                     require(!validated.ok(), "default_k above INT_MAX should fail");
                     require(validated.code() == common::ErrorCode::InvalidConfiguration,
                             "expected InvalidConfiguration");
                     cfg.retrieval.default_k = 2147483647ULL;
                     require(config::validate_config(cfg).ok(), "INT_MAX is allowed");
                   }});

  tests.push_back({"config_validate_warns_on_large_overlap_and_missing_key", [] {
                     config::Config cfg;
                     cfg.chunking.window_size = 100;
                     cfg.chunking.overlap = 60;
                     cfg.embedding.provider = "openai";
                     cfg.embedding.api_key.clear();
                     const auto validated = config::validate_config(cfg);
                     require(validated.ok(), validated.error());
                     require(validated.value().size() == 2, "expected two warnings");
                   }});

  tests.push_back({"config_save_and_load_round_trip", [] {
                     TempWorkspace workspace;
                     ConfigOverrideGuard guard(workspace.path() / "config.toml");
                     EnvGuard location_env("RAGVIX_INDEX_LOCATION", std::nullopt);
                     EnvGuard model_env("RAGVIX_EMBEDDING_MODEL", std::nullopt);
                     EnvGuard env_file("RAGVIX_ENV_FILE", std::nullopt);

                     config::Config cfg;
                     cfg.chunking.window_size = 512;
                     cfg.chunking.overlap = 64;
                     cfg.index.location = (workspace.path() / "idx").string();
                     cfg.index.distance_metric = "inner_product";
                     cfg.retrieval.default_k = 7;
                     require(config::save_config(cfg).ok(), "save should succeed");
                     require(config::config_exists(), "config file should exist");

                     const auto loaded = config::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().chunking.window_size == 512, "window persisted");
                     require(loaded.value().index.distance_metric == "inner_product",
                             "metric persisted");
                     require(loaded.value().retrieval.default_k == 7, "default_k persisted");
                     require(loaded.value().index.location == cfg.index.location,
                             "location persisted");
                   }});

  tests.push_back({"config_env_overrides_file_values", [] {
                     TempWorkspace workspace;
                     ConfigOverrideGuard guard(workspace.path() / "config.toml");
                     workspace.create_file("config.toml", "[index]\nlocation = \"/from/file\"\n");
                     EnvGuard location_env("RAGVIX_INDEX_LOCATION", "/from/env");
                     EnvGuard model_env("RAGVIX_EMBEDDING_MODEL", "custom-model");
                     EnvGuard key_env("RAGVIX_EMBEDDING_API_KEY", "sk-test");

                     const auto loaded = config::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().index.location == "/from/env", "env location wins");
                     require(loaded.value().embedding.model_id == "custom-model", "env model");
                     require(loaded.value().embedding.api_key == "sk-test", "env api key");
                   }});

  tests.push_back({"config_load_prefixes_errors_with_path", [] {
                     TempWorkspace workspace;
                     ConfigOverrideGuard guard(workspace.path() / "config.toml");
                     workspace.create_file("config.toml", "[chunking]\nwindow_size = -1\n");
                     const auto loaded = config::load_config();
                     require(!loaded.ok(), "negative window should fail");
                     require(loaded.error().find("config.toml") != std::string::npos,
                             "error should name the file: " + loaded.error());
                   }});

  tests.push_back({"config_path_honours_env_variable", [] {
                     TempWorkspace workspace;
                     ConfigOverrideGuard guard;
                     EnvGuard env("RAGVIX_CONFIG_PATH", (workspace.path() / "alt.toml").string());
                     const auto path = config::config_path();
                     require(path.ok(), path.error());
                     require(path.value() == workspace.path() / "alt.toml",
                             "unexpected path: " + path.value().string());
                   }});
}
