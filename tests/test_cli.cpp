#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "ragvix/cli/commands.hpp"
#include "ragvix/config/config.hpp"
#include "ragvix/index/vector_index.hpp"
#include "ragvix/observability/global.hpp"

#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace {

int run_cli(const std::vector<std::string> &args) {
  std::vector<std::string> owned = args;
  std::vector<char *> argv;
  argv.reserve(owned.size());
  for (auto &arg : owned) {
    argv.push_back(arg.data());
  }
  return ragvix::cli::run_cli(static_cast<int>(argv.size()), argv.data());
}

// Points the CLI at a config inside the workspace for the lifetime of the guard.
struct CliEnvironment {
  ragvix::testing::TempWorkspace workspace;
  ragvix::testing::EnvGuard config_env;
  ragvix::testing::EnvGuard location_env{"RAGVIX_INDEX_LOCATION", std::nullopt};
  ragvix::testing::EnvGuard model_env{"RAGVIX_EMBEDDING_MODEL", std::nullopt};

  CliEnvironment() : config_env("RAGVIX_CONFIG_PATH", std::nullopt) {
    ragvix::config::clear_config_path_override();
    workspace.create_file("config.toml", "[chunking]\n"
                                         "window_size = 6\n"
                                         "overlap = 2\n"
                                         "unit = \"tokens\"\n"
                                         "[embedding]\n"
                                         "provider = \"local\"\n"
                                         "dimensions = 64\n"
                                         "batch_size = 4\n"
                                         "[index]\n"
                                         "location = \"" +
                                             (workspace.path() / "index").string() +
                                             "\"\n"
                                             "[observability]\n"
                                             "backend = \"none\"\n");
    workspace.create_file(
        "docs.jsonl",
        "{\"id\": \"p1\", \"title\": \"Sparse Retrieval\", \"category\": \"cs.IR\", "
        "\"published\": \"2020-01-01\", \"text\": \"bm25 sparse lexical retrieval ranks "
        "documents by term overlap with inverse document frequency weighting\"}\n"
        "{\"id\": \"p2\", \"title\": \"Protein Folding\", \"category\": \"q-bio\", "
        "\"published\": \"2021-06-01\", \"text\": \"protein structure prediction from amino "
        "acid sequences with attention models\"}\n");
    setenv("RAGVIX_CONFIG_PATH", (workspace.path() / "config.toml").c_str(), 1);
  }

  ~CliEnvironment() { ragvix::observability::set_global_observer(nullptr); }

  [[nodiscard]] std::string path(const std::string &name) const {
    return (workspace.path() / name).string();
  }
};

} // namespace

void register_cli_tests(std::vector<ragvix::tests::TestCase> &tests) {
  using ragvix::tests::require;

  tests.push_back({"cli_help_and_version", [] {
                     require(run_cli({"ragvix"}) == 0, "no args prints help");
                     require(run_cli({"ragvix", "--help"}) == 0, "--help");
                     require(run_cli({"ragvix", "version"}) == 0, "version");
                     require(run_cli({"ragvix", "frobnicate"}) == 2, "unknown command");
                     require(run_cli({"ragvix", "--config"}) == 2, "--config without value");
                   }});

  tests.push_back({"cli_config_path_uses_override", [] {
                     CliEnvironment env;
                     require(run_cli({"ragvix", "config-path"}) == 0, "config-path");
                     require(run_cli({"ragvix", "--config=" + env.path("config.toml"),
                                      "config-path"}) == 0,
                             "--config= form");
                     ragvix::config::clear_config_path_override();
                   }});

  tests.push_back({"cli_chunk_build_search_pipeline", [] {
                     CliEnvironment env;
                     require(run_cli({"ragvix", "chunk", "--input", env.path("docs.jsonl"),
                                      "--output", env.path("chunks.jsonl")}) == 0,
                             "chunk command");
                     require(std::filesystem::exists(env.path("chunks.jsonl")),
                             "chunk corpus written");

                     require(run_cli({"ragvix", "build", "--chunks", env.path("chunks.jsonl")}) ==
                                 0,
                             "build command");
                     const auto index_dir = env.workspace.path() / "index";
                     require(std::filesystem::exists(index_dir /
                                                     ragvix::index::VectorIndex::kVectorFile),
                             "vector file written");
                     require(std::filesystem::exists(index_dir /
                                                     ragvix::index::VectorIndex::kSidecarFile),
                             "sidecar written");

                     require(run_cli({"ragvix", "search", "sparse", "retrieval", "-k", "2"}) == 0,
                             "search command");
                     require(run_cli({"ragvix", "search", "protein", "--json", "--category",
                                      "q-bio"}) == 0,
                             "search --json with filter");
                     require(run_cli({"ragvix", "stats"}) == 0, "stats command");
                     require(run_cli({"ragvix", "add", "--chunks", env.path("chunks.jsonl")}) == 0,
                             "re-adding the same chunks is skipped");

                     auto loaded = ragvix::index::VectorIndex::load(index_dir);
                     require(loaded.ok(), loaded.error());
                     require(loaded.value()->stats().documents == 2, "two documents indexed");
                   }});

  tests.push_back({"cli_eval_reports_metrics", [] {
                     CliEnvironment env;
                     env.workspace.create_file(
                         "judgments.jsonl",
                         "{\"query\": \"protein structure\", \"relevant\": [\"p2\"]}\n");
                     require(run_cli({"ragvix", "chunk", "-i", env.path("docs.jsonl"), "-o",
                                      env.path("chunks.jsonl")}) == 0,
                             "chunk");
                     require(run_cli({"ragvix", "build", "-c", env.path("chunks.jsonl")}) == 0,
                             "build");
                     require(run_cli({"ragvix", "eval", "--judgments", env.path("judgments.jsonl"),
                                      "--ks", "1,2"}) == 0,
                             "eval command");
                     require(run_cli({"ragvix", "eval", "--judgments", env.path("judgments.jsonl"),
                                      "--ks", "0"}) == 2,
                             "invalid ks");
                   }});

  tests.push_back({"cli_reports_failures", [] {
                     CliEnvironment env;
                     require(run_cli({"ragvix", "search", "anything"}) == 1,
                             "search without an index fails");
                     require(run_cli({"ragvix", "search"}) == 2, "search without a query");
                     require(run_cli({"ragvix", "build"}) == 2, "build without --chunks");
                     require(run_cli({"ragvix", "chunk", "--input", env.path("missing.jsonl"),
                                      "--output", env.path("out.jsonl")}) == 1,
                             "missing input file");
                     require(run_cli({"ragvix", "chunk", "--input", env.path("docs.jsonl"),
                                      "--output", env.path("out.jsonl"), "--window", "2",
                                      "--overlap", "2"}) == 1,
                             "overlap equal to window");
                     require(run_cli({"ragvix", "search", "x", "-k", "many"}) == 2,
                             "non-numeric k");
                     require(run_cli({"ragvix", "search", "x", "-k", "4294967297"}) == 2,
                             "k beyond int range");
                     require(run_cli({"ragvix", "search", "x", "-k", "2147483648"}) == 2,
                             "k one past INT_MAX");
                     require(run_cli({"ragvix", "search", "x", "-k", "0"}) == 2, "zero k");
                     require(run_cli({"ragvix", "search", "x", "-k", "-3"}) == 2, "negative k");
                     require(run_cli({"ragvix", "search", "x", "-k", "5x"}) == 2,
                             "trailing garbage in k");
                     require(run_cli({"ragvix", "eval", "--judgments", env.path("j.jsonl"),
                                      "--ks", "1,4294967297"}) == 2,
                             "eval k beyond int range");
                   }});
}
