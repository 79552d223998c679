#include "ragvix/cli/commands.hpp"

#include "ragvix/common/fs.hpp"
#include "ragvix/common/json_util.hpp"
#include "ragvix/config/config.hpp"
#include "ragvix/corpus/chunk_corpus.hpp"
#include "ragvix/corpus/chunker.hpp"
#include "ragvix/embedding/service.hpp"
#include "ragvix/observability/factory.hpp"
#include "ragvix/observability/global.hpp"
#include "ragvix/retrieval/evaluation.hpp"
#include "ragvix/retrieval/indexer.hpp"
#include "ragvix/retrieval/retriever.hpp"

#include <charconv>
#include <climits>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace ragvix::cli {

namespace {

std::string version_string() {
#ifdef RAGVIX_VERSION
  std::string version = RAGVIX_VERSION;
#else
  std::string version = "0.1.0";
#endif
  return "ragvix " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

std::vector<std::string> take_repeated(std::vector<std::string> &args,
                                       const std::string &long_name) {
  std::vector<std::string> values;
  std::string value;
  while (take_option(args, long_name, "", value)) {
    values.push_back(value);
  }
  return values;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::string join_tokens(const std::vector<std::string> &args) {
  std::ostringstream out;
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (i > 0) {
      out << ' ';
    }
    out << args[i];
  }
  return out.str();
}

bool parse_size(const std::string &raw, std::size_t &out) {
  const auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), out);
  return !raw.empty() && ec == std::errc() && ptr == raw.data() + raw.size();
}

// Rejects zero, negatives and anything above INT_MAX.
bool parse_positive_int(const std::string &raw, int &out) {
  int value = 0;
  const auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), value);
  if (raw.empty() || ec != std::errc() || ptr != raw.data() + raw.size() || value <= 0) {
    return false;
  }
  out = value;
  return true;
}

int fail(const common::Status &status) {
  std::cerr << status.describe() << "\n";
  return 1;
}

int usage_error(const std::string &message) {
  std::cerr << message << "\n";
  return 2;
}

/// Loaded configuration with the observer installed. `--index` overrides the location.
common::Result<config::Config> load_context(std::vector<std::string> &args) {
  auto loaded = config::load_config();
  if (!loaded.ok()) {
    return loaded;
  }
  config::Config cfg = loaded.value();
  std::string location;
  if (take_option(args, "--index", "", location)) {
    cfg.index.location = common::expand_path(location);
  }
  observability::set_global_observer(observability::create_observer(cfg));
  return common::Result<config::Config>::success(std::move(cfg));
}

common::Result<std::unique_ptr<retrieval::Retriever>>
open_retriever(const config::Config &cfg) {
  using R = common::Result<std::unique_ptr<retrieval::Retriever>>;
  auto options = retrieval::retriever_options_from_config(cfg);
  if (!options.ok()) {
    return R::failure(options.status());
  }
  auto embedder = embedding::acquire_embedder(cfg.embedding);
  if (!embedder.ok()) {
    return R::failure(embedder.status());
  }
  auto retriever = std::make_unique<retrieval::Retriever>(options.value(), embedder.value());
  if (auto status = retriever->load(cfg.index.location); !status.ok()) {
    return R::failure(status);
  }
  return R::success(std::move(retriever));
}

std::string format_score(const float score) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(4) << score;
  return out.str();
}

std::string report_to_json(const retrieval::SearchReport &report) {
  std::ostringstream out;
  out << "{\"query\":\"" << common::json_escape(report.query) << "\"";
  out << ",\"num_results\":" << report.results.size();
  out << ",\"results\":[";
  for (std::size_t i = 0; i < report.results.size(); ++i) {
    const auto &result = report.results[i];
    if (i > 0) {
      out << ",";
    }
    out << "{\"chunk_id\":\"" << common::json_escape(result.chunk_id) << "\"";
    out << ",\"score\":" << result.score;
    out << ",\"document_id\":\"" << common::json_escape(result.document_id) << "\"";
    out << ",\"sequence_index\":" << result.sequence_index;
    out << ",\"start_offset\":" << result.start_offset;
    out << ",\"end_offset\":" << result.end_offset;
    out << ",\"title\":\"" << common::json_escape(result.document.title) << "\"";
    out << ",\"category\":\"" << common::json_escape(result.document.category) << "\"";
    out << ",\"published\":\"" << common::json_escape(result.document.published) << "\"";
    out << ",\"text\":\"" << common::json_escape(result.text) << "\"}";
  }
  out << "]";
  const auto &stats = report.index_stats;
  out << ",\"index_stats\":{\"chunks\":" << stats.chunks << ",\"documents\":" << stats.documents
      << ",\"model\":\"" << common::json_escape(stats.model_id) << "\""
      << ",\"dimension\":" << stats.dimension << ",\"metric\":\""
      << index::distance_metric_name(stats.metric) << "\"}}";
  return out.str();
}

int run_chunk(std::vector<std::string> args) {
  auto cfg = load_context(args);
  if (!cfg.ok()) {
    return fail(cfg.status());
  }

  std::string input;
  std::string output;
  std::string raw;
  if (!take_option(args, "--input", "-i", input) || !take_option(args, "--output", "-o", output)) {
    return usage_error("usage: ragvix chunk --input DOCS.jsonl --output CHUNKS.jsonl "
                       "[--window N] [--overlap N] [--unit chars|tokens]");
  }

  corpus::ChunkingOptions options{
      .window_size = static_cast<std::size_t>(cfg.value().chunking.window_size),
      .overlap = static_cast<std::size_t>(cfg.value().chunking.overlap),
      .unit = corpus::ChunkUnit::Chars};
  std::string unit = cfg.value().chunking.unit;
  (void)take_option(args, "--unit", "", unit);
  auto parsed_unit = corpus::parse_chunk_unit(unit);
  if (!parsed_unit.ok()) {
    return fail(parsed_unit.status());
  }
  options.unit = parsed_unit.value();
  if (take_option(args, "--window", "", raw) && !parse_size(raw, options.window_size)) {
    return usage_error("invalid --window: " + raw);
  }
  if (take_option(args, "--overlap", "", raw) && !parse_size(raw, options.overlap)) {
    return usage_error("invalid --overlap: " + raw);
  }

  auto documents = corpus::read_documents(input);
  if (!documents.ok()) {
    return fail(documents.status());
  }
  auto chunks = corpus::chunk_documents(documents.value(), options);
  if (!chunks.ok()) {
    return fail(chunks.status());
  }

  const corpus::ChunkCorpus chunk_corpus{.chunks = std::move(chunks.value()),
                                         .documents =
                                             corpus::collect_document_info(documents.value())};
  if (auto status = corpus::write_chunk_corpus(output, chunk_corpus); !status.ok()) {
    return fail(status);
  }
  std::cout << "Wrote " << chunk_corpus.chunks.size() << " chunks from "
            << documents.value().size() << " documents to " << output << "\n";
  return 0;
}

int run_build(std::vector<std::string> args, const bool incremental) {
  auto cfg = load_context(args);
  if (!cfg.ok()) {
    return fail(cfg.status());
  }
  std::string chunks_path;
  if (!take_option(args, "--chunks", "-c", chunks_path)) {
    return usage_error(std::string("usage: ragvix ") + (incremental ? "add" : "build") +
                       " --chunks CHUNKS.jsonl [--index DIR]");
  }

  auto chunk_corpus = corpus::read_chunk_corpus(chunks_path);
  if (!chunk_corpus.ok()) {
    return fail(chunk_corpus.status());
  }
  auto options = retrieval::index_options_from_config(cfg.value());
  if (!options.ok()) {
    return fail(options.status());
  }
  auto embedder = embedding::acquire_embedder(cfg.value().embedding);
  if (!embedder.ok()) {
    return fail(embedder.status());
  }
  const std::filesystem::path location = cfg.value().index.location;

  if (!incremental) {
    auto built = retrieval::build_index(*embedder.value(), options.value(), chunk_corpus.value());
    if (!built.ok()) {
      return fail(built.status());
    }
    if (auto status = built.value()->save(location); !status.ok()) {
      return fail(status);
    }
    std::cout << "Indexed " << built.value()->size() << " chunks into " << location.string()
              << "\n";
    return 0;
  }

  auto loaded = index::VectorIndex::load(location, options.value());
  if (!loaded.ok()) {
    return fail(loaded.status());
  }
  auto summary = retrieval::add_to_index(*embedder.value(), *loaded.value(), chunk_corpus.value());
  if (!summary.ok()) {
    return fail(summary.status());
  }
  if (auto status = loaded.value()->save(location); !status.ok()) {
    return fail(status);
  }
  std::cout << "Added " << summary.value().added << " chunks (" << summary.value().skipped
            << " already indexed); index now holds " << loaded.value()->size() << "\n";
  return 0;
}

int run_search(std::vector<std::string> args) {
  auto cfg = load_context(args);
  if (!cfg.ok()) {
    return fail(cfg.status());
  }

  const bool json = take_flag(args, "--json");
  // load_config keeps default_k within int range.
  int k = static_cast<int>(cfg.value().retrieval.default_k);
  std::string raw;
  if (take_option(args, "--k", "-k", raw) && !parse_positive_int(raw, k)) {
    return usage_error("invalid -k (expected 1.." + std::to_string(INT_MAX) + "): " + raw);
  }
  retrieval::SearchFilters filters;
  filters.document_ids = take_repeated(args, "--document");
  filters.categories = take_repeated(args, "--category");
  (void)take_option(args, "--from", "", filters.published_from);
  (void)take_option(args, "--to", "", filters.published_to);

  const std::string query = join_tokens(args);
  if (common::trim(query).empty()) {
    return usage_error("usage: ragvix search QUERY [-k N] [--json] [--document ID] "
                       "[--category CAT] [--from DATE] [--to DATE] [--index DIR]");
  }

  auto retriever = open_retriever(cfg.value());
  if (!retriever.ok()) {
    return fail(retriever.status());
  }
  auto report = retriever.value()->search_with_context(query, k, filters);
  if (!report.ok()) {
    return fail(report.status());
  }

  if (json) {
    std::cout << report_to_json(report.value()) << "\n";
    return 0;
  }

  std::cout << "Search: '" << query << "'\n\n";
  if (report.value().results.empty()) {
    std::cout << "No results found.\n";
    return 0;
  }
  std::size_t rank = 1;
  for (const auto &result : report.value().results) {
    const std::string title =
        result.document.title.empty() ? std::string("Unknown Title") : result.document.title;
    std::cout << rank++ << ". " << title << "\n";
    std::cout << "   " << result.chunk_id << " | score " << format_score(result.score) << "\n";
    const std::string snippet = corpus::truncate_code_points(result.text, 200);
    std::cout << "   " << snippet << (snippet.size() < result.text.size() ? "..." : "")
              << "\n\n";
  }
  return 0;
}

int run_stats(std::vector<std::string> args) {
  auto cfg = load_context(args);
  if (!cfg.ok()) {
    return fail(cfg.status());
  }
  auto options = retrieval::index_options_from_config(cfg.value());
  if (!options.ok()) {
    return fail(options.status());
  }
  auto loaded = index::VectorIndex::load(cfg.value().index.location, options.value());
  if (!loaded.ok()) {
    return fail(loaded.status());
  }
  const auto stats = loaded.value()->stats();
  std::cout << "Location: " << cfg.value().index.location << "\n";
  std::cout << "Chunks: " << stats.chunks << "\n";
  std::cout << "Documents: " << stats.documents << "\n";
  std::cout << "Model: " << stats.model_id << "\n";
  std::cout << "Dimension: " << stats.dimension << "\n";
  std::cout << "Metric: " << index::distance_metric_name(stats.metric) << "\n";
  return 0;
}

int run_eval(std::vector<std::string> args) {
  auto cfg = load_context(args);
  if (!cfg.ok()) {
    return fail(cfg.status());
  }
  std::string judgments_path;
  if (!take_option(args, "--judgments", "-j", judgments_path)) {
    return usage_error("usage: ragvix eval --judgments FILE.jsonl [--ks 1,3,5,10] [--index DIR]");
  }
  std::vector<std::size_t> k_values = {1, 3, 5, 10};
  std::string raw;
  if (take_option(args, "--ks", "", raw)) {
    k_values.clear();
    std::stringstream stream(raw);
    std::string part;
    while (std::getline(stream, part, ',')) {
      int k = 0;
      if (!parse_positive_int(common::trim(part), k)) {
        return usage_error("invalid --ks: " + raw);
      }
      k_values.push_back(static_cast<std::size_t>(k));
    }
  }

  auto judgments = retrieval::read_judgments(judgments_path);
  if (!judgments.ok()) {
    return fail(judgments.status());
  }
  auto retriever = open_retriever(cfg.value());
  if (!retriever.ok()) {
    return fail(retriever.status());
  }
  auto report = retrieval::evaluate_retrieval(*retriever.value(), judgments.value(), k_values);
  if (!report.ok()) {
    return fail(report.status());
  }

  std::cout << "Queries: " << report.value().queries << "\n";
  for (const auto k : k_values) {
    const std::string suffix = "@" + std::to_string(k);
    std::cout << "recall" << suffix << " = " << format_score(static_cast<float>(
                                                    report.value().metrics.at("recall" + suffix)))
              << "  precision" << suffix << " = "
              << format_score(static_cast<float>(report.value().metrics.at("precision" + suffix)))
              << "\n";
  }
  return 0;
}

void print_help() {
  std::cout << version_string() << " - chunk, embed, index and search academic papers\n\n";
  std::cout << "USAGE\n";
  std::cout << "  ragvix [--config PATH] <command> [options]\n\n";
  std::cout << "COMMANDS\n";
  std::cout << "  chunk --input DOCS --output CHUNKS   Split documents into chunk records\n";
  std::cout << "        [--window N] [--overlap N] [--unit chars|tokens]\n";
  std::cout << "  build --chunks CHUNKS [--index DIR]  Embed chunks and write a fresh index\n";
  std::cout << "  add   --chunks CHUNKS [--index DIR]  Append chunks to an existing index\n";
  std::cout << "  search QUERY [-k N] [--json]         Query the index\n";
  std::cout << "        [--document ID] [--category CAT] [--from DATE] [--to DATE]\n";
  std::cout << "  stats [--index DIR]                  Show index statistics\n";
  std::cout << "  eval --judgments FILE [--ks 1,3,5]   Report recall@k and precision@k\n";
  std::cout << "  config-path                          Print the config file location\n";
  std::cout << "  version                              Print the version\n";
}

} // namespace

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc > 0 ? argc - 1 : 0, argv + (argc > 0 ? 1 : 0));
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 2;
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      return fail(path_result.status());
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }
  if (subcommand == "chunk") {
    return run_chunk(std::move(args));
  }
  if (subcommand == "build") {
    return run_build(std::move(args), false);
  }
  if (subcommand == "add") {
    return run_build(std::move(args), true);
  }
  if (subcommand == "search") {
    return run_search(std::move(args));
  }
  if (subcommand == "stats") {
    return run_stats(std::move(args));
  }
  if (subcommand == "eval") {
    return run_eval(std::move(args));
  }

  std::cerr << "Unknown command: " << subcommand << "\n\n";
  print_help();
  return 2;
}

} // namespace ragvix::cli
