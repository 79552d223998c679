#pragma once

#include <cstdint>
#include <string>

namespace ragvix::config {

struct ChunkingConfig {
  std::uint64_t window_size = 1200;
  std::uint64_t overlap = 120;
  /// "chars" (UTF-8 code points) or "tokens" (whitespace-delimited).
  std::string unit = "chars";
};

struct EmbeddingConfig {
  std::string provider = "local";
  /// Empty means the provider's default model.
  std::string model_id;
  std::uint64_t batch_size = 32;
  std::uint64_t dimensions = 384;
  std::string endpoint = "https://api.openai.com/v1/embeddings";
  std::string api_key;
  std::uint64_t timeout_ms = 30'000;
};

struct IndexConfig {
  std::string location = "data/index";
  std::string distance_metric = "cosine";
  std::string on_duplicate = "skip";
  bool allow_empty = false;
};

struct RetrievalConfig {
  /// 0 = unlimited.
  std::uint64_t max_chunks_per_document = 0;
  std::uint64_t candidate_multiplier = 4;
  std::uint64_t default_k = 5;
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  ChunkingConfig chunking;
  EmbeddingConfig embedding;
  IndexConfig index;
  RetrievalConfig retrieval;
  ObservabilityConfig observability;
};

} // namespace ragvix::config
