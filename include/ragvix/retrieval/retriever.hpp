#pragma once

#include "ragvix/common/result.hpp"
#include "ragvix/config/schema.hpp"
#include "ragvix/corpus/document.hpp"
#include "ragvix/embedding/service.hpp"
#include "ragvix/index/vector_index.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace ragvix::retrieval {

/// Restricts results by document metadata. Empty members do not restrict.
struct SearchFilters {
  std::vector<std::string> document_ids;
  /// Matched case-insensitively against DocumentInfo::category.
  std::vector<std::string> categories;
  /// Inclusive ISO-8601 bounds. `published_to` also admits timestamps on the bound day.
  std::string published_from;
  std::string published_to;

  [[nodiscard]] bool empty() const {
    return document_ids.empty() && categories.empty() && published_from.empty() &&
           published_to.empty();
  }
  [[nodiscard]] bool matches(const std::string &document_id,
                             const corpus::DocumentInfo &info) const;
};

struct SearchResult {
  std::string chunk_id;
  float score = 0.0F;
  std::string text;
  std::string document_id;
  std::uint64_t sequence_index = 0;
  std::uint64_t start_offset = 0;
  std::uint64_t end_offset = 0;
  corpus::DocumentInfo document;
};

struct SearchReport {
  std::string query;
  std::vector<SearchResult> results;
  index::IndexStats index_stats;
};

struct RetrieverOptions {
  /// Metric and model the index must have been built with, plus the policies used for
  /// indexes loaded through this retriever.
  index::IndexOptions index;
  /// 0 = unlimited.
  std::size_t max_chunks_per_document = 0;
  /// The index is first asked for k * candidate_multiplier candidates.
  std::size_t candidate_multiplier = 4;
};

[[nodiscard]] common::Result<index::IndexOptions>
index_options_from_config(const config::Config &config);
[[nodiscard]] common::Result<RetrieverOptions>
retriever_options_from_config(const config::Config &config);

/// Answers text queries: embeds the query, over-fetches candidates from the index, applies
/// filters and the per-document cap, and attaches chunk text and document metadata.
class Retriever {
public:
  Retriever(RetrieverOptions options, std::shared_ptr<embedding::Embedder> embedder);

  /// Uses an existing index. Fails with InvalidConfiguration when its metric or model
  /// differs from this retriever's.
  [[nodiscard]] common::Status attach(std::shared_ptr<index::VectorIndex> index);
  [[nodiscard]] common::Status load(const std::filesystem::path &location);

  [[nodiscard]] bool ready() const;
  [[nodiscard]] std::shared_ptr<index::VectorIndex> index() const;
  [[nodiscard]] const RetrieverOptions &options() const { return options_; }

  /// InvalidArgument for k <= 0, IndexUnavailable before attach()/load().
  [[nodiscard]] common::Result<std::vector<SearchResult>>
  search(const std::string &query, int k, const SearchFilters &filters = {}) const;
  [[nodiscard]] common::Result<std::vector<SearchResult>>
  search_vector(const std::vector<float> &query, int k, const SearchFilters &filters = {}) const;
  [[nodiscard]] common::Result<SearchReport>
  search_with_context(const std::string &query, int k, const SearchFilters &filters = {}) const;

private:
  [[nodiscard]] common::Status check_compatible(const index::VectorIndex &index) const;

  RetrieverOptions options_;
  std::shared_ptr<embedding::Embedder> embedder_;
  mutable std::mutex index_mutex_;
  std::shared_ptr<index::VectorIndex> index_;
};

} // namespace ragvix::retrieval
