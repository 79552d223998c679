#include "ragvix/retrieval/retriever.hpp"

#include "ragvix/common/fs.hpp"
#include "ragvix/observability/global.hpp"

#include <algorithm>
#include <chrono>
#include <limits>
#include <unordered_map>

namespace ragvix::retrieval {

bool SearchFilters::matches(const std::string &document_id,
                            const corpus::DocumentInfo &info) const {
  if (!document_ids.empty() &&
      std::find(document_ids.begin(), document_ids.end(), document_id) == document_ids.end()) {
    return false;
  }
  if (!categories.empty()) {
    const std::string category = common::to_lower(info.category);
    const bool found = std::any_of(categories.begin(), categories.end(),
                                   [&category](const std::string &wanted) {
                                     return common::to_lower(wanted) == category;
                                   });
    if (!found) {
      return false;
    }
  }
  if (!published_from.empty() && (info.published.empty() || info.published < published_from)) {
    return false;
  }
  if (!published_to.empty() &&
      (info.published.empty() || info.published.substr(0, published_to.size()) > published_to)) {
    return false;
  }
  return true;
}

common::Result<index::IndexOptions> index_options_from_config(const config::Config &config) {
  using R = common::Result<index::IndexOptions>;
  auto metric = index::parse_distance_metric(config.index.distance_metric);
  if (!metric.ok()) {
    return R::failure(metric.status());
  }
  auto policy = index::parse_duplicate_policy(config.index.on_duplicate);
  if (!policy.ok()) {
    return R::failure(policy.status());
  }
  return R::success(index::IndexOptions{.metric = metric.value(),
                                        .on_duplicate = policy.value(),
                                        .allow_empty = config.index.allow_empty,
                                        .model_id = config.embedding.model_id,
                                        .dimension = 0});
}

common::Result<RetrieverOptions> retriever_options_from_config(const config::Config &config) {
  auto index_options = index_options_from_config(config);
  if (!index_options.ok()) {
    return common::Result<RetrieverOptions>::failure(index_options.status());
  }
  if (config.retrieval.candidate_multiplier == 0) {
    return common::Result<RetrieverOptions>::failure(
        common::ErrorCode::InvalidConfiguration, "retrieval.candidate_multiplier must be >= 1");
  }
  return common::Result<RetrieverOptions>::success(RetrieverOptions{
      .index = index_options.value(),
      .max_chunks_per_document = static_cast<std::size_t>(config.retrieval.max_chunks_per_document),
      .candidate_multiplier = static_cast<std::size_t>(config.retrieval.candidate_multiplier)});
}

Retriever::Retriever(RetrieverOptions options, std::shared_ptr<embedding::Embedder> embedder)
    : options_(std::move(options)), embedder_(std::move(embedder)) {
  if (options_.candidate_multiplier == 0) {
    options_.candidate_multiplier = 1;
  }
  if (options_.index.model_id.empty() && embedder_ != nullptr) {
    options_.index.model_id = embedder_->model_id();
  }
}

common::Status Retriever::check_compatible(const index::VectorIndex &index) const {
  if (index.metric() != options_.index.metric) {
    return common::Status::error(
        common::ErrorCode::InvalidConfiguration,
        "index uses metric " + std::string(index::distance_metric_name(index.metric())) +
            ", retriever is configured for " +
            std::string(index::distance_metric_name(options_.index.metric)));
  }
  const std::string index_model = index.model_id();
  if (!index_model.empty() && !options_.index.model_id.empty() &&
      index_model != options_.index.model_id) {
    return common::Status::error(common::ErrorCode::InvalidConfiguration,
                                 "index was embedded with " + index_model +
                                     ", retriever uses " + options_.index.model_id);
  }
  if (embedder_ != nullptr && index.size() > 0 && index.dimension() != embedder_->dimensions()) {
    return common::Status::error(common::ErrorCode::DimensionMismatch,
                                 "index dimension " + std::to_string(index.dimension()) +
                                     " differs from embedder dimension " +
                                     std::to_string(embedder_->dimensions()));
  }
  return common::Status::success();
}

common::Status Retriever::attach(std::shared_ptr<index::VectorIndex> index) {
  if (index == nullptr) {
    return common::Status::error(common::ErrorCode::IndexUnavailable, "no index given");
  }
  if (auto status = check_compatible(*index); !status.ok()) {
    return status;
  }
  std::lock_guard<std::mutex> lock(index_mutex_);
  index_ = std::move(index);
  return common::Status::success();
}

common::Status Retriever::load(const std::filesystem::path &location) {
  auto loaded = index::VectorIndex::load(location, options_.index);
  if (!loaded.ok()) {
    observability::record_error("retrieval", loaded.error());
    return loaded.status();
  }
  return attach(std::shared_ptr<index::VectorIndex>(std::move(loaded.value())));
}

bool Retriever::ready() const {
  std::lock_guard<std::mutex> lock(index_mutex_);
  return index_ != nullptr;
}

std::shared_ptr<index::VectorIndex> Retriever::index() const {
  std::lock_guard<std::mutex> lock(index_mutex_);
  return index_;
}

common::Result<std::vector<SearchResult>>
Retriever::search(const std::string &query, const int k, const SearchFilters &filters) const {
  using R = common::Result<std::vector<SearchResult>>;
  if (k <= 0) {
    return R::failure(common::ErrorCode::InvalidArgument,
                      "k must be positive, got " + std::to_string(k));
  }
  if (!ready()) {
    return R::failure(common::ErrorCode::IndexUnavailable,
                      "no index has been built or loaded");
  }
  if (embedder_ == nullptr) {
    return R::failure(common::ErrorCode::ModelUnavailable, "retriever has no embedder");
  }

  auto vector = embedder_->embed_query(query);
  if (!vector.ok()) {
    return R::failure(vector.status());
  }
  return search_vector(vector.value(), k, filters);
}

common::Result<std::vector<SearchResult>> Retriever::search_vector(
    const std::vector<float> &query, const int k, const SearchFilters &filters) const {
  using R = common::Result<std::vector<SearchResult>>;
  if (k <= 0) {
    return R::failure(common::ErrorCode::InvalidArgument,
                      "k must be positive, got " + std::to_string(k));
  }
  const auto index = this->index();
  if (index == nullptr) {
    return R::failure(common::ErrorCode::IndexUnavailable,
                      "no index has been built or loaded");
  }

  const auto started = std::chrono::steady_clock::now();
  const std::size_t wanted = static_cast<std::size_t>(k);
  const std::size_t total = index->size();
  const bool restricted = !filters.empty() || options_.max_chunks_per_document > 0;

  std::vector<SearchResult> results;
  std::size_t candidates = std::min(total, restricted ? wanted * options_.candidate_multiplier
                                                      : wanted);
  while (candidates > 0) {
    const auto limit = std::min<std::size_t>(
        candidates, static_cast<std::size_t>(std::numeric_limits<int>::max()));
    auto hits = index->search(query, static_cast<int>(limit));
    if (!hits.ok()) {
      return R::failure(hits.status());
    }

    results.clear();
    std::unordered_map<std::string, std::size_t> per_document;
    for (const auto &hit : hits.value()) {
      auto chunk = index->chunk(hit.chunk_id);
      if (!chunk.has_value()) {
        continue;
      }
      corpus::DocumentInfo info =
          index->document(chunk->document_id).value_or(corpus::DocumentInfo{});
      if (!filters.matches(chunk->document_id, info)) {
        continue;
      }
      if (options_.max_chunks_per_document > 0 &&
          per_document[chunk->document_id] >= options_.max_chunks_per_document) {
        continue;
      }
      ++per_document[chunk->document_id];

      results.push_back(SearchResult{.chunk_id = hit.chunk_id,
                                     .score = hit.score,
                                     .text = std::move(chunk->text),
                                     .document_id = chunk->document_id,
                                     .sequence_index = chunk->sequence_index,
                                     .start_offset = chunk->start_offset,
                                     .end_offset = chunk->end_offset,
                                     .document = std::move(info)});
      if (results.size() == wanted) {
        break;
      }
    }

    if (results.size() == wanted || candidates >= total) {
      break;
    }
    candidates = std::min(total, candidates * 2);
  }

  observability::record_search(
      wanted, results.size(),
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                            started));
  return R::success(std::move(results));
}

common::Result<SearchReport> Retriever::search_with_context(const std::string &query,
                                                            const int k,
                                                            const SearchFilters &filters) const {
  auto results = search(query, k, filters);
  if (!results.ok()) {
    return common::Result<SearchReport>::failure(results.status());
  }
  return common::Result<SearchReport>::success(SearchReport{
      .query = query, .results = std::move(results.value()), .index_stats = index()->stats()});
}

} // namespace ragvix::retrieval
