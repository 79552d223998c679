#include "ragvix/embedding/service.hpp"

#include "ragvix/common/fs.hpp"
#include "ragvix/observability/global.hpp"

#include <algorithm>
#include <chrono>
#include <mutex>

namespace ragvix::embedding {

namespace {

using Vectors = std::vector<std::vector<float>>;

struct CacheEntry {
  std::string provider;
  std::string model_id;
  std::size_t dimensions = 0;
  std::size_t batch_size = 0;
  std::shared_ptr<Embedder> embedder;
};

std::mutex g_cache_mutex;
std::unique_ptr<CacheEntry> g_cache;

bool matches(const CacheEntry &entry, const config::EmbeddingConfig &config) {
  return entry.provider == common::to_lower(common::trim(config.provider)) &&
         (config.model_id.empty() || entry.model_id == config.model_id) &&
         entry.dimensions == config.dimensions && entry.batch_size == config.batch_size;
}

} // namespace

Embedder::Embedder(std::shared_ptr<IEmbedder> backend, const std::size_t batch_size)
    : backend_(std::move(backend)), batch_size_(batch_size == 0 ? 1 : batch_size) {}

const std::string &Embedder::model_id() const { return backend_->model_id(); }

std::size_t Embedder::dimensions() const { return backend_->dimensions(); }

common::Result<Vectors> Embedder::embed(const std::vector<std::string> &texts) {
  for (std::size_t i = 0; i < texts.size(); ++i) {
    if (common::trim(texts[i]).empty()) {
      return common::Result<Vectors>::failure(common::ErrorCode::EmbeddingError,
                                              "text at position " + std::to_string(i) +
                                                  " is empty");
    }
  }

  Vectors out;
  out.reserve(texts.size());
  for (std::size_t offset = 0; offset < texts.size(); offset += batch_size_) {
    const std::size_t end = std::min(offset + batch_size_, texts.size());
    const std::vector<std::string> batch(texts.begin() + static_cast<std::ptrdiff_t>(offset),
                                         texts.begin() + static_cast<std::ptrdiff_t>(end));

    const auto started = std::chrono::steady_clock::now();
    auto vectors = backend_->embed_batch(batch);
    if (!vectors.ok()) {
      observability::record_error("embedding", vectors.error());
      return vectors;
    }
    if (vectors.value().size() != batch.size()) {
      return common::Result<Vectors>::failure(common::ErrorCode::EmbeddingError,
                                              "backend returned " +
                                                  std::to_string(vectors.value().size()) +
                                                  " vectors for " +
                                                  std::to_string(batch.size()) + " texts");
    }
    for (auto &vector : vectors.value()) {
      if (vector.size() != dimensions()) {
        return common::Result<Vectors>::failure(
            common::ErrorCode::EmbeddingError,
            "backend returned a vector of length " + std::to_string(vector.size()) +
                ", expected " + std::to_string(dimensions()));
      }
      out.push_back(std::move(vector));
    }
    observability::record_embed_batch(
        model_id(), batch.size(),
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                              started));
  }
  return common::Result<Vectors>::success(std::move(out));
}

common::Result<std::vector<float>> Embedder::embed_query(const std::string &text) {
  auto vectors = embed({text});
  if (!vectors.ok()) {
    return common::Result<std::vector<float>>::failure(vectors.status());
  }
  return common::Result<std::vector<float>>::success(std::move(vectors.value().front()));
}

common::Result<std::shared_ptr<Embedder>>
acquire_embedder(const config::EmbeddingConfig &config,
                 std::shared_ptr<http::HttpClient> http_client) {
  using R = common::Result<std::shared_ptr<Embedder>>;
  std::lock_guard<std::mutex> lock(g_cache_mutex);
  if (g_cache != nullptr && matches(*g_cache, config)) {
    return R::success(g_cache->embedder);
  }

  auto backend = create_embedder(config, std::move(http_client));
  if (!backend.ok()) {
    return R::failure(backend.status());
  }
  if (const auto status = backend.value()->warmup(); !status.ok()) {
    observability::record_error("embedding", status.error());
    return R::failure(status);
  }

  auto entry = std::make_unique<CacheEntry>();
  entry->provider = common::to_lower(common::trim(config.provider));
  entry->model_id = backend.value()->model_id();
  entry->dimensions = config.dimensions;
  entry->batch_size = config.batch_size;
  entry->embedder = std::make_shared<Embedder>(
      std::shared_ptr<IEmbedder>(std::move(backend.value())), config.batch_size);
  g_cache = std::move(entry);
  return R::success(g_cache->embedder);
}

void reset_embedder_cache() {
  std::lock_guard<std::mutex> lock(g_cache_mutex);
  g_cache.reset();
}

} // namespace ragvix::embedding
