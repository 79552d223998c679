#pragma once

#include "ragvix/common/result.hpp"
#include "ragvix/config/schema.hpp"
#include "ragvix/embedding/embedder.hpp"

#include <memory>
#include <string>
#include <vector>

namespace ragvix::embedding {

/// Front end over an embedding backend: splits inputs into fixed-size batches, keeps
/// output order and length equal to the input, and rejects empty texts.
class Embedder {
public:
  Embedder(std::shared_ptr<IEmbedder> backend, std::size_t batch_size);

  [[nodiscard]] const std::string &model_id() const;
  [[nodiscard]] std::size_t dimensions() const;
  [[nodiscard]] std::size_t batch_size() const { return batch_size_; }
  [[nodiscard]] IEmbedder &backend() { return *backend_; }

  /// Empty or whitespace-only texts fail the whole call with EmbeddingError.
  [[nodiscard]] common::Result<std::vector<std::vector<float>>>
  embed(const std::vector<std::string> &texts);
  [[nodiscard]] common::Result<std::vector<float>> embed_query(const std::string &text);

private:
  std::shared_ptr<IEmbedder> backend_;
  std::size_t batch_size_;
};

/// Process-wide embedder. The first call creates and warms up the backend; later calls
/// with the same provider, model and dimensions return the cached instance, while a
/// different configuration replaces it.
[[nodiscard]] common::Result<std::shared_ptr<Embedder>>
acquire_embedder(const config::EmbeddingConfig &config,
                 std::shared_ptr<http::HttpClient> http_client = nullptr);

/// Drops the cached embedder. Holders of a shared_ptr keep their instance alive.
void reset_embedder_cache();

} // namespace ragvix::embedding
