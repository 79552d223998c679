#pragma once

#include "ragvix/common/result.hpp"
#include "ragvix/config/schema.hpp"
#include "ragvix/http/http_client.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace ragvix::embedding {

/// A text embedding backend. Implementations are deterministic for a given model id.
class IEmbedder {
public:
  virtual ~IEmbedder() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  [[nodiscard]] virtual const std::string &model_id() const = 0;
  [[nodiscard]] virtual std::size_t dimensions() const = 0;

  /// Loads or warms up the model. Fails with ModelUnavailable.
  [[nodiscard]] virtual common::Status warmup() { return common::Status::success(); }

  [[nodiscard]] virtual common::Result<std::vector<float>> embed(std::string_view text) = 0;
  [[nodiscard]] virtual common::Result<std::vector<std::vector<float>>>
  embed_batch(const std::vector<std::string> &texts) = 0;
};

/// Selects the backend named by `config.provider`. The HTTP client is only used by remote
/// backends; a curl client is created when none is given.
[[nodiscard]] common::Result<std::unique_ptr<IEmbedder>>
create_embedder(const config::EmbeddingConfig &config,
                std::shared_ptr<http::HttpClient> http_client = nullptr);

} // namespace ragvix::embedding
