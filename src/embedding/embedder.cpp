#include "ragvix/embedding/embedder.hpp"

#include "ragvix/common/fs.hpp"
#include "ragvix/embedding/embedder_local.hpp"
#include "ragvix/embedding/embedder_openai.hpp"

namespace ragvix::embedding {

common::Result<std::unique_ptr<IEmbedder>>
create_embedder(const config::EmbeddingConfig &config,
                std::shared_ptr<http::HttpClient> http_client) {
  using R = common::Result<std::unique_ptr<IEmbedder>>;
  const std::string provider = common::to_lower(common::trim(config.provider));
  if (config.dimensions == 0) {
    return R::failure(common::ErrorCode::InvalidConfiguration,
                      "embedding.dimensions must be > 0");
  }

  if (provider == "local") {
    return R::success(std::make_unique<HashingEmbedder>(config.dimensions, config.model_id));
  }

  if (provider == "openai") {
    if (http_client == nullptr) {
      http_client = std::make_shared<http::CurlHttpClient>();
    }
    const std::string model =
        config.model_id.empty() ? std::string(OpenAiEmbedder::kDefaultModel) : config.model_id;
    return R::success(std::make_unique<OpenAiEmbedder>(config.api_key, model, config.dimensions,
                                                       config.endpoint, config.timeout_ms,
                                                       std::move(http_client)));
  }

  return R::failure(common::ErrorCode::InvalidConfiguration,
                    "unknown embedding provider: " + config.provider);
}

} // namespace ragvix::embedding
