#pragma once

#include "ragvix/embedding/embedder.hpp"

namespace ragvix::embedding {

/// Client for OpenAI-compatible `/v1/embeddings` endpoints.
class OpenAiEmbedder final : public IEmbedder {
public:
  OpenAiEmbedder(std::string api_key, std::string model, std::size_t dimensions,
                 std::string endpoint, std::uint64_t timeout_ms,
                 std::shared_ptr<http::HttpClient> http_client =
                     std::make_shared<http::CurlHttpClient>());

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] const std::string &model_id() const override;
  [[nodiscard]] std::size_t dimensions() const override;
  [[nodiscard]] common::Status warmup() override;
  [[nodiscard]] common::Result<std::vector<float>> embed(std::string_view text) override;
  [[nodiscard]] common::Result<std::vector<std::vector<float>>>
  embed_batch(const std::vector<std::string> &texts) override;

  static constexpr const char *kDefaultModel = "text-embedding-3-small";

private:
  std::string api_key_;
  std::string model_;
  std::size_t dimensions_;
  std::string endpoint_;
  std::uint64_t timeout_ms_;
  std::shared_ptr<http::HttpClient> http_client_;
};

/// Parses an embeddings response body into `expected` vectors ordered by their `index`.
[[nodiscard]] common::Result<std::vector<std::vector<float>>>
parse_embeddings_response(const std::string &body, std::size_t expected);

} // namespace ragvix::embedding
