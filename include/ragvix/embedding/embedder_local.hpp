#pragma once

#include "ragvix/embedding/embedder.hpp"

namespace ragvix::embedding {

/// Feature-hashing embedder over lower-cased word unigrams and bigrams. Needs no model
/// files, so it is always available.
class HashingEmbedder final : public IEmbedder {
public:
  explicit HashingEmbedder(std::size_t dimensions = kDefaultDimensions,
                           std::string model_id = "");

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] const std::string &model_id() const override;
  [[nodiscard]] std::size_t dimensions() const override;
  [[nodiscard]] common::Result<std::vector<float>> embed(std::string_view text) override;
  [[nodiscard]] common::Result<std::vector<std::vector<float>>>
  embed_batch(const std::vector<std::string> &texts) override;

  static constexpr std::size_t kDefaultDimensions = 384;

private:
  std::size_t dimensions_;
  std::string model_id_;
};

} // namespace ragvix::embedding
