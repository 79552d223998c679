#include "ragvix/embedding/embedder_local.hpp"

#include <cctype>
#include <cmath>
#include <cstdint>

namespace ragvix::embedding {

namespace {

// FNV-1a keeps vectors identical across processes and platforms, which std::hash does not.
std::uint64_t fnv1a(std::string_view text, std::uint64_t seed = 14695981039346656037ULL) {
  std::uint64_t hash = seed;
  for (const char ch : text) {
    hash ^= static_cast<unsigned char>(ch);
    hash *= 1099511628211ULL;
  }
  return hash;
}

std::vector<std::string> tokenize(std::string_view text) {
  std::vector<std::string> tokens;
  std::string current;
  for (const char ch : text) {
    const auto uch = static_cast<unsigned char>(ch);
    if (std::isalnum(uch) != 0 || uch >= 0x80) {
      current.push_back(static_cast<char>(std::tolower(uch)));
    } else if (!current.empty()) {
      tokens.push_back(std::move(current));
      current.clear();
    }
  }
  if (!current.empty()) {
    tokens.push_back(std::move(current));
  }
  return tokens;
}

void add_feature(std::vector<float> &values, std::string_view feature, const float weight) {
  const std::uint64_t hash = fnv1a(feature);
  const std::size_t idx = static_cast<std::size_t>(hash % values.size());
  const float sign = ((hash >> 63) & 1U) != 0 ? -1.0F : 1.0F;
  values[idx] += sign * weight;
}

void normalize(std::vector<float> &values) {
  double norm = 0.0;
  for (float v : values) {
    norm += static_cast<double>(v) * static_cast<double>(v);
  }
  norm = std::sqrt(norm);
  if (norm < 1e-9) {
    return;
  }
  for (float &v : values) {
    v = static_cast<float>(static_cast<double>(v) / norm);
  }
}

} // namespace

HashingEmbedder::HashingEmbedder(const std::size_t dimensions, std::string model_id)
    : dimensions_(dimensions == 0 ? kDefaultDimensions : dimensions),
      model_id_(model_id.empty() ? "ragvix-hash-v1-" + std::to_string(dimensions_)
                                 : std::move(model_id)) {}

std::string_view HashingEmbedder::name() const { return "local"; }

const std::string &HashingEmbedder::model_id() const { return model_id_; }

std::size_t HashingEmbedder::dimensions() const { return dimensions_; }

common::Result<std::vector<float>> HashingEmbedder::embed(const std::string_view text) {
  std::vector<float> values(dimensions_, 0.0F);

  auto tokens = tokenize(text);
  if (tokens.empty()) {
    // Punctuation-only input still maps to a stable non-zero vector.
    tokens.emplace_back(text);
  }
  for (std::size_t i = 0; i < tokens.size(); ++i) {
    add_feature(values, tokens[i], 1.0F);
    if (i + 1 < tokens.size()) {
      add_feature(values, tokens[i] + " " + tokens[i + 1], 0.5F);
    }
  }

  normalize(values);
  return common::Result<std::vector<float>>::success(std::move(values));
}

common::Result<std::vector<std::vector<float>>>
HashingEmbedder::embed_batch(const std::vector<std::string> &texts) {
  std::vector<std::vector<float>> out;
  out.reserve(texts.size());
  for (const auto &text : texts) {
    auto emb = embed(text);
    if (!emb.ok()) {
      return common::Result<std::vector<std::vector<float>>>::failure(emb.status());
    }
    out.push_back(std::move(emb.value()));
  }
  return common::Result<std::vector<std::vector<float>>>::success(std::move(out));
}

} // namespace ragvix::embedding
