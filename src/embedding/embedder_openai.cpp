#include "ragvix/embedding/embedder_openai.hpp"

#include "ragvix/common/fs.hpp"
#include "ragvix/common/json_util.hpp"

#include <charconv>
#include <optional>
#include <sstream>

namespace ragvix::embedding {

namespace {

using Vectors = std::vector<std::vector<float>>;

std::string api_error_message(const http::HttpResponse &response) {
  // OpenAI-style errors arrive as {"error": {"message": ...}}.
  const auto top = common::json_parse_flat(response.body);
  std::string message;
  if (const auto error = top.find("error"); error != top.end()) {
    const auto nested = common::json_parse_flat(error->second);
    message = nested.contains("message") ? nested.at("message") : error->second;
  } else if (const auto flat = top.find("message"); flat != top.end()) {
    message = flat->second;
  }
  if (message.empty()) {
    message = response.body.substr(0, 200);
  }
  return "HTTP " + std::to_string(response.status) + (message.empty() ? "" : ": " + message);
}

} // namespace

common::Result<Vectors> parse_embeddings_response(const std::string &body,
                                                  const std::size_t expected) {
  const auto top = common::json_parse_flat(body);
  const auto data_it = top.find("data");
  if (data_it == top.end() || data_it->second.empty() || data_it->second.front() != '[') {
    return common::Result<Vectors>::failure(common::ErrorCode::EmbeddingError,
                                            "embedding response has no data array");
  }

  const auto items = common::json_split_top_level_objects(data_it->second);
  if (items.size() != expected) {
    return common::Result<Vectors>::failure(
        common::ErrorCode::EmbeddingError,
        "embedding response has " + std::to_string(items.size()) + " items, expected " +
            std::to_string(expected));
  }

  std::vector<std::optional<std::vector<float>>> slots(expected);
  for (std::size_t position = 0; position < items.size(); ++position) {
    const auto fields = common::json_parse_flat(items[position]);

    std::size_t index = position;
    if (const auto it = fields.find("index"); it != fields.end()) {
      const auto &raw = it->second;
      const auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), index);
      if (ec != std::errc() || ptr != raw.data() + raw.size()) {
        return common::Result<Vectors>::failure(common::ErrorCode::EmbeddingError,
                                                "invalid embedding index: " + raw);
      }
    }
    if (index >= expected || slots[index].has_value()) {
      return common::Result<Vectors>::failure(common::ErrorCode::EmbeddingError,
                                              "embedding index out of range or repeated");
    }

    const auto embedding = fields.find("embedding");
    if (embedding == fields.end()) {
      return common::Result<Vectors>::failure(common::ErrorCode::EmbeddingError,
                                              "embedding field missing");
    }
    std::vector<float> values;
    if (!common::json_parse_float_array(embedding->second, values) || values.empty()) {
      return common::Result<Vectors>::failure(common::ErrorCode::EmbeddingError,
                                              "embedding array parse failed");
    }
    slots[index] = std::move(values);
  }

  Vectors out;
  out.reserve(expected);
  for (auto &slot : slots) {
    out.push_back(std::move(*slot));
  }
  return common::Result<Vectors>::success(std::move(out));
}

OpenAiEmbedder::OpenAiEmbedder(std::string api_key, std::string model,
                               const std::size_t dimensions, std::string endpoint,
                               const std::uint64_t timeout_ms,
                               std::shared_ptr<http::HttpClient> http_client)
    : api_key_(std::move(api_key)), model_(std::move(model)), dimensions_(dimensions),
      endpoint_(std::move(endpoint)), timeout_ms_(timeout_ms),
      http_client_(std::move(http_client)) {}

std::string_view OpenAiEmbedder::name() const { return "openai"; }

const std::string &OpenAiEmbedder::model_id() const { return model_; }

std::size_t OpenAiEmbedder::dimensions() const { return dimensions_; }

common::Status OpenAiEmbedder::warmup() {
  if (common::trim(api_key_).empty()) {
    return common::Status::error(common::ErrorCode::ModelUnavailable,
                                 "missing API key for embedding model " + model_);
  }
  auto warmup = embed_batch({"ragvix warmup"});
  if (!warmup.ok()) {
    return common::Status::error(common::ErrorCode::ModelUnavailable,
                                 "embedding model " + model_ + " unavailable: " + warmup.error());
  }
  return common::Status::success();
}

common::Result<std::vector<float>> OpenAiEmbedder::embed(const std::string_view text) {
  auto batch = embed_batch({std::string(text)});
  if (!batch.ok()) {
    return common::Result<std::vector<float>>::failure(batch.status());
  }
  return common::Result<std::vector<float>>::success(std::move(batch.value().front()));
}

common::Result<Vectors> OpenAiEmbedder::embed_batch(const std::vector<std::string> &texts) {
  if (texts.empty()) {
    return common::Result<Vectors>::success({});
  }
  if (common::trim(api_key_).empty()) {
    return common::Result<Vectors>::failure(common::ErrorCode::ModelUnavailable,
                                            "missing API key");
  }

  std::ostringstream body;
  body << "{";
  body << "\"model\":\"" << common::json_escape(model_) << "\",";
  if (model_.find("text-embedding-3") != std::string::npos) {
    body << "\"dimensions\":" << dimensions_ << ",";
  }
  body << "\"input\":[";
  for (std::size_t i = 0; i < texts.size(); ++i) {
    if (i > 0) {
      body << ",";
    }
    body << "\"" << common::json_escape(texts[i]) << "\"";
  }
  body << "]}";

  const std::unordered_map<std::string, std::string> headers = {
      {"Content-Type", "application/json"},
      {"Authorization", "Bearer " + api_key_},
  };

  const auto response = http_client_->post_json(endpoint_, headers, body.str(), timeout_ms_);
  if (response.timeout) {
    return common::Result<Vectors>::failure(common::ErrorCode::EmbeddingError,
                                            "embedding request timed out");
  }
  if (response.network_error) {
    return common::Result<Vectors>::failure(common::ErrorCode::EmbeddingError,
                                            response.network_error_message);
  }
  if (response.status < 200 || response.status >= 300) {
    return common::Result<Vectors>::failure(common::ErrorCode::EmbeddingError,
                                            api_error_message(response));
  }

  auto parsed = parse_embeddings_response(response.body, texts.size());
  if (!parsed.ok()) {
    return parsed;
  }
  for (const auto &vector : parsed.value()) {
    if (vector.size() != dimensions_) {
      return common::Result<Vectors>::failure(
          common::ErrorCode::EmbeddingError,
          "model returned " + std::to_string(vector.size()) + " dimensions, configured " +
              std::to_string(dimensions_));
    }
  }
  return parsed;
}

} // namespace ragvix::embedding
