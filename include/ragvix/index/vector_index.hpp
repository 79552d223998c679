#pragma once

#include "ragvix/common/result.hpp"
#include "ragvix/corpus/document.hpp"

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace ragvix::index {

enum class DistanceMetric {
  Cosine,
  /// Inner product over L2-normalised vectors, so a stored vector's own query always
  /// scores highest.
  InnerProduct,
  /// Scored as the negative squared Euclidean distance.
  L2,
};

enum class DuplicatePolicy {
  Skip,
  Reject,
};

[[nodiscard]] common::Result<DistanceMetric> parse_distance_metric(const std::string &value);
[[nodiscard]] std::string_view distance_metric_name(DistanceMetric metric);
[[nodiscard]] common::Result<DuplicatePolicy> parse_duplicate_policy(const std::string &value);

struct EmbeddedChunk {
  corpus::Chunk chunk;
  std::vector<float> vector;
  std::string model_id;
};

struct IndexOptions {
  DistanceMetric metric = DistanceMetric::Cosine;
  DuplicatePolicy on_duplicate = DuplicatePolicy::Skip;
  bool allow_empty = false;
  /// When set, every vector must come from this model. Empty: taken from the first chunk.
  std::string model_id;
  /// When non-zero, every vector must have this length. Zero: taken from the first chunk.
  std::size_t dimension = 0;
};

struct ScoredChunk {
  std::string chunk_id;
  float score = 0.0F;
};

struct MutationSummary {
  std::size_t added = 0;
  std::size_t skipped = 0;
};

struct IndexStats {
  std::size_t chunks = 0;
  std::size_t documents = 0;
  std::string model_id;
  std::size_t dimension = 0;
  DistanceMetric metric = DistanceMetric::Cosine;
};

[[nodiscard]] float score_vectors(DistanceMetric metric, const float *a, const float *b,
                                  std::size_t dimension);

/// Exact nearest-neighbour index over embedded chunks.
///
/// Vectors live in one packed arena addressed by slot; slot i's metadata is records_[i] and
/// chunk ids resolve to slots through slot_by_id_. The layout is written to disk as-is:
/// `vectors.bin` holds the arena, `metadata.db` (SQLite) holds the records, document
/// metadata and an index_info table with the vector file's SHA-256.
///
/// Single writer, many readers: search() and the accessors take a shared lock, add() an
/// exclusive one. build() and add() validate the whole batch before touching state, so a
/// failed call leaves the index unchanged.
class VectorIndex {
  struct PrivateTag {
    explicit PrivateTag() = default;
  };

public:
  /// Reachable only through build() and load().
  VectorIndex(PrivateTag, IndexOptions options) : options_(std::move(options)) {}

  static constexpr const char *kVectorFile = "vectors.bin";
  static constexpr const char *kSidecarFile = "metadata.db";
  static constexpr std::uint32_t kFormatVersion = 1;

  /// Fails with DimensionMismatch when vectors disagree in length or model id, with
  /// EmptyBatch on zero chunks unless allow_empty is set, and with InvalidArgument on
  /// duplicate or empty chunk ids.
  [[nodiscard]] static common::Result<std::unique_ptr<VectorIndex>>
  build(const IndexOptions &options, std::vector<EmbeddedChunk> chunks,
        std::map<std::string, corpus::DocumentInfo> documents = {});

  /// Reads an index written by save(). A missing directory is IndexUnavailable; a missing
  /// or inconsistent artifact is CorruptIndex. When `expected` names a metric or model id
  /// that differs from the persisted one the load fails with InvalidConfiguration.
  [[nodiscard]] static common::Result<std::unique_ptr<VectorIndex>>
  load(const std::filesystem::path &location, const std::optional<IndexOptions> &expected = {});

  /// Appends chunks. Ids already present are skipped or rejected per on_duplicate; ids
  /// repeated inside the batch are always InvalidArgument.
  [[nodiscard]] common::Result<MutationSummary>
  add(std::vector<EmbeddedChunk> chunks,
      const std::map<std::string, corpus::DocumentInfo> &documents = {});

  /// Up to k results, best first; ties broken by ascending chunk id.
  [[nodiscard]] common::Result<std::vector<ScoredChunk>> search(const std::vector<float> &query,
                                                                int k) const;

  [[nodiscard]] common::Status save(const std::filesystem::path &location) const;

  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] bool contains(const std::string &chunk_id) const;
  [[nodiscard]] std::optional<corpus::Chunk> chunk(const std::string &chunk_id) const;
  [[nodiscard]] std::optional<corpus::DocumentInfo> document(const std::string &document_id) const;
  [[nodiscard]] IndexStats stats() const;
  [[nodiscard]] DistanceMetric metric() const { return options_.metric; }
  [[nodiscard]] std::string model_id() const;
  [[nodiscard]] std::size_t dimension() const;

private:
  /// Checks a batch against the index's model and dimension (fixing them on first use)
  /// and returns the vectors in stored form. Called with the exclusive lock held or before
  /// the index is shared.
  [[nodiscard]] common::Status stage(const std::vector<EmbeddedChunk> &chunks,
                                     std::vector<float> &staged, std::string &model_id,
                                     std::size_t &dimension) const;

  IndexOptions options_;
  mutable std::shared_mutex mutex_;
  std::vector<float> vectors_;
  std::vector<corpus::Chunk> records_;
  std::unordered_map<std::string, std::size_t> slot_by_id_;
  std::map<std::string, corpus::DocumentInfo> documents_;
};

} // namespace ragvix::index
