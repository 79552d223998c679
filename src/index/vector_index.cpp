#include "ragvix/index/vector_index.hpp"

#include "ragvix/common/fs.hpp"
#include "ragvix/index/sidecar_store.hpp"
#include "ragvix/observability/global.hpp"

#include <openssl/sha.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <unordered_set>

namespace ragvix::index {

namespace {

constexpr char kMagic[4] = {'R', 'V', 'X', 'I'};
constexpr std::size_t kHeaderSize = 32;

struct VectorFileHeader {
  std::uint32_t version = 0;
  std::uint32_t metric = 0;
  std::uint64_t dimension = 0;
  std::uint64_t count = 0;
};

std::string sha256_hex(const std::string &bytes) {
  unsigned char digest[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char *>(bytes.data()), bytes.size(), digest);

  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (const unsigned char c : digest) {
    stream << std::setw(2) << static_cast<int>(c);
  }
  return stream.str();
}

void normalize(float *values, const std::size_t dimension) {
  double norm = 0.0;
  for (std::size_t i = 0; i < dimension; ++i) {
    norm += static_cast<double>(values[i]) * static_cast<double>(values[i]);
  }
  norm = std::sqrt(norm);
  if (norm < 1e-12) {
    return;
  }
  for (std::size_t i = 0; i < dimension; ++i) {
    values[i] = static_cast<float>(static_cast<double>(values[i]) / norm);
  }
}

// Every metric except L2 compares directions only.
bool uses_unit_vectors(const DistanceMetric metric) { return metric != DistanceMetric::L2; }

template <typename T> void append_pod(std::string &out, const T &value) {
  out.append(reinterpret_cast<const char *>(&value), sizeof(T));
}

template <typename T> T read_pod(const std::string &in, const std::size_t offset) {
  T value{};
  std::memcpy(&value, in.data() + offset, sizeof(T));
  return value;
}

std::uint32_t metric_code(const DistanceMetric metric) {
  switch (metric) {
  case DistanceMetric::Cosine:
    return 0;
  case DistanceMetric::InnerProduct:
    return 1;
  case DistanceMetric::L2:
    return 2;
  }
  return 0;
}

std::optional<DistanceMetric> metric_from_code(const std::uint32_t code) {
  switch (code) {
  case 0:
    return DistanceMetric::Cosine;
  case 1:
    return DistanceMetric::InnerProduct;
  case 2:
    return DistanceMetric::L2;
  default:
    return std::nullopt;
  }
}

common::Status find_batch_duplicate(const std::vector<EmbeddedChunk> &chunks) {
  std::unordered_set<std::string> seen;
  seen.reserve(chunks.size());
  for (const auto &entry : chunks) {
    if (!seen.insert(entry.chunk.chunk_id).second) {
      return common::Status::error(common::ErrorCode::InvalidArgument,
                                   "duplicate chunk_id in batch: " + entry.chunk.chunk_id);
    }
  }
  return common::Status::success();
}

common::Result<std::string> read_binary(const std::filesystem::path &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return common::Result<std::string>::failure(common::ErrorCode::CorruptIndex,
                                                "unable to read " + path.string());
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return common::Result<std::string>::success(buffer.str());
}

common::Status corrupt(const std::string &message) {
  return common::Status::error(common::ErrorCode::CorruptIndex, message);
}

std::chrono::milliseconds elapsed_since(const std::chrono::steady_clock::time_point started) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                               started);
}

} // namespace

common::Result<DistanceMetric> parse_distance_metric(const std::string &value) {
  const std::string normalized = common::to_lower(common::trim(value));
  if (normalized == "cosine") {
    return common::Result<DistanceMetric>::success(DistanceMetric::Cosine);
  }
  if (normalized == "inner_product" || normalized == "ip" || normalized == "dot") {
    return common::Result<DistanceMetric>::success(DistanceMetric::InnerProduct);
  }
  if (normalized == "l2" || normalized == "euclidean") {
    return common::Result<DistanceMetric>::success(DistanceMetric::L2);
  }
  return common::Result<DistanceMetric>::failure(common::ErrorCode::InvalidConfiguration,
                                                 "unknown distance metric: " + value);
}

std::string_view distance_metric_name(const DistanceMetric metric) {
  switch (metric) {
  case DistanceMetric::Cosine:
    return "cosine";
  case DistanceMetric::InnerProduct:
    return "inner_product";
  case DistanceMetric::L2:
    return "l2";
  }
  return "cosine";
}

common::Result<DuplicatePolicy> parse_duplicate_policy(const std::string &value) {
  const std::string normalized = common::to_lower(common::trim(value));
  if (normalized == "skip") {
    return common::Result<DuplicatePolicy>::success(DuplicatePolicy::Skip);
  }
  if (normalized == "reject") {
    return common::Result<DuplicatePolicy>::success(DuplicatePolicy::Reject);
  }
  return common::Result<DuplicatePolicy>::failure(common::ErrorCode::InvalidConfiguration,
                                                  "unknown duplicate policy: " + value);
}

float score_vectors(const DistanceMetric metric, const float *a, const float *b,
                    const std::size_t dimension) {
  double acc = 0.0;
  if (metric == DistanceMetric::L2) {
    for (std::size_t i = 0; i < dimension; ++i) {
      const double diff = static_cast<double>(a[i]) - static_cast<double>(b[i]);
      acc += diff * diff;
    }
    return static_cast<float>(-acc);
  }
  for (std::size_t i = 0; i < dimension; ++i) {
    acc += static_cast<double>(a[i]) * static_cast<double>(b[i]);
  }
  return static_cast<float>(acc);
}

common::Status VectorIndex::stage(const std::vector<EmbeddedChunk> &chunks,
                                  std::vector<float> &staged, std::string &model_id,
                                  std::size_t &dimension) const {
  model_id = options_.model_id;
  dimension = options_.dimension;

  for (const auto &entry : chunks) {
    if (entry.chunk.chunk_id.empty()) {
      return common::Status::error(common::ErrorCode::InvalidArgument, "empty chunk_id");
    }
    if (dimension == 0) {
      dimension = entry.vector.size();
      if (dimension == 0) {
        return common::Status::error(common::ErrorCode::DimensionMismatch,
                                     "chunk " + entry.chunk.chunk_id + " has an empty vector");
      }
      staged.reserve(chunks.size() * dimension);
    }
    if (entry.vector.size() != dimension) {
      return common::Status::error(common::ErrorCode::DimensionMismatch,
                                   "chunk " + entry.chunk.chunk_id + " has dimension " +
                                       std::to_string(entry.vector.size()) + ", expected " +
                                       std::to_string(dimension));
    }
    if (model_id.empty()) {
      model_id = entry.model_id;
    } else if (entry.model_id != model_id) {
      return common::Status::error(common::ErrorCode::DimensionMismatch,
                                   "chunk " + entry.chunk.chunk_id + " was embedded by '" +
                                       entry.model_id + "', index uses '" + model_id + "'");
    }
    for (const float value : entry.vector) {
      if (!std::isfinite(value)) {
        return common::Status::error(common::ErrorCode::InvalidArgument,
                                     "chunk " + entry.chunk.chunk_id +
                                         " has a non-finite vector component");
      }
    }

    const std::size_t offset = staged.size();
    staged.insert(staged.end(), entry.vector.begin(), entry.vector.end());
    if (uses_unit_vectors(options_.metric)) {
      normalize(staged.data() + offset, dimension);
    }
  }
  return common::Status::success();
}

common::Result<std::unique_ptr<VectorIndex>>
VectorIndex::build(const IndexOptions &options, std::vector<EmbeddedChunk> chunks,
                   std::map<std::string, corpus::DocumentInfo> documents) {
  using R = common::Result<std::unique_ptr<VectorIndex>>;
  const auto started = std::chrono::steady_clock::now();

  if (chunks.empty() && !options.allow_empty) {
    return R::failure(common::ErrorCode::EmptyBatch, "cannot build an index from zero chunks");
  }
  if (auto status = find_batch_duplicate(chunks); !status.ok()) {
    return R::failure(status);
  }

  auto index = std::make_unique<VectorIndex>(PrivateTag{}, options);
  std::vector<float> staged;
  std::string model_id;
  std::size_t dimension = 0;
  if (auto status = index->stage(chunks, staged, model_id, dimension); !status.ok()) {
    return R::failure(status);
  }

  index->vectors_ = std::move(staged);
  index->records_.reserve(chunks.size());
  index->slot_by_id_.reserve(chunks.size());
  for (auto &entry : chunks) {
    index->slot_by_id_.emplace(entry.chunk.chunk_id, index->records_.size());
    index->records_.push_back(std::move(entry.chunk));
  }
  index->options_.model_id = std::move(model_id);
  index->options_.dimension = dimension;
  index->documents_ = std::move(documents);

  observability::record_index_mutation("build", index->records_.size(), 0,
                                       index->records_.size(), elapsed_since(started));
  return R::success(std::move(index));
}

common::Result<MutationSummary>
VectorIndex::add(std::vector<EmbeddedChunk> chunks,
                 const std::map<std::string, corpus::DocumentInfo> &documents) {
  using R = common::Result<MutationSummary>;
  const auto started = std::chrono::steady_clock::now();
  std::unique_lock<std::shared_mutex> lock(mutex_);

  if (auto status = find_batch_duplicate(chunks); !status.ok()) {
    return R::failure(status);
  }

  MutationSummary summary;
  std::vector<EmbeddedChunk> fresh;
  fresh.reserve(chunks.size());
  for (auto &entry : chunks) {
    if (!slot_by_id_.contains(entry.chunk.chunk_id)) {
      fresh.push_back(std::move(entry));
      continue;
    }
    if (options_.on_duplicate == DuplicatePolicy::Reject) {
      return R::failure(common::ErrorCode::InvalidArgument,
                        "chunk_id already indexed: " + entry.chunk.chunk_id);
    }
    ++summary.skipped;
  }

  std::vector<float> staged;
  std::string model_id;
  std::size_t dimension = 0;
  if (auto status = stage(fresh, staged, model_id, dimension); !status.ok()) {
    return R::failure(status);
  }

  // Reserve first so that nothing below can fail halfway through the append.
  vectors_.reserve(vectors_.size() + staged.size());
  records_.reserve(records_.size() + fresh.size());
  slot_by_id_.reserve(slot_by_id_.size() + fresh.size());

  vectors_.insert(vectors_.end(), staged.begin(), staged.end());
  for (auto &entry : fresh) {
    slot_by_id_.emplace(entry.chunk.chunk_id, records_.size());
    records_.push_back(std::move(entry.chunk));
  }
  if (!fresh.empty()) {
    options_.model_id = std::move(model_id);
    options_.dimension = dimension;
  }
  for (const auto &[document_id, info] : documents) {
    documents_.insert_or_assign(document_id, info);
  }
  summary.added = fresh.size();

  observability::record_index_mutation("add", summary.added, summary.skipped, records_.size(),
                                       elapsed_since(started));
  return R::success(summary);
}

common::Result<std::vector<ScoredChunk>> VectorIndex::search(const std::vector<float> &query,
                                                             const int k) const {
  using R = common::Result<std::vector<ScoredChunk>>;
  if (k <= 0) {
    return R::failure(common::ErrorCode::InvalidArgument,
                      "k must be positive, got " + std::to_string(k));
  }

  std::shared_lock<std::shared_mutex> lock(mutex_);
  const std::size_t count = records_.size();
  if (count == 0) {
    return R::success({});
  }
  const std::size_t dimension = options_.dimension;
  if (query.size() != dimension) {
    return R::failure(common::ErrorCode::DimensionMismatch,
                      "query has dimension " + std::to_string(query.size()) + ", index has " +
                          std::to_string(dimension));
  }
  for (const float value : query) {
    if (!std::isfinite(value)) {
      return R::failure(common::ErrorCode::InvalidArgument,
                        "query vector has a non-finite component");
    }
  }

  std::vector<float> stored_form(query);
  if (uses_unit_vectors(options_.metric)) {
    normalize(stored_form.data(), dimension);
  }

  std::vector<std::pair<float, std::size_t>> scored;
  scored.reserve(count);
  for (std::size_t slot = 0; slot < count; ++slot) {
    scored.emplace_back(score_vectors(options_.metric, stored_form.data(),
                                      vectors_.data() + slot * dimension, dimension),
                        slot);
  }

  const std::size_t limit = std::min(static_cast<std::size_t>(k), count);
  std::partial_sort(scored.begin(), scored.begin() + static_cast<std::ptrdiff_t>(limit),
                    scored.end(), [this](const auto &lhs, const auto &rhs) {
                      if (lhs.first != rhs.first) {
                        return lhs.first > rhs.first;
                      }
                      return records_[lhs.second].chunk_id < records_[rhs.second].chunk_id;
                    });

  std::vector<ScoredChunk> results;
  results.reserve(limit);
  for (std::size_t i = 0; i < limit; ++i) {
    results.push_back(ScoredChunk{.chunk_id = records_[scored[i].second].chunk_id,
                                  .score = scored[i].first});
  }
  return R::success(std::move(results));
}

common::Status VectorIndex::save(const std::filesystem::path &location) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);

  if (auto dir = common::ensure_dir(location); !dir.ok()) {
    return dir.status();
  }

  std::string bytes;
  bytes.reserve(kHeaderSize + vectors_.size() * sizeof(float));
  bytes.append(kMagic, sizeof(kMagic));
  append_pod(bytes, kFormatVersion);
  append_pod(bytes, metric_code(options_.metric));
  append_pod(bytes, std::uint32_t{0});
  append_pod(bytes, static_cast<std::uint64_t>(options_.dimension));
  append_pod(bytes, static_cast<std::uint64_t>(records_.size()));
  bytes.append(reinterpret_cast<const char *>(vectors_.data()), vectors_.size() * sizeof(float));

  const std::filesystem::path vector_path = location / kVectorFile;
  const std::filesystem::path sidecar_path = location / kSidecarFile;
  const std::filesystem::path vector_tmp = vector_path.string() + ".tmp";
  const std::filesystem::path sidecar_tmp = sidecar_path.string() + ".tmp";

  {
    std::ofstream out(vector_tmp, std::ios::binary | std::ios::trunc);
    if (!out) {
      return common::Status::error(common::ErrorCode::IoError,
                                   "failed to open " + vector_tmp.string() + " for write");
    }
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    out.close();
    if (!out) {
      return common::Status::error(common::ErrorCode::IoError,
                                   "failed to write " + vector_tmp.string());
    }
  }

  SidecarContents contents;
  contents.info = {
      {"format_version", std::to_string(kFormatVersion)},
      {"model_id", options_.model_id},
      {"dimension", std::to_string(options_.dimension)},
      {"metric", std::string(distance_metric_name(options_.metric))},
      {"count", std::to_string(records_.size())},
      {"vectors_sha256", sha256_hex(bytes)},
  };
  contents.chunks = records_;
  contents.documents = documents_;
  {
    auto store = SidecarStore::create(sidecar_tmp);
    if (!store.ok()) {
      return store.status();
    }
    if (auto status = store.value()->write(contents); !status.ok()) {
      return status;
    }
  }

  std::error_code ec;
  std::filesystem::rename(vector_tmp, vector_path, ec);
  if (!ec) {
    std::filesystem::rename(sidecar_tmp, sidecar_path, ec);
  }
  if (ec) {
    return common::Status::error(common::ErrorCode::IoError,
                                 "failed to replace index files: " + ec.message());
  }

  observability::record_index_persist("save", location.string(), records_.size());
  return common::Status::success();
}

common::Result<std::unique_ptr<VectorIndex>>
VectorIndex::load(const std::filesystem::path &location,
                  const std::optional<IndexOptions> &expected) {
  using R = common::Result<std::unique_ptr<VectorIndex>>;
  const std::filesystem::path vector_path = location / kVectorFile;
  const std::filesystem::path sidecar_path = location / kSidecarFile;

  std::error_code ec;
  const bool has_vectors = std::filesystem::is_regular_file(vector_path, ec);
  const bool has_sidecar = std::filesystem::is_regular_file(sidecar_path, ec);
  if (!has_vectors && !has_sidecar) {
    return R::failure(common::ErrorCode::IndexUnavailable,
                      "no index found at " + location.string());
  }
  if (!has_vectors || !has_sidecar) {
    return R::failure(corrupt(std::string("index at ") + location.string() + " is missing " +
                              (has_vectors ? kSidecarFile : kVectorFile)));
  }

  auto bytes = read_binary(vector_path);
  if (!bytes.ok()) {
    return R::failure(bytes.status());
  }
  auto store = SidecarStore::open(sidecar_path);
  if (!store.ok()) {
    return R::failure(store.status());
  }
  auto sidecar = store.value()->read();
  if (!sidecar.ok()) {
    return R::failure(sidecar.status());
  }
  SidecarContents &contents = sidecar.value();
  const auto info = [&contents](const std::string &key) {
    const auto it = contents.info.find(key);
    return it == contents.info.end() ? std::string() : it->second;
  };

  const std::string &data = bytes.value();
  if (info("vectors_sha256") != sha256_hex(data)) {
    return R::failure(corrupt("vector file checksum does not match the metadata sidecar"));
  }
  if (data.size() < kHeaderSize || std::memcmp(data.data(), kMagic, sizeof(kMagic)) != 0) {
    return R::failure(corrupt("vector file has no valid header"));
  }

  VectorFileHeader header;
  header.version = read_pod<std::uint32_t>(data, 4);
  header.metric = read_pod<std::uint32_t>(data, 8);
  header.dimension = read_pod<std::uint64_t>(data, 16);
  header.count = read_pod<std::uint64_t>(data, 24);
  if (header.version != kFormatVersion || info("format_version") != std::to_string(kFormatVersion)) {
    return R::failure(corrupt("unsupported index format version " +
                              std::to_string(header.version)));
  }
  const auto metric = metric_from_code(header.metric);
  if (!metric.has_value() || info("metric") != distance_metric_name(*metric)) {
    return R::failure(corrupt("distance metric differs between vector file and sidecar"));
  }
  if (info("dimension") != std::to_string(header.dimension) ||
      info("count") != std::to_string(header.count) || contents.chunks.size() != header.count) {
    return R::failure(corrupt("vector count or dimension differs between vector file and "
                              "sidecar"));
  }
  if ((header.dimension > 0 &&
       header.count > (data.size() / sizeof(float)) / header.dimension) ||
      data.size() != kHeaderSize + header.count * header.dimension * sizeof(float)) {
    return R::failure(corrupt("vector file size does not match its header"));
  }

  const std::string model_id = info("model_id");
  if (expected.has_value()) {
    if (expected->metric != *metric) {
      return R::failure(common::ErrorCode::InvalidConfiguration,
                        "index was built with metric " +
                            std::string(distance_metric_name(*metric)) + ", configured " +
                            std::string(distance_metric_name(expected->metric)));
    }
    if (!expected->model_id.empty() && expected->model_id != model_id) {
      return R::failure(common::ErrorCode::InvalidConfiguration,
                        "index was built with model " + model_id + ", configured " +
                            expected->model_id);
    }
  }

  IndexOptions options = expected.value_or(IndexOptions{});
  options.metric = *metric;
  options.model_id = model_id;
  options.dimension = static_cast<std::size_t>(header.dimension);

  auto index = std::make_unique<VectorIndex>(PrivateTag{}, std::move(options));
  index->vectors_.resize(header.count * header.dimension);
  std::memcpy(index->vectors_.data(), data.data() + kHeaderSize,
              index->vectors_.size() * sizeof(float));
  index->slot_by_id_.reserve(contents.chunks.size());
  for (std::size_t slot = 0; slot < contents.chunks.size(); ++slot) {
    if (!index->slot_by_id_.emplace(contents.chunks[slot].chunk_id, slot).second) {
      return R::failure(corrupt("duplicate chunk_id in sidecar: " +
                                contents.chunks[slot].chunk_id));
    }
  }
  index->records_ = std::move(contents.chunks);
  index->documents_ = std::move(contents.documents);

  observability::record_index_persist("load", location.string(), index->records_.size());
  return R::success(std::move(index));
}

std::size_t VectorIndex::size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return records_.size();
}

bool VectorIndex::contains(const std::string &chunk_id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return slot_by_id_.contains(chunk_id);
}

std::optional<corpus::Chunk> VectorIndex::chunk(const std::string &chunk_id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  const auto it = slot_by_id_.find(chunk_id);
  if (it == slot_by_id_.end()) {
    return std::nullopt;
  }
  return records_[it->second];
}

std::optional<corpus::DocumentInfo> VectorIndex::document(const std::string &document_id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  const auto it = documents_.find(document_id);
  if (it == documents_.end()) {
    return std::nullopt;
  }
  return it->second;
}

IndexStats VectorIndex::stats() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::unordered_set<std::string> documents;
  for (const auto &record : records_) {
    documents.insert(record.document_id);
  }
  return IndexStats{.chunks = records_.size(),
                    .documents = documents.size(),
                    .model_id = options_.model_id,
                    .dimension = options_.dimension,
                    .metric = options_.metric};
}

std::string VectorIndex::model_id() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return options_.model_id;
}

std::size_t VectorIndex::dimension() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return options_.dimension;
}

} // namespace ragvix::index
