#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace ragvix::observability {

struct ChunkingEvent {
  std::string document_id;
  std::uint64_t chunk_count = 0;
};

struct EmbedBatchEvent {
  std::string model_id;
  std::uint64_t batch_size = 0;
  std::chrono::milliseconds duration{0};
};

struct IndexMutationEvent {
  /// "build" or "add".
  std::string operation;
  std::uint64_t added = 0;
  std::uint64_t skipped = 0;
  std::uint64_t total = 0;
  std::chrono::milliseconds duration{0};
};

struct IndexPersistEvent {
  /// "save" or "load".
  std::string operation;
  std::string location;
  std::uint64_t count = 0;
};

struct SearchEvent {
  std::uint64_t k = 0;
  std::uint64_t result_count = 0;
  std::chrono::milliseconds duration{0};
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<ChunkingEvent, EmbedBatchEvent, IndexMutationEvent,
                                   IndexPersistEvent, SearchEvent, ErrorEvent>;

struct SearchLatencyMetric {
  std::chrono::milliseconds latency{0};
};

struct IndexSizeMetric {
  std::uint64_t chunks = 0;
};

using ObserverMetric = std::variant<SearchLatencyMetric, IndexSizeMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace ragvix::observability
