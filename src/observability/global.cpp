#include "ragvix/observability/global.hpp"

#include <mutex>

namespace ragvix::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_chunking(const std::string &document_id, const std::uint64_t chunk_count) {
  record_event(ChunkingEvent{.document_id = document_id, .chunk_count = chunk_count});
}

void record_embed_batch(const std::string &model_id, const std::uint64_t batch_size,
                        std::chrono::milliseconds duration) {
  record_event(
      EmbedBatchEvent{.model_id = model_id, .batch_size = batch_size, .duration = duration});
}

void record_index_mutation(const std::string &operation, const std::uint64_t added,
                           const std::uint64_t skipped, const std::uint64_t total,
                           std::chrono::milliseconds duration) {
  record_event(IndexMutationEvent{.operation = operation,
                                  .added = added,
                                  .skipped = skipped,
                                  .total = total,
                                  .duration = duration});
  record_metric(IndexSizeMetric{.chunks = total});
}

void record_index_persist(const std::string &operation, const std::string &location,
                          const std::uint64_t count) {
  record_event(IndexPersistEvent{.operation = operation, .location = location, .count = count});
  if (operation == "load") {
    record_metric(IndexSizeMetric{.chunks = count});
  }
}

void record_search(const std::uint64_t k, const std::uint64_t result_count,
                   std::chrono::milliseconds duration) {
  record_event(SearchEvent{.k = k, .result_count = result_count, .duration = duration});
  record_metric(SearchLatencyMetric{.latency = duration});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace ragvix::observability
