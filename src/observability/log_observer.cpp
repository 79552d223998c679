#include "ragvix/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace ragvix::observability {

namespace {

void log_line(const std::string &level, const std::string &message) {
  std::cerr << "[" << level << "] " << message << "\n";
}

} // namespace

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, ChunkingEvent>) {
          log_line("DEBUG", "chunk.document id=" + evt.document_id +
                                " chunks=" + std::to_string(evt.chunk_count));
        } else if constexpr (std::is_same_v<T, EmbedBatchEvent>) {
          log_line("DEBUG", "embed.batch model=" + evt.model_id +
                                " size=" + std::to_string(evt.batch_size) +
                                " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, IndexMutationEvent>) {
          log_line("INFO", "index." + evt.operation + " added=" + std::to_string(evt.added) +
                               " skipped=" + std::to_string(evt.skipped) +
                               " total=" + std::to_string(evt.total) +
                               " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, IndexPersistEvent>) {
          log_line("INFO", "index." + evt.operation + " location=" + evt.location +
                               " chunks=" + std::to_string(evt.count));
        } else if constexpr (std::is_same_v<T, SearchEvent>) {
          log_line("DEBUG", "retrieval.search k=" + std::to_string(evt.k) +
                                " results=" + std::to_string(evt.result_count) +
                                " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, SearchLatencyMetric>) {
          log_line("DEBUG", "metric.search_latency_ms=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, IndexSizeMetric>) {
          log_line("DEBUG", "metric.index_size=" + std::to_string(m.chunks));
        }
      },
      metric);
}

} // namespace ragvix::observability
