#pragma once

#include "ragvix/observability/observer.hpp"

#include <memory>

namespace ragvix::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_chunking(const std::string &document_id, std::uint64_t chunk_count);
void record_embed_batch(const std::string &model_id, std::uint64_t batch_size,
                        std::chrono::milliseconds duration);
void record_index_mutation(const std::string &operation, std::uint64_t added,
                           std::uint64_t skipped, std::uint64_t total,
                           std::chrono::milliseconds duration);
void record_index_persist(const std::string &operation, const std::string &location,
                          std::uint64_t count);
void record_search(std::uint64_t k, std::uint64_t result_count,
                   std::chrono::milliseconds duration);
void record_error(const std::string &component, const std::string &message);

} // namespace ragvix::observability
