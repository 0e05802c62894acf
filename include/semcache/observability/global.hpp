#pragma once

#include "semcache/observability/observer.hpp"

#include <memory>

namespace semcache::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_cache_lookup(const std::string &path, const std::string &query_digest,
                         float similarity, std::chrono::milliseconds duration);
void record_cache_record(const std::string &query_digest, bool was_new);
void record_index_rebuild(std::uint64_t entries, std::chrono::milliseconds duration);
void record_generation(const std::string &provider, const std::string &model,
                       std::chrono::milliseconds duration, bool success);
void record_error(const std::string &component, const std::string &message);

} // namespace semcache::observability
