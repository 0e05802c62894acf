#include "semcache/observability/global.hpp"

#include <mutex>

namespace semcache::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  if (g_observer != nullptr) {
    g_observer->flush();
  }
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

void record_cache_lookup(const std::string &path, const std::string &query_digest,
                         const float similarity, const std::chrono::milliseconds duration) {
  record_event(CacheLookupEvent{.path = path,
                                .query_digest = query_digest,
                                .similarity = similarity,
                                .duration = duration});
}

void record_cache_record(const std::string &query_digest, const bool was_new) {
  record_event(CacheRecordEvent{.query_digest = query_digest, .was_new = was_new});
}

void record_index_rebuild(const std::uint64_t entries, const std::chrono::milliseconds duration) {
  record_event(IndexRebuildEvent{.entries = entries, .duration = duration});
}

void record_generation(const std::string &provider, const std::string &model,
                       const std::chrono::milliseconds duration, const bool success) {
  record_event(GenerationEvent{
      .provider = provider, .model = model, .duration = duration, .success = success});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace semcache::observability
