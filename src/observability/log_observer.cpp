#include "semcache/observability/log_observer.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>
#include <type_traits>

namespace semcache::observability {

namespace {

std::string format_similarity(const float similarity) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(4) << similarity;
  return out.str();
}

} // namespace

void LogObserver::log_line(const std::string_view level, const std::string &message) {
  if (level == "DEBUG" && !verbose_) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  std::cerr << "[" << level << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, CacheLookupEvent>) {
          log_line("DEBUG", "cache.lookup key=" + evt.query_digest + " path=" + evt.path +
                                " similarity=" + format_similarity(evt.similarity) +
                                " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, CacheRecordEvent>) {
          log_line("DEBUG", "cache.record key=" + evt.query_digest +
                                (evt.was_new ? " outcome=new" : " outcome=updated"));
        } else if constexpr (std::is_same_v<T, IndexRebuildEvent>) {
          log_line("INFO", "cache.rebuild entries=" + std::to_string(evt.entries) +
                               " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, GenerationEvent>) {
          log_line(evt.success ? "DEBUG" : "WARN",
                   "generation provider=" + evt.provider + " model=" + evt.model +
                       " duration_ms=" + std::to_string(evt.duration.count()) +
                       " success=" + (evt.success ? std::string("true") : std::string("false")));
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, RequestLatencyMetric>) {
          log_line("DEBUG", "metric.request_latency_ms=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, IndexSizeMetric>) {
          log_line("DEBUG", "metric.index_size=" + std::to_string(m.entries));
        }
      },
      metric);
}

} // namespace semcache::observability
