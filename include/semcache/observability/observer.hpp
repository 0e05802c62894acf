#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace semcache::observability {

struct CacheLookupEvent {
  std::string path;
  std::string query_digest;
  float similarity = 0.0F;
  std::chrono::milliseconds duration{0};
};

struct CacheRecordEvent {
  std::string query_digest;
  bool was_new = false;
};

struct IndexRebuildEvent {
  std::uint64_t entries = 0;
  std::chrono::milliseconds duration{0};
};

struct GenerationEvent {
  std::string provider;
  std::string model;
  std::chrono::milliseconds duration{0};
  bool success = false;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<CacheLookupEvent, CacheRecordEvent, IndexRebuildEvent,
                                   GenerationEvent, ErrorEvent>;

struct RequestLatencyMetric {
  std::chrono::milliseconds latency{0};
};

struct IndexSizeMetric {
  std::uint64_t entries = 0;
};

using ObserverMetric = std::variant<RequestLatencyMetric, IndexSizeMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace semcache::observability
