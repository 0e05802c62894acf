#pragma once

#include "semcache/observability/observer.hpp"

#include <mutex>

namespace semcache::observability {

// Writes one "[LEVEL] message" line per event to stderr. DEBUG lines are only
// emitted when constructed with verbose = true.
class LogObserver final : public IObserver {
public:
  explicit LogObserver(bool verbose = false) : verbose_(verbose) {}

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  [[nodiscard]] std::string_view name() const override { return "log"; }

private:
  void log_line(std::string_view level, const std::string &message);

  bool verbose_ = false;
  std::mutex mutex_;
};

} // namespace semcache::observability
