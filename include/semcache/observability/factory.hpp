#pragma once

#include "semcache/common/result.hpp"
#include "semcache/config/schema.hpp"
#include "semcache/observability/observer.hpp"

#include <memory>
#include <string_view>
#include <vector>

namespace semcache::observability {

enum class ObserverBackend {
  Log,
  Verbose,
  None,
};

// Parses `observability.backend`: a comma list of log, verbose (or debug) and
// none (or noop). Blank entries are skipped; any other name is a ConfigError.
[[nodiscard]] common::Result<std::vector<ObserverBackend>> parse_backends(std::string_view spec);

class NoopObserver final : public IObserver {
public:
  void record_event(const ObserverEvent &) override {}
  void record_metric(const ObserverMetric &) override {}
  [[nodiscard]] std::string_view name() const override { return "noop"; }
};

// Hands each event and metric to every attached observer, in attach order.
class FanoutObserver final : public IObserver {
public:
  explicit FanoutObserver(std::vector<std::unique_ptr<IObserver>> sinks);

  [[nodiscard]] std::size_t size() const { return sinks_.size(); }

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "fanout"; }

private:
  std::vector<std::unique_ptr<IObserver>> sinks_;
};

// None entries contribute nothing, so a blank or "none" backend yields a
// NoopObserver. A backend that does not parse falls back to plain logging.
[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace semcache::observability
