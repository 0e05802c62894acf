#include "semcache/observability/factory.hpp"

#include "semcache/common/fs.hpp"
#include "semcache/observability/log_observer.hpp"

#include <algorithm>

namespace semcache::observability {

common::Result<std::vector<ObserverBackend>> parse_backends(const std::string_view spec) {
  using BackendsResult = common::Result<std::vector<ObserverBackend>>;
  std::vector<ObserverBackend> backends;

  std::size_t begin = 0;
  while (begin <= spec.size()) {
    const std::size_t comma = std::min(spec.find(',', begin), spec.size());
    const std::string entry =
        common::to_lower(common::trim(std::string(spec.substr(begin, comma - begin))));
    begin = comma + 1;

    if (entry.empty()) {
      continue;
    }
    if (entry == "log") {
      backends.push_back(ObserverBackend::Log);
    } else if (entry == "verbose" || entry == "debug") {
      backends.push_back(ObserverBackend::Verbose);
    } else if (entry == "none" || entry == "noop") {
      backends.push_back(ObserverBackend::None);
    } else {
      return BackendsResult::failure(common::ErrorCode::ConfigError,
                                     "unknown observability backend: " + entry);
    }
  }
  return BackendsResult::success(std::move(backends));
}

FanoutObserver::FanoutObserver(std::vector<std::unique_ptr<IObserver>> sinks)
    : sinks_(std::move(sinks)) {}

void FanoutObserver::record_event(const ObserverEvent &event) {
  for (auto &sink : sinks_) {
    sink->record_event(event);
  }
}

void FanoutObserver::record_metric(const ObserverMetric &metric) {
  for (auto &sink : sinks_) {
    sink->record_metric(metric);
  }
}

void FanoutObserver::flush() {
  for (auto &sink : sinks_) {
    sink->flush();
  }
}

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  auto parsed = parse_backends(config.observability.backend);
  if (!parsed.ok()) {
    return std::make_unique<LogObserver>();
  }

  std::vector<std::unique_ptr<IObserver>> sinks;
  for (const auto backend : parsed.value()) {
    if (backend == ObserverBackend::Log) {
      sinks.push_back(std::make_unique<LogObserver>());
    } else if (backend == ObserverBackend::Verbose) {
      sinks.push_back(std::make_unique<LogObserver>(true));
    }
  }

  if (sinks.empty()) {
    return std::make_unique<NoopObserver>();
  }
  if (sinks.size() == 1) {
    return std::move(sinks.front());
  }
  return std::make_unique<FanoutObserver>(std::move(sinks));
}

} // namespace semcache::observability
