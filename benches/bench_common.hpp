#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <functional>
#include <iostream>
#include <string>
#include <vector>

namespace semcache::bench {

// Times each call of `op` separately and prints total, median and p99 in
// microseconds. `op` returns false when the operation failed; failures are
// counted and reported next to the timings.
inline void run_bench(const std::string &name, const std::size_t iterations,
                      const std::function<bool()> &op) {
  using clock = std::chrono::steady_clock;
  std::vector<double> samples;
  samples.reserve(iterations);
  std::size_t failures = 0;

  for (std::size_t i = 0; i < iterations; ++i) {
    const auto start = clock::now();
    if (!op()) {
      ++failures;
    }
    samples.push_back(std::chrono::duration<double, std::micro>(clock::now() - start).count());
  }
  if (samples.empty()) {
    return;
  }

  double total = 0.0;
  for (const double sample : samples) {
    total += sample;
  }
  std::sort(samples.begin(), samples.end());
  const double p50 = samples[samples.size() / 2];
  const double p99 = samples[std::min(samples.size() - 1, samples.size() * 99 / 100)];

  std::cout << name << ": n=" << iterations << " total_us=" << static_cast<long long>(total)
            << " p50_us=" << p50 << " p99_us=" << p99;
  if (failures > 0) {
    std::cout << " failures=" << failures;
  }
  std::cout << "\n";
}

} // namespace semcache::bench
