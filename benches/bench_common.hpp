#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <iostream>
#include <string>

namespace shellgate::bench {

// `items` is the number of commands one call of `fn` evaluates; the per-item average is
// what a single hook invocation costs.
inline void run_bench(const std::string &name, int iterations, const std::function<void()> &fn,
                      std::size_t items = 1) {
  fn();
  const auto start = std::chrono::steady_clock::now();
  for (int i = 0; i < iterations; ++i) {
    fn();
  }
  const auto end = std::chrono::steady_clock::now();
  const auto total =
      std::chrono::duration_cast<std::chrono::microseconds>(end - start).count();
  const double calls = static_cast<double>(iterations) * static_cast<double>(items);
  std::cout << name << ": iterations=" << iterations << " items=" << items
            << " total_us=" << total << " avg_us_per_item=" << static_cast<double>(total) / calls
            << "\n";
}

} // namespace shellgate::bench
