#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <iostream>
#include <string>

namespace selfspy::bench {

/// Times `iterations` calls of `fn`. Each call is taken to handle
/// `events_per_call` activity events, which sets the reported event rate.
inline void run_bench(const std::string &name, const int iterations,
                      const std::function<void()> &fn, const std::uint64_t events_per_call = 1) {
  const auto start = std::chrono::steady_clock::now();
  for (int i = 0; i < iterations; ++i) {
    fn();
  }
  const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
                           std::chrono::steady_clock::now() - start)
                           .count();
  const double avg_us = static_cast<double>(elapsed) / iterations;
  const double events = static_cast<double>(events_per_call) * iterations;
  const double events_per_sec = elapsed > 0 ? events * 1'000'000.0 / elapsed : 0.0;
  std::cout << name << ": iterations=" << iterations << " avg_us=" << avg_us
            << " events_per_sec=" << static_cast<std::uint64_t>(events_per_sec) << "\n";
}

} // namespace selfspy::bench
