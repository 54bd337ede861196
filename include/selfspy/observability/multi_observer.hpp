#pragma once

#include "selfspy/observability/observer.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <vector>

namespace selfspy::observability {

/// Fans every event and metric out to its sinks. A sink that throws is
/// reported on stderr and skipped for that call; the remaining sinks still
/// run, so capture callbacks never see an observer failure.
class MultiObserver final : public IObserver {
public:
  void add(std::unique_ptr<IObserver> observer);
  [[nodiscard]] std::size_t size() const { return sinks_.size(); }
  [[nodiscard]] std::uint64_t sink_failures() const { return failures_.load(); }

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "multi"; }

private:
  template <typename Fn> void each_sink(const char *what, Fn &&fn);

  std::vector<std::unique_ptr<IObserver>> sinks_;
  std::atomic<std::uint64_t> failures_{0};
};

} // namespace selfspy::observability
