#pragma once

#include "selfspy/observability/observer.hpp"

#include <mutex>

namespace selfspy::observability {

/// Writes one `[LEVEL] message` line per event to stderr.
class LogObserver final : public IObserver {
public:
  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "log"; }

private:
  void write_line(const char *level, const std::string &message);

  std::mutex mutex_;
};

} // namespace selfspy::observability
