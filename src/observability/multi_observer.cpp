#include "selfspy/observability/multi_observer.hpp"

#include <exception>
#include <iostream>

namespace selfspy::observability {

void MultiObserver::add(std::unique_ptr<IObserver> observer) {
  if (observer == nullptr) {
    return;
  }
  sinks_.push_back(std::move(observer));
}

template <typename Fn> void MultiObserver::each_sink(const char *what, Fn &&fn) {
  for (const auto &sink : sinks_) {
    try {
      fn(*sink);
    } catch (const std::exception &e) {
      ++failures_;
      std::cerr << "[ERROR] observer " << sink->name() << " failed to " << what << ": "
                << e.what() << '\n';
    }
  }
}

void MultiObserver::record_event(const ObserverEvent &event) {
  each_sink("record event", [&event](IObserver &sink) { sink.record_event(event); });
}

void MultiObserver::record_metric(const ObserverMetric &metric) {
  each_sink("record metric", [&metric](IObserver &sink) { sink.record_metric(metric); });
}

void MultiObserver::flush() {
  each_sink("flush", [](IObserver &sink) { sink.flush(); });
}

} // namespace selfspy::observability
