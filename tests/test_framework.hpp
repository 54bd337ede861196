#pragma once

#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace selfspy::tests {

struct TestCase {
  std::string name;
  std::function<void()> fn;
};

inline void require(bool condition, const std::string &message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

/// Fails with the carried error text when a Status or Result is not ok.
template <typename Outcome> void require_ok(const Outcome &outcome, const std::string &context) {
  if (!outcome.ok()) {
    throw std::runtime_error(context + ": " + outcome.error());
  }
}

} // namespace selfspy::tests
