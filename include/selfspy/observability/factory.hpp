#pragma once

#include "selfspy/config/schema.hpp"
#include "selfspy/observability/observer.hpp"

#include <memory>

namespace selfspy::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace selfspy::observability
