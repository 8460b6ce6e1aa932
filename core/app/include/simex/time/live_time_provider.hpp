#pragma once

#include "simex/time/i_time_provider.hpp"

namespace simex {

// -----------------------------------------------------------------------------
// LiveTimeProvider — wall-clock ITimeProvider used by the live paper runner.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace simex
