#pragma once

#include "simex/domain/side.hpp"
#include "simex/time/time_utils.hpp"

namespace simex {
namespace domain {

// -----------------------------------------------------------------------------
// Signal — directional trade intent emitted once per bar by a strategy
// -----------------------------------------------------------------------------
//
// @brief  What the strategy wants to do before risk and sizing have had their
//         say.
//
// @details
// `size` is a magnitude; `side` carries the direction. The sizing stage
// overwrites it and the risk manager may hand back a copy with a smaller
// size, so the pipeline always works with the latest returned value rather
// than mutating the strategy's object. A size of 0 is a no-op.
//
// `confidence` is in [0, 1] and is informational for the engine.
// -----------------------------------------------------------------------------
struct Signal {
  Timestamp timestamp{};
  Side side{Side::Buy};
  double confidence{1.0};
  double size{0.0};
};

}  // namespace domain
}  // namespace simex
