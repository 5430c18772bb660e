/* Library-wide sentinels. */
#pragma once

#include <limits>

#include "dvroute/core/types.hpp"

namespace dvroute::core {

// Cost of a destination with no known path. Adding a finite link cost keeps it
// infinite, so an unreachable advertisement never yields a finite candidate.
inline constexpr Cost kInfCost = std::numeric_limits<Cost>::infinity();

// next_hop of an entry that has no route yet.
inline constexpr NodeId kNoNode = -1;

} // namespace dvroute::core
