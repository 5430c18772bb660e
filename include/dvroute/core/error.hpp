#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

#include "dvroute/core/types.hpp"

namespace dvroute::core {

// Invalid input or a broken exchange contract (e.g., relaxing against a
// router that is not a direct neighbor). Raised before any state changes.
struct ConfigurationError : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

// The round bound was reached without a quiet round.
class TopologyError : public std::runtime_error {
public:
  TopologyError(const std::string& what, std::int32_t rounds_attempted, RoundSnapshot last_snapshot)
    : std::runtime_error(what),
      rounds_attempted_(rounds_attempted),
      last_snapshot_(std::move(last_snapshot)) {}

  [[nodiscard]] std::int32_t rounds_attempted() const noexcept { return rounds_attempted_; }
  [[nodiscard]] const RoundSnapshot& last_snapshot() const noexcept { return last_snapshot_; }

private:
  std::int32_t rounds_attempted_ {0};
  RoundSnapshot last_snapshot_ {};
};

} // namespace dvroute::core
