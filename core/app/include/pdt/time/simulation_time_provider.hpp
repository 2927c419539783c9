#pragma once

#include "pdt/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace pdt {

// -----------------------------------------------------------------------------
// SimulationTimeProvider: externally driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose "now" is whatever the owner last set.
//
// @details
// Lets tests walk the compliance tracker across week boundaries without
// sleeping: set the clock to a Friday, admit trades, advance to the next
// Monday and observe the reset.
//
// Thread model:
//   now_ms() and set_time()/advance_by() are atomic and may be called from
//   any thread. Monotonicity is not enforced; tests may jump backwards.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;
  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  // @brief  Sets the clock to an absolute epoch-millisecond value.
  void set_time(std::int64_t new_time_ms);

  // @brief  Moves the clock forward (or backward for negative deltas).
  void advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace pdt
