#pragma once

#include "pdt/events/event_types.hpp"

#include <optional>
#include <string>

namespace pdt {

// -----------------------------------------------------------------------------
// ISignalStrategy: signal-generation seam
// -----------------------------------------------------------------------------
//
// @brief  Turns one market data observation into at most one signal.
//
// @details
// Concrete strategies live outside the scheduler. The SchedulerEngine runs
// every registered strategy for each MarketDataEvent on its analysis loop
// thread and emits the returned signals on "signal.generated". Hold signals
// and signals with confidence <= 0 are dropped there, so strategies may
// return them freely.
//
// An exception thrown from analyze() is logged and skips that strategy for
// that event only.
//
// Thread model:
//   analyze() is only ever called from the analysis loop thread.
// -----------------------------------------------------------------------------
class ISignalStrategy {
 public:
  virtual ~ISignalStrategy() = default;

  virtual std::string name() const = 0;

  virtual std::optional<SignalEvent> analyze(const MarketDataEvent& event) = 0;
};

}  // namespace pdt
