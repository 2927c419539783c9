#pragma once

#include "pdt/execution/i_execution_venue.hpp"
#include "pdt/time/i_time_provider.hpp"

namespace pdt {

// -----------------------------------------------------------------------------
// StubExecutionVenue: stands in when no broker is configured
// -----------------------------------------------------------------------------
// Every order "fills" immediately: order id STUB_<symbol>_<epoch seconds>,
// 100 shares at 100.0. Timestamps come from the injected ITimeProvider so
// order ids are deterministic under SimulationTimeProvider.
// -----------------------------------------------------------------------------
class StubExecutionVenue final : public IExecutionVenue {
 public:
  static constexpr double kQuantity = 100.0;
  static constexpr double kPrice = 100.0;

  explicit StubExecutionVenue(const ITimeProvider& clock) : clock_(clock) {}

  std::string name() const override { return "stub"; }

  std::optional<OrderFill> placeOrder(const SignalEvent& signal) override;

 private:
  const ITimeProvider& clock_;
};

}  // namespace pdt
