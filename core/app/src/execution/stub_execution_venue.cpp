#include "pdt/execution/stub_execution_venue.hpp"

#include <iostream>

namespace pdt {

std::optional<OrderFill> StubExecutionVenue::placeOrder(
    const SignalEvent& signal) {
  OrderFill fill;
  fill.order_id =
      "STUB_" + signal.symbol + "_" + std::to_string(clock_.now_ms() / 1000);
  fill.quantity = kQuantity;
  fill.price = kPrice;

  std::cerr << "[StubExecutionVenue] WARNING: using stub execution for "
            << signal.symbol << "\n";
  return fill;
}

}  // namespace pdt
