#pragma once

#include <cstdint>

namespace pdt {

// -----------------------------------------------------------------------------
// ITimeProvider: abstract time source
// -----------------------------------------------------------------------------
//
// @brief  Answers "what time is it?" for every component that makes a
//         time-dependent decision.
//
// @details
// The compliance window is anchored to calendar weeks, so the tracker must
// be able to observe a Monday rollover on demand. Components never call
// std::chrono::system_clock directly; they receive a `const ITimeProvider&`
// and the owner decides whether it is live or simulated:
//
//   - LiveTimeProvider       → wall clock (production).
//   - SimulationTimeProvider → value set by tests or replay harnesses.
//
// Time is expressed as int64 milliseconds since the Unix epoch (UTC). The
// week arithmetic in time_utils.hpp works on the same representation.
//
// Thread-safety contract:
//   Implementations must be safe for concurrent reads from any thread.
//
// Ownership:
//   Components hold a const reference; the provider must outlive them.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // @brief  Current time in epoch milliseconds (UTC).
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace pdt
