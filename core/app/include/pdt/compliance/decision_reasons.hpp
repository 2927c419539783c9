#pragma once

namespace pdt {
namespace reasons {

// Reason strings carried by TradeApprovalEvent. Consumers (dashboards, the
// execution collaborator) match on these, so they are part of the wire
// contract.
constexpr const char* kSwingTrade = "swing trade - unrestricted";
constexpr const char* kEmergencySlot = "emergency slot";
constexpr const char* kSlotAvailable = "slot available";
constexpr const char* kLimitReachedQueued =
    "limit reached, queued for weekly batch";
constexpr const char* kBatchApproved = "selected in weekly batch";
constexpr const char* kNotInTopN = "not in top-N this week";
constexpr const char* kNoSlotsAvailable = "no slots available";

}  // namespace reasons
}  // namespace pdt
