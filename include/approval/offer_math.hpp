#pragma once

#include <cstdint>
#include <optional>
#include "range_policy.hpp"
#include "types.hpp"

namespace approval {
namespace offer {

/**
 * Approval score = (financial factor / amount) * period.
 *
 * 1 means the amount is exactly the customer's maximum for the period,
 * above 1 means the customer qualifies for more, below 1 for less.
 * amount must be positive; RangePolicy guarantees it.
 */
double approval_score(int32_t financial_factor, double amount, int32_t period);

/// financial factor * period, capped at the bounds' maximum amount.
double max_amount_for_period(int32_t financial_factor, int32_t period,
                             const OfferBounds& bounds);

/**
 * Scan periods after the requested one, up to the maximum period, for the
 * first whose capped amount lies within the amount bounds.
 *
 * Returns std::nullopt when no such period exists.
 */
std::optional<PurchaseDetails> find_nearest_offer(int32_t financial_factor,
                                                  int32_t requested_period,
                                                  const OfferBounds& bounds);

} // namespace offer
} // namespace approval
