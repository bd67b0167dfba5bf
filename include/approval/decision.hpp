#pragma once

#include <cstdint>
#include <string>
#include "profile_store.hpp"
#include "range_policy.hpp"
#include "types.hpp"

namespace approval {

/**
 * Decides whether a purchase can be financed, and on what terms.
 *
 * Order of evaluation: range policy, profile lookup, approval score,
 * capped maximum for the requested period, then the nearest later period.
 * Every path ends in a PurchaseResponse; nothing is thrown for a denial.
 *
 * Holds no mutable state. The store must outlive the decider.
 */
class PurchaseDecider {
public:
    PurchaseDecider(const ProfileStore& store, RangePolicy policy);

    /// The decider keeps a reference to the store; a temporary would dangle.
    PurchaseDecider(ProfileStore&& store, RangePolicy policy) = delete;

    PurchaseResponse evaluate(const std::string& customer_id, double amount,
                              int32_t period) const;

    PurchaseResponse evaluate(const PurchaseRequest& request) const;

    const RangePolicy& policy() const { return policy_; }

private:
    PurchaseResponse decide_offer(const CustomerProfile& profile,
                                  const PurchaseDetails& details) const;

    const ProfileStore& store_;
    RangePolicy policy_;
};

} // namespace approval
