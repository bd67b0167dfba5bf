#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include "types.hpp"

namespace approval {

/**
 * Valid amount and period ranges for offers.
 *
 * An immutable value: build it once from configuration and pass it into the
 * policy, so several product lines can run with their own bounds.
 */
struct OfferBounds {
    double min_amount = 200;
    double max_amount = 5000;
    int32_t min_period = 6;
    int32_t max_period = 24;

    bool contains_amount(double amount) const {
        return amount >= min_amount && amount <= max_amount;
    }

    bool contains_period(int32_t period) const {
        return period >= min_period && period <= max_period;
    }

    /// Throws ConfigError if the ranges are empty or non-positive.
    void validate() const;
};

/// What to do with a request outside the bounds.
enum class RangeStrategy {
    Clamp,   ///< saturate to the nearest bound
    Reject,  ///< deny before any further computation
};

const char* to_string(RangeStrategy strategy);

/// Parse "clamp" or "reject". Throws ConfigError otherwise.
RangeStrategy parse_range_strategy(const std::string& name);

/// Normalized details, or the denial reason.
using RangeResult = std::variant<PurchaseDetails, Outcome>;

/**
 * Single entry point for raw request values.
 *
 * Everything downstream of apply() sees only in-range details.
 */
class RangePolicy {
public:
    explicit RangePolicy(RangeStrategy strategy = RangeStrategy::Clamp,
                         OfferBounds bounds = OfferBounds{});

    RangeResult apply(const PurchaseDetails& raw) const;

    /// Human readable reason for a range denial.
    std::string denial_message(Outcome outcome) const;

    RangeStrategy strategy() const { return strategy_; }
    const OfferBounds& bounds() const { return bounds_; }

private:
    RangeResult clamp(const PurchaseDetails& raw) const;
    RangeResult reject(const PurchaseDetails& raw) const;

    RangeStrategy strategy_;
    OfferBounds bounds_;
};

} // namespace approval
