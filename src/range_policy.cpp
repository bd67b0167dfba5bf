#include "approval/range_policy.hpp"
#include "approval/errors.hpp"
#include <algorithm>
#include <cmath>

namespace approval {

void OfferBounds::validate() const {
    if (!(min_amount > 0)) {
        throw ConfigError("min_amount must be positive");
    }
    if (!(max_amount >= min_amount)) {
        throw ConfigError("max_amount must not be below min_amount");
    }
    if (min_period <= 0) {
        throw ConfigError("min_period must be positive");
    }
    if (max_period < min_period) {
        throw ConfigError("max_period must not be below min_period");
    }
}

const char* to_string(RangeStrategy strategy) {
    switch (strategy) {
    case RangeStrategy::Clamp:
        return "clamp";
    case RangeStrategy::Reject:
        return "reject";
    }

    return "clamp";
}

RangeStrategy parse_range_strategy(const std::string& name) {
    if (name == "clamp") {
        return RangeStrategy::Clamp;
    }
    if (name == "reject") {
        return RangeStrategy::Reject;
    }
    throw ConfigError("Unknown range strategy: " + name + " (expected clamp or reject)");
}

RangePolicy::RangePolicy(RangeStrategy strategy, OfferBounds bounds)
    : strategy_(strategy), bounds_(bounds) {
    bounds_.validate();
}

RangeResult RangePolicy::apply(const PurchaseDetails& raw) const {
    // NaN compares false against both bounds
    if (std::isnan(raw.amount)) {
        return Outcome::InvalidAmount;
    }
    return strategy_ == RangeStrategy::Reject ? reject(raw) : clamp(raw);
}

RangeResult RangePolicy::clamp(const PurchaseDetails& raw) const {
    PurchaseDetails details;
    details.amount = std::clamp(raw.amount, bounds_.min_amount, bounds_.max_amount);
    details.period = std::clamp(raw.period, bounds_.min_period, bounds_.max_period);
    return details;
}

RangeResult RangePolicy::reject(const PurchaseDetails& raw) const {
    if (raw.amount < bounds_.min_amount) {
        return Outcome::AmountBelowMinimum;
    }
    if (raw.amount > bounds_.max_amount) {
        return Outcome::AmountAboveMaximum;
    }
    if (raw.period < bounds_.min_period) {
        return Outcome::PeriodBelowMinimum;
    }
    if (raw.period > bounds_.max_period) {
        return Outcome::PeriodAboveMaximum;
    }
    return raw;
}

std::string RangePolicy::denial_message(Outcome outcome) const {
    switch (outcome) {
    case Outcome::AmountBelowMinimum:
        return "Requested amount is below the minimum of €" + format_amount(bounds_.min_amount) + ".";
    case Outcome::AmountAboveMaximum:
        return "Requested amount is above the maximum of €" + format_amount(bounds_.max_amount) + ".";
    case Outcome::PeriodBelowMinimum:
        return "Requested period is below the minimum of " +
               std::to_string(bounds_.min_period) + " months.";
    case Outcome::PeriodAboveMaximum:
        return "Requested period is above the maximum of " +
               std::to_string(bounds_.max_period) + " months.";
    case Outcome::InvalidAmount:
        return "Requested amount is not a valid number.";
    default:
        return std::string("Request is out of range: ") + to_string(outcome);
    }
}

} // namespace approval
