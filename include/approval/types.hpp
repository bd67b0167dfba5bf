#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace approval {

/// Risk profile of a customer, owned by the profile store.
struct CustomerProfile {
    bool flagged = false;
    /// Capacity per month of period. Meaningless when flagged (may be -1).
    int32_t financial_factor = 0;
};

/// Amount and period of a requested offer or of a counter-offer.
struct PurchaseDetails {
    double amount = 0;
    int32_t period = 0;
};

inline bool operator==(const PurchaseDetails& a, const PurchaseDetails& b) {
    return a.amount == b.amount && a.period == b.period;
}

inline bool operator!=(const PurchaseDetails& a, const PurchaseDetails& b) {
    return !(a == b);
}

struct PurchaseRequest {
    std::string customer_id;
    PurchaseDetails details;
};

/// Which branch of the decision produced a verdict.
enum class Outcome {
    ExactMatch,
    MaximumOffer,
    NearestOffer,
    AmountBelowMinimum,
    AmountAboveMaximum,
    PeriodBelowMinimum,
    PeriodAboveMaximum,
    InvalidAmount,
    CustomerNotFound,
    CustomerFlagged,
    NoValidOffer,
};

inline const char* to_string(Outcome outcome) {
    switch (outcome) {
    case Outcome::ExactMatch:
        return "exact-match";
    case Outcome::MaximumOffer:
        return "maximum-offer";
    case Outcome::NearestOffer:
        return "nearest-offer";
    case Outcome::AmountBelowMinimum:
        return "amount-below-minimum";
    case Outcome::AmountAboveMaximum:
        return "amount-above-maximum";
    case Outcome::PeriodBelowMinimum:
        return "period-below-minimum";
    case Outcome::PeriodAboveMaximum:
        return "period-above-maximum";
    case Outcome::InvalidAmount:
        return "invalid-amount";
    case Outcome::CustomerNotFound:
        return "customer-not-found";
    case Outcome::CustomerFlagged:
        return "customer-flagged";
    case Outcome::NoValidOffer:
        return "no-valid-offer";
    }

    return "no-valid-offer";
}

inline bool is_approval(Outcome outcome) {
    return outcome == Outcome::ExactMatch ||
           outcome == Outcome::MaximumOffer ||
           outcome == Outcome::NearestOffer;
}

/**
 * Verdict of a single decision.
 *
 * details is set if and only if approved is true; use approve() and deny()
 * to build one so the two never disagree.
 */
struct PurchaseResponse {
    bool approved = false;
    std::optional<PurchaseDetails> details;
    std::string message;
    Outcome outcome = Outcome::NoValidOffer;

    static PurchaseResponse approve(Outcome outcome, const PurchaseDetails& details,
                                    std::string message) {
        return PurchaseResponse{true, details, std::move(message), outcome};
    }

    static PurchaseResponse deny(Outcome outcome, std::string message) {
        return PurchaseResponse{false, std::nullopt, std::move(message), outcome};
    }
};

/// Format a currency amount for messages: two decimals, ".00" dropped.
std::string format_amount(double amount);

} // namespace approval
