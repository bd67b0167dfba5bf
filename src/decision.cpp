#include "approval/decision.hpp"
#include "approval/offer_math.hpp"
#include <utility>

namespace approval {

PurchaseDecider::PurchaseDecider(const ProfileStore& store, RangePolicy policy)
    : store_(store), policy_(std::move(policy)) {}

PurchaseResponse PurchaseDecider::evaluate(const std::string& customer_id, double amount,
                                           int32_t period) const {
    return evaluate(PurchaseRequest{customer_id, PurchaseDetails{amount, period}});
}

PurchaseResponse PurchaseDecider::evaluate(const PurchaseRequest& request) const {
    RangeResult range = policy_.apply(request.details);
    if (const auto* violation = std::get_if<Outcome>(&range)) {
        return PurchaseResponse::deny(*violation, policy_.denial_message(*violation));
    }
    const auto& details = std::get<PurchaseDetails>(range);

    auto profile = store_.lookup(request.customer_id);
    if (!profile) {
        return PurchaseResponse::deny(Outcome::CustomerNotFound, "Customer is not found.");
    }
    if (profile->flagged) {
        return PurchaseResponse::deny(Outcome::CustomerFlagged, "Customer is flagged.");
    }

    return decide_offer(*profile, details);
}

PurchaseResponse PurchaseDecider::decide_offer(const CustomerProfile& profile,
                                               const PurchaseDetails& details) const {
    const OfferBounds& bounds = policy_.bounds();
    const int32_t factor = profile.financial_factor;

    // Exactly the customer's maximum for this period
    if (offer::approval_score(factor, details.amount, details.period) == 1) {
        return PurchaseResponse::approve(
            Outcome::ExactMatch, details,
            "The maximum available offer is the same as the requested amount €" +
                format_amount(details.amount));
    }

    double max_amount = offer::max_amount_for_period(factor, details.period, bounds);
    if (max_amount >= bounds.min_amount) {
        return PurchaseResponse::approve(
            Outcome::MaximumOffer, PurchaseDetails{max_amount, details.period},
            "The maximum available offer is €" + format_amount(max_amount));
    }

    auto nearest = offer::find_nearest_offer(factor, details.period, bounds);
    if (nearest) {
        return PurchaseResponse::approve(
            Outcome::NearestOffer, *nearest,
            "Nearest offer - €" + format_amount(nearest->amount) + " in " +
                std::to_string(nearest->period) + " months");
    }

    return PurchaseResponse::deny(Outcome::NoValidOffer, "No valid offer found.");
}

} // namespace approval
