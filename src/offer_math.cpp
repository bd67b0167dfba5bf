#include "approval/offer_math.hpp"
#include <algorithm>

namespace approval {
namespace offer {

double approval_score(int32_t financial_factor, double amount, int32_t period) {
    return (financial_factor / amount) * period;
}

double max_amount_for_period(int32_t financial_factor, int32_t period,
                             const OfferBounds& bounds) {
    // Widen before multiplying; factor * period can exceed int32.
    double amount = static_cast<double>(financial_factor) * period;
    return std::min(amount, bounds.max_amount);
}

std::optional<PurchaseDetails> find_nearest_offer(int32_t financial_factor,
                                                  int32_t requested_period,
                                                  const OfferBounds& bounds) {
    if (requested_period >= bounds.max_period) {
        return std::nullopt;
    }
    for (int32_t months = requested_period + 1; months <= bounds.max_period; ++months) {
        double amount = max_amount_for_period(financial_factor, months, bounds);
        if (bounds.contains_amount(amount)) {
            return PurchaseDetails{amount, months};
        }
    }
    return std::nullopt;
}

} // namespace offer
} // namespace approval
