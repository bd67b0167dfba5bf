#include "approval/purchase_service.hpp"
#include "approval/errors.hpp"
#include "approval/logging.hpp"

namespace approval {

namespace convert {

PurchaseRequest from_proto(const proto::PurchaseRequest& request) {
    PurchaseRequest out;
    out.customer_id = request.customer_id();
    // Missing details read as zeros; the range policy decides what that means
    out.details.amount = request.details().amount();
    out.details.period = request.details().period();
    return out;
}

proto::Outcome to_proto(Outcome outcome) {
    switch (outcome) {
    case Outcome::ExactMatch:
        return proto::EXACT_MATCH;
    case Outcome::MaximumOffer:
        return proto::MAXIMUM_OFFER;
    case Outcome::NearestOffer:
        return proto::NEAREST_OFFER;
    case Outcome::AmountBelowMinimum:
        return proto::AMOUNT_BELOW_MINIMUM;
    case Outcome::AmountAboveMaximum:
        return proto::AMOUNT_ABOVE_MAXIMUM;
    case Outcome::PeriodBelowMinimum:
        return proto::PERIOD_BELOW_MINIMUM;
    case Outcome::PeriodAboveMaximum:
        return proto::PERIOD_ABOVE_MAXIMUM;
    case Outcome::InvalidAmount:
        return proto::INVALID_AMOUNT;
    case Outcome::CustomerNotFound:
        return proto::CUSTOMER_NOT_FOUND;
    case Outcome::CustomerFlagged:
        return proto::CUSTOMER_FLAGGED;
    case Outcome::NoValidOffer:
        return proto::NO_VALID_OFFER;
    }

    return proto::OUTCOME_UNSPECIFIED;
}

void to_proto(const PurchaseResponse& response, proto::PurchaseResponse* out) {
    out->set_approved(response.approved);
    out->set_message(response.message);
    out->set_outcome(to_proto(response.outcome));
    if (response.details) {
        auto* details = out->mutable_details();
        details->set_amount(response.details->amount);
        details->set_period(response.details->period);
    } else {
        out->clear_details();
    }
}

} // namespace convert

grpc::Status PurchaseApprovalService::EvaluatePurchase(grpc::ServerContext* context,
                                                       const proto::PurchaseRequest* request,
                                                       proto::PurchaseResponse* response) {
    try {
        auto decision = decider_.evaluate(convert::from_proto(*request));
        convert::to_proto(decision, response);

        log_info("purchase", "purchase_evaluated",
            {{"customer_id", request->customer_id()},
             {"outcome", to_string(decision.outcome)},
             {"approved", decision.approved}});
        return grpc::Status::OK;

    } catch (const ApprovalError& e) {
        log_error("purchase", "purchase_evaluation_failed",
            {{"customer_id", request->customer_id()}, {"error", e.what()}});
        return e.to_grpc_status();
    } catch (const std::exception& e) {
        log_error("purchase", "purchase_evaluation_failed",
            {{"customer_id", request->customer_id()}, {"error", e.what()}});
        return grpc::Status(grpc::StatusCode::INTERNAL, e.what());
    }
}

grpc::Status PurchaseApprovalService::GetLimits(grpc::ServerContext* context,
                                                const proto::GetLimitsRequest* request,
                                                proto::OfferLimits* response) {
    const RangePolicy& policy = decider_.policy();
    const OfferBounds& bounds = policy.bounds();

    response->set_min_amount(bounds.min_amount);
    response->set_max_amount(bounds.max_amount);
    response->set_min_period(bounds.min_period);
    response->set_max_period(bounds.max_period);
    response->set_range_strategy(to_string(policy.strategy()));
    return grpc::Status::OK;
}

std::unique_ptr<PurchaseApprovalService> create_purchase_service(const PurchaseDecider& decider) {
    return std::make_unique<PurchaseApprovalService>(decider);
}

} // namespace approval
