#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>
#include "approval/purchase.grpc.pb.h"
#include "decision.hpp"

namespace approval {

/// gRPC front end for PurchaseDecider. Denials are OK responses.
class PurchaseApprovalService final : public proto::PurchaseApproval::Service {
public:
    explicit PurchaseApprovalService(const PurchaseDecider& decider)
        : decider_(decider) {}

    grpc::Status EvaluatePurchase(grpc::ServerContext* context,
                                  const proto::PurchaseRequest* request,
                                  proto::PurchaseResponse* response) override;

    grpc::Status GetLimits(grpc::ServerContext* context,
                           const proto::GetLimitsRequest* request,
                           proto::OfferLimits* response) override;

private:
    const PurchaseDecider& decider_;
};

namespace convert {

PurchaseRequest from_proto(const proto::PurchaseRequest& request);

void to_proto(const PurchaseResponse& response, proto::PurchaseResponse* out);

proto::Outcome to_proto(Outcome outcome);

} // namespace convert

std::unique_ptr<PurchaseApprovalService> create_purchase_service(const PurchaseDecider& decider);

} // namespace approval
