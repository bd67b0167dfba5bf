#pragma once

#include <stdexcept>
#include <string>
#include <grpcpp/grpcpp.h>

namespace approval {

/**
 * Base exception for infrastructure faults around the decision.
 *
 * Business denials are never thrown; they come back as a PurchaseResponse.
 */
class ApprovalError : public std::runtime_error {
public:
    explicit ApprovalError(const std::string& message)
        : std::runtime_error(message) {}

    /**
     * Returns true if the error was caused by invalid configuration.
     */
    virtual bool is_config_error() const { return false; }

    /**
     * Returns true if the profile source could not serve the lookup.
     */
    virtual bool is_store_error() const { return false; }

    virtual grpc::Status to_grpc_status() const {
        return grpc::Status(grpc::StatusCode::INTERNAL, what());
    }
};

/**
 * Thrown when a configuration value or file is invalid.
 * Maps to gRPC INVALID_ARGUMENT status.
 */
class ConfigError : public ApprovalError {
public:
    explicit ConfigError(const std::string& message)
        : ApprovalError(message) {}

    bool is_config_error() const override { return true; }

    grpc::Status to_grpc_status() const override {
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, what());
    }
};

/**
 * Thrown when customer profiles cannot be loaded or read.
 * Maps to gRPC UNAVAILABLE status.
 */
class ProfileStoreError : public ApprovalError {
public:
    explicit ProfileStoreError(const std::string& message)
        : ApprovalError(message) {}

    bool is_store_error() const override { return true; }

    grpc::Status to_grpc_status() const override {
        return grpc::Status(grpc::StatusCode::UNAVAILABLE, what());
    }
};

} // namespace approval
