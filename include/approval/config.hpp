#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "range_policy.hpp"

namespace approval {

constexpr int DEFAULT_PORT = 50410;

/**
 * Server configuration.
 *
 * Built from an optional JSON file, then environment overrides:
 *   PORT                    listening port
 *   APPROVAL_RANGE_STRATEGY "clamp" or "reject"
 *   APPROVAL_PROFILES_PATH  JSON profile file; demo profiles when unset
 */
struct ServiceConfig {
    int port = DEFAULT_PORT;
    RangeStrategy range_strategy = RangeStrategy::Clamp;
    OfferBounds bounds;
    std::string profiles_path;

    /// Throws ConfigError on wrong types, unknown strategy or bad bounds.
    static ServiceConfig from_json(const nlohmann::json& doc);

    /// Parse a JSON config file. Throws ConfigError.
    static ServiceConfig load(const std::string& path);

    void apply_env_overrides();

    RangePolicy range_policy() const { return RangePolicy(range_strategy, bounds); }

    nlohmann::json to_json() const;
};

} // namespace approval
