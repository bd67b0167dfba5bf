#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <nlohmann/json.hpp>
#include "types.hpp"

namespace approval {

/**
 * Source of customer risk profiles.
 *
 * lookup() returns std::nullopt for an unknown customer, which callers must
 * keep apart from a profile that exists but is flagged. Implementations must
 * allow concurrent lookups.
 */
class ProfileStore {
public:
    virtual ~ProfileStore() = default;

    virtual std::optional<CustomerProfile> lookup(const std::string& customer_id) const = 0;
};

/// Immutable in-memory store, filled once at construction.
class InMemoryProfileStore : public ProfileStore {
public:
    InMemoryProfileStore() = default;
    explicit InMemoryProfileStore(std::unordered_map<std::string, CustomerProfile> profiles)
        : profiles_(std::move(profiles)) {}

    std::optional<CustomerProfile> lookup(const std::string& customer_id) const override;

    size_t size() const { return profiles_.size(); }

    /// The demonstration customers: one flagged, three with factors 50, 100 and 500.
    static InMemoryProfileStore with_demo_profiles();

    /**
     * Build a store from a JSON object keyed by customer id:
     *   { "12345678912": { "flagged": false, "financial_factor": 50 } }
     * Throws ProfileStoreError on malformed entries.
     */
    static InMemoryProfileStore from_json(const nlohmann::json& doc);

    /// Read and parse a JSON profile file. Throws ProfileStoreError.
    static InMemoryProfileStore load_profiles(const std::string& path);

private:
    std::unordered_map<std::string, CustomerProfile> profiles_;
};

} // namespace approval
