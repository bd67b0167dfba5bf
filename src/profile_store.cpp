#include "approval/profile_store.hpp"
#include "approval/errors.hpp"
#include <cstdint>
#include <fstream>
#include <limits>

namespace approval {

namespace {

bool fits_int32(const nlohmann::json& value) {
    if (value.is_number_unsigned()) {
        return value.get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int32_t>::max());
    }
    int64_t n = value.get<int64_t>();
    return n >= std::numeric_limits<int32_t>::min() && n <= std::numeric_limits<int32_t>::max();
}

} // anonymous namespace

std::optional<CustomerProfile> InMemoryProfileStore::lookup(const std::string& customer_id) const {
    auto it = profiles_.find(customer_id);
    if (it == profiles_.end()) {
        return std::nullopt;
    }
    return it->second;
}

InMemoryProfileStore InMemoryProfileStore::with_demo_profiles() {
    return InMemoryProfileStore({
        {"12345678901", CustomerProfile{true, -1}},    // ineligible
        {"12345678912", CustomerProfile{false, 50}},
        {"12345678923", CustomerProfile{false, 100}},
        {"12345678934", CustomerProfile{false, 500}},
    });
}

InMemoryProfileStore InMemoryProfileStore::from_json(const nlohmann::json& doc) {
    if (!doc.is_object()) {
        throw ProfileStoreError("Profile document must be a JSON object keyed by customer id");
    }

    std::unordered_map<std::string, CustomerProfile> profiles;
    for (const auto& [customer_id, entry] : doc.items()) {
        if (customer_id.empty()) {
            throw ProfileStoreError("Profile with empty customer id");
        }
        if (!entry.is_object()) {
            throw ProfileStoreError("Profile for " + customer_id + " must be an object");
        }
        const auto flagged = entry.find("flagged");
        const auto factor = entry.find("financial_factor");
        if (flagged != entry.end() && !flagged->is_boolean()) {
            throw ProfileStoreError("Profile for " + customer_id + ": flagged must be a boolean");
        }
        if (factor == entry.end() || !factor->is_number_integer()) {
            throw ProfileStoreError("Profile for " + customer_id +
                                    ": financial_factor must be an integer");
        }
        if (!fits_int32(*factor)) {
            throw ProfileStoreError("Profile for " + customer_id +
                                    ": financial_factor out of range: " + factor->dump());
        }

        CustomerProfile profile;
        profile.flagged = flagged != entry.end() && flagged->get<bool>();
        profile.financial_factor = static_cast<int32_t>(factor->get<int64_t>());
        profiles.emplace(customer_id, profile);
    }
    return InMemoryProfileStore(std::move(profiles));
}

InMemoryProfileStore InMemoryProfileStore::load_profiles(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ProfileStoreError("Cannot open profile file: " + path);
    }

    nlohmann::json doc;
    try {
        in >> doc;
    } catch (const nlohmann::json::parse_error& e) {
        throw ProfileStoreError("Malformed profile file " + path + ": " + e.what());
    }
    return from_json(doc);
}

} // namespace approval
