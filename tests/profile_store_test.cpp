#include <gtest/gtest.h>
#include <limits>
#include <string>
#include <nlohmann/json.hpp>
#include "approval/errors.hpp"
#include "approval/profile_store.hpp"

using namespace approval;

namespace {
const std::string kDataDir = APPROVAL_TEST_DATA_DIR;
}

// =============================================================================
// Demo Profiles Tests
// =============================================================================

TEST(ProfileStoreTest, DemoProfiles_ShouldContainFourCustomers) {
    auto store = InMemoryProfileStore::with_demo_profiles();

    EXPECT_EQ(store.size(), 4u);
}

TEST(ProfileStoreTest, DemoProfiles_IneligibleCustomer_ShouldBeFlagged) {
    auto store = InMemoryProfileStore::with_demo_profiles();

    auto profile = store.lookup("12345678901");

    ASSERT_TRUE(profile.has_value());
    EXPECT_TRUE(profile->flagged);
}

TEST(ProfileStoreTest, DemoProfiles_ShouldCarryFinancialFactors) {
    auto store = InMemoryProfileStore::with_demo_profiles();

    EXPECT_EQ(store.lookup("12345678912")->financial_factor, 50);
    EXPECT_EQ(store.lookup("12345678923")->financial_factor, 100);
    EXPECT_EQ(store.lookup("12345678934")->financial_factor, 500);
    EXPECT_FALSE(store.lookup("12345678934")->flagged);
}

TEST(ProfileStoreTest, Lookup_UnknownId_ShouldReturnNullopt) {
    auto store = InMemoryProfileStore::with_demo_profiles();

    EXPECT_FALSE(store.lookup("99999999999").has_value());
    EXPECT_FALSE(store.lookup("").has_value());
}

// =============================================================================
// JSON Loading Tests
// =============================================================================

TEST(ProfileStoreTest, FromJson_FlaggedDefaultsToFalse) {
    auto store = InMemoryProfileStore::from_json(nlohmann::json::parse(R"({
        "42": { "financial_factor": 75 }
    })"));

    auto profile = store.lookup("42");
    ASSERT_TRUE(profile.has_value());
    EXPECT_FALSE(profile->flagged);
    EXPECT_EQ(profile->financial_factor, 75);
}

TEST(ProfileStoreTest, FromJson_MissingFactor_ShouldThrow) {
    auto doc = nlohmann::json::parse(R"({ "42": { "flagged": false } })");

    EXPECT_THROW(InMemoryProfileStore::from_json(doc), ProfileStoreError);
}

TEST(ProfileStoreTest, FromJson_WrongTypes_ShouldThrow) {
    EXPECT_THROW(InMemoryProfileStore::from_json(nlohmann::json::array()), ProfileStoreError);
    EXPECT_THROW(InMemoryProfileStore::from_json(nlohmann::json::parse(R"({ "42": 7 })")),
                 ProfileStoreError);
    EXPECT_THROW(InMemoryProfileStore::from_json(
                     nlohmann::json::parse(R"({ "42": { "financial_factor": 1.5 } })")),
                 ProfileStoreError);
}

TEST(ProfileStoreTest, FromJson_FactorOutsideInt32_ShouldThrow) {
    EXPECT_THROW(InMemoryProfileStore::from_json(
                     nlohmann::json::parse(R"({ "42": { "financial_factor": 4294967196 } })")),
                 ProfileStoreError);
    EXPECT_THROW(InMemoryProfileStore::from_json(
                     nlohmann::json::parse(R"({ "42": { "financial_factor": 5000000000 } })")),
                 ProfileStoreError);
    EXPECT_THROW(InMemoryProfileStore::from_json(
                     nlohmann::json::parse(R"({ "42": { "financial_factor": -2147483649 } })")),
                 ProfileStoreError);
}

TEST(ProfileStoreTest, FromJson_FactorAtInt32Limits_ShouldLoad) {
    auto store = InMemoryProfileStore::from_json(nlohmann::json::parse(R"({
        "max": { "financial_factor": 2147483647 },
        "min": { "financial_factor": -2147483648 }
    })"));

    EXPECT_EQ(store.lookup("max")->financial_factor, std::numeric_limits<int32_t>::max());
    EXPECT_EQ(store.lookup("min")->financial_factor, std::numeric_limits<int32_t>::min());
}

TEST(ProfileStoreTest, LoadProfiles_ValidFile_ShouldLoadAll) {
    auto store = InMemoryProfileStore::load_profiles(kDataDir + "/profiles.json");

    EXPECT_EQ(store.size(), 3u);
    EXPECT_TRUE(store.lookup("10000000001")->flagged);
    EXPECT_EQ(store.lookup("10000000002")->financial_factor, 15);
    EXPECT_EQ(store.lookup("10000000003")->financial_factor, 250);
}

TEST(ProfileStoreTest, LoadProfiles_MissingFile_ShouldThrowStoreError) {
    try {
        InMemoryProfileStore::load_profiles(kDataDir + "/does_not_exist.json");
        FAIL() << "Expected ProfileStoreError";
    } catch (const ProfileStoreError& e) {
        EXPECT_TRUE(e.is_store_error());
        EXPECT_EQ(e.to_grpc_status().error_code(), grpc::StatusCode::UNAVAILABLE);
    }
}

TEST(ProfileStoreTest, LoadProfiles_MalformedFile_ShouldThrowStoreError) {
    EXPECT_THROW(InMemoryProfileStore::load_profiles(kDataDir + "/profiles_malformed.json"),
                 ProfileStoreError);
}
