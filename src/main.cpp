#include <memory>
#include <string>
#include <grpcpp/grpcpp.h>
#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include <grpcpp/health_check_service_interface.h>

#include "approval/config.hpp"
#include "approval/decision.hpp"
#include "approval/errors.hpp"
#include "approval/logging.hpp"
#include "approval/profile_store.hpp"
#include "approval/purchase_service.hpp"

namespace {

constexpr const char* SERVER_DOMAIN = "purchase";

approval::InMemoryProfileStore open_profile_store(const approval::ServiceConfig& config) {
    if (config.profiles_path.empty()) {
        approval::log_warn(SERVER_DOMAIN, "using_demo_profiles");
        return approval::InMemoryProfileStore::with_demo_profiles();
    }
    return approval::InMemoryProfileStore::load_profiles(config.profiles_path);
}

} // anonymous namespace

int main(int argc, char** argv) {
    approval::ServiceConfig config;
    approval::RangePolicy policy;
    std::unique_ptr<approval::InMemoryProfileStore> store;
    try {
        if (argc > 1) {
            config = approval::ServiceConfig::load(argv[1]);
        }
        config.apply_env_overrides();
        policy = config.range_policy();
        store = std::make_unique<approval::InMemoryProfileStore>(open_profile_store(config));
    } catch (const approval::ApprovalError& e) {
        approval::log_error(SERVER_DOMAIN, "startup_failed", {{"error", e.what()}});
        return 1;
    }

    approval::PurchaseDecider decider(*store, policy);
    auto service = approval::create_purchase_service(decider);

    std::string server_address = "0.0.0.0:" + std::to_string(config.port);

    grpc::EnableDefaultHealthCheckService(true);
    grpc::reflection::InitProtoReflectionServerBuilderPlugin();

    grpc::ServerBuilder builder;
    builder.AddListeningPort(server_address, grpc::InsecureServerCredentials());
    builder.RegisterService(service.get());

    std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
    if (!server) {
        approval::log_error(SERVER_DOMAIN, "server_start_failed", {{"address", server_address}});
        return 1;
    }

    approval::log_info(SERVER_DOMAIN, "purchase_approval_server_started",
        {{"address", server_address},
         {"profiles", store->size()},
         {"config", config.to_json()}});

    server->Wait();

    return 0;
}
