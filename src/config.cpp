#include "approval/config.hpp"
#include "approval/errors.hpp"
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <limits>

namespace approval {

namespace {

int check_port(int64_t port) {
    if (port <= 0 || port > 65535) {
        throw ConfigError("Port out of range: " + std::to_string(port));
    }
    return static_cast<int>(port);
}

int parse_port(const std::string& text) {
    try {
        size_t consumed = 0;
        long long port = std::stoll(text, &consumed);
        if (consumed == text.size()) {
            return check_port(port);
        }
    } catch (const std::logic_error&) {
        // fall through to the error below
    }
    throw ConfigError("Invalid port: " + text);
}

template<typename T>
T require_number(const nlohmann::json& obj, const char* key, T fallback) {
    auto it = obj.find(key);
    if (it == obj.end()) {
        return fallback;
    }
    if (!it->is_number()) {
        throw ConfigError(std::string(key) + " must be a number");
    }
    return it->get<T>();
}

int32_t require_int32(const nlohmann::json& obj, const char* key, int32_t fallback) {
    auto it = obj.find(key);
    if (it == obj.end()) {
        return fallback;
    }
    if (!it->is_number_integer()) {
        throw ConfigError(std::string(key) + " must be an integer");
    }
    bool in_range = it->is_number_unsigned()
        ? it->get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int32_t>::max())
        : it->get<int64_t>() >= std::numeric_limits<int32_t>::min() &&
          it->get<int64_t>() <= std::numeric_limits<int32_t>::max();
    if (!in_range) {
        throw ConfigError(std::string(key) + " out of range: " + it->dump());
    }
    return static_cast<int32_t>(it->get<int64_t>());
}

} // anonymous namespace

ServiceConfig ServiceConfig::from_json(const nlohmann::json& doc) {
    if (!doc.is_object()) {
        throw ConfigError("Config must be a JSON object");
    }

    ServiceConfig config;

    if (auto it = doc.find("port"); it != doc.end()) {
        if (!it->is_number_integer()) {
            throw ConfigError("port must be an integer");
        }
        if (it->is_number_unsigned() &&
            it->get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            throw ConfigError("Port out of range: " + it->dump());
        }
        config.port = check_port(it->get<int64_t>());
    }

    if (auto it = doc.find("range_strategy"); it != doc.end()) {
        if (!it->is_string()) {
            throw ConfigError("range_strategy must be a string");
        }
        config.range_strategy = parse_range_strategy(it->get<std::string>());
    }

    if (auto it = doc.find("bounds"); it != doc.end()) {
        if (!it->is_object()) {
            throw ConfigError("bounds must be an object");
        }
        const auto& b = *it;
        config.bounds.min_amount = require_number<double>(b, "min_amount", config.bounds.min_amount);
        config.bounds.max_amount = require_number<double>(b, "max_amount", config.bounds.max_amount);
        config.bounds.min_period = require_int32(b, "min_period", config.bounds.min_period);
        config.bounds.max_period = require_int32(b, "max_period", config.bounds.max_period);
        config.bounds.validate();
    }

    if (auto it = doc.find("profiles_path"); it != doc.end()) {
        if (!it->is_string()) {
            throw ConfigError("profiles_path must be a string");
        }
        config.profiles_path = it->get<std::string>();
    }

    return config;
}

ServiceConfig ServiceConfig::load(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("Cannot open config file: " + path);
    }

    nlohmann::json doc;
    try {
        in >> doc;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("Malformed config file " + path + ": " + e.what());
    }
    return from_json(doc);
}

void ServiceConfig::apply_env_overrides() {
    if (const char* port_env = std::getenv("PORT")) {
        port = parse_port(port_env);
    }
    if (const char* strategy_env = std::getenv("APPROVAL_RANGE_STRATEGY")) {
        range_strategy = parse_range_strategy(strategy_env);
    }
    if (const char* profiles_env = std::getenv("APPROVAL_PROFILES_PATH")) {
        profiles_path = profiles_env;
    }
}

nlohmann::json ServiceConfig::to_json() const {
    return {
        {"port", port},
        {"range_strategy", to_string(range_strategy)},
        {"bounds", {
            {"min_amount", bounds.min_amount},
            {"max_amount", bounds.max_amount},
            {"min_period", bounds.min_period},
            {"max_period", bounds.max_period}
        }},
        {"profiles_path", profiles_path}
    };
}

} // namespace approval
