#include "service_config.h"
#include <signal_lambda/common/env_loader.h>

#include <algorithm>
#include <array>
#include <format>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace signal_lambda::config {

namespace {

constexpr std::array kLogLevels{"trace", "debug", "info", "warn", "error", "critical", "off"};

void ValidateLogLevel(const std::string& level) {
    if (std::ranges::find(kLogLevels, level) == kLogLevels.end()) {
        throw std::runtime_error(std::format("Unknown log level '{}'", level));
    }
}

std::uint16_t ParsePort(const std::string& text) {
    int port = 0;
    try {
        port = std::stoi(text);
    } catch (const std::exception&) {
        throw std::runtime_error(std::format("Invalid port '{}'", text));
    }
    if (port <= 0 || port > 65535) {
        throw std::runtime_error(std::format("Port {} out of range", port));
    }
    return static_cast<std::uint16_t>(port);
}

} // namespace

ServiceConfig ParseServiceConfig(const std::string& yaml) {
    try {
        YAML::Node root = YAML::Load(yaml);
        if (!root || root.IsNull()) {
            return ServiceConfig{};
        }
        return root.as<ServiceConfig>();
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(std::format("Invalid service configuration: {}", e.what()));
    }
}

ServiceConfig LoadServiceConfig(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        throw std::runtime_error(std::format("Config file not found: {}", path.string()));
    }
    try {
        YAML::Node root = YAML::LoadFile(path.string());
        ServiceConfig config = root.IsNull() ? ServiceConfig{} : root.as<ServiceConfig>();
        SPDLOG_INFO("Loaded service configuration from {}", path.string());
        return config;
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(std::format("Invalid service configuration {}: {}", path.string(), e.what()));
    }
}

void ApplyEnvironmentOverrides(ServiceConfig& config, const EnvLoader& env) {
    if (auto port = env.getOptional(kPortEnv); port && !port->empty()) {
        config.server.port = ParsePort(*port);
    }
    if (auto level = env.getOptional(kLogLevelEnv); level && !level->empty()) {
        ValidateLogLevel(*level);
        config.logging.level = *level;
    }
    if (auto enabled = env.getOptional(kSandboxEnabledEnv); enabled && !enabled->empty()) {
        config.sandbox.enabled = env.getBool(kSandboxEnabledEnv, config.sandbox.enabled);
    }
}

ServiceConfig LoadServiceConfigFromEnvironment(const EnvLoader& env) {
    ServiceConfig config;
    if (auto path = env.getOptional(kConfigPathEnv); path && !path->empty()) {
        config = LoadServiceConfig(*path);
    } else if (std::filesystem::exists(kDefaultConfigPath)) {
        config = LoadServiceConfig(kDefaultConfigPath);
    } else {
        SPDLOG_INFO("No configuration file, using defaults");
    }
    ApplyEnvironmentOverrides(config, env);
    return config;
}

void ConfigureLogging(const LoggingConfig& logging) {
    ValidateLogLevel(logging.level);
    spdlog::set_level(spdlog::level::from_str(logging.level));
    spdlog::set_pattern(logging.pattern);
}

} // namespace signal_lambda::config

namespace YAML {

bool convert<signal_lambda::config::ServiceConfig>::decode(const Node& node,
                                                            signal_lambda::config::ServiceConfig& config) {
    using namespace signal_lambda::config;
    if (!node.IsMap()) {
        throw std::runtime_error("service configuration must be a map, not " + YAML::Dump(node));
    }

    if (auto server = node["server"]) {
        config.server.host = server["host"].as<std::string>(config.server.host);
        config.server.port = ParsePort(server["port"].as<std::string>(std::to_string(config.server.port)));
        config.server.threads = server["threads"].as<std::size_t>(config.server.threads);
        config.server.max_body_bytes = server["max_body_bytes"].as<std::size_t>(config.server.max_body_bytes);
        if (config.server.threads == 0) {
            throw std::runtime_error("server.threads must be at least 1");
        }
    }

    if (auto logging = node["logging"]) {
        config.logging.level = logging["level"].as<std::string>(config.logging.level);
        config.logging.pattern = logging["pattern"].as<std::string>(config.logging.pattern);
        ValidateLogLevel(config.logging.level);
    }

    if (auto sandbox = node["sandbox"]) {
        config.sandbox.enabled = sandbox["enabled"].as<bool>(config.sandbox.enabled);
    }
    return true;
}

} // namespace YAML
