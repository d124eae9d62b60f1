#pragma once
//
// Service configuration: YAML file plus SIGNAL_LAMBDA_* environment overrides.
// The sandbox resource budget is fixed in code and has no setting here.
//

#include <cstdint>
#include <filesystem>
#include <string>
#include <yaml-cpp/yaml.h>

namespace signal_lambda {

class EnvLoader;

namespace config {

constexpr const char* kDefaultConfigPath = "config/signal_lambda.yaml";

// Environment keys
constexpr const char* kConfigPathEnv = "SIGNAL_LAMBDA_CONFIG";
constexpr const char* kPortEnv = "SIGNAL_LAMBDA_PORT";
constexpr const char* kLogLevelEnv = "SIGNAL_LAMBDA_LOG_LEVEL";
constexpr const char* kSandboxEnabledEnv = "SIGNAL_LAMBDA_SANDBOX_ENABLED";

struct ServerConfig {
    std::string host{"0.0.0.0"};
    std::uint16_t port{8080};
    std::size_t threads{4};
    std::size_t max_body_bytes{1 << 20};
};

struct LoggingConfig {
    std::string level{"info"};
    std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%s:%#] %v"};
};

struct SandboxConfig {
    bool enabled{true};
};

struct ServiceConfig {
    ServerConfig server;
    LoggingConfig logging;
    SandboxConfig sandbox;
};

// Throws std::runtime_error for unreadable files or invalid values
ServiceConfig LoadServiceConfig(const std::filesystem::path& path);

ServiceConfig ParseServiceConfig(const std::string& yaml);

void ApplyEnvironmentOverrides(ServiceConfig& config, const EnvLoader& env);

// SIGNAL_LAMBDA_CONFIG (or the default path, when it exists) plus overrides
ServiceConfig LoadServiceConfigFromEnvironment(const EnvLoader& env);

// Sets the spdlog level and pattern; throws on an unknown level name
void ConfigureLogging(const LoggingConfig& logging);

} // namespace config
} // namespace signal_lambda

namespace YAML {
template <>
struct convert<signal_lambda::config::ServiceConfig> {
    static bool decode(const Node& node, signal_lambda::config::ServiceConfig& config);
};
} // namespace YAML
