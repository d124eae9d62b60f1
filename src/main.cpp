//
// signal_lambda_server
//
// HTTP service exposing the signal lambda sandbox:
//   POST /signals/validate-lambda
//   POST /signals/apply-lambda
//   GET  /signals/lambda-help
//   GET  /health
//

#include "api/lambda_routes.h"
#include "config/service_config.h"
#include <signal_lambda/api/lambda_api.h>
#include <signal_lambda/common/env_loader.h>
#include <signal_lambda/runtime/availability.h>
#include <signal_lambda/runtime/iorchestrator.h>

#include <drogon/HttpAppFramework.h>
#include <spdlog/spdlog.h>

int main() {
    using namespace signal_lambda;

    config::ServiceConfig serviceConfig;
    try {
        serviceConfig = config::LoadServiceConfigFromEnvironment(EnvLoader::instance());
        config::ConfigureLogging(serviceConfig.logging);
    } catch (const std::exception& e) {
        SPDLOG_CRITICAL("Failed to load configuration: {}", e.what());
        return 1;
    }

    // Computed once; an unavailable sandbox disables lambdas, not the service
    runtime::SandboxAvailability availability = runtime::ProbeSandbox(serviceConfig.sandbox.enabled);

    std::shared_ptr<const runtime::ILambdaOrchestrator> orchestrator =
        runtime::CreateLambdaOrchestrator(std::move(availability));
    auto api = std::make_shared<const api::LambdaApi>(orchestrator);
    api::RegisterLambdaRoutes(api);

    SPDLOG_INFO("Listening on {}:{} with {} threads", serviceConfig.server.host, serviceConfig.server.port,
                serviceConfig.server.threads);

    drogon::app()
        .addListener(serviceConfig.server.host, serviceConfig.server.port)
        .setThreadNum(serviceConfig.server.threads)
        .setClientMaxBodySize(serviceConfig.server.max_body_bytes)
        .run();
    return 0;
}
