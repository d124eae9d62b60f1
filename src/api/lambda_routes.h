#pragma once

#include <signal_lambda/api/lambda_api.h>
#include <memory>

namespace signal_lambda::api {

// Registers the /signals/* and /health handlers on drogon::app()
void RegisterLambdaRoutes(std::shared_ptr<const LambdaApi> api);

} // namespace signal_lambda::api
