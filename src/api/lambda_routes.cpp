#include "lambda_routes.h"

#include <drogon/HttpAppFramework.h>
#include <spdlog/spdlog.h>

namespace signal_lambda::api {

namespace {

using Callback = std::function<void(const drogon::HttpResponsePtr&)>;

drogon::HttpResponsePtr ToHttpResponse(const ApiResponse& response) {
    auto http = drogon::HttpResponse::newHttpResponse();
    http->setStatusCode(static_cast<drogon::HttpStatusCode>(response.status));
    http->setContentTypeCode(drogon::CT_APPLICATION_JSON);
    http->setBody(response.body);
    return http;
}

// Handlers run synchronously on the drogon I/O thread that received the request
template <typename Handler>
auto MakeHandler(const char* route, Handler handler) {
    return [route, handler = std::move(handler)](const drogon::HttpRequestPtr& req, Callback&& callback) {
        ApiResponse response;
        try {
            response = handler(*req);
        } catch (const std::exception& e) {
            SPDLOG_ERROR("Unhandled exception in {}: {}", route, e.what());
            response = ApiResponse{500, R"({"error":"internal error"})"};
        }
        SPDLOG_DEBUG("{} {} -> {}", req->getMethodString(), route, response.status);
        callback(ToHttpResponse(response));
    };
}

} // namespace

void RegisterLambdaRoutes(std::shared_ptr<const LambdaApi> api) {
    auto& app = drogon::app();

    app.registerHandler(
        "/signals/validate-lambda",
        MakeHandler("/signals/validate-lambda",
                    [api](const drogon::HttpRequest& req) { return api->ValidateLambda(req.getBody()); }),
        {drogon::Post});

    app.registerHandler(
        "/signals/apply-lambda",
        MakeHandler("/signals/apply-lambda",
                    [api](const drogon::HttpRequest& req) { return api->ApplyLambda(req.getBody()); }),
        {drogon::Post});

    app.registerHandler(
        "/signals/lambda-help",
        MakeHandler("/signals/lambda-help", [api](const drogon::HttpRequest&) { return api->LambdaHelp(); }),
        {drogon::Get});

    app.registerHandler("/health",
                        MakeHandler("/health", [api](const drogon::HttpRequest&) { return api->Health(); }),
                        {drogon::Get});

    SPDLOG_INFO("Registered lambda routes");
}

} // namespace signal_lambda::api
