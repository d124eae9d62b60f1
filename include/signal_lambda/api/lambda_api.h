#pragma once
//
// LambdaApi - the boundary between the HTTP layer and the sandbox
//
// Takes raw request bodies, returns a status code and a JSON body. Knows
// nothing about the transport, so the same object serves the HTTP routes and
// the command-line runner.
//
// Status mapping for apply:
//   200  success                        { signals, trace }
//   400  grammar / runtime / resource    { trace, error, error_detail }
//   400  malformed request body          { error }
//   503  sandbox unavailable             { error, detail }
//   500  internal error                  { error }
//
// error is always a string; error_detail holds kind, location and record.
//

#include <signal_lambda/core/sandbox_error.h>
#include <signal_lambda/runtime/iorchestrator.h>
#include <memory>
#include <string>
#include <string_view>

namespace signal_lambda::api {

struct ApiResponse {
    int status{200};
    std::string body;
};

class LambdaApi {
public:
    explicit LambdaApi(std::shared_ptr<const runtime::ILambdaOrchestrator> orchestrator);

    // POST /signals/validate-lambda
    [[nodiscard]] ApiResponse ValidateLambda(std::string_view body) const;

    // POST /signals/apply-lambda
    [[nodiscard]] ApiResponse ApplyLambda(std::string_view body) const;

    // GET /signals/lambda-help
    [[nodiscard]] ApiResponse LambdaHelp() const;

    // GET /health
    [[nodiscard]] ApiResponse Health() const;

    static int StatusForError(SandboxErrorKind kind);

private:
    std::shared_ptr<const runtime::ILambdaOrchestrator> m_orchestrator;
};

// Static documentation served by lambda-help, as JSON
std::string LambdaHelpJson();

} // namespace signal_lambda::api
