#include <signal_lambda/api/lambda_api.h>

#include <glaze/glaze.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <vector>

namespace signal_lambda::api {

namespace {

constexpr auto kReadOpts = glz::opts{.error_on_unknown_keys = false};

struct ValidateLambdaRequest {
    std::optional<std::string> code;
};

struct ApplyLambdaRequest {
    std::optional<std::string> code;
    std::optional<std::vector<JsonValue>> signals;
};

// error carries the diagnostic message; error_detail its location
struct ValidateLambdaResponse {
    bool valid{false};
    std::optional<std::string> error;
    std::optional<ValidationDiagnostic> error_detail;
};

struct ErrorDetail {
    std::string kind;
    std::string message;
    std::optional<int> line;
    std::optional<int> column;
    std::optional<std::size_t> record_index;
    std::optional<std::string> ticker;
};

struct ApplyLambdaResponse {
    std::vector<JsonValue> signals;
    std::vector<TraceEntry> trace;
};

struct ApplyLambdaFailure {
    std::vector<TraceEntry> trace;
    std::string error;
    ErrorDetail error_detail;
};

struct ErrorResponse {
    std::string error;
    std::optional<std::string> detail;
};

struct HealthResponse {
    std::string status;
    std::string sandbox;
    std::optional<std::string> reason;
};

template <typename T>
ApiResponse JsonResponse(int status, const T& payload) {
    auto json = glz::write_json(payload);
    if (!json) {
        SPDLOG_ERROR("Failed to serialize response: {}", glz::format_error(json.error()));
        return ApiResponse{500, R"({"error":"internal error"})"};
    }
    return ApiResponse{status, std::move(*json)};
}

ApiResponse BadRequest(std::string message) {
    SPDLOG_DEBUG("Rejecting request: {}", message);
    return JsonResponse(400, ErrorResponse{.error = std::move(message)});
}

// glaze expects a null-terminated buffer
template <typename T>
std::optional<std::string> ReadRequest(T& request, std::string_view body) {
    std::string buffer{body};
    if (auto ec = glz::read<kReadOpts>(request, buffer)) {
        return "Invalid request body: " + glz::format_error(ec, buffer);
    }
    return std::nullopt;
}

ErrorDetail ToErrorDetail(const SandboxError& error) {
    ErrorDetail detail{.kind = std::string{SandboxErrorKindToString(error.kind)}, .message = error.message};
    if (error.location) {
        detail.line = error.location->line;
        detail.column = error.location->column;
    }
    detail.record_index = error.record_index;
    detail.ticker = error.ticker;
    return detail;
}

} // namespace

LambdaApi::LambdaApi(std::shared_ptr<const runtime::ILambdaOrchestrator> orchestrator)
    : m_orchestrator(std::move(orchestrator)) {
    if (!m_orchestrator) {
        throw std::invalid_argument("LambdaApi requires an orchestrator");
    }
}

int LambdaApi::StatusForError(SandboxErrorKind kind) {
    switch (kind) {
        case SandboxErrorKind::GrammarViolation:
        case SandboxErrorKind::RuntimeExecutionError:
        case SandboxErrorKind::ResourceLimitExceeded: return 400;
        case SandboxErrorKind::SandboxUnavailable: return 503;
        case SandboxErrorKind::InternalError: return 500;
    }
    return 500;
}

ApiResponse LambdaApi::ValidateLambda(std::string_view body) const {
    ValidateLambdaRequest request;
    if (auto error = ReadRequest(request, body)) {
        return BadRequest(std::move(*error));
    }
    if (!request.code) {
        return BadRequest("Missing required field: code");
    }

    ValidationResult result = m_orchestrator->Validate(*request.code);
    ValidateLambdaResponse response{.valid = result.valid};
    if (result.error) {
        response.error = result.error->message;
        response.error_detail = std::move(result.error);
    }
    return JsonResponse(200, response);
}

ApiResponse LambdaApi::ApplyLambda(std::string_view body) const {
    ApplyLambdaRequest request;
    if (auto error = ReadRequest(request, body)) {
        return BadRequest(std::move(*error));
    }
    if (!request.code) {
        return BadRequest("Missing required field: code");
    }
    if (!request.signals) {
        return BadRequest("Missing required field: signals");
    }

    SignalBatch batch;
    try {
        batch = ParseSignalBatch(*request.signals);
    } catch (const std::invalid_argument& e) {
        return BadRequest(e.what());
    }

    runtime::ApplyOutcome outcome = m_orchestrator->Apply(*request.code, batch);

    if (outcome.error) {
        const SandboxError& error = *outcome.error;
        const int status = StatusForError(error.kind);
        if (error.kind == SandboxErrorKind::SandboxUnavailable) {
            return JsonResponse(status, ErrorResponse{.error = "sandbox unavailable",
                                                      .detail = m_orchestrator->GetAvailability().GetReason()});
        }
        if (error.kind == SandboxErrorKind::InternalError) {
            SPDLOG_ERROR("Lambda apply failed internally: {}", error.message);
            return JsonResponse(status, ErrorResponse{.error = "internal error"});
        }
        return JsonResponse(status, ApplyLambdaFailure{.trace = outcome.trace.GetEntries(),
                                                       .error = error.message,
                                                       .error_detail = ToErrorDetail(error)});
    }

    if (!outcome.signals) {
        SPDLOG_ERROR("Orchestrator reported success without a result batch");
        return JsonResponse(500, ErrorResponse{.error = "internal error"});
    }

    return JsonResponse(200, ApplyLambdaResponse{.signals = SignalBatchToJson(*outcome.signals),
                                                  .trace = outcome.trace.GetEntries()});
}

ApiResponse LambdaApi::LambdaHelp() const {
    return ApiResponse{200, LambdaHelpJson()};
}

ApiResponse LambdaApi::Health() const {
    const auto& availability = m_orchestrator->GetAvailability();
    HealthResponse health{.status = "ok", .sandbox = availability.IsReady() ? "ready" : "unavailable"};
    if (!availability.IsReady()) {
        health.reason = availability.GetReason();
    }
    return JsonResponse(200, health);
}

} // namespace signal_lambda::api
