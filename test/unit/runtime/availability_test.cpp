#include <catch2/catch_test_macros.hpp>
#include "common/signal_test_utils.h"
#include <signal_lambda/runtime/availability.h>
#include <signal_lambda/runtime/iorchestrator.h>

using namespace signal_lambda;
using namespace signal_lambda::runtime;
using namespace signal_lambda::test;

TEST_CASE("Sandbox availability probe", "[runtime][availability]") {

    SECTION("Disabled by configuration") {
        auto availability = ProbeSandbox(false);
        REQUIRE_FALSE(availability.IsReady());
        REQUIRE(availability.GetReason() == "disabled by configuration");
    }

    SECTION("Enabled probe runs the smoke program") {
        auto availability = ProbeSandbox(true);
        REQUIRE(availability.IsReady());
        REQUIRE(availability.GetReason().empty());
    }
}

TEST_CASE("CreateLambdaOrchestrator keeps the availability it was given", "[runtime][availability]") {

    SECTION("Ready") {
        auto orchestrator = CreateLambdaOrchestrator(SandboxAvailability::Ready());
        REQUIRE(orchestrator->GetAvailability().IsReady());
        auto outcome = orchestrator->Apply("result = signals\n", ScenarioBatch());
        REQUIRE(outcome.Succeeded());
        REQUIRE(outcome.signals->size() == 2);
    }

    SECTION("Unavailable") {
        auto orchestrator = CreateLambdaOrchestrator(SandboxAvailability::Unavailable("probe failed"));
        REQUIRE(orchestrator->GetAvailability().GetReason() == "probe failed");

        auto outcome = orchestrator->Apply("result = signals\n", ScenarioBatch());
        REQUIRE(outcome.error->kind == SandboxErrorKind::SandboxUnavailable);

        // Validation does not depend on availability
        REQUIRE(orchestrator->Validate("result = signals\n").valid);
    }
}
