#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

// Fixed limits of the sandbox. None of these are caller- or config-adjustable.
namespace signal_lambda::constants {

    // Grammar
    constexpr std::size_t kMaxCodeLength = 10'000;
    constexpr std::size_t kMaxNestingDepth = 64;

    // Resource budget for one apply call (all records of the batch together)
    constexpr std::chrono::milliseconds kExecutionTimeout{5'000};
    constexpr std::uint64_t kMaxSteps = 2'000'000;
    constexpr std::uint64_t kDeadlineCheckInterval = 1'024;
    constexpr std::size_t kMaxHeapElements = 200'000;
    constexpr std::size_t kMaxStringLength = 1 << 20;
    constexpr std::size_t kMaxStringBytes = 64 << 20;  // live string data, and JSON copied out
    constexpr std::size_t kMaxValueDepth = 256;  // nesting of lists/dicts inside each other

    // Captured print output
    constexpr std::size_t kMaxOutputLines = 100;
    constexpr std::size_t kMaxOutputLineChars = 500;

    // Trace bounds
    constexpr std::size_t kMaxSampleDiffs = 5;
    constexpr std::size_t kMaxFieldChangesPerSample = 20;
    constexpr std::size_t kMaxErrorMessageLength = 500;

    // Names bound in the execution namespace
    constexpr const char* kSignalsName = "signals";
    constexpr const char* kSignalName = "signal";
    constexpr const char* kResultName = "result";
    constexpr const char* kMathName = "math";
    constexpr const char* kTickerField = "ticker";

} // namespace signal_lambda::constants
