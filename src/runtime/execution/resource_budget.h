#pragma once
//
// Per-call resource budget for the confinement runtime
// Counts interpreter steps, heap elements, string sizes and live string bytes,
// and enforces the wall-clock deadline. One budget covers a whole apply call.
//

#include <signal_lambda/core/constants.h>
#include <signal_lambda/core/sandbox_error.h>
#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>

namespace signal_lambda::runtime {

struct BudgetLimits {
    std::uint64_t max_steps{constants::kMaxSteps};
    std::chrono::milliseconds timeout{constants::kExecutionTimeout};
    std::size_t max_heap_elements{constants::kMaxHeapElements};
    std::size_t max_string_length{constants::kMaxStringLength};
    std::size_t max_string_bytes{constants::kMaxStringBytes};
};

class ResourceBudget {
public:
    using Clock = std::chrono::steady_clock;

    explicit ResourceBudget(BudgetLimits limits = {});

    // Non-copyable: there is exactly one budget per call
    ResourceBudget(const ResourceBudget&) = delete;
    ResourceBudget& operator=(const ResourceBudget&) = delete;

    // Consume interpreter steps; throws ResourceLimitExceeded
    void Tick(std::uint64_t cost = 1) {
        m_steps += cost;
        if (m_steps > m_limits.max_steps) {
            ThrowStepLimit();
        }
        if (m_steps >= m_nextDeadlineCheck) {
            CheckDeadline();
        }
    }

    // Throws ResourceLimitExceeded once the deadline has passed
    void CheckDeadline();

    // Account for container elements about to be allocated
    void ChargeElements(std::size_t count);

    // Return elements of a heap that has been torn down
    void ReleaseElements(std::size_t count) noexcept { m_heapElements -= std::min(count, m_heapElements); }

    // Throws when a string of this length may not be created
    void CheckStringLength(std::size_t length) const;

    // Account for a string about to be created; checks its length and the
    // total of all live strings
    void ChargeStringBytes(std::size_t length);

    // Return the bytes of a string that has been destroyed
    void ReleaseStringBytes(std::size_t length) noexcept { m_stringBytes -= std::min(length, m_stringBytes); }

    // Account for JSON copied out of the runtime: one node, plus its string bytes.
    // Output stays charged until the call ends.
    void ChargeOutput(std::size_t stringBytes);

    [[nodiscard]] std::uint64_t GetSteps() const noexcept { return m_steps; }
    [[nodiscard]] std::size_t GetHeapElements() const noexcept { return m_heapElements; }
    [[nodiscard]] std::size_t GetStringBytes() const noexcept { return m_stringBytes; }
    [[nodiscard]] const BudgetLimits& GetLimits() const noexcept { return m_limits; }
    [[nodiscard]] std::chrono::duration<double, std::milli> GetElapsed() const;

private:
    BudgetLimits m_limits;
    Clock::time_point m_start;
    Clock::time_point m_deadline;
    std::uint64_t m_steps{0};
    std::uint64_t m_nextDeadlineCheck{constants::kDeadlineCheckInterval};
    std::size_t m_heapElements{0};
    std::size_t m_stringBytes{0};
    std::size_t m_outputNodes{0};
    std::size_t m_outputBytes{0};

    [[noreturn]] void ThrowStepLimit() const;
};

using ResourceBudgetPtr = std::shared_ptr<ResourceBudget>;

} // namespace signal_lambda::runtime
