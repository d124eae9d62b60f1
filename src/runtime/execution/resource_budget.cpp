#include "resource_budget.h"
#include <algorithm>
#include <format>

namespace signal_lambda::runtime {

ResourceBudget::ResourceBudget(BudgetLimits limits)
    : m_limits(limits), m_start(Clock::now()), m_deadline(m_start + limits.timeout) {}

void ResourceBudget::CheckDeadline() {
    m_nextDeadlineCheck = m_steps + constants::kDeadlineCheckInterval;
    if (Clock::now() >= m_deadline) {
        throw ResourceLimitExceeded(
            std::format("Execution timed out after {} ms", m_limits.timeout.count()));
    }
}

void ResourceBudget::ChargeElements(std::size_t count) {
    if (count > m_limits.max_heap_elements - std::min(m_heapElements, m_limits.max_heap_elements)) {
        throw ResourceLimitExceeded(
            std::format("Memory limit exceeded ({} container elements)", m_limits.max_heap_elements));
    }
    m_heapElements += count;
}

void ResourceBudget::CheckStringLength(std::size_t length) const {
    if (length > m_limits.max_string_length) {
        throw ResourceLimitExceeded(
            std::format("String too long ({} characters, limit {})", length, m_limits.max_string_length));
    }
}

void ResourceBudget::ChargeStringBytes(std::size_t length) {
    CheckStringLength(length);
    if (length > m_limits.max_string_bytes - std::min(m_stringBytes, m_limits.max_string_bytes)) {
        throw ResourceLimitExceeded(
            std::format("Memory limit exceeded ({} bytes of string data)", m_limits.max_string_bytes));
    }
    m_stringBytes += length;
}

void ResourceBudget::ChargeOutput(std::size_t stringBytes) {
    if (m_outputNodes >= m_limits.max_heap_elements) {
        throw ResourceLimitExceeded(
            std::format("Result too large ({} values, limit {})", m_outputNodes + 1, m_limits.max_heap_elements));
    }
    if (stringBytes > m_limits.max_string_bytes - std::min(m_outputBytes, m_limits.max_string_bytes)) {
        throw ResourceLimitExceeded(
            std::format("Result too large (more than {} bytes of string data)", m_limits.max_string_bytes));
    }
    ++m_outputNodes;
    m_outputBytes += stringBytes;
}

std::chrono::duration<double, std::milli> ResourceBudget::GetElapsed() const {
    return Clock::now() - m_start;
}

void ResourceBudget::ThrowStepLimit() const {
    throw ResourceLimitExceeded(std::format("Step limit exceeded ({} steps)", m_limits.max_steps));
}

} // namespace signal_lambda::runtime
