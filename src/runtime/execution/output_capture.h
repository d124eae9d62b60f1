#pragma once
//
// OutputCapture - per-call buffer standing in for the console
//
// Owned by the orchestrator for the duration of one apply call and handed to
// the interpreter by reference. Lines beyond the limit are counted, not kept.
//

#include <signal_lambda/core/constants.h>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace signal_lambda::runtime {

struct CapturedLine {
    std::string text;
    std::optional<std::size_t> record_index;
};

class OutputCapture {
public:
    static constexpr std::string_view kTruncationMarker = "... (truncated)";

    explicit OutputCapture(std::size_t maxLines = constants::kMaxOutputLines,
                           std::size_t maxLineChars = constants::kMaxOutputLineChars)
        : m_maxLines(maxLines), m_maxLineChars(maxLineChars) {}

    // One line per newline-separated piece of text
    void Write(std::string text, std::optional<std::size_t> recordIndex = std::nullopt);

    [[nodiscard]] const std::vector<CapturedLine>& GetLines() const { return m_lines; }
    [[nodiscard]] std::size_t GetDroppedCount() const { return m_dropped; }

private:
    std::size_t m_maxLines;
    std::size_t m_maxLineChars;
    std::vector<CapturedLine> m_lines;
    std::size_t m_dropped{0};
};

} // namespace signal_lambda::runtime
