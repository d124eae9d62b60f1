#include "output_capture.h"

namespace signal_lambda::runtime {

void OutputCapture::Write(std::string text, std::optional<std::size_t> recordIndex) {
    std::size_t newline = text.find('\n');
    if (newline != std::string::npos) {
        std::size_t start = 0;
        while (newline != std::string::npos) {
            Write(text.substr(start, newline - start), recordIndex);
            start = newline + 1;
            newline = text.find('\n', start);
        }
        Write(text.substr(start), recordIndex);
        return;
    }

    if (m_lines.size() >= m_maxLines) {
        ++m_dropped;
        return;
    }

    if (text.size() > m_maxLineChars) {
        text.resize(m_maxLineChars);
        text += kTruncationMarker;
    }
    m_lines.push_back(CapturedLine{std::move(text), recordIndex});
}

} // namespace signal_lambda::runtime
