#include "argument_error.h"
#include <algorithm>
#include <sstream>

namespace signal_lambda {
namespace error_formatting {

std::string ArgumentCountError::Format() const {
    std::ostringstream oss;
    oss << function_name_ << "() takes ";

    if (min_count_ == max_count_) {
        if (min_count_ == 0) {
            oss << "no arguments";
        } else if (min_count_ == 1) {
            oss << "exactly one argument";
        } else {
            oss << "exactly " << min_count_ << " arguments";
        }
    } else if (received_count_ < min_count_) {
        oss << "at least " << min_count_ << (min_count_ == 1 ? " argument" : " arguments");
    } else {
        oss << "at most " << max_count_ << (max_count_ == 1 ? " argument" : " arguments");
    }

    oss << " (" << received_count_ << " given)";
    return oss.str();
}

std::string UnknownIdentifierError::Format() const {
    std::ostringstream oss;
    oss << "Unknown identifier: " << name_;

    // Suggest the closest known name when it is a plausible typo
    const std::string* best = nullptr;
    std::size_t bestDistance = 0;
    for (const auto& candidate : known_names_) {
        std::size_t distance = EditDistance(name_, candidate);
        if (!best || distance < bestDistance) {
            best = &candidate;
            bestDistance = distance;
        }
    }

    std::size_t threshold = std::max<std::size_t>(1, name_.size() / 3);
    if (best && bestDistance > 0 && bestDistance <= threshold) {
        oss << " (did you mean '" << *best << "'?)";
    }
    return oss.str();
}

std::size_t UnknownIdentifierError::EditDistance(const std::string& a, const std::string& b) {
    std::vector<std::size_t> previous(b.size() + 1);
    std::vector<std::size_t> current(b.size() + 1);
    for (std::size_t j = 0; j <= b.size(); ++j) {
        previous[j] = j;
    }

    for (std::size_t i = 1; i <= a.size(); ++i) {
        current[0] = i;
        for (std::size_t j = 1; j <= b.size(); ++j) {
            std::size_t substitution = previous[j - 1] + (a[i - 1] == b[j - 1] ? 0 : 1);
            current[j] = std::min({previous[j] + 1, current[j - 1] + 1, substitution});
        }
        std::swap(previous, current);
    }
    return previous[b.size()];
}

std::string UnexpectedKeywordError::Format() const {
    return function_name_ + "() got an unexpected keyword argument '" + keyword_ + "'";
}

} // namespace error_formatting
} // namespace signal_lambda
