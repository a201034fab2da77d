#pragma once

#include <cstddef>

namespace retry {

// Maximum number of sends for a single chunk
constexpr std::size_t DEFAULT_MAX_ATTEMPTS = 3;

// Calls `operation(attempt)` (attempt is 1-based) until one result reports
// success or `max_attempts` calls were made, with no delay in between. Returns the
// last result; a default constructed result when max_attempts is 0.
// The result type must expose `bool success`.
template <typename OperationT>
auto with_attempts(std::size_t max_attempts, OperationT&& operation)
    -> decltype(operation(std::size_t{})) {
    decltype(operation(std::size_t{})) result{};
    for (std::size_t attempt = 1; attempt <= max_attempts; ++attempt) {
        result = operation(attempt);
        if (result.success)
            break;
    }
    return result;
}

} // namespace retry
