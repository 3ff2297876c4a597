#pragma once

#include "hookvault/http.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace hookvault {

/// Exponential backoff: min(max_delay, base_delay * 2^(attempt-1)).
struct RetryPolicy {
    uint32_t max_retries = 5;
    std::chrono::milliseconds base_delay{1500};
    std::chrono::milliseconds max_delay{15000};

    /// Delay before retry number `attempt` (1-based).
    std::chrono::milliseconds backoff_delay(uint32_t attempt) const;
};

using Sleeper = std::function<void(std::chrono::milliseconds)>;

/// Sleeper backed by std::this_thread::sleep_for.
Sleeper default_sleeper();

/// Everything a backend needs to retry a call.
struct RetryContext {
    RetryPolicy policy;
    Sleeper sleeper;
    std::atomic<uint64_t>* retry_counter = nullptr;  // incremented per retry, may be null
};

/// Server-provided delay hint in milliseconds. Reads the Retry-After header
/// and the JSON body field at `body_pointer` (a JSON pointer such as
/// "/retry_after"). Values above 1000 are already milliseconds, smaller ones
/// are seconds. Returns the larger of the two, or nullopt when neither is set.
std::optional<int64_t> parse_retry_after_ms(const net::HttpResponse& response,
                                            const std::string& body_pointer);

/// Send `request` until it produces a non-transient answer.
///
/// Network failures, 429 and 5xx are retried up to policy.max_retries times.
/// A 429 waits max(backoff, server hint). Any other response (2xx or a
/// non-retryable 4xx) is returned to the caller for interpretation. Throws
/// Error{FatalBackend, retries_exhausted} when the budget runs out and
/// Error{Cancelled} when `cancel` is raised.
net::HttpResponse execute_with_backoff(net::HttpTransport& transport,
                                       const net::HttpRequest& request,
                                       const RetryContext& retry,
                                       const std::string& label,
                                       const std::string& retry_after_pointer,
                                       const std::atomic<bool>* cancel = nullptr);

}  // namespace hookvault
