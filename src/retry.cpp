#include "hookvault/retry.hpp"
#include "hookvault/error.hpp"
#include "hookvault/log.hpp"

#include <algorithm>
#include <cmath>
#include <thread>

#include <nlohmann/json.hpp>

namespace hookvault {

namespace {

// Hint values above 1000 are taken as milliseconds, anything else as seconds
std::optional<int64_t> hint_to_ms(double value) {
    if (!std::isfinite(value) || value <= 0) return std::nullopt;
    double ms = value > 1000 ? value : value * 1000.0;
    return static_cast<int64_t>(std::ceil(ms));
}

std::string short_body(const net::HttpResponse& response) {
    auto text = response.body_string();
    if (text.size() > 200) {
        text.resize(200);
        text += "...";
    }
    return text;
}

}  // namespace

std::chrono::milliseconds RetryPolicy::backoff_delay(uint32_t attempt) const {
    if (attempt == 0) attempt = 1;
    // 2^30 already dwarfs any sane cap; clamp so the shift cannot overflow
    uint32_t exponent = std::min<uint32_t>(attempt - 1, 30);
    double delay = static_cast<double>(base_delay.count()) * static_cast<double>(1ULL << exponent);
    double cap = static_cast<double>(max_delay.count());
    return std::chrono::milliseconds(static_cast<int64_t>(std::min(delay, cap)));
}

Sleeper default_sleeper() {
    return [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
}

std::optional<int64_t> parse_retry_after_ms(const net::HttpResponse& response,
                                            const std::string& body_pointer) {
    std::optional<int64_t> result;

    if (auto header = response.headers.get("Retry-After")) {
        try {
            result = hint_to_ms(std::stod(*header));
        } catch (const std::exception&) {
            // HTTP-date form: ignored, backoff applies
        }
    }

    if (!body_pointer.empty() && !response.body.empty()) {
        auto j = nlohmann::json::parse(response.body.begin(), response.body.end(),
                                       nullptr, false);
        if (!j.is_discarded()) {
            nlohmann::json::json_pointer ptr(body_pointer);
            if (j.contains(ptr) && j.at(ptr).is_number()) {
                auto body_ms = hint_to_ms(j.at(ptr).get<double>());
                if (body_ms && (!result || *body_ms > *result)) result = body_ms;
            }
        }
    }

    return result;
}

net::HttpResponse execute_with_backoff(net::HttpTransport& transport,
                                       const net::HttpRequest& request,
                                       const RetryContext& retry,
                                       const std::string& label,
                                       const std::string& retry_after_pointer,
                                       const std::atomic<bool>* cancel) {
    auto cancelled = [cancel] { return cancel && cancel->load(); };
    const Sleeper& sleep = retry.sleeper ? retry.sleeper : default_sleeper();

    uint32_t attempt = 0;
    while (true) {
        if (cancelled()) {
            throw Error(ErrorKind::Cancelled, label + ": cancelled");
        }

        auto response = transport.execute(request);

        if (response.aborted || cancelled()) {
            throw Error(ErrorKind::Cancelled, label + ": cancelled");
        }

        bool transient = response.is_network_error || net::is_retryable_status(response.status_code);
        if (!transient) {
            return response;
        }

        std::string reason = response.is_network_error
            ? response.error
            : "HTTP " + std::to_string(response.status_code) + ": " + short_body(response);

        attempt += 1;
        if (attempt > retry.policy.max_retries) {
            throw Error(ErrorKind::FatalBackend,
                        label + " failed after " + std::to_string(retry.policy.max_retries) +
                            " retries: " + reason,
                        response.status_code, true);
        }

        auto delay = retry.policy.backoff_delay(attempt);
        if (!response.is_network_error) {
            if (auto hint = parse_retry_after_ms(response, retry_after_pointer)) {
                delay = std::max(delay, std::chrono::milliseconds(*hint));
            }
        }

        log_warn("retry", "%s attempt=%u delay=%lldms: %s", label.c_str(), attempt,
                 static_cast<long long>(delay.count()), reason.c_str());
        if (retry.retry_counter) {
            retry.retry_counter->fetch_add(1, std::memory_order_relaxed);
        }
        sleep(delay);
    }
}

}  // namespace hookvault
