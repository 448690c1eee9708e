#pragma once

#include <azmcp/http/i_http_client.hpp>

#include <chrono>
#include <functional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace azmcp {

// ---------------------------------------------------------------------------
// RetryPolicy — attempt count and backoff base for RetryingFetcher.
//
// The delay before attempt n+1 (after attempt n failed) is
// base_backoff * 2^n. There is no jitter.
// ---------------------------------------------------------------------------
struct RetryPolicy {
    int max_attempts = 3;
    std::chrono::milliseconds base_backoff{500};
};

/// Delay inserted after the given (zero-based) failed attempt.
[[nodiscard]] std::chrono::milliseconds BackoffDelay(const RetryPolicy& policy,
                                                     int attempt_index);

/// Upper bound on the total backoff sleep of one FetchJson call.
[[nodiscard]] std::chrono::milliseconds MaxTotalBackoff(const RetryPolicy& policy);

// Sleeps for the given duration. Injected so tests can observe delays
// without waiting for them.
using SleepFn = std::function<void(std::chrono::milliseconds)>;

/// Default SleepFn: std::this_thread::sleep_for.
void ThreadSleep(std::chrono::milliseconds duration);

// ---------------------------------------------------------------------------
// RetryingFetcher — GET a JSON document with bounded retries.
//
// Each attempt is one IHttpClient::Get; the per-attempt deadline is the
// client's timeout. Transport failures (connection errors, timeouts and
// non-2xx statuses) are retried with exponential backoff until
// max_attempts calls have been made, then the last error is returned.
// A 2xx response whose body is not valid JSON fails immediately with
// ErrorCategory::Decode and is not retried.
// ---------------------------------------------------------------------------
class RetryingFetcher {
public:
    RetryingFetcher(IHttpClient& client, RetryPolicy policy,
                    SleepFn sleep = ThreadSleep);

    [[nodiscard]] Result<nlohmann::json, Error> FetchJson(
        std::string_view path, const HttpQuery& query = {});

    [[nodiscard]] const RetryPolicy& Policy() const noexcept { return policy_; }

private:
    IHttpClient& client_;
    RetryPolicy policy_;
    SleepFn sleep_;
};

} // namespace azmcp
