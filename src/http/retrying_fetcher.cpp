#include <azmcp/http/retrying_fetcher.hpp>

#include <azmcp/core/log.hpp>

#include <algorithm>
#include <cstdint>
#include <optional>
#include <thread>

namespace azmcp {

namespace {

// 2^30 ms is already > 12 days; larger shifts would overflow.
constexpr int kMaxBackoffShift = 30;

Result<nlohmann::json, Error> DecodeBody(std::string_view path,
                                         const HttpResponse& response) {
    auto parsed = nlohmann::json::parse(response.body, nullptr,
                                        /*allow_exceptions=*/false);
    if (parsed.is_discarded()) {
        return Result<nlohmann::json, Error>::Err(Error{
            "FetchJson", std::string(path), response.status_code,
            "Response body is not valid JSON", std::nullopt,
            ErrorCategory::Decode});
    }
    return Result<nlohmann::json, Error>::Ok(std::move(parsed));
}

} // anonymous namespace

std::chrono::milliseconds BackoffDelay(const RetryPolicy& policy,
                                       int attempt_index) {
    const int shift = std::clamp(attempt_index, 0, kMaxBackoffShift);
    return policy.base_backoff * (int64_t{1} << shift);
}

std::chrono::milliseconds MaxTotalBackoff(const RetryPolicy& policy) {
    std::chrono::milliseconds total{0};
    for (int i = 0; i + 1 < policy.max_attempts; ++i) {
        total += BackoffDelay(policy, i);
    }
    return total;
}

void ThreadSleep(std::chrono::milliseconds duration) {
    std::this_thread::sleep_for(duration);
}

RetryingFetcher::RetryingFetcher(IHttpClient& client, RetryPolicy policy,
                                 SleepFn sleep)
    : client_(client), policy_(policy), sleep_(std::move(sleep)) {
    if (policy_.max_attempts < 1) {
        policy_.max_attempts = 1;
    }
    if (!sleep_) {
        sleep_ = ThreadSleep;
    }
}

Result<nlohmann::json, Error> RetryingFetcher::FetchJson(
    std::string_view path, const HttpQuery& query) {
    std::optional<Error> last_error;

    for (int attempt = 0; attempt < policy_.max_attempts; ++attempt) {
        auto result = client_.Get(path, query);

        if (result.IsOk()) {
            const auto& response = result.Value();
            if (response.IsSuccess()) {
                return DecodeBody(path, response);
            }
            last_error = Error::FromHttpStatus("FetchJson", std::string(path),
                                               response.status_code,
                                               response.body);
        } else {
            last_error = std::move(result).Error();
        }

        if (!last_error->IsTransport()) {
            break;
        }

        const bool is_last = attempt + 1 >= policy_.max_attempts;
        LogWarn("fetch", "Attempt " + std::to_string(attempt + 1) + "/" +
                             std::to_string(policy_.max_attempts) +
                             " failed: " + last_error->ToString());
        if (is_last) {
            break;
        }

        const auto delay = BackoffDelay(policy_, attempt);
        LogDebug("fetch", "Retrying in " + std::to_string(delay.count()) + "ms");
        sleep_(delay);
    }

    return Result<nlohmann::json, Error>::Err(std::move(*last_error));
}

} // namespace azmcp
