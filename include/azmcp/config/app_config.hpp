#pragma once

#include <azmcp/core/log.hpp>
#include <azmcp/mcp/frame_codec.hpp>

#include <cstddef>
#include <optional>
#include <string>

namespace azmcp {

inline constexpr const char* kDefaultPricingApi =
    "https://prices.azure.com/api/retail/prices";
inline constexpr const char* kDefaultHealthSku = "Standard_B2s";

// Upper bounds accepted by ValidateConfig.
inline constexpr double kMaxTimeoutSeconds = 3600.0;
inline constexpr double kMaxBackoffSeconds = 300.0;

struct PricingConfig {
    std::string api_url = kDefaultPricingApi;
    std::optional<std::string> region;    // default filter when a call has none
    std::optional<std::string> currency;
};

struct FetchConfig {
    double timeout_seconds = 10.0;  // per attempt
    int retries = 3;                // total attempts, not extra ones
    double backoff_seconds = 0.5;   // base of the exponential backoff
};

struct ServerConfig {
    size_t max_frame_bytes = kDefaultMaxFrameBytes;
};

struct HealthConfig {
    std::string sku = kDefaultHealthSku;
    std::optional<std::string> region;
    std::optional<std::string> currency;
};

struct LogConfig {
    LogLevel level = LogLevel::Warn;
    bool json = false;
    bool color = true;  // still subject to TTY detection and NO_COLOR
};

struct AppConfig {
    std::string service = "pricing";
    PricingConfig pricing;
    FetchConfig fetch;
    ServerConfig server;
    HealthConfig health;
    LogConfig log;
};

// ---------------------------------------------------------------------------
// ConfigOverrides — one configuration layer. Unset fields leave the value
// from the layer below untouched.
// ---------------------------------------------------------------------------
struct ConfigOverrides {
    std::optional<std::string> service;
    std::optional<std::string> api_url;
    std::optional<std::string> region;
    std::optional<std::string> currency;
    std::optional<double> timeout_seconds;
    std::optional<int> retries;
    std::optional<double> backoff_seconds;
    std::optional<size_t> max_frame_bytes;
    std::optional<std::string> health_sku;
    std::optional<std::string> health_region;
    std::optional<std::string> health_currency;
    std::optional<LogLevel> log_level;
    std::optional<bool> log_json;
    std::optional<bool> color;
};

} // namespace azmcp
