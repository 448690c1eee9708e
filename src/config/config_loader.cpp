#include <azmcp/config/config_loader.hpp>

#include <azmcp/core/types.hpp>
#include <azmcp/core/version.hpp>
#include <azmcp/mcp/tool_handlers.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <exception>

namespace azmcp {

namespace {

Error MakeConfigError(const std::string& message) {
    return Error{"ConfigLoader", "", std::nullopt, message, std::nullopt,
                 ErrorCategory::Config};
}

std::optional<double> ParseDouble(const std::string& text) {
    if (text.empty()) return std::nullopt;
    errno = 0;
    char* end = nullptr;
    const double value = std::strtod(text.c_str(), &end);
    if (end == text.c_str() || *end != '\0' || errno == ERANGE ||
        !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

std::optional<long long> ParseInteger(const std::string& text) {
    if (text.empty()) return std::nullopt;
    errno = 0;
    char* end = nullptr;
    const long long value = std::strtoll(text.c_str(), &end, 10);
    if (end == text.c_str() || *end != '\0' || errno == ERANGE) {
        return std::nullopt;
    }
    return value;
}

std::optional<bool> ParseBool(const std::string& text) {
    if (text == "1" || text == "true" || text == "yes" || text == "on") return true;
    if (text == "0" || text == "false" || text == "no" || text == "off") return false;
    return std::nullopt;
}

// Scalar string from a YAML node, nullopt when the key is absent or null.
std::optional<std::string> YamlString(const YAML::Node& parent, const char* key) {
    const auto node = parent[key];
    if (!node || node.IsNull()) return std::nullopt;
    return node.as<std::string>();
}

template <typename T>
std::optional<T> YamlScalar(const YAML::Node& parent, const char* key) {
    const auto node = parent[key];
    if (!node || node.IsNull()) return std::nullopt;
    return node.as<T>();
}

} // anonymous namespace

std::optional<std::string> ProcessEnv(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) return std::nullopt;
    return std::string(value);
}

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<ConfigOverrides, Error> LoadFromYaml(std::string_view file_path) {
    ConfigOverrides layer;
    try {
        const YAML::Node root = YAML::LoadFile(std::string(file_path));
        if (!root || root.IsNull()) {
            return Result<ConfigOverrides, Error>::Ok(layer);
        }
        if (!root.IsMap()) {
            return Result<ConfigOverrides, Error>::Err(
                MakeConfigError("Config file must contain a mapping: " +
                                std::string(file_path)));
        }

        layer.service = YamlString(root, "service");

        if (const auto pricing = root["pricing"]) {
            layer.api_url = YamlString(pricing, "api_url");
            layer.region = YamlString(pricing, "region");
            layer.currency = YamlString(pricing, "currency");
        }
        if (const auto fetch = root["fetch"]) {
            layer.timeout_seconds = YamlScalar<double>(fetch, "timeout");
            layer.retries = YamlScalar<int>(fetch, "retries");
            layer.backoff_seconds = YamlScalar<double>(fetch, "backoff");
        }
        if (const auto server = root["server"]) {
            if (auto bytes = YamlScalar<long long>(server, "max_frame_bytes")) {
                if (*bytes <= 0) {
                    return Result<ConfigOverrides, Error>::Err(MakeConfigError(
                        "server.max_frame_bytes must be positive"));
                }
                layer.max_frame_bytes = static_cast<size_t>(*bytes);
            }
        }
        if (const auto health = root["health"]) {
            layer.health_sku = YamlString(health, "sku");
            layer.health_region = YamlString(health, "region");
            layer.health_currency = YamlString(health, "currency");
        }
        if (const auto log = root["log"]) {
            if (auto level = YamlString(log, "level")) {
                layer.log_level = ParseLogLevel(*level);
                if (!layer.log_level) {
                    return Result<ConfigOverrides, Error>::Err(
                        MakeConfigError("Unknown log.level: " + *level));
                }
            }
            layer.log_json = YamlScalar<bool>(log, "json");
            layer.color = YamlScalar<bool>(log, "color");
        }
    } catch (const YAML::Exception& e) {
        return Result<ConfigOverrides, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }

    return Result<ConfigOverrides, Error>::Ok(std::move(layer));
}

// ---------------------------------------------------------------------------
// LoadFromEnv
// ---------------------------------------------------------------------------
Result<ConfigOverrides, Error> LoadFromEnv(const EnvLookup& env) {
    ConfigOverrides layer;

    auto get = [&env](const char* name) -> std::optional<std::string> {
        auto value = env(name);
        if (!value || value->empty()) return std::nullopt;
        return value;
    };
    auto invalid = [](const char* name, const std::string& value) {
        return Result<ConfigOverrides, Error>::Err(MakeConfigError(
            std::string("Invalid ") + name + ": '" + value + "'"));
    };

    layer.api_url = get("AZURE_PRICING_API");
    layer.region = get("AZURE_PRICING_REGION");
    layer.currency = get("AZURE_PRICING_CURRENCY");

    if (auto raw = get("AZURE_PRICING_TIMEOUT")) {
        layer.timeout_seconds = ParseDouble(*raw);
        if (!layer.timeout_seconds) return invalid("AZURE_PRICING_TIMEOUT", *raw);
    }
    if (auto raw = get("AZURE_PRICING_RETRIES")) {
        auto retries = ParseInteger(*raw);
        if (!retries || *retries < 0 || *retries > 1000) {
            return invalid("AZURE_PRICING_RETRIES", *raw);
        }
        layer.retries = static_cast<int>(*retries);
    }
    if (auto raw = get("AZURE_PRICING_BACKOFF")) {
        layer.backoff_seconds = ParseDouble(*raw);
        if (!layer.backoff_seconds) return invalid("AZURE_PRICING_BACKOFF", *raw);
    }

    layer.health_sku = get("AZURE_PRICING_HEALTH_SKU");
    layer.health_region = get("AZURE_PRICING_HEALTH_REGION");
    layer.health_currency = get("AZURE_PRICING_HEALTH_CURRENCY");

    if (auto raw = get("AZMCP_LOG_LEVEL")) {
        layer.log_level = ParseLogLevel(*raw);
        if (!layer.log_level) return invalid("AZMCP_LOG_LEVEL", *raw);
    }
    if (auto raw = get("AZMCP_LOG_JSON")) {
        layer.log_json = ParseBool(*raw);
        if (!layer.log_json) return invalid("AZMCP_LOG_JSON", *raw);
    }

    return Result<ConfigOverrides, Error>::Ok(std::move(layer));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<CliInvocation, Error> LoadFromCli(int argc, const char* const* argv) {
    // -v is verbosity here, so only -h/--help is added automatically.
    argparse::ArgumentParser program("azmcp", kVersion,
                                     argparse::default_arguments::help);
    program.add_description(
        "Framed JSON-RPC tool server for Azure retail pricing.\n"
        "Commands: mcp, ping, price_search SKU, cost_estimate SKU [QUANTITY],\n"
        "query KUSTO, search QUERY, health");

    program.add_argument("words")
        .help("command followed by its arguments")
        .nargs(argparse::nargs_pattern::any);

    program.add_argument("--service")
        .help("tool service: pricing, resource-graph or docs");
    program.add_argument("-c", "--config")
        .help("path to YAML config file");
    program.add_argument("--api-url")
        .help("Azure Retail Prices API URL");
    program.add_argument("--timeout")
        .help("per-attempt HTTP timeout in seconds")
        .scan<'g', double>();
    program.add_argument("--retries")
        .help("total HTTP attempts per fetch")
        .scan<'i', int>();
    program.add_argument("--backoff")
        .help("base retry backoff in seconds")
        .scan<'g', double>();
    program.add_argument("--region")
        .help("default region filter");
    program.add_argument("--currency")
        .help("default currency filter");
    program.add_argument("--max-frame-bytes")
        .help("largest accepted frame body")
        .scan<'i', long long>();

    int verbosity = 0;
    program.add_argument("-v", "--verbose")
        .help("increase log verbosity (-v info, -vv debug)")
        .action([&verbosity](const auto&) { ++verbosity; })
        .append()
        .default_value(false)
        .implicit_value(true)
        .nargs(0);
    program.add_argument("--log-json")
        .help("log JSON lines to stderr")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-color")
        .help("disable colored log output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--version")
        .help("print version and exit")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<CliInvocation, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    CliInvocation invocation;
    auto& layer = invocation.overrides;

    auto words = program.get<std::vector<std::string>>("words");
    if (!words.empty()) {
        invocation.command = words.front();
        invocation.args.assign(words.begin() + 1, words.end());
    }

    invocation.config_path = program.present("--config");
    layer.service = program.present("--service");
    layer.api_url = program.present("--api-url");
    layer.region = program.present("--region");
    layer.currency = program.present("--currency");
    layer.timeout_seconds = program.present<double>("--timeout");
    layer.retries = program.present<int>("--retries");
    layer.backoff_seconds = program.present<double>("--backoff");
    if (auto bytes = program.present<long long>("--max-frame-bytes")) {
        if (*bytes <= 0) {
            return Result<CliInvocation, Error>::Err(
                MakeConfigError("--max-frame-bytes must be positive"));
        }
        layer.max_frame_bytes = static_cast<size_t>(*bytes);
    }

    if (verbosity >= 2) {
        layer.log_level = LogLevel::Debug;
    } else if (verbosity == 1) {
        layer.log_level = LogLevel::Info;
    }
    if (program.get<bool>("--log-json")) {
        layer.log_json = true;
    }
    if (program.get<bool>("--no-color")) {
        layer.color = false;
    }
    invocation.show_version = program.get<bool>("--version");

    return Result<CliInvocation, Error>::Ok(std::move(invocation));
}

// ---------------------------------------------------------------------------
// ApplyOverrides
// ---------------------------------------------------------------------------
void ApplyOverrides(AppConfig& config, const ConfigOverrides& layer) {
    if (layer.service) config.service = *layer.service;
    if (layer.api_url) config.pricing.api_url = *layer.api_url;
    if (layer.region) config.pricing.region = layer.region;
    if (layer.currency) config.pricing.currency = layer.currency;
    if (layer.timeout_seconds) config.fetch.timeout_seconds = *layer.timeout_seconds;
    if (layer.retries) config.fetch.retries = *layer.retries;
    if (layer.backoff_seconds) config.fetch.backoff_seconds = *layer.backoff_seconds;
    if (layer.max_frame_bytes) config.server.max_frame_bytes = *layer.max_frame_bytes;
    if (layer.health_sku) config.health.sku = *layer.health_sku;
    if (layer.health_region) config.health.region = layer.health_region;
    if (layer.health_currency) config.health.currency = layer.health_currency;
    if (layer.log_level) config.log.level = *layer.log_level;
    if (layer.log_json) config.log.json = *layer.log_json;
    if (layer.color) config.log.color = *layer.color;
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    if (!ParseServiceKind(config.service)) {
        return Result<void, Error>::Err(MakeConfigError(
            "Unknown service '" + config.service +
            "' (expected pricing, resource-graph or docs)"));
    }
    auto url = ApiUrl::Create(config.pricing.api_url)
                   .MapErr([](const std::string& why) {
                       return MakeConfigError("Invalid API URL: " + why);
                   });
    if (url.IsErr()) {
        return Result<void, Error>::Err(url.Error());
    }
    if (!(config.fetch.timeout_seconds > 0)) {
        return Result<void, Error>::Err(
            MakeConfigError("timeout must be greater than 0"));
    }
    if (!(config.fetch.timeout_seconds <= kMaxTimeoutSeconds)) {
        return Result<void, Error>::Err(MakeConfigError(
            "timeout must be at most " + std::to_string(static_cast<int>(kMaxTimeoutSeconds)) +
            " seconds"));
    }
    if (config.fetch.retries < 1) {
        return Result<void, Error>::Err(
            MakeConfigError("retries must be at least 1"));
    }
    if (!(config.fetch.backoff_seconds >= 0)) {
        return Result<void, Error>::Err(
            MakeConfigError("backoff must not be negative"));
    }
    if (!(config.fetch.backoff_seconds <= kMaxBackoffSeconds)) {
        return Result<void, Error>::Err(MakeConfigError(
            "backoff must be at most " + std::to_string(static_cast<int>(kMaxBackoffSeconds)) +
            " seconds"));
    }
    if (config.server.max_frame_bytes == 0) {
        return Result<void, Error>::Err(
            MakeConfigError("max_frame_bytes must be positive"));
    }
    if (config.health.sku.empty()) {
        return Result<void, Error>::Err(
            MakeConfigError("health sku must not be empty"));
    }
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// ResolveConfig
// ---------------------------------------------------------------------------
Result<AppConfig, Error> ResolveConfig(const CliInvocation& invocation,
                                       const EnvLookup& env) {
    AppConfig config;

    if (invocation.config_path) {
        auto yaml = LoadFromYaml(*invocation.config_path);
        if (yaml.IsErr()) {
            return Result<AppConfig, Error>::Err(std::move(yaml).Error());
        }
        ApplyOverrides(config, yaml.Value());
    }

    auto from_env = LoadFromEnv(env);
    if (from_env.IsErr()) {
        return Result<AppConfig, Error>::Err(std::move(from_env).Error());
    }
    ApplyOverrides(config, from_env.Value());
    ApplyOverrides(config, invocation.overrides);

    auto valid = ValidateConfig(config);
    if (valid.IsErr()) {
        return Result<AppConfig, Error>::Err(valid.Error());
    }
    return Result<AppConfig, Error>::Ok(std::move(config));
}

} // namespace azmcp
