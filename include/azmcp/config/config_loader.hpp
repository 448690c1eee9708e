#pragma once

#include <azmcp/config/app_config.hpp>
#include <azmcp/core/error.hpp>

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace azmcp {

// Environment lookup; returns nullopt for unset variables.
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

/// EnvLookup backed by std::getenv.
std::optional<std::string> ProcessEnv(const std::string& name);

// Parse a YAML config file into an override layer.
Result<ConfigOverrides, Error> LoadFromYaml(std::string_view file_path);

// Read the AZURE_PRICING_* environment variables into an override layer.
// Empty variables are treated as unset.
Result<ConfigOverrides, Error> LoadFromEnv(const EnvLookup& env = ProcessEnv);

// ---------------------------------------------------------------------------
// CliInvocation — parsed command line.
//
//   azmcp [global options] <command> [args...]
// ---------------------------------------------------------------------------
struct CliInvocation {
    std::string command;                  // empty when none was given
    std::vector<std::string> args;        // positionals after the command
    std::optional<std::string> config_path;
    ConfigOverrides overrides;
    bool show_version = false;
};

// Parse CLI arguments. Errors carry ErrorCategory::Config.
Result<CliInvocation, Error> LoadFromCli(int argc, const char* const* argv);

// Apply one override layer on top of config.
void ApplyOverrides(AppConfig& config, const ConfigOverrides& layer);

// Validate that values are usable.
Result<void, Error> ValidateConfig(const AppConfig& config);

// Defaults, then the YAML file (if any), then the environment, then the
// command line. The result is validated.
Result<AppConfig, Error> ResolveConfig(const CliInvocation& invocation,
                                       const EnvLookup& env = ProcessEnv);

} // namespace azmcp
