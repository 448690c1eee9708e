#include <azmcp/cli/command_runner.hpp>
#include <azmcp/config/config_loader.hpp>
#include <azmcp/core/log.hpp>
#include <azmcp/core/terminal.hpp>
#include <azmcp/core/types.hpp>
#include <azmcp/core/version.hpp>
#include <azmcp/http/http_client.hpp>
#include <azmcp/http/retrying_fetcher.hpp>
#include <azmcp/mcp/dispatcher.hpp>
#include <azmcp/mcp/mcp_server.hpp>
#include <azmcp/mcp/tool_handlers.hpp>
#include <azmcp/pricing/price_catalog.hpp>

#include <chrono>
#include <cmath>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

namespace {

using namespace azmcp;

void PrintError(const Error& error, bool json_output) {
    if (json_output) {
        std::cerr << error.ToJson() << "\n";
    } else {
        std::cerr << "Error: " << error.ToString() << "\n";
    }
}

std::chrono::milliseconds SecondsToMillis(double seconds) {
    return std::chrono::milliseconds(
        static_cast<long long>(std::llround(seconds * 1000.0)));
}

void InitLogging(const LogConfig& log, const std::string& service) {
    const bool use_color = DetectColorPolicy(log.color).UseColor();
    InitGlobalLogger(MakeStderrSink(log.json, use_color, service), log.level);
}

int RunMcpServer(const AppConfig& config, ServiceKind service,
                 PriceCatalog& catalog) {
    ToolRegistry registry;
    RegisterServiceTools(registry, service, catalog,
                         PricingDefaults{config.pricing.region,
                                         config.pricing.currency});

    Dispatcher dispatcher(std::move(registry),
                          ServerIdentity{ServiceName(service), kVersion});
    McpServer server(std::move(dispatcher), std::cin, std::cout,
                     config.server.max_frame_bytes);
    server.Run();
    return kExitSuccess;
}

int Run(int argc, const char* const* argv) {
    auto cli = LoadFromCli(argc, argv);
    if (cli.IsErr()) {
        PrintError(cli.Error(), false);
        return cli.Error().ExitCode();
    }
    const auto invocation = std::move(cli).Value();

    if (invocation.show_version) {
        std::cout << "azmcp " << kVersion << "\n";
        return kExitSuccess;
    }

    auto resolved = ResolveConfig(invocation);
    if (resolved.IsErr()) {
        PrintError(resolved.Error(), invocation.overrides.log_json.value_or(false));
        return resolved.Error().ExitCode();
    }
    const auto config = std::move(resolved).Value();

    // ValidateConfig accepted both values, so neither lookup can fail.
    const auto service = ParseServiceKind(config.service).value_or(ServiceKind::Pricing);
    const auto api = ApiUrl::Create(config.pricing.api_url).Value();
    InitLogging(config.log, ServiceName(service));

    const auto command = invocation.command.empty() ? std::string("ping")
                                                    : invocation.command;
    if (command != "mcp" && !CommandRunner::IsOneShotCommand(command)) {
        std::cerr << "azmcp: unknown command: " << command
                  << " (try --help)\n";
        return kExitUsage;
    }

    HttpClientOptions http_options;
    http_options.timeout = SecondsToMillis(config.fetch.timeout_seconds);
    http_options.user_agent = std::string("azmcp/") + kVersion;
    HttpClient http(api.Origin(), http_options);

    RetryPolicy policy;
    policy.max_attempts = config.fetch.retries;
    policy.base_backoff = SecondsToMillis(config.fetch.backoff_seconds);
    RetryingFetcher fetcher(http, policy);
    PriceCatalog catalog(fetcher, api.Path());

    LogDebug("cli", "service=" + config.service + " api=" + api.Value() +
                        " attempts=" + std::to_string(policy.max_attempts));

    if (command == "mcp") {
        if (!invocation.args.empty()) {
            std::cerr << "azmcp: mcp takes no arguments\n";
            return kExitUsage;
        }
        return RunMcpServer(config, service, catalog);
    }

    CommandRunner runner(config, catalog);
    return runner.Run(command, invocation.args);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    // Frames are read with readsome(); that needs cin's own buffer.
    std::ios::sync_with_stdio(false);

    try {
        return Run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return azmcp::kExitFailure;
    }
}
