#pragma once

#include <azmcp/config/app_config.hpp>
#include <azmcp/mcp/tool_handlers.hpp>
#include <azmcp/pricing/price_catalog.hpp>

#include <iostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace azmcp {

// Process exit codes.
inline constexpr int kExitSuccess = 0;
inline constexpr int kExitFailure = 1;  // tool or upstream failure
inline constexpr int kExitUsage = 2;    // bad command line or config

// ---------------------------------------------------------------------------
// CommandRunner — one-shot CLI commands.
//
//   ping                         service liveness document
//   price_search SKU             price records (region/currency from config)
//   cost_estimate SKU [QUANTITY] monthly estimate
//   query KUSTO                  resource-graph query (stub)
//   search QUERY                 docs search (stub)
//   health                       ping + price_search for the health SKU
//
// Each command prints exactly one JSON document on the output stream.
// Usage errors go to the error stream.
// ---------------------------------------------------------------------------
class CommandRunner {
public:
    CommandRunner(const AppConfig& config, PriceCatalog& catalog,
                  std::ostream& out = std::cout,
                  std::ostream& err = std::cerr);

    /// True for the commands Run() understands (everything except "mcp").
    [[nodiscard]] static bool IsOneShotCommand(const std::string& command);

    /// Run one command and return the process exit code.
    int Run(const std::string& command, const std::vector<std::string>& args);

    /// Combined health report; status "error" in any part fails the check.
    [[nodiscard]] nlohmann::json HealthReport();

private:
    int RunTool(const std::string& tool, const ToolOutcome& outcome);
    int Usage(const std::string& message);

    const AppConfig& config_;
    PriceCatalog& catalog_;
    std::ostream& out_;
    std::ostream& err_;
};

} // namespace azmcp
