#pragma once

#include <azmcp/mcp/tool_registry.hpp>
#include <azmcp/pricing/price_catalog.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace azmcp {

// ---------------------------------------------------------------------------
// ServiceKind — which tool catalog a server instance exposes.
//
//   pricing          price_search, cost_estimate   (azure-pricing-mcp)
//   resource-graph   query (stub)                  (azure-resource-graph-mcp)
//   docs             search (stub)                 (microsoft-docs-mcp)
// ---------------------------------------------------------------------------
enum class ServiceKind {
    Pricing,
    ResourceGraph,
    Docs,
};

std::optional<ServiceKind> ParseServiceKind(std::string_view text);

/// Command-line spelling: "pricing", "resource-graph", "docs".
std::string ServiceKindName(ServiceKind kind);

/// Server identity name reported by initialize and ping.
std::string ServiceName(ServiceKind kind);

// Region and currency used when a call does not supply its own.
struct PricingDefaults {
    std::optional<std::string> region;
    std::optional<std::string> currency;
};

// Register price_search and cost_estimate. Handlers capture &catalog by
// reference; the catalog must outlive the registry.
void RegisterPricingTools(ToolRegistry& registry, PriceCatalog& catalog,
                          const PricingDefaults& defaults);

void RegisterResourceGraphTools(ToolRegistry& registry);

void RegisterDocsTools(ToolRegistry& registry);

// Register the tool catalog of one service.
void RegisterServiceTools(ToolRegistry& registry, ServiceKind kind,
                          PriceCatalog& catalog, const PricingDefaults& defaults);

// ---------------------------------------------------------------------------
// Tool bodies, shared by the MCP handlers and the one-shot CLI.
// ---------------------------------------------------------------------------

/// {"status":"ok","service":<name>}
nlohmann::json PingResult(ServiceKind kind);

ToolOutcome RunPriceSearch(PriceCatalog& catalog, const nlohmann::json& arguments,
                           const PricingDefaults& defaults);

ToolOutcome RunCostEstimate(PriceCatalog& catalog,
                            const nlohmann::json& arguments,
                            const PricingDefaults& defaults);

ToolOutcome RunResourceGraphQuery(const nlohmann::json& arguments);

ToolOutcome RunDocsSearch(const nlohmann::json& arguments);

} // namespace azmcp
