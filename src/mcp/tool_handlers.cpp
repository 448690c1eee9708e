#include <azmcp/mcp/tool_handlers.hpp>

#include <azmcp/core/types.hpp>

#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace azmcp {

namespace {

// ---------------------------------------------------------------------------
// Argument helpers
// ---------------------------------------------------------------------------

ToolOutcome ParamError(const std::string& msg) {
    return ToolOutcome::Err(ToolError::InvalidParams(msg));
}

ToolError UpstreamFailure(const Error& error) {
    return ToolError::Failed(error.ToString());
}

// Non-empty string argument, or nullopt when absent, null or empty.
std::optional<std::string> OptString(const nlohmann::json& args,
                                     const std::string& key) {
    auto it = args.find(key);
    if (it == args.end() || !it->is_string()) return std::nullopt;
    auto value = it->get<std::string>();
    if (value.empty()) return std::nullopt;
    return value;
}

// Call value if given, else the configured default. Both are trimmed; a
// value that trims to nothing means "no filter".
Result<std::optional<std::string>, std::string> FilterArg(
    const nlohmann::json& args, const std::string& key,
    const std::optional<std::string>& fallback) {
    using R = Result<std::optional<std::string>, std::string>;
    std::optional<std::string> raw;
    auto it = args.find(key);
    if (it != args.end() && !it->is_null()) {
        if (!it->is_string()) {
            return R::Err(key + " must be a string");
        }
        raw = it->get<std::string>();
    }
    if (!raw || raw->empty()) raw = fallback;
    if (!raw) return R::Ok(std::nullopt);

    auto trimmed = std::string(TrimWhitespace(*raw));
    if (trimmed.empty()) return R::Ok(std::nullopt);
    return R::Ok(std::move(trimmed));
}

// Integer quantity: JSON integers, finite numbers (truncated) and decimal
// strings are accepted.
std::optional<long long> ParseQuantity(const nlohmann::json& value) {
    if (value.is_number_integer()) return value.get<long long>();
    if (value.is_number_float()) {
        const double d = value.get<double>();
        if (!std::isfinite(d) ||
            std::fabs(d) > static_cast<double>(std::numeric_limits<long long>::max())) {
            return std::nullopt;
        }
        return static_cast<long long>(d);
    }
    if (value.is_string()) {
        auto text = std::string(TrimWhitespace(value.get<std::string>()));
        if (text.empty()) return std::nullopt;
        size_t pos = 0;
        try {
            const long long parsed = std::stoll(text, &pos, 10);
            if (pos != text.size()) return std::nullopt;
            return parsed;
        } catch (const std::logic_error&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

// Only an absent sku is an argument error; everything the pricing call itself
// rejects fails the call.
Result<PriceQuery, ToolError> MakePriceQuery(const nlohmann::json& args,
                                             const PricingDefaults& defaults) {
    using R = Result<PriceQuery, ToolError>;
    auto it = args.find("sku");
    if (it == args.end() || it->is_null() ||
        (it->is_string() && it->get<std::string>().empty())) {
        return R::Err(ToolError::InvalidParams("Missing required argument: sku"));
    }
    if (!it->is_string()) {
        return R::Err(ToolError::Failed("sku must be a non-empty string"));
    }
    auto sku = SkuName::Create(it->get<std::string>());
    if (sku.IsErr()) return R::Err(ToolError::Failed(sku.Error()));

    auto region = FilterArg(args, "region", defaults.region);
    if (region.IsErr()) return R::Err(ToolError::Failed(region.Error()));
    auto currency = FilterArg(args, "currency", defaults.currency);
    if (currency.IsErr()) return R::Err(ToolError::Failed(currency.Error()));

    return R::Ok(PriceQuery{sku.Value(), region.Value(), currency.Value()});
}

// ---------------------------------------------------------------------------
// JSON Schema helpers
// ---------------------------------------------------------------------------

nlohmann::json StringProp(const std::string& desc) {
    return {{"type", "string"}, {"description", desc}};
}

nlohmann::json NullableStringProp(const std::string& desc) {
    return {{"type", nlohmann::json::array({"string", "null"})}, {"description", desc}};
}

nlohmann::json MakeSchema(const nlohmann::json& properties,
                          const nlohmann::json& required) {
    nlohmann::json schema = {{"type", "object"}, {"properties", properties}};
    if (!required.empty()) {
        schema["required"] = required;
    }
    return schema;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Service kinds
// ---------------------------------------------------------------------------

std::optional<ServiceKind> ParseServiceKind(std::string_view text) {
    if (text == "pricing") return ServiceKind::Pricing;
    if (text == "resource-graph") return ServiceKind::ResourceGraph;
    if (text == "docs") return ServiceKind::Docs;
    return std::nullopt;
}

std::string ServiceKindName(ServiceKind kind) {
    switch (kind) {
        case ServiceKind::Pricing:       return "pricing";
        case ServiceKind::ResourceGraph: return "resource-graph";
        case ServiceKind::Docs:          return "docs";
    }
    return "pricing";
}

std::string ServiceName(ServiceKind kind) {
    switch (kind) {
        case ServiceKind::Pricing:       return "azure-pricing-mcp";
        case ServiceKind::ResourceGraph: return "azure-resource-graph-mcp";
        case ServiceKind::Docs:          return "microsoft-docs-mcp";
    }
    return "azure-pricing-mcp";
}

nlohmann::json PingResult(ServiceKind kind) {
    return {{"status", "ok"}, {"service", ServiceName(kind)}};
}

// ---------------------------------------------------------------------------
// Tool bodies
// ---------------------------------------------------------------------------

ToolOutcome RunPriceSearch(PriceCatalog& catalog, const nlohmann::json& arguments,
                           const PricingDefaults& defaults) {
    auto query = MakePriceQuery(arguments, defaults);
    if (query.IsErr()) return ToolOutcome::Err(query.Error());

    auto found = catalog.Search(query.Value()).MapErr(UpstreamFailure);
    if (found.IsErr()) return ToolOutcome::Err(found.Error());
    const auto& search = found.Value();
    return ToolOutcome::Ok({{"status", "ok"},
                            {"tool", "price_search"},
                            {"sku", arguments.at("sku")},
                            {"count", search.count},
                            {"items", search.items}});
}

ToolOutcome RunCostEstimate(PriceCatalog& catalog,
                            const nlohmann::json& arguments,
                            const PricingDefaults& defaults) {
    auto query = MakePriceQuery(arguments, defaults);
    if (query.IsErr()) return ToolOutcome::Err(query.Error());

    long long quantity = 1;
    if (auto it = arguments.find("quantity"); it != arguments.end() && !it->is_null()) {
        auto parsed = ParseQuantity(*it);
        if (!parsed) return ParamError("quantity must be an integer");
        quantity = *parsed;
    }

    auto estimate = catalog.Estimate(query.Value(), quantity);
    if (estimate.IsErr()) {
        const auto& error = estimate.Error();
        if (error.category == ErrorCategory::NotFound) {
            return ToolOutcome::Ok({{"status", "not-found"},
                                    {"tool", "cost_estimate"},
                                    {"sku", arguments.at("sku")}});
        }
        return ToolOutcome::Err(UpstreamFailure(error));
    }

    const auto& value = estimate.Value();
    return ToolOutcome::Ok({{"status", "ok"},
                            {"tool", "cost_estimate"},
                            {"sku", arguments.at("sku")},
                            {"quantity", value.quantity},
                            {"unit_price", value.unit_price},
                            {"monthly_usd", value.monthly}});
}

ToolOutcome RunResourceGraphQuery(const nlohmann::json& arguments) {
    auto kusto = OptString(arguments, "kusto");
    if (!kusto) kusto = OptString(arguments, "query");
    if (!kusto) return ParamError("Missing required argument: kusto");

    return ToolOutcome::Ok({{"status", "ok"},
                            {"tool", "query"},
                            {"query", *kusto},
                            {"results", nlohmann::json::array()},
                            {"note", "stub response"}});
}

ToolOutcome RunDocsSearch(const nlohmann::json& arguments) {
    auto query = OptString(arguments, "query");
    if (!query) return ParamError("Missing required argument: query");

    nlohmann::json hit = {{"title", "stub result"},
                          {"url", "https://learn.microsoft.com/"},
                          {"snippet", *query}};
    return ToolOutcome::Ok({{"status", "ok"},
                            {"tool", "search"},
                            {"query", *query},
                            {"results", nlohmann::json::array({hit})},
                            {"note", "stub response"}});
}

// ---------------------------------------------------------------------------
// Registration
// ---------------------------------------------------------------------------

void RegisterPricingTools(ToolRegistry& registry, PriceCatalog& catalog,
                          const PricingDefaults& defaults) {
    registry.Register(
        "price_search",
        "Search Azure Retail Prices for a SKU name (optionally filtered by "
        "region/currency)",
        MakeSchema({{"sku", StringProp("SKU name substring, e.g. Standard_D2s_v3")},
                    {"region", NullableStringProp("ARM region name, e.g. eastus")},
                    {"currency", NullableStringProp("Currency code, e.g. USD")}},
                   {"sku"}),
        [&catalog, defaults](const nlohmann::json& args) {
            return RunPriceSearch(catalog, args, defaults);
        });

    registry.Register(
        "cost_estimate",
        "Estimate monthly cost (rough) for a SKU and quantity (optionally "
        "filtered by region/currency)",
        MakeSchema({{"sku", StringProp("SKU name substring")},
                    {"quantity", {{"type", "integer"},
                                  {"minimum", 1},
                                  {"description", "Number of instances (default 1)"}}},
                    {"region", NullableStringProp("ARM region name")},
                    {"currency", NullableStringProp("Currency code")}},
                   {"sku"}),
        [&catalog, defaults](const nlohmann::json& args) {
            return RunCostEstimate(catalog, args, defaults);
        });
}

void RegisterResourceGraphTools(ToolRegistry& registry) {
    registry.Register(
        "query",
        "Run an Azure Resource Graph KQL query (stub)",
        MakeSchema({{"kusto", StringProp("KQL query text")},
                    {"query", StringProp("Alias for kusto")}},
                   nlohmann::json::array()),
        [](const nlohmann::json& args) { return RunResourceGraphQuery(args); });
}

void RegisterDocsTools(ToolRegistry& registry) {
    registry.Register(
        "search",
        "Search Microsoft Learn/Docs (stub)",
        MakeSchema({{"query", StringProp("Search text")}}, {"query"}),
        [](const nlohmann::json& args) { return RunDocsSearch(args); });
}

void RegisterServiceTools(ToolRegistry& registry, ServiceKind kind,
                          PriceCatalog& catalog, const PricingDefaults& defaults) {
    switch (kind) {
        case ServiceKind::Pricing:
            RegisterPricingTools(registry, catalog, defaults);
            break;
        case ServiceKind::ResourceGraph:
            RegisterResourceGraphTools(registry);
            break;
        case ServiceKind::Docs:
            RegisterDocsTools(registry);
            break;
    }
}

} // namespace azmcp
