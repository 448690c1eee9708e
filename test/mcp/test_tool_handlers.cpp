#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <azmcp/mcp/tool_handlers.hpp>

#include "../mocks/mock_http_client.hpp"

#include <chrono>
#include <string>

using namespace azmcp;
using namespace azmcp::testing;
using Catch::Matchers::WithinAbs;

namespace {

struct CatalogFixture {
    MockHttpClient http;
    RetryingFetcher fetcher{http, RetryPolicy{}, [](std::chrono::milliseconds) {}};
    PriceCatalog catalog{fetcher, "/api/retail/prices"};

    std::string LastFilter() const {
        REQUIRE(http.GetCallCount() > 0);
        return http.GetCalls().back().QueryValue("$filter");
    }
};

} // anonymous namespace

// ===========================================================================
// Service kinds
// ===========================================================================

TEST_CASE("ServiceKind: parse and names", "[mcp][handlers]") {
    CHECK(ParseServiceKind("pricing") == ServiceKind::Pricing);
    CHECK(ParseServiceKind("resource-graph") == ServiceKind::ResourceGraph);
    CHECK(ParseServiceKind("docs") == ServiceKind::Docs);
    CHECK_FALSE(ParseServiceKind("Pricing").has_value());
    CHECK_FALSE(ParseServiceKind("").has_value());

    CHECK(ServiceKindName(ServiceKind::ResourceGraph) == "resource-graph");
    CHECK(ServiceName(ServiceKind::Pricing) == "azure-pricing-mcp");
    CHECK(ServiceName(ServiceKind::ResourceGraph) == "azure-resource-graph-mcp");
    CHECK(ServiceName(ServiceKind::Docs) == "microsoft-docs-mcp");
    CHECK(PingResult(ServiceKind::Docs) ==
          nlohmann::json({{"status", "ok"}, {"service", "microsoft-docs-mcp"}}));
}

TEST_CASE("RegisterServiceTools: each service has its own catalog",
          "[mcp][handlers]") {
    CatalogFixture fx;

    ToolRegistry pricing;
    RegisterServiceTools(pricing, ServiceKind::Pricing, fx.catalog, {});
    REQUIRE(pricing.Tools().size() == 2);
    CHECK(pricing.Tools()[0].name == "price_search");
    CHECK(pricing.Tools()[1].name == "cost_estimate");
    CHECK(pricing.Tools()[0].input_schema["required"] == nlohmann::json::array({"sku"}));
    CHECK(pricing.Tools()[1].input_schema["properties"]["quantity"]["minimum"] == 1);

    ToolRegistry graph;
    RegisterServiceTools(graph, ServiceKind::ResourceGraph, fx.catalog, {});
    REQUIRE(graph.Tools().size() == 1);
    CHECK(graph.Tools()[0].name == "query");
    CHECK_FALSE(graph.Tools()[0].input_schema.contains("required"));

    ToolRegistry docs;
    RegisterServiceTools(docs, ServiceKind::Docs, fx.catalog, {});
    REQUIRE(docs.Tools().size() == 1);
    CHECK(docs.Tools()[0].name == "search");

    CHECK(fx.http.GetCallCount() == 0);
}

// ===========================================================================
// price_search
// ===========================================================================

TEST_CASE("price_search: builds the filter and truncates items", "[mcp][handlers]") {
    CatalogFixture fx;
    fx.http.EnqueueResponse(200, PriceItemsBody(8));

    auto out = RunPriceSearch(fx.catalog,
                              {{"sku", "Standard_D2s_v3"},
                               {"region", "eastus"},
                               {"currency", "USD"}},
                              {});

    REQUIRE(out.IsOk());
    CHECK(out.Value()["status"] == "ok");
    CHECK(out.Value()["tool"] == "price_search");
    CHECK(out.Value()["sku"] == "Standard_D2s_v3");
    CHECK(out.Value()["count"] == 8);
    CHECK(out.Value()["items"].size() == 5);
    CHECK(fx.LastFilter() ==
          "contains(skuName,'Standard_D2s_v3') and armRegionName eq 'eastus' "
          "and currencyCode eq 'USD'");
    CHECK(fx.http.GetCalls().back().path == "/api/retail/prices");
}

TEST_CASE("price_search: defaults apply when call omits region and currency",
          "[mcp][handlers]") {
    CatalogFixture fx;
    fx.http.EnqueueResponse(200, R"({"Items":[]})");
    fx.http.EnqueueResponse(200, R"({"Items":[]})");
    PricingDefaults defaults{std::string("westeurope"), std::string("EUR")};

    REQUIRE(RunPriceSearch(fx.catalog, {{"sku", "B2s"}, {"region", nullptr}},
                           defaults).IsOk());
    CHECK(fx.LastFilter() ==
          "contains(skuName,'B2s') and armRegionName eq 'westeurope' "
          "and currencyCode eq 'EUR'");

    REQUIRE(RunPriceSearch(fx.catalog, {{"sku", "B2s"}, {"region", " eastus "}},
                           defaults).IsOk());
    CHECK(fx.LastFilter() ==
          "contains(skuName,'B2s') and armRegionName eq 'eastus' "
          "and currencyCode eq 'EUR'");
}

TEST_CASE("price_search: quotes in the SKU are escaped", "[mcp][handlers]") {
    CatalogFixture fx;
    fx.http.EnqueueResponse(200, R"({"Items":[]})");

    auto out = RunPriceSearch(fx.catalog, {{"sku", "O'Brien"}}, {});
    REQUIRE(out.IsOk());
    CHECK(out.Value()["count"] == 0);
    CHECK(out.Value()["items"].empty());
    CHECK(fx.LastFilter() == "contains(skuName,'O''Brien')");
}

TEST_CASE("price_search: only a missing sku is InvalidParams", "[mcp][handlers]") {
    CatalogFixture fx;

    auto absent = RunPriceSearch(fx.catalog, nlohmann::json::object(), {});
    REQUIRE(absent.IsErr());
    CHECK(absent.Error().kind == ToolErrorKind::InvalidParams);
    CHECK(absent.Error().message == "Missing required argument: sku");

    auto empty = RunPriceSearch(fx.catalog, {{"sku", ""}}, {});
    REQUIRE(empty.IsErr());
    CHECK(empty.Error().kind == ToolErrorKind::InvalidParams);

    CHECK(fx.http.GetCallCount() == 0);
}

TEST_CASE("price_search: rejected sku or filters fail the call", "[mcp][handlers]") {
    CatalogFixture fx;

    auto blank = RunPriceSearch(fx.catalog, {{"sku", "   "}}, {});
    REQUIRE(blank.IsErr());
    CHECK(blank.Error().kind == ToolErrorKind::Failed);
    CHECK(blank.Error().message == "sku must be a non-empty string");

    auto too_long = RunPriceSearch(
        fx.catalog, {{"sku", std::string(SkuName::kMaxLength + 1, 'x')}}, {});
    REQUIRE(too_long.IsErr());
    CHECK(too_long.Error().kind == ToolErrorKind::Failed);

    auto number = RunPriceSearch(fx.catalog, {{"sku", 42}}, {});
    REQUIRE(number.IsErr());
    CHECK(number.Error().kind == ToolErrorKind::Failed);

    auto bad_region = RunPriceSearch(fx.catalog, {{"sku", "B2s"}, {"region", 3}}, {});
    REQUIRE(bad_region.IsErr());
    CHECK(bad_region.Error().kind == ToolErrorKind::Failed);
    CHECK(bad_region.Error().message == "region must be a string");

    CHECK(fx.http.GetCallCount() == 0);
}

TEST_CASE("price_search: upstream failure is Failed", "[mcp][handlers]") {
    CatalogFixture fx;
    fx.http.SetStickyResponse(ConnectionRefused("/api/retail/prices"));

    auto out = RunPriceSearch(fx.catalog, {{"sku", "B2s"}}, {});
    REQUIRE(out.IsErr());
    CHECK(out.Error().kind == ToolErrorKind::Failed);
    CHECK_FALSE(out.Error().message.empty());
    CHECK(fx.http.GetCallCount() == 3);
}

// ===========================================================================
// cost_estimate
// ===========================================================================

TEST_CASE("cost_estimate: first item price times quantity times 730",
          "[mcp][handlers]") {
    CatalogFixture fx;
    fx.http.EnqueueResponse(200, R"({"Items":[{"retailPrice":0.5},{"retailPrice":9}]})");

    auto out = RunCostEstimate(fx.catalog, {{"sku", "B2s"}, {"quantity", 2}}, {});
    REQUIRE(out.IsOk());
    const auto& v = out.Value();
    CHECK(v["status"] == "ok");
    CHECK(v["tool"] == "cost_estimate");
    CHECK(v["sku"] == "B2s");
    CHECK(v["quantity"] == 2);
    CHECK_THAT(v["unit_price"].get<double>(), WithinAbs(0.5, 1e-9));
    CHECK_THAT(v["monthly_usd"].get<double>(), WithinAbs(730.0, 1e-9));
}

TEST_CASE("cost_estimate: quantity defaults to 1 and accepts strings",
          "[mcp][handlers]") {
    CatalogFixture fx;
    fx.http.EnqueueResponse(200, R"({"Items":[{"retailPrice":1.0}]})");
    fx.http.EnqueueResponse(200, R"({"Items":[{"retailPrice":1.0}]})");
    fx.http.EnqueueResponse(200, R"({"Items":[{"retailPrice":1.0}]})");

    auto defaulted = RunCostEstimate(fx.catalog, {{"sku", "B2s"}}, {});
    REQUIRE(defaulted.IsOk());
    CHECK(defaulted.Value()["quantity"] == 1);
    CHECK_THAT(defaulted.Value()["monthly_usd"].get<double>(), WithinAbs(730.0, 1e-9));

    auto text = RunCostEstimate(fx.catalog, {{"sku", "B2s"}, {"quantity", "3"}}, {});
    REQUIRE(text.IsOk());
    CHECK(text.Value()["quantity"] == 3);

    auto fractional = RunCostEstimate(fx.catalog, {{"sku", "B2s"}, {"quantity", 2.9}}, {});
    REQUIRE(fractional.IsOk());
    CHECK(fractional.Value()["quantity"] == 2);
}

TEST_CASE("cost_estimate: bad quantity is rejected before any fetch",
          "[mcp][handlers]") {
    CatalogFixture fx;

    auto word = RunCostEstimate(fx.catalog, {{"sku", "B2s"}, {"quantity", "two"}}, {});
    REQUIRE(word.IsErr());
    CHECK(word.Error().kind == ToolErrorKind::InvalidParams);
    CHECK(word.Error().message == "quantity must be an integer");

    auto list = RunCostEstimate(fx.catalog,
                                {{"sku", "B2s"}, {"quantity", nlohmann::json::array()}}, {});
    REQUIRE(list.IsErr());
    CHECK(list.Error().kind == ToolErrorKind::InvalidParams);

    CHECK(fx.http.GetCallCount() == 0);
}

TEST_CASE("cost_estimate: zero and negative quantities are computed as given",
          "[mcp][handlers]") {
    CatalogFixture fx;
    fx.http.EnqueueResponse(200, R"({"Items":[{"retailPrice":1.0}]})");
    fx.http.EnqueueResponse(200, R"({"Items":[{"retailPrice":1.0}]})");

    auto zero = RunCostEstimate(fx.catalog, {{"sku", "B2s"}, {"quantity", 0}}, {});
    REQUIRE(zero.IsOk());
    CHECK(zero.Value()["quantity"] == 0);
    CHECK_THAT(zero.Value()["monthly_usd"].get<double>(), WithinAbs(0.0, 1e-9));

    auto negative = RunCostEstimate(fx.catalog, {{"sku", "B2s"}, {"quantity", -2}}, {});
    REQUIRE(negative.IsOk());
    CHECK_THAT(negative.Value()["monthly_usd"].get<double>(), WithinAbs(-1460.0, 1e-9));
}

TEST_CASE("cost_estimate: no records is a not-found result, not an error",
          "[mcp][handlers]") {
    CatalogFixture fx;
    fx.http.EnqueueResponse(200, R"({"Items":[]})");

    auto out = RunCostEstimate(fx.catalog, {{"sku", "Nonexistent"}}, {});
    REQUIRE(out.IsOk());
    CHECK(out.Value() == nlohmann::json({{"status", "not-found"},
                                         {"tool", "cost_estimate"},
                                         {"sku", "Nonexistent"}}));
}

TEST_CASE("cost_estimate: missing retailPrice estimates zero", "[mcp][handlers]") {
    CatalogFixture fx;
    fx.http.EnqueueResponse(200, R"({"Items":[{"skuName":"B2s"}]})");

    auto out = RunCostEstimate(fx.catalog, {{"sku", "B2s"}, {"quantity", 4}}, {});
    REQUIRE(out.IsOk());
    CHECK(out.Value()["monthly_usd"].get<double>() == 0.0);
}

// ===========================================================================
// Stub services
// ===========================================================================

TEST_CASE("query: echoes the KQL text with empty results", "[mcp][handlers]") {
    auto out = RunResourceGraphQuery({{"kusto", "Resources | take 1"}});
    REQUIRE(out.IsOk());
    CHECK(out.Value()["tool"] == "query");
    CHECK(out.Value()["query"] == "Resources | take 1");
    CHECK(out.Value()["results"].empty());
    CHECK(out.Value()["note"] == "stub response");

    auto alias = RunResourceGraphQuery({{"query", "Resources"}});
    REQUIRE(alias.IsOk());
    CHECK(alias.Value()["query"] == "Resources");

    auto none = RunResourceGraphQuery(nlohmann::json::object());
    REQUIRE(none.IsErr());
    CHECK(none.Error().kind == ToolErrorKind::InvalidParams);
}

TEST_CASE("search: returns one stub hit carrying the query", "[mcp][handlers]") {
    auto out = RunDocsSearch({{"query", "aks autoscale"}});
    REQUIRE(out.IsOk());
    CHECK(out.Value()["tool"] == "search");
    REQUIRE(out.Value()["results"].size() == 1);
    CHECK(out.Value()["results"][0]["snippet"] == "aks autoscale");
    CHECK(out.Value()["results"][0]["url"] == "https://learn.microsoft.com/");

    CHECK(RunDocsSearch({{"query", ""}}).IsErr());
}
