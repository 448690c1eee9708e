#include <azmcp/pricing/price_catalog.hpp>

#include <azmcp/core/log.hpp>

#include <cstdlib>
#include <vector>

namespace azmcp {

std::string ODataEscape(std::string_view value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        out += c;
        if (c == '\'') out += '\'';
    }
    return out;
}

std::string BuildPriceFilter(const PriceQuery& query) {
    std::vector<std::string> clauses;
    clauses.push_back("contains(skuName,'" + ODataEscape(query.sku.Value()) + "')");
    if (query.region && !query.region->empty()) {
        clauses.push_back("armRegionName eq '" + ODataEscape(*query.region) + "'");
    }
    if (query.currency && !query.currency->empty()) {
        clauses.push_back("currencyCode eq '" + ODataEscape(*query.currency) + "'");
    }

    std::string filter;
    for (const auto& clause : clauses) {
        if (!filter.empty()) filter += " and ";
        filter += clause;
    }
    return filter;
}

double UnitPriceOf(const nlohmann::json& item) {
    if (!item.is_object()) return 0.0;
    auto it = item.find("retailPrice");
    if (it == item.end()) return 0.0;
    if (it->is_number()) return it->get<double>();
    if (it->is_string()) {
        const auto text = it->get<std::string>();
        char* end = nullptr;
        const double value = std::strtod(text.c_str(), &end);
        if (end != text.c_str() && *end == '\0') return value;
    }
    return 0.0;
}

PriceCatalog::PriceCatalog(RetryingFetcher& fetcher, std::string api_path)
    : fetcher_(fetcher), api_path_(std::move(api_path)) {}

Result<PriceSearchResult, Error> PriceCatalog::Search(const PriceQuery& query) {
    const auto filter = BuildPriceFilter(query);
    LogDebug("pricing", "$filter=" + filter);

    auto fetched = fetcher_.FetchJson(api_path_, {{"$filter", filter}});
    if (fetched.IsErr()) {
        return Result<PriceSearchResult, Error>::Err(std::move(fetched).Error());
    }

    const auto& body = fetched.Value();
    PriceSearchResult result;
    result.items = nlohmann::json::array();
    if (body.is_object()) {
        auto items = body.find("Items");
        if (items != body.end() && items->is_array()) {
            result.count = items->size();
            for (size_t i = 0; i < items->size() && i < kMaxPriceItems; ++i) {
                result.items.push_back((*items)[i]);
            }
        }
    }
    LogInfo("pricing", query.sku.Value() + ": " + std::to_string(result.count) +
                           " price record(s)");
    return Result<PriceSearchResult, Error>::Ok(std::move(result));
}

Result<CostEstimate, Error> PriceCatalog::Estimate(const PriceQuery& query,
                                                   long long quantity) {
    auto found = Search(query);
    if (found.IsErr()) {
        return Result<CostEstimate, Error>::Err(std::move(found).Error());
    }
    const auto& search = found.Value();
    if (search.items.empty()) {
        return Result<CostEstimate, Error>::Err(Error{
            "CostEstimate", api_path_, std::nullopt,
            "No price records for " + query.sku.Value(), std::nullopt,
            ErrorCategory::NotFound});
    }

    CostEstimate estimate;
    estimate.quantity = quantity;
    estimate.unit_price = UnitPriceOf(search.items.front());
    estimate.monthly = estimate.unit_price * static_cast<double>(quantity) *
                       kHoursPerMonth;
    return Result<CostEstimate, Error>::Ok(estimate);
}

} // namespace azmcp
