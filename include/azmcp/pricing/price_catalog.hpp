#pragma once

#include <azmcp/core/error.hpp>
#include <azmcp/core/types.hpp>
#include <azmcp/http/retrying_fetcher.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace azmcp {

// ---------------------------------------------------------------------------
// Azure Retail Prices catalog queries.
//
// The upstream answers GET <api>?$filter=<odata> with
//   {"Items": [ {...price record...}, ... ], ...}
// ---------------------------------------------------------------------------

inline constexpr size_t kMaxPriceItems = 5;
inline constexpr double kHoursPerMonth = 730.0;

struct PriceQuery {
    SkuName sku;
    std::optional<std::string> region;
    std::optional<std::string> currency;
};

struct PriceSearchResult {
    size_t count = 0;                 // items returned upstream
    nlohmann::json items;             // first kMaxPriceItems records
};

struct CostEstimate {
    double unit_price = 0.0;
    long long quantity = 1;
    double monthly = 0.0;
};

/// Double every single quote so value is safe inside an OData string literal.
std::string ODataEscape(std::string_view value);

/// contains(skuName,'..') [and armRegionName eq '..'] [and currencyCode eq '..']
std::string BuildPriceFilter(const PriceQuery& query);

// ---------------------------------------------------------------------------
// PriceCatalog — price lookups against one API path through a fetcher.
// ---------------------------------------------------------------------------
class PriceCatalog {
public:
    PriceCatalog(RetryingFetcher& fetcher, std::string api_path);

    /// Fetch matching price records. A response without an "Items" array
    /// counts as zero items.
    [[nodiscard]] Result<PriceSearchResult, Error> Search(
        const PriceQuery& query);

    /// Unit price of the first matching record times quantity times
    /// kHoursPerMonth. Err with ErrorCategory::NotFound when nothing matches.
    [[nodiscard]] Result<CostEstimate, Error> Estimate(const PriceQuery& query,
                                                       long long quantity);

private:
    RetryingFetcher& fetcher_;
    std::string api_path_;
};

/// retailPrice of a price record; missing, null, zero or non-numeric -> 0.
double UnitPriceOf(const nlohmann::json& item);

} // namespace azmcp
