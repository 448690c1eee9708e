#include <azmcp/cli/command_runner.hpp>

#include <azmcp/core/log.hpp>

namespace azmcp {

namespace {

void PrintJsonLine(std::ostream& out, const nlohmann::json& doc) {
    out << doc.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)
        << "\n";
    out.flush();
}

nlohmann::json OptionalString(const std::optional<std::string>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

} // anonymous namespace

CommandRunner::CommandRunner(const AppConfig& config, PriceCatalog& catalog,
                             std::ostream& out, std::ostream& err)
    : config_(config), catalog_(catalog), out_(out), err_(err) {}

bool CommandRunner::IsOneShotCommand(const std::string& command) {
    return command == "ping" || command == "price_search" ||
           command == "cost_estimate" || command == "query" ||
           command == "search" || command == "health";
}

int CommandRunner::Run(const std::string& command,
                       const std::vector<std::string>& args) {
    const PricingDefaults defaults{config_.pricing.region,
                                   config_.pricing.currency};

    if (command == "ping") {
        if (!args.empty()) return Usage("ping takes no arguments");
        const auto kind = ParseServiceKind(config_.service).value_or(ServiceKind::Pricing);
        PrintJsonLine(out_, PingResult(kind));
        return kExitSuccess;
    }
    if (command == "price_search") {
        if (args.size() != 1) return Usage("usage: azmcp price_search SKU");
        return RunTool(command,
                       RunPriceSearch(catalog_, {{"sku", args[0]}}, defaults));
    }
    if (command == "cost_estimate") {
        if (args.empty() || args.size() > 2) {
            return Usage("usage: azmcp cost_estimate SKU [QUANTITY]");
        }
        nlohmann::json arguments = {{"sku", args[0]}};
        if (args.size() == 2) arguments["quantity"] = args[1];
        return RunTool(command, RunCostEstimate(catalog_, arguments, defaults));
    }
    if (command == "query") {
        if (args.size() != 1) return Usage("usage: azmcp query KUSTO");
        return RunTool(command, RunResourceGraphQuery({{"kusto", args[0]}}));
    }
    if (command == "search") {
        if (args.size() != 1) return Usage("usage: azmcp search QUERY");
        return RunTool(command, RunDocsSearch({{"query", args[0]}}));
    }
    if (command == "health") {
        if (!args.empty()) return Usage("health takes no arguments");
        auto report = HealthReport();
        PrintJsonLine(out_, report);
        for (const auto& item : report.items()) {
            if (item.value().is_object() &&
                item.value().value("status", "") == "error") {
                return kExitFailure;
            }
        }
        return kExitSuccess;
    }
    return Usage("unknown command: " + command);
}

nlohmann::json CommandRunner::HealthReport() {
    const auto& health = config_.health;
    nlohmann::json report = {{"sku", health.sku},
                             {"region", OptionalString(health.region)},
                             {"currency", OptionalString(health.currency)}};

    report["ping"] =
        PingResult(ParseServiceKind(config_.service).value_or(ServiceKind::Pricing));

    auto search = RunPriceSearch(catalog_, {{"sku", health.sku}},
                                 PricingDefaults{health.region, health.currency});
    if (search.IsOk()) {
        report["price_search"] = search.Value();
    } else {
        LogError("cli", "Health price_search failed: " + search.Error().message);
        report["price_search"] = {{"status", "error"},
                                  {"message", search.Error().message}};
    }
    return report;
}

int CommandRunner::RunTool(const std::string& tool, const ToolOutcome& outcome) {
    if (outcome.IsOk()) {
        PrintJsonLine(out_, outcome.Value());
        return kExitSuccess;
    }

    const auto& error = outcome.Error();
    LogError("cli", tool + ": " + error.message);
    PrintJsonLine(out_, {{"status", "error"},
                         {"tool", tool},
                         {"message", error.message}});
    return error.kind == ToolErrorKind::InvalidParams ? kExitUsage : kExitFailure;
}

int CommandRunner::Usage(const std::string& message) {
    err_ << "azmcp: " << message << "\n";
    return kExitUsage;
}

} // namespace azmcp
