#include <catch2/catch_test_macros.hpp>

#include <azmcp/mcp/tool_registry.hpp>

#include <stdexcept>

using namespace azmcp;

namespace {

ToolHandler Echo() {
    return [](const nlohmann::json& args) {
        return ToolOutcome::Ok(args);
    };
}

nlohmann::json SchemaRequiring(std::initializer_list<const char*> names) {
    nlohmann::json required = nlohmann::json::array();
    for (const auto* n : names) required.push_back(n);
    return {{"type", "object"},
            {"properties", nlohmann::json::object()},
            {"required", required}};
}

} // anonymous namespace

TEST_CASE("ToolRegistry: empty by default", "[mcp][registry]") {
    ToolRegistry registry;
    CHECK(registry.Tools().empty());
    CHECK_FALSE(registry.HasTool("anything"));
    CHECK(registry.Find("anything") == nullptr);
    CHECK(registry.FindSpec("anything") == nullptr);
}

TEST_CASE("ToolRegistry: Tools() keeps registration order", "[mcp][registry]") {
    ToolRegistry registry;
    registry.Register("zeta", "last letter", SchemaRequiring({}), Echo());
    registry.Register("alpha", "first letter", SchemaRequiring({}), Echo());
    registry.Register("mid", "middle", SchemaRequiring({}), Echo());

    const auto& tools = registry.Tools();
    REQUIRE(tools.size() == 3);
    CHECK(tools[0].name == "zeta");
    CHECK(tools[1].name == "alpha");
    CHECK(tools[2].name == "mid");
    CHECK(tools[1].description == "first letter");
}

TEST_CASE("ToolRegistry: Find returns a callable handler", "[mcp][registry]") {
    ToolRegistry registry;
    registry.Register("echo", "", SchemaRequiring({"x"}), Echo());

    const auto* handler = registry.Find("echo");
    REQUIRE(handler != nullptr);
    auto out = (*handler)({{"x", 3}});
    REQUIRE(out.IsOk());
    CHECK(out.Value()["x"] == 3);

    const auto* spec = registry.FindSpec("echo");
    REQUIRE(spec != nullptr);
    CHECK(spec->input_schema["required"][0] == "x");
}

TEST_CASE("ToolRegistry: duplicate names are rejected", "[mcp][registry]") {
    ToolRegistry registry;
    registry.Register("dup", "", SchemaRequiring({}), Echo());
    CHECK_THROWS_AS(registry.Register("dup", "", SchemaRequiring({}), Echo()),
                    std::logic_error);
    CHECK(registry.Tools().size() == 1);
}

TEST_CASE("ToolRegistry: empty name is rejected", "[mcp][registry]") {
    ToolRegistry registry;
    CHECK_THROWS_AS(registry.Register("", "", SchemaRequiring({}), Echo()),
                    std::logic_error);
}

TEST_CASE("ToolError: factories set the kind", "[mcp][registry]") {
    CHECK(ToolError::InvalidParams("x").kind == ToolErrorKind::InvalidParams);
    auto failed = ToolError::Failed("upstream");
    CHECK(failed.kind == ToolErrorKind::Failed);
    CHECK(failed.message == "upstream");
}

// ===========================================================================
// MissingRequiredArgument
// ===========================================================================

TEST_CASE("MissingRequiredArgument: absent, null and empty count as missing",
          "[mcp][registry]") {
    auto schema = SchemaRequiring({"sku"});
    CHECK(MissingRequiredArgument(schema, nlohmann::json::object()) == "sku");
    CHECK(MissingRequiredArgument(schema, {{"sku", nullptr}}) == "sku");
    CHECK(MissingRequiredArgument(schema, {{"sku", ""}}) == "sku");
    CHECK_FALSE(MissingRequiredArgument(schema, {{"sku", "B2s"}}).has_value());
    // Non-string values are present; their type is the handler's concern.
    CHECK_FALSE(MissingRequiredArgument(schema, {{"sku", 5}}).has_value());
}

TEST_CASE("MissingRequiredArgument: reports the first missing name",
          "[mcp][registry]") {
    auto schema = SchemaRequiring({"a", "b", "c"});
    CHECK(MissingRequiredArgument(schema, {{"a", 1}}) == "b");
}

TEST_CASE("MissingRequiredArgument: schema without required list",
          "[mcp][registry]") {
    nlohmann::json schema = {{"type", "object"}};
    CHECK_FALSE(MissingRequiredArgument(schema, nlohmann::json::object()).has_value());
    CHECK_FALSE(MissingRequiredArgument(nullptr, nlohmann::json::object()).has_value());
}
