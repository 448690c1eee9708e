#include <catch2/catch_test_macros.hpp>

#include <azmcp/http/http_client.hpp>
#include <azmcp/http/retrying_fetcher.hpp>

#include <httplib.h>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>

using namespace azmcp;
using namespace std::chrono_literals;

// ===========================================================================
// Helper: a local httplib::Server on a free port, for tests that exercise
// the real HttpClient over a socket.
// ===========================================================================
namespace {

class LocalServer {
public:
    explicit LocalServer(httplib::Server& svr) : svr_(svr) {
        port_ = svr_.bind_to_any_port("127.0.0.1");
        thread_ = std::thread([this] { svr_.listen_after_bind(); });
        svr_.wait_until_ready();
    }

    ~LocalServer() {
        svr_.stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    [[nodiscard]] std::string Origin() const {
        return "http://127.0.0.1:" + std::to_string(port_);
    }

    LocalServer(const LocalServer&) = delete;
    LocalServer& operator=(const LocalServer&) = delete;

private:
    httplib::Server& svr_;
    int port_ = 0;
    std::thread thread_;
};

HttpClientOptions FastOptions() {
    HttpClientOptions opts;
    opts.timeout = 2000ms;
    return opts;
}

} // anonymous namespace

TEST_CASE("HttpClient: GET decodes the OData filter on the server side",
          "[http][client]") {
    httplib::Server svr;
    std::string seen_filter;
    std::string seen_accept;
    svr.Get("/api/retail/prices", [&](const httplib::Request& req,
                                      httplib::Response& res) {
        seen_filter = req.get_param_value("$filter");
        seen_accept = req.get_header_value("Accept");
        res.set_content(R"({"Items":[{"retailPrice":0.1}]})", "application/json");
    });
    LocalServer server(svr);

    HttpClient client(server.Origin(), FastOptions());
    auto result = client.Get("/api/retail/prices",
                             {{"$filter", "contains(skuName,'O''Brien') and "
                                          "armRegionName eq 'eastus'"}});

    REQUIRE(result.IsOk());
    CHECK(result.Value().status_code == 200);
    CHECK(result.Value().IsSuccess());
    CHECK(seen_filter == "contains(skuName,'O''Brien') and armRegionName eq 'eastus'");
    CHECK(seen_accept == "application/json");
}

TEST_CASE("HttpClient: non-2xx status is a response, not an error",
          "[http][client]") {
    httplib::Server svr;
    svr.Get("/down", [](const httplib::Request&, httplib::Response& res) {
        res.status = 503;
        res.set_content("maintenance", "text/plain");
    });
    LocalServer server(svr);

    HttpClient client(server.Origin(), FastOptions());
    auto result = client.Get("/down");

    REQUIRE(result.IsOk());
    CHECK(result.Value().status_code == 503);
    CHECK_FALSE(result.Value().IsSuccess());
    CHECK(result.Value().body == "maintenance");
}

TEST_CASE("HttpClient: slow upstream maps to Timeout", "[http][client][slow]") {
    httplib::Server svr;
    svr.Get("/slow", [](const httplib::Request&, httplib::Response& res) {
        std::this_thread::sleep_for(500ms);
        res.set_content("{}", "application/json");
    });
    LocalServer server(svr);

    HttpClientOptions opts;
    opts.timeout = 100ms;
    HttpClient client(server.Origin(), opts);
    auto result = client.Get("/slow");

    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Timeout);
    CHECK(result.Error().IsTransport());
}

TEST_CASE("HttpClient: refused connection maps to Connection", "[http][client]") {
    int port = 0;
    {
        // Reserve a port, then release it so nothing listens there.
        httplib::Server svr;
        port = svr.bind_to_any_port("127.0.0.1");
    }

    HttpClient client("http://127.0.0.1:" + std::to_string(port), FastOptions());
    auto result = client.Get("/api");

    REQUIRE(result.IsErr());
    CHECK(result.Error().operation == "HttpGet");
    CHECK(result.Error().IsTransport());
}

TEST_CASE("RetryingFetcher over HttpClient: retries a 502 then succeeds",
          "[http][client][retry]") {
    httplib::Server svr;
    std::atomic<int> hits{0};
    svr.Get("/prices", [&hits](const httplib::Request&, httplib::Response& res) {
        if (hits.fetch_add(1) == 0) {
            res.status = 502;
            return;
        }
        res.set_content(R"({"Items":[]})", "application/json");
    });
    LocalServer server(svr);

    HttpClient client(server.Origin(), FastOptions());
    RetryPolicy policy;
    policy.max_attempts = 3;
    policy.base_backoff = 10ms;
    RetryingFetcher fetcher(client, policy);

    auto result = fetcher.FetchJson("/prices");

    REQUIRE(result.IsOk());
    CHECK(result.Value()["Items"].empty());
    CHECK(hits.load() == 2);
}
