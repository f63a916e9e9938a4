// Conduit Adapter Unit Tests

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

#include "../../src/pipeline/adapter.hpp"
#include "test_helpers.hpp"

using namespace conduit;
using namespace conduit::pipeline;
using conduit::testing::make_request;
using conduit::testing::make_unit;
using conduit::testing::test_logger;
using conduit::testing::unit_config;

namespace {

http::Response echo_handler(Context&, http::Request& req) {
    http::Response response(http::StatusCode::OK);
    response.set_body(req.path, "text/plain");
    return response;
}

}  // namespace

TEST_CASE("Adapter resolves chain types from paths", "[pipeline][adapter]") {
    struct Case {
        const char* path;
        ChainType expected;
    };

    const std::vector<Case> cases = {
        {"/api", ChainType::API},
        {"/api/v1/users", ChainType::API},
        {"/apiary", ChainType::Default},
        {"/dashboard", ChainType::Web},
        {"/dashboard/stats", ChainType::Web},
        {"/forms/contact", ChainType::Web},
        {"/login", ChainType::Auth},
        {"/signup", ChainType::Auth},
        {"/logout", ChainType::Auth},
        {"/forgot-password", ChainType::Auth},
        {"/reset-password", ChainType::Auth},
        {"/login/help", ChainType::Default},
        {"/admin", ChainType::Admin},
        {"/admin/users", ChainType::Admin},
        {"/administrator", ChainType::Default},
        {"/public/info", ChainType::Public},
        {"/static/app.js", ChainType::Static},
        {"/assets/logo.png", ChainType::Static},
        {"/", ChainType::Default},
        {"", ChainType::Default},
        {"/about", ChainType::Default},
    };

    for (const auto& c : cases) {
        INFO("path: " << c.path);
        REQUIRE(Adapter::resolve_chain_type(c.path) == c.expected);
    }
}

TEST_CASE("Adapter setup_chains registers every chain type", "[pipeline][adapter]") {
    control::Config cfg;
    cfg.middleware["cors"] = unit_config("security", 10);
    cfg.middleware["auth"] = unit_config("auth", 20);
    control::StaticConfigProvider provider(cfg);
    Registry registry(provider, test_logger());
    Orchestrator orchestrator(registry, provider, test_logger());
    Adapter adapter(orchestrator, test_logger());

    REQUIRE_FALSE(registry.register_unit(make_unit("cors")));
    REQUIRE_FALSE(registry.register_unit(make_unit("auth")));

    REQUIRE_FALSE(adapter.setup_chains());
    REQUIRE(orchestrator.list_chains() ==
            std::vector<std::string>{"admin", "api", "auth", "default", "public", "static", "web"});
    REQUIRE(orchestrator.get_chain("api")->names() == std::vector<std::string>{"cors", "auth"});
    REQUIRE(orchestrator.get_chain("static")->length() == 0);

    SECTION("second setup collides with the registered names") {
        Error error = adapter.setup_chains();
        REQUIRE(error.code == Errc::AlreadyExists);
    }
}

TEST_CASE("Adapter dispatch", "[pipeline][adapter]") {
    control::Config cfg;
    cfg.middleware["cors"] = unit_config("security", 10);
    cfg.middleware["auth"] = unit_config("auth", 20);
    cfg.middleware["auth"].exclude_paths = {"/api/health"};

    SECTION("request runs through the chain for its path") {
        control::StaticConfigProvider provider(cfg);
        Registry registry(provider, test_logger());
        Orchestrator orchestrator(registry, provider, test_logger());
        Adapter adapter(orchestrator, test_logger());
        REQUIRE_FALSE(registry.register_unit(make_unit("cors")));
        REQUIRE_FALSE(registry.register_unit(make_unit("auth")));

        Context ctx;
        auto req = make_request("/api/users");
        auto response = adapter.dispatch(ctx, req, echo_handler);
        REQUIRE(response.status == http::StatusCode::OK);
        REQUIRE(response.body == "/api/users");
        REQUIRE(ctx.get_metadata("trace") == "cors,auth");
        REQUIRE_FALSE(ctx.has_error);
        REQUIRE(logging::is_valid_uuid(ctx.correlation_id));

        Context health_ctx;
        auto health = make_request("/api/health");
        REQUIRE(adapter.dispatch(health_ctx, health, echo_handler).status == http::StatusCode::OK);
        REQUIRE(health_ctx.get_metadata("trace") == "cors");

        // Public chain has no auth category
        Context public_ctx;
        auto pub = make_request("/public/info");
        REQUIRE(adapter.dispatch(public_ctx, pub, echo_handler).status == http::StatusCode::OK);
        REQUIRE(public_ctx.get_metadata("trace") == "cors");
    }

    SECTION("chain_for caches per path") {
        control::StaticConfigProvider provider(cfg);
        Registry registry(provider);
        Orchestrator orchestrator(registry, provider);
        Adapter adapter(orchestrator);
        REQUIRE_FALSE(registry.register_unit(make_unit("cors")));

        Error error;
        auto first = adapter.chain_for("/api/users", error);
        auto second = adapter.chain_for("/api/users", error);
        REQUIRE(first != nullptr);
        REQUIRE(first.get() == second.get());
        REQUIRE(orchestrator.get_cache_stats().cache_size == 1);
    }

    SECTION("distinct request paths keep the cache bounded") {
        control::StaticConfigProvider provider(cfg);
        Registry registry(provider);
        Orchestrator orchestrator(registry, provider, nullptr, 8);
        Adapter adapter(orchestrator);
        REQUIRE_FALSE(registry.register_unit(make_unit("cors")));
        REQUIRE_FALSE(registry.register_unit(make_unit("auth")));

        for (int i = 0; i < 50; ++i) {
            Context ctx;
            auto req = make_request("/api/users/" + std::to_string(i));
            auto response = adapter.dispatch(ctx, req, echo_handler);
            REQUIRE(response.status == http::StatusCode::OK);
            REQUIRE(ctx.get_metadata("trace") == "cors,auth");
        }

        auto stats = orchestrator.get_cache_stats();
        REQUIRE(stats.cache_size == 8);
        REQUIRE(stats.uncached_builds == 42);
    }

    SECTION("failed build yields 500") {
        cfg.middleware["session"] = unit_config("auth", 30, {"auth"});
        cfg.chains["api"].middleware = {"cors", "session"};
        control::StaticConfigProvider provider(cfg);
        Registry registry(provider, test_logger());
        Orchestrator orchestrator(registry, provider, test_logger());
        Adapter adapter(orchestrator, test_logger());
        REQUIRE_FALSE(registry.register_unit(make_unit("cors")));
        REQUIRE_FALSE(registry.register_unit(make_unit("auth")));
        REQUIRE_FALSE(registry.register_unit(make_unit("session")));

        bool terminal_called = false;
        Context ctx;
        ctx.correlation_id = "req-42";
        auto req = make_request("/api/users");
        auto response = adapter.dispatch(ctx, req, [&terminal_called](Context&, http::Request&) {
            terminal_called = true;
            return http::Response(http::StatusCode::OK);
        });

        REQUIRE(response.status == http::StatusCode::InternalServerError);
        REQUIRE(response.body == "Internal Server Error");
        REQUIRE(response.get_header("Content-Type") == "text/plain");
        REQUIRE_FALSE(terminal_called);
        REQUIRE(ctx.has_error);
        REQUIRE(ctx.correlation_id == "req-42");
        REQUIRE(ctx.error_message.find("session") != std::string::npos);

        // Other chain types are still served
        Context web_ctx;
        auto web = make_request("/dashboard");
        REQUIRE(adapter.dispatch(web_ctx, web, echo_handler).status == http::StatusCode::OK);
    }
}
