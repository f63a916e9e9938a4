// Conduit Chain Unit Tests

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

#include "../../src/pipeline/chain.hpp"
#include "test_helpers.hpp"

using namespace conduit;
using namespace conduit::pipeline;
using conduit::testing::make_request;
using conduit::testing::make_unit;

namespace {

/// Unit that answers without calling next
MiddlewarePtr make_blocker(std::string name, http::StatusCode status) {
    return make_function_middleware(
        std::move(name), kDefaultPriority,
        [status](Context& ctx, http::Request&, const Next&) {
            ctx.set_metadata("blocked", "true");
            return http::Response(status);
        });
}

/// Unit that calls next twice
MiddlewarePtr make_double_caller() {
    return make_function_middleware("double", kDefaultPriority,
                                    [](Context&, http::Request&, const Next& next) {
                                        auto first = next();
                                        auto second = next();
                                        (void)first;
                                        return second;
                                    });
}

http::Response ok_handler(Context& ctx, http::Request&) {
    ctx.set_metadata("terminal", "ran");
    http::Response resp(http::StatusCode::OK);
    resp.set_body("done", "text/plain");
    return resp;
}

}  // namespace

TEST_CASE("Chain executes units in stored order", "[pipeline][chain]") {
    Chain chain({make_unit("a"), make_unit("b"), make_unit("c")});
    Context ctx;
    auto req = make_request("/");

    SECTION("without terminal handler the end yields an empty 404") {
        auto resp = chain.process(ctx, req);
        REQUIRE(ctx.get_metadata("trace") == "a,b,c");
        REQUIRE(resp.status == http::StatusCode::NotFound);
        REQUIRE(resp.body.empty());
    }

    SECTION("terminal handler runs after the last unit") {
        auto resp = chain.process(ctx, req, ok_handler);
        REQUIRE(ctx.get_metadata("trace") == "a,b,c");
        REQUIRE(ctx.get_metadata("terminal") == "ran");
        REQUIRE(resp.status == http::StatusCode::OK);
        REQUIRE(resp.body == "done");
    }

    SECTION("empty chain goes straight to the terminal handler") {
        Chain empty;
        auto resp = empty.process(ctx, req, ok_handler);
        REQUIRE(resp.status == http::StatusCode::OK);
        REQUIRE(ctx.get_metadata("trace").empty());
    }
}

TEST_CASE("Chain short-circuit", "[pipeline][chain]") {
    Chain chain({make_unit("a"), make_blocker("auth", http::StatusCode::Unauthorized),
                 make_unit("c")});
    Context ctx;
    auto req = make_request("/admin");

    auto resp = chain.process(ctx, req, ok_handler);

    REQUIRE(resp.status == http::StatusCode::Unauthorized);
    REQUIRE(ctx.get_metadata("trace") == "a");
    REQUIRE(ctx.get_metadata("blocked") == "true");
    REQUIRE(ctx.get_metadata("terminal").empty());
}

TEST_CASE("Units can wrap the downstream response", "[pipeline][chain]") {
    auto header_unit = make_function_middleware(
        "security-headers", 10, [](Context&, http::Request&, const Next& next) {
            auto resp = next();
            resp.set_header("X-Content-Type-Options", "nosniff");
            return resp;
        });

    Chain chain({header_unit, make_unit("b")});
    Context ctx;
    auto req = make_request("/");

    auto resp = chain.process(ctx, req, ok_handler);
    REQUIRE(resp.status == http::StatusCode::OK);
    REQUIRE(resp.get_header("X-Content-Type-Options") == "nosniff");
}

TEST_CASE("Continuation invoked twice is rejected", "[pipeline][chain]") {
    int terminal_runs = 0;
    Handler counting = [&terminal_runs](Context&, http::Request&) {
        ++terminal_runs;
        return http::Response(http::StatusCode::OK);
    };

    Chain chain({make_double_caller(), make_unit("after")});
    Context ctx;
    auto req = make_request("/");

    auto resp = chain.process(ctx, req, counting);

    REQUIRE(resp.status == http::StatusCode::InternalServerError);
    REQUIRE(terminal_runs == 1);
    REQUIRE(ctx.get_metadata("trace") == "after");
    REQUIRE(ctx.has_error);
    REQUIRE(ctx.error_message.find("double") != std::string::npos);
}

TEST_CASE("Chain mutation", "[pipeline][chain]") {
    Chain chain({make_unit("a", 10), make_unit("b", 20)});

    SECTION("add appends without re-sorting") {
        chain.add(make_unit("early", 1));
        REQUIRE(chain.names() == std::vector<std::string>{"a", "b", "early"});

        chain.add({make_unit("x"), make_unit("y")});
        REQUIRE(chain.length() == 5);
        REQUIRE(chain.names().back() == "y");
    }

    SECTION("insert at front") {
        chain.insert(0, make_unit("first"));
        REQUIRE(chain.names() == std::vector<std::string>{"first", "a", "b"});
    }

    SECTION("insert in the middle keeps relative order of the inserted units") {
        chain.insert(1, {make_unit("m1"), make_unit("m2")});
        REQUIRE(chain.names() == std::vector<std::string>{"a", "m1", "m2", "b"});
    }

    SECTION("insert at -1 or out of range appends") {
        chain.insert(-1, make_unit("last"));
        chain.insert(100, make_unit("later"));
        chain.insert(-7, make_unit("latest"));
        REQUIRE(chain.names() ==
                std::vector<std::string>{"a", "b", "last", "later", "latest"});
    }

    SECTION("remove, get, clear") {
        REQUIRE(chain.get("b") != nullptr);
        REQUIRE(chain.contains("a"));
        REQUIRE(chain.remove("a"));
        REQUIRE_FALSE(chain.remove("a"));
        REQUIRE(chain.get("a") == nullptr);
        REQUIRE(chain.length() == 1);

        chain.clear();
        REQUIRE(chain.length() == 0);
        REQUIRE(chain.list().empty());
    }

    SECTION("list returns a copy") {
        auto units = chain.list();
        units.clear();
        REQUIRE(chain.length() == 2);
    }
}

TEST_CASE("Context helpers", "[pipeline][context]") {
    Context ctx;
    REQUIRE(ctx.get_metadata("missing").empty());

    ctx.set_metadata("user", "42");
    REQUIRE(ctx.get_metadata("user") == "42");

    REQUIRE_FALSE(ctx.has_error);
    ctx.set_error("boom");
    REQUIRE(ctx.has_error);
    REQUIRE(ctx.error_message == "boom");
}
