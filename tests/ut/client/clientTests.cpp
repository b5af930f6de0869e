#include <chrono>
#include <cstddef>
#include <exception>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <catch2/catch_test_macros.hpp>
#include <conduit/client/clientBuilder.hpp>
#include <conduit/client/clientWithMiddleware.hpp>
#include <conduit/common/resultSender.hpp>
#include <conduit/context/extensions.hpp>
#include <conduit/error/error.hpp>
#include <conduit/middleware/fnMiddleware.hpp>
#include <exec/static_thread_pool.hpp>
#include <stdexec/execution.hpp>

#include "helpers/mockTransport.hpp"

namespace
{
using namespace conduit;
using tests::Journal;
using tests::MockEngine;

struct Marker
{
    std::string value;
};

// Echoes the Marker it finds in the bag back as the response body.
auto echoMarker()
{
    return middleware::fromFn([](http::Request t_request, context::Extensions& t_extensions,
                                 const middleware::Next& t_next) {
        const auto* marker = t_extensions.get<Marker>();
        const auto seen = marker != nullptr ? marker->value : std::string{"none"};

        return t_next.run(std::move(t_request), t_extensions) | stdexec::then([seen](http::Response t_response) {
                   t_response.body = seen;
                   return t_response;
               });
    });
}
}  // namespace

TEST_CASE("client - method helpers set the method and url", "[client]")
{
    auto engine = std::make_shared<MockEngine>();
    const client::ClientWithMiddleware client{engine};

    static_cast<void>(tests::waitResponse(client.get("http://example.test/a").send()));
    static_cast<void>(tests::waitResponse(client.post("http://example.test/b").body("x").send()));
    static_cast<void>(tests::waitResponse(client.put("http://example.test/c").send()));
    static_cast<void>(tests::waitResponse(client.patch("http://example.test/d").send()));
    static_cast<void>(tests::waitResponse(client.del("http://example.test/e").send()));
    static_cast<void>(tests::waitResponse(client.head("http://example.test/f").send()));
    static_cast<void>(tests::waitResponse(client.request("OPTIONS", "http://example.test/g").send()));

    const auto& received = engine->received();
    REQUIRE(received.size() == 7);

    const std::vector<std::pair<std::string, std::string>> expected{
        {"GET", "/a"}, {"POST", "/b"}, {"PUT", "/c"}, {"PATCH", "/d"}, {"DELETE", "/e"}, {"HEAD", "/f"}, {"OPTIONS", "/g"}};

    for (std::size_t i = 0; i < expected.size(); ++i) {
        REQUIRE(received[i].method == expected[i].first);
        REQUIRE(received[i].url.path == expected[i].second);
    }

    REQUIRE(*received[1].body.bytes() == "x");
}

TEST_CASE("client - null engine is rejected", "[client]")
{
    REQUIRE_THROWS_AS(client::ClientWithMiddleware{std::shared_ptr<MockEngine>{}}, std::invalid_argument);
}

TEST_CASE("client - builder extensions reach middleware", "[client][extensions]")
{
    auto engine = std::make_shared<MockEngine>();
    auto client = client::ClientBuilder{engine}.with(echoMarker()).build();

    SECTION("Through withExtension")
    {
        auto response = tests::waitResponse(client.get("http://example.test/").withExtension(Marker{"m1"}).send());

        REQUIRE(response.body == "m1");
    }

    SECTION("Through extensions()")
    {
        auto builder = client.get("http://example.test/");
        builder.extensions().insert(Marker{"m2"});

        auto response = tests::waitResponse(std::move(builder).send());

        REQUIRE(response.body == "m2");
    }

    SECTION("Absent")
    {
        REQUIRE(tests::waitResponse(client.get("http://example.test/").send()).body == "none");
    }
}

TEST_CASE("client - concurrent requests keep separate extensions", "[client][extensions][concurrency]")
{
    auto engine = std::make_shared<MockEngine>();
    auto client = client::ClientBuilder{engine}.with(echoMarker()).build();

    exec::static_thread_pool pool{4};
    auto scheduler = pool.get_scheduler();

    for (int round = 0; round < 20; ++round) {
        auto result = stdexec::sync_wait(stdexec::when_all(
            stdexec::starts_on(scheduler, client.get("http://example.test/1").withExtension(Marker{"one"}).send()),
            stdexec::starts_on(scheduler, client.get("http://example.test/2").withExtension(Marker{"two"}).send()),
            stdexec::starts_on(scheduler, client.get("http://example.test/3").send())));

        REQUIRE(result.has_value());

        auto [first, second, third] = std::move(*result);
        REQUIRE(first.body == "one");
        REQUIRE(second.body == "two");
        REQUIRE(third.body == "none");
    }

    REQUIRE(engine->calls() == 60);
}

TEST_CASE("client - build errors fail before any middleware", "[client][error]")
{
    auto journal = std::make_shared<Journal>();
    auto engine = std::make_shared<MockEngine>(
        [](const http::Request&) { return http::Response::ok(); }, journal);
    auto client = client::ClientBuilder{engine}.with(tests::recording(journal, "A")).build();

    SECTION("Invalid url")
    {
        auto error = tests::waitError(client.get("not a url").send());

        REQUIRE(error.has_value());
        REQUIRE(error->isBuild());
    }

    SECTION("Invalid header")
    {
        auto error = tests::waitError(client.get("http://example.test/").header("Bad Name", "v").send());

        REQUIRE(error.has_value());
        REQUIRE(error->isBuild());
    }

    SECTION("Invalid timeout")
    {
        auto error = tests::waitError(client.get("http://example.test/").timeout(std::chrono::milliseconds{0}).send());

        REQUIRE(error.has_value());
        REQUIRE(error->isBuild());
    }

    REQUIRE(journal->entries().empty());
    REQUIRE(engine->calls() == 0);
}

TEST_CASE("client - middleware error short-circuits the chain", "[client][error]")
{
    auto journal = std::make_shared<Journal>();
    auto engine = std::make_shared<MockEngine>(
        [](const http::Request&) { return http::Response::ok(); }, journal);

    SECTION("Returned on the error channel")
    {
        auto client = client::ClientBuilder{engine}
                          .with(tests::recording(journal, "outer"))
                          .with(middleware::fromFn([](http::Request, context::Extensions&, const middleware::Next&) {
                              return common::ResultSender<http::Response>{stdexec::just_error(
                                  std::make_exception_ptr(error::Error::middleware("quota exceeded")))};
                          }))
                          .with(tests::recording(journal, "inner"))
                          .build();

        auto error = tests::waitError(client.get("http://example.test/").send());

        REQUIRE(error.has_value());
        REQUIRE(error->isMiddleware());
        REQUIRE(journal->entries() == std::vector<std::string>{"outer>", "!outer"});
    }

    SECTION("Thrown while handling the request")
    {
        auto client = client::ClientBuilder{engine}
                          .with(tests::recording(journal, "outer"))
                          .with(middleware::fromFn([](http::Request, context::Extensions&, const middleware::Next&)
                                                       -> common::ResultSender<http::Response> {
                              throw std::runtime_error("not allowed");
                          }))
                          .build();

        auto error = tests::waitError(client.get("http://example.test/").send());

        REQUIRE(error.has_value());
        REQUIRE(error->isMiddleware());
        REQUIRE(std::string{error->what()}.find("not allowed") != std::string::npos);
    }

    REQUIRE(engine->calls() == 0);
}

TEST_CASE("client - middleware may answer without the transport", "[client]")
{
    auto engine = std::make_shared<MockEngine>();
    auto client = client::ClientBuilder{engine}
                      .with(middleware::fromFn([](http::Request t_request, context::Extensions& t_extensions,
                                                  const middleware::Next& t_next) -> common::ResultSender<http::Response> {
                          if (t_request.url.path == "/cached") {
                              return common::ResultSender<http::Response>{stdexec::just(http::Response::ok("cached"))};
                          }
                          return t_next.run(std::move(t_request), t_extensions);
                      }))
                      .build();

    REQUIRE(tests::waitResponse(client.get("http://example.test/cached").send()).body == "cached");
    REQUIRE(engine->calls() == 0);

    REQUIRE(tests::waitResponse(client.get("http://example.test/live").send()).body == "mock");
    REQUIRE(engine->calls() == 1);
}

TEST_CASE("client - transport failures surface as transport errors", "[client][error]")
{
    auto journal = std::make_shared<Journal>();
    auto engine = std::make_shared<MockEngine>(
        [](const http::Request&) -> http::Response { throw std::runtime_error("connection reset"); }, journal);
    auto client = client::ClientBuilder{engine}.with(tests::recording(journal, "A")).build();

    auto error = tests::waitError(client.get("http://example.test/").send());

    REQUIRE(error.has_value());
    REQUIRE(error->isTransport());
    REQUIRE(journal->entries() == std::vector<std::string>{"A>", "transport", "!A"});
}

TEST_CASE("client - execute runs a prebuilt request", "[client]")
{
    auto engine = std::make_shared<MockEngine>();
    auto client = client::ClientBuilder{engine}.with(echoMarker()).build();

    auto request = http::RequestBuilder{"GET", "http://example.test/prebuilt"}.build();
    REQUIRE(request.has_value());

    SECTION("Without extensions")
    {
        REQUIRE(tests::waitResponse(client.execute(std::move(*request))).body == "none");
    }

    SECTION("With extensions")
    {
        context::Extensions extensions;
        extensions.insert(Marker{"given"});

        auto response = tests::waitResponse(client.executeWithExtensions(std::move(*request), std::move(extensions)));

        REQUIRE(response.body == "given");
    }

    REQUIRE(engine->received().back().url.path == "/prebuilt");
}

TEST_CASE("client - copies share the engine", "[client]")
{
    auto engine = std::make_shared<MockEngine>();
    const auto client = client::ClientBuilder{engine}.with(echoMarker()).build();
    const auto copy = client;

    REQUIRE(copy.engine() == client.engine());

    static_cast<void>(tests::waitResponse(copy.get("http://example.test/").send()));
    static_cast<void>(tests::waitResponse(client.get("http://example.test/").send()));

    REQUIRE(engine->calls() == 2);
}
