#include <chrono>
#include <optional>
#include <string>

#include <catch2/catch_test_macros.hpp>
#include <conduit/http/multipartForm.hpp>
#include <conduit/http/requestBuilder.hpp>

namespace
{
using namespace conduit::http;
using namespace std::chrono_literals;
}  // namespace

TEST_CASE("request builder - valid request", "[http][requestBuilder]")
{
    auto request = RequestBuilder{"GET", "http://example.test:8080/path?x=1"}.header("Accept", "text/plain").build();

    REQUIRE(request.has_value());
    REQUIRE(request->method == "GET");
    REQUIRE(request->url.host == "example.test");
    REQUIRE(request->url.port == 8080);
    REQUIRE(request->url.target() == "/path?x=1");
    REQUIRE(request->headers.get("accept") == "text/plain");
    REQUIRE(request->body.empty());
    REQUIRE_FALSE(request->timeout.has_value());
}

TEST_CASE("request builder - repeated headers", "[http][requestBuilder]")
{
    SECTION("Adding a name twice keeps both values")
    {
        auto request = RequestBuilder{"GET", "http://example.test/"}
                           .header("Accept", "text/html")
                           .header("accept", "application/json")
                           .build();

        REQUIRE(request.has_value());
        REQUIRE(request->headers.size() == 1);
        REQUIRE(request->headers.get("Accept") == "text/html, application/json");
    }

    SECTION("A header map replaces what is there")
    {
        HeaderMap replacement;
        replacement.set("Accept", "text/plain");

        auto request = RequestBuilder{"GET", "http://example.test/"}
                           .header("Accept", "text/html")
                           .headers(replacement)
                           .build();

        REQUIRE(request->headers.get("Accept") == "text/plain");
    }

    SECTION("Credentials replace earlier ones")
    {
        auto request = RequestBuilder{"GET", "http://example.test/"}.bearerAuth("old").bearerAuth("new").build();

        REQUIRE(request->headers.get("Authorization") == "Bearer new");
    }
}

TEST_CASE("request builder - deferred errors", "[http][requestBuilder][error]")
{
    SECTION("Bad url")
    {
        auto request = RequestBuilder{"GET", "ftp://example.test/"}.build();

        REQUIRE_FALSE(request.has_value());
        REQUIRE(request.error().isBuild());
    }

    SECTION("Bad method")
    {
        REQUIRE_FALSE(RequestBuilder{"GE T", "http://example.test/"}.build().has_value());
    }

    SECTION("Header value with a newline")
    {
        auto builder = RequestBuilder{"GET", "http://example.test/"}.header("X-Evil", "a\r\nInjected: yes");

        REQUIRE(builder.hasError());
        REQUIRE_FALSE(std::move(builder).build().has_value());
    }

    SECTION("First error wins")
    {
        auto request = RequestBuilder{"GET", "http://example.test/"}
                           .header("Bad Name", "v")
                           .timeout(0ms)
                           .build();

        REQUIRE_FALSE(request.has_value());
        REQUIRE(std::string{request.error().what()}.find("Bad Name") != std::string::npos);
    }

    SECTION("Later valid calls keep the error")
    {
        auto request = RequestBuilder{"GET", "http://example.test/"}
                           .timeout(-5ms)
                           .header("Accept", "text/plain")
                           .build();

        REQUIRE_FALSE(request.has_value());
    }
}

TEST_CASE("request builder - authentication", "[http][requestBuilder]")
{
    SECTION("Basic with password")
    {
        auto request = RequestBuilder{"GET", "http://example.test/"}.basicAuth("Aladdin", "open sesame").build();

        REQUIRE(request->headers.get("Authorization") == "Basic QWxhZGRpbjpvcGVuIHNlc2FtZQ==");
    }

    SECTION("Basic without password")
    {
        auto request = RequestBuilder{"GET", "http://example.test/"}.basicAuth("user", std::nullopt).build();

        REQUIRE(request->headers.get("Authorization") == "Basic dXNlcjo=");
    }

    SECTION("Bearer")
    {
        auto request = RequestBuilder{"GET", "http://example.test/"}.bearerAuth("token").build();

        REQUIRE(request->headers.get("Authorization") == "Bearer token");
    }
}

TEST_CASE("request builder - bodies", "[http][requestBuilder]")
{
    SECTION("Form")
    {
        auto request = RequestBuilder{"POST", "http://example.test/"}.form({{"a b", "1&2"}, {"c", "3"}}).build();

        REQUIRE(request->headers.get("Content-Type") == "application/x-www-form-urlencoded");
        REQUIRE(*request->body.bytes() == "a%20b=1%262&c=3");
    }

    SECTION("Json")
    {
        auto request = RequestBuilder{"POST", "http://example.test/"}.json("[1,2]").build();

        REQUIRE(request->headers.get("Content-Type") == "application/json");
        REQUIRE(*request->body.bytes() == "[1,2]");
    }

    SECTION("Multipart")
    {
        const auto form = MultipartForm{"XYZ"}.text("field", "value");
        auto request = RequestBuilder{"POST", "http://example.test/"}.multipart(form).build();

        REQUIRE(request->headers.get("Content-Type") == "multipart/form-data; boundary=XYZ");
        REQUIRE(*request->body.bytes() == form.render());
    }

    SECTION("Query appends to an existing query")
    {
        auto request = RequestBuilder{"GET", "http://example.test/?x=1"}.query({{"q", "a/b"}}).build();

        REQUIRE(request->url.query == "x=1&q=a%2Fb");
    }

    SECTION("Timeout")
    {
        auto request = RequestBuilder{"GET", "http://example.test/"}.timeout(250ms).build();

        REQUIRE(request->timeout == 250ms);
    }
}

TEST_CASE("request builder - validators", "[http][requestBuilder]")
{
    REQUIRE(isValidHeaderName("X-Custom_Header"));
    REQUIRE_FALSE(isValidHeaderName(""));
    REQUIRE_FALSE(isValidHeaderName("Bad:Name"));

    REQUIRE(isValidHeaderValue("anything goes here"));
    REQUIRE_FALSE(isValidHeaderValue("line\nbreak"));

    REQUIRE(isValidMethod("PROPFIND"));
    REQUIRE_FALSE(isValidMethod("GET /"));
}
