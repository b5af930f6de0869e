#include <cstddef>
#include <string>
#include <string_view>

#include <catch2/catch_test_macros.hpp>
#include <conduit/http/httpParser.hpp>

namespace
{
using conduit::http::HttpParser;
using conduit::http::ResponseFramer;

auto oversizedChunks() -> std::string
{
    std::string raw;
    for (int i = 0; i < 2000; ++i) {
        raw += "fffffffffffffffe\r\n";
    }
    return raw + "0\r\n\r\n";
}
}  // namespace

TEST_CASE("http parser - content length", "[http][parser]")
{
    const std::string raw = "HTTP/1.1 201 Created\r\n"
                            "Content-Type: text/plain\r\n"
                            "Content-Length: 5\r\n"
                            "\r\n"
                            "hello";

    REQUIRE(HttpParser::is_complete(raw));

    const auto response = HttpParser::parse(raw);

    REQUIRE(response.has_value());
    REQUIRE(response->version == "HTTP/1.1");
    REQUIRE(response->status_code == 201);
    REQUIRE(response->status_text == "Created");
    REQUIRE(response->header("content-type") == "text/plain");
    REQUIRE(response->body == "hello");
    REQUIRE(response->isSuccess());
}

TEST_CASE("http parser - incomplete input", "[http][parser]")
{
    SECTION("Head not finished")
    {
        REQUIRE_FALSE(HttpParser::is_complete("HTTP/1.1 200 OK\r\nContent-Length: 5\r\n"));
    }

    SECTION("Body shorter than announced")
    {
        const std::string raw = "HTTP/1.1 200 OK\r\nContent-Length: 5\r\n\r\nhel";

        REQUIRE_FALSE(HttpParser::is_complete(raw));
        REQUIRE_FALSE(HttpParser::parse(raw).has_value());
    }

    SECTION("No length means read until close")
    {
        const std::string raw = "HTTP/1.0 200 OK\r\n\r\npartial";

        REQUIRE_FALSE(HttpParser::is_complete(raw));
        REQUIRE(HttpParser::parse(raw)->body == "partial");
    }
}

TEST_CASE("http parser - chunked", "[http][parser]")
{
    const std::string raw = "HTTP/1.1 200 OK\r\n"
                            "Transfer-Encoding: chunked\r\n"
                            "\r\n"
                            "4\r\nWiki\r\n"
                            "6;ext=1\r\npedia \r\n"
                            "E\r\nin \r\n\r\nchunks.\r\n"
                            "0\r\n"
                            "\r\n";

    REQUIRE(HttpParser::is_complete(raw));
    REQUIRE(HttpParser::parse(raw)->body == "Wikipedia in \r\n\r\nchunks.");

    REQUIRE_FALSE(HttpParser::is_complete(raw.substr(0, raw.size() - 2)));
    REQUIRE(HttpParser::decodeChunked("3\r\nabc\r\n0\r\n\r\n") == "abc");
    REQUIRE_FALSE(HttpParser::decodeChunked("zz\r\nabc\r\n0\r\n\r\n").has_value());
}

TEST_CASE("http parser - responses without a body", "[http][parser]")
{
    SECTION("204")
    {
        const std::string raw = "HTTP/1.1 204 No Content\r\n\r\n";

        REQUIRE(HttpParser::is_complete(raw));
        REQUIRE(HttpParser::parse(raw)->body.empty());
    }

    SECTION("HEAD")
    {
        const std::string raw = "HTTP/1.1 200 OK\r\nContent-Length: 100\r\n\r\n";

        REQUIRE(HttpParser::is_complete(raw, false));
        REQUIRE(HttpParser::parse(raw, false)->body.empty());
    }
}

TEST_CASE("http parser - repeated headers are folded", "[http][parser]")
{
    const std::string raw = "HTTP/1.1 200 OK\r\nVary: Accept\r\nvary: Origin\r\nContent-Length: 0\r\n\r\n";

    REQUIRE(HttpParser::parse(raw)->header("Vary") == "Accept, Origin");
}

TEST_CASE("http parser - malformed", "[http][parser]")
{
    REQUIRE_FALSE(HttpParser::parse("HTTX/1.1 200 OK\r\n\r\n").has_value());
    REQUIRE_FALSE(HttpParser::parse("HTTP/1.1 2000 OK\r\n\r\n").has_value());
    REQUIRE_FALSE(HttpParser::parse("HTTP/1.1 200 OK\r\nno colon\r\n\r\n").has_value());
    REQUIRE_FALSE(HttpParser::parse("garbage").has_value());
}

TEST_CASE("http parser - chunk sizes past the input", "[http][parser]")
{
    SECTION("Decoding rejects the first oversized chunk")
    {
        REQUIRE_FALSE(HttpParser::decodeChunked(oversizedChunks()).has_value());
        REQUIRE_FALSE(HttpParser::decodeChunked("ffff\r\nabc\r\n0\r\n\r\n").has_value());
    }

    SECTION("A response announcing one is reported finished and unparsable")
    {
        const auto raw = "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n" + oversizedChunks();

        REQUIRE(HttpParser::is_complete(raw));
        REQUIRE_FALSE(HttpParser::parse(raw).has_value());
    }

    SECTION("Content-Length that cannot fit")
    {
        const std::string raw = "HTTP/1.1 200 OK\r\nContent-Length: 18446744073709551615\r\n\r\nabc";

        REQUIRE(HttpParser::is_complete(raw));
    }
}

TEST_CASE("http parser - framing a response as it arrives", "[http][parser]")
{
    SECTION("Terminators and chunk data split across reads")
    {
        const std::string raw = "HTTP/1.1 200 OK\r\n"
                                "Transfer-Encoding: chunked\r\n"
                                "\r\n"
                                "5\r\nhello\r\n"
                                "6\r\n world\r\n"
                                "0\r\n"
                                "X-Trailer: 1\r\n"
                                "\r\n";

        ResponseFramer framer;
        for (std::size_t size = 0; size < raw.size(); ++size) {
            REQUIRE_FALSE(framer.update(std::string_view{raw}.substr(0, size)));
        }
        REQUIRE(framer.update(raw));
        REQUIRE(HttpParser::parse(raw)->body == "hello world");
    }

    SECTION("Content-Length")
    {
        const std::string raw = "HTTP/1.1 200 OK\r\nContent-Length: 4\r\n\r\nbody";

        ResponseFramer framer;
        REQUIRE_FALSE(framer.update(std::string_view{raw}.substr(0, 20)));
        REQUIRE_FALSE(framer.update(std::string_view{raw}.substr(0, raw.size() - 1)));
        REQUIRE(framer.update(raw));
    }

    SECTION("Chunk data not followed by CRLF")
    {
        ResponseFramer framer;

        REQUIRE(framer.update("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n3\r\nabcXY"));
    }

    SECTION("A size line that never ends")
    {
        const auto raw = "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n" + std::string(8192, '1');

        ResponseFramer framer;
        REQUIRE(framer.update(raw));
        REQUIRE_FALSE(HttpParser::parse(raw).has_value());
    }

    SECTION("Body until close is never complete")
    {
        ResponseFramer framer;

        REQUIRE_FALSE(framer.update("HTTP/1.1 200 OK\r\n\r\nsome"));
    }
}
