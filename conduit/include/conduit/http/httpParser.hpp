#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "conduit/http/httpMessages.hpp"

namespace conduit::http
{
class HttpParser
{
public:
    // t_expectBody is false for responses to HEAD.
    static auto parse(std::string_view t_raw, bool t_expectBody = true) -> std::optional<Response>;

    // True once t_data holds a whole response whose end can be told without
    // the peer closing the connection, or once it can no longer become one.
    static auto is_complete(std::string_view t_data, bool t_expectBody = true) -> bool;

    // The decoded body is never larger than t_data.
    static auto decodeChunked(std::string_view t_data) -> std::optional<std::string>;

private:
    friend class ResponseFramer;

    struct Head
    {
        Response response;
        std::size_t body_offset = 0;
    };

    static auto parseHead(std::string_view t_raw) -> std::optional<Head>;
    static auto hasBody(const Response& t_response, bool t_expectBody) -> bool;
    static auto contentLength(const Response& t_response) -> std::optional<std::size_t>;
    static auto isChunked(const Response& t_response) -> bool;
};

// Finds where a response ends while it is being received. The buffer handed
// to update() must only ever grow; every byte is looked at once.
class ResponseFramer
{
public:
    explicit ResponseFramer(bool t_expectBody = true);

    // t_data is everything received so far. Returns true once the response
    // is complete or malformed; HttpParser::parse tells the two apart.
    auto update(std::string_view t_data) -> bool;

private:
    enum class Mode
    {
        head,
        length,
        chunkSize,
        chunkData,
        trailer,
        untilClose,
        done
    };

    auto frameChunks(std::string_view t_data) -> bool;

    bool m_expectBody;
    Mode m_mode{Mode::head};
    // Absolute offset of the next byte to inspect.
    std::size_t m_cursor{0};
    // End of the body for Content-Length, end of the current chunk otherwise.
    std::size_t m_end{0};
};
}  // namespace conduit::http
