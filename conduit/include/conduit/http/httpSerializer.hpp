#pragma once

#include <string>
#include <string_view>

#include "conduit/http/httpMessages.hpp"

namespace conduit::http
{
class HttpSerializer
{
public:
    // Request line and headers, terminated by the empty line. Stream bodies
    // are announced as chunked, buffered ones by Content-Length.
    static auto serializeHead(const Request& t_request) -> std::string;

    static auto serializeChunk(std::string_view t_chunk) -> std::string;
    static auto lastChunk() -> std::string_view;
};
}  // namespace conduit::http
