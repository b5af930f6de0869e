#include "conduit/http/httpSerializer.hpp"

#include <format>
#include <string>
#include <string_view>

namespace conduit::http
{
auto HttpSerializer::serializeHead(const Request& t_request) -> std::string
{
    std::string result = std::format("{} {} HTTP/1.1\r\n", t_request.method, t_request.url.target());

    if (!t_request.headers.contains("Host")) {
        result += std::format("Host: {}\r\n", t_request.url.hostHeader());
    }

    for (const auto& [name, value] : t_request.headers) {
        if (iequals(name, "Content-Length") || iequals(name, "Transfer-Encoding") || iequals(name, "Connection")) {
            continue;
        }
        result += std::format("{}: {}\r\n", name, value);
    }

    if (t_request.body.isStream()) {
        result += "Transfer-Encoding: chunked\r\n";
    } else if (const auto* bytes = t_request.body.bytes(); !bytes->empty() || t_request.method == "POST"
                                                           || t_request.method == "PUT" || t_request.method == "PATCH") {
        result += std::format("Content-Length: {}\r\n", bytes->size());
    }

    result += "Connection: close\r\n";
    result += "\r\n";

    return result;
}

auto HttpSerializer::serializeChunk(std::string_view t_chunk) -> std::string
{
    if (t_chunk.empty()) {
        return {};
    }

    return std::format("{:x}\r\n{}\r\n", t_chunk.size(), t_chunk);
}

auto HttpSerializer::lastChunk() -> std::string_view
{
    return "0\r\n\r\n";
}
}  // namespace conduit::http
