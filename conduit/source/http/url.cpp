#include "conduit/http/url.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace
{
auto isUnreserved(const unsigned char t_char) -> bool
{
    return std::isalnum(t_char) != 0 || t_char == '-' || t_char == '.' || t_char == '_' || t_char == '~';
}

auto lowercase(std::string_view t_text) -> std::string
{
    std::string result{t_text};
    std::ranges::transform(result, result.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    return result;
}
}  // namespace

namespace conduit::http
{
auto Url::parse(std::string_view t_text) -> std::optional<Url>
{
    const auto schemeEnd = t_text.find("://");
    if (schemeEnd == std::string_view::npos) {
        return std::nullopt;
    }

    Url url;
    url.scheme = lowercase(t_text.substr(0, schemeEnd));
    if (url.scheme != "http") {
        return std::nullopt;
    }

    auto rest = t_text.substr(schemeEnd + 3);

    const auto fragment = rest.find('#');
    if (fragment != std::string_view::npos) {
        rest = rest.substr(0, fragment);
    }

    const auto authorityEnd = rest.find_first_of("/?");
    const auto authority = rest.substr(0, authorityEnd);
    if (authority.empty() || authority.find('@') != std::string_view::npos) {
        return std::nullopt;
    }

    const auto colon = authority.rfind(':');
    if (colon != std::string_view::npos) {
        const auto portText = authority.substr(colon + 1);
        uint16_t port{};
        const auto [ptr, ec] = std::from_chars(portText.data(), portText.data() + portText.size(), port);
        if (ec != std::errc{} || ptr != portText.data() + portText.size() || port == 0) {
            return std::nullopt;
        }

        url.port = port;
        url.host = lowercase(authority.substr(0, colon));
    } else {
        url.host = lowercase(authority);
    }

    if (url.host.empty()) {
        return std::nullopt;
    }

    const auto badHostChar = std::ranges::any_of(url.host, [](unsigned char c) {
        return std::isalnum(c) == 0 && c != '-' && c != '.';
    });
    if (badHostChar) {
        return std::nullopt;
    }

    if (authorityEnd == std::string_view::npos) {
        return url;
    }

    auto pathAndQuery = rest.substr(authorityEnd);
    const auto question = pathAndQuery.find('?');
    if (question != std::string_view::npos) {
        url.query = std::string{pathAndQuery.substr(question + 1)};
        pathAndQuery = pathAndQuery.substr(0, question);
    }

    if (!pathAndQuery.empty()) {
        url.path = std::string{pathAndQuery};
    }

    const auto hasWhitespace = std::ranges::any_of(url.path + url.query, [](unsigned char c) {
        return std::isspace(c) != 0 || std::iscntrl(c) != 0;
    });
    if (hasWhitespace) {
        return std::nullopt;
    }

    return url;
}

auto Url::appendQuery(std::string_view t_key, std::string_view t_value) -> void
{
    if (!query.empty()) {
        query += '&';
    }

    query += percentEncode(t_key);
    query += '=';
    query += percentEncode(t_value);
}

auto Url::target() const -> std::string
{
    if (query.empty()) {
        return path;
    }

    return path + "?" + query;
}

auto Url::hostHeader() const -> std::string
{
    if (port == 80) {
        return host;
    }

    return host + ":" + std::to_string(port);
}

auto Url::toString() const -> std::string
{
    return scheme + "://" + hostHeader() + target();
}

auto percentEncode(std::string_view t_text) -> std::string
{
    constexpr std::string_view hex = "0123456789ABCDEF";

    std::string result;
    result.reserve(t_text.size());

    for (const auto c : t_text) {
        const auto byte = static_cast<unsigned char>(c);
        if (isUnreserved(byte)) {
            result += c;
        } else {
            result += '%';
            result += hex[byte >> 4];
            result += hex[byte & 0x0F];
        }
    }

    return result;
}
}  // namespace conduit::http
