#include "conduit/http/requestBuilder.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace
{
auto base64Encode(std::string_view t_input) -> std::string
{
    constexpr std::string_view alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string result;
    result.reserve(((t_input.size() + 2) / 3) * 4);

    std::size_t i = 0;
    for (; i + 2 < t_input.size(); i += 3) {
        const uint32_t triple = (static_cast<uint8_t>(t_input[i]) << 16) | (static_cast<uint8_t>(t_input[i + 1]) << 8)
                                | static_cast<uint8_t>(t_input[i + 2]);
        result += alphabet[(triple >> 18) & 0x3F];
        result += alphabet[(triple >> 12) & 0x3F];
        result += alphabet[(triple >> 6) & 0x3F];
        result += alphabet[triple & 0x3F];
    }

    const auto remaining = t_input.size() - i;
    if (remaining == 1) {
        const uint32_t triple = static_cast<uint8_t>(t_input[i]) << 16;
        result += alphabet[(triple >> 18) & 0x3F];
        result += alphabet[(triple >> 12) & 0x3F];
        result += "==";
    } else if (remaining == 2) {
        const uint32_t triple = (static_cast<uint8_t>(t_input[i]) << 16) | (static_cast<uint8_t>(t_input[i + 1]) << 8);
        result += alphabet[(triple >> 18) & 0x3F];
        result += alphabet[(triple >> 12) & 0x3F];
        result += alphabet[(triple >> 6) & 0x3F];
        result += '=';
    }

    return result;
}

auto isTokenChar(const unsigned char t_char) noexcept -> bool
{
    constexpr std::string_view extra = "!#$%&'*+-.^_`|~";
    return std::isalnum(t_char) != 0 || extra.find(static_cast<char>(t_char)) != std::string_view::npos;
}

auto encodePairs(const conduit::http::RequestBuilder::Pairs& t_pairs) -> std::string
{
    std::string result;
    for (const auto& [key, value] : t_pairs) {
        if (!result.empty()) {
            result += '&';
        }
        result += conduit::http::percentEncode(key);
        result += '=';
        result += conduit::http::percentEncode(value);
    }

    return result;
}
}  // namespace

namespace conduit::http
{
RequestBuilder::RequestBuilder(std::string_view t_method, std::string_view t_url)
{
    m_request.method = std::string{t_method};

    if (!isValidMethod(t_method)) {
        fail("invalid method '" + std::string{t_method} + "'");
    }

    auto url = Url::parse(t_url);
    if (!url) {
        fail("invalid url '" + std::string{t_url} + "'");
        return;
    }

    m_request.url = std::move(*url);
}

auto RequestBuilder::header(std::string_view t_name, std::string_view t_value) && -> RequestBuilder
{
    putHeader(t_name, t_value, false);
    return std::move(*this);
}

auto RequestBuilder::headers(const HeaderMap& t_headers) && -> RequestBuilder
{
    for (const auto& [name, value] : t_headers) {
        putHeader(name, value, true);
    }

    return std::move(*this);
}

auto RequestBuilder::basicAuth(std::string_view t_user, std::optional<std::string_view> t_password) && -> RequestBuilder
{
    auto credentials = std::string{t_user} + ":";
    if (t_password) {
        credentials += *t_password;
    }

    putHeader("Authorization", "Basic " + base64Encode(credentials), true);
    return std::move(*this);
}

auto RequestBuilder::bearerAuth(std::string_view t_token) && -> RequestBuilder
{
    putHeader("Authorization", "Bearer " + std::string{t_token}, true);
    return std::move(*this);
}

auto RequestBuilder::body(Body t_body) && -> RequestBuilder
{
    m_request.body = std::move(t_body);
    return std::move(*this);
}

auto RequestBuilder::query(const Pairs& t_pairs) && -> RequestBuilder
{
    for (const auto& [key, value] : t_pairs) {
        m_request.url.appendQuery(key, value);
    }

    return std::move(*this);
}

auto RequestBuilder::form(const Pairs& t_pairs) && -> RequestBuilder
{
    m_request.headers.set("Content-Type", "application/x-www-form-urlencoded");
    m_request.body = Body{encodePairs(t_pairs)};

    return std::move(*this);
}

auto RequestBuilder::json(std::string t_json_text) && -> RequestBuilder
{
    m_request.headers.set("Content-Type", "application/json");
    m_request.body = Body{std::move(t_json_text)};

    return std::move(*this);
}

auto RequestBuilder::multipart(const MultipartForm& t_form) && -> RequestBuilder
{
    m_request.headers.set("Content-Type", t_form.contentType());
    m_request.body = Body{t_form.render()};

    return std::move(*this);
}

auto RequestBuilder::timeout(std::chrono::milliseconds t_timeout) && -> RequestBuilder
{
    if (t_timeout <= std::chrono::milliseconds::zero()) {
        fail("timeout must be positive");
    } else {
        m_request.timeout = t_timeout;
    }

    return std::move(*this);
}

auto RequestBuilder::build() && -> std::expected<Request, error::Error>
{
    if (m_error) {
        return std::unexpected{std::move(*m_error)};
    }

    return std::move(m_request);
}

auto RequestBuilder::tryClone() const -> std::optional<RequestBuilder>
{
    auto request = m_request.tryClone();
    if (!request) {
        return std::nullopt;
    }

    RequestBuilder copy;
    copy.m_request = std::move(*request);
    copy.m_error = m_error;

    return copy;
}

auto RequestBuilder::peek() const noexcept -> const Request&
{
    return m_request;
}

auto RequestBuilder::hasError() const noexcept -> bool
{
    return m_error.has_value();
}

auto RequestBuilder::putHeader(std::string_view t_name, std::string_view t_value, bool t_replace) -> void
{
    if (!isValidHeaderName(t_name)) {
        fail("invalid header name '" + std::string{t_name} + "'");
    } else if (!isValidHeaderValue(t_value)) {
        fail("invalid value for header '" + std::string{t_name} + "'");
    } else if (t_replace) {
        m_request.headers.set(std::string{t_name}, std::string{t_value});
    } else {
        m_request.headers.append(std::string{t_name}, t_value);
    }
}

auto RequestBuilder::fail(std::string t_message) -> void
{
    if (!m_error) {
        m_error.emplace(error::Error::build(t_message));
    }
}

auto isValidHeaderName(std::string_view t_name) noexcept -> bool
{
    return !t_name.empty() && std::ranges::all_of(t_name, [](unsigned char c) { return isTokenChar(c); });
}

auto isValidHeaderValue(std::string_view t_value) noexcept -> bool
{
    return std::ranges::none_of(t_value, [](char c) { return c == '\r' || c == '\n' || c == '\0'; });
}

auto isValidMethod(std::string_view t_method) noexcept -> bool
{
    return isValidHeaderName(t_method);
}
}  // namespace conduit::http
