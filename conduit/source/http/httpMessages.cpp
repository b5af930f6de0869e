#include "conduit/http/httpMessages.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace conduit::http
{
auto iequals(std::string_view t_lhs, std::string_view t_rhs) noexcept -> bool
{
    return std::ranges::equal(t_lhs, t_rhs, [](unsigned char a, unsigned char b) {
        return std::tolower(a) == std::tolower(b);
    });
}

auto CaseInsensitiveLess::operator()(std::string_view t_lhs, std::string_view t_rhs) const noexcept -> bool
{
    return std::ranges::lexicographical_compare(t_lhs, t_rhs, [](unsigned char a, unsigned char b) {
        return std::tolower(a) < std::tolower(b);
    });
}

auto HeaderMap::set(std::string t_name, std::string t_value) -> void
{
    auto it = m_headers.find(t_name);
    if (it != m_headers.end()) {
        it->second = std::move(t_value);
        return;
    }

    m_headers.emplace(std::move(t_name), std::move(t_value));
}

auto HeaderMap::append(std::string t_name, std::string_view t_value) -> void
{
    auto it = m_headers.find(t_name);
    if (it == m_headers.end()) {
        m_headers.emplace(std::move(t_name), std::string{t_value});
        return;
    }

    it->second += ", ";
    it->second += t_value;
}

auto HeaderMap::erase(std::string_view t_name) -> bool
{
    auto it = m_headers.find(t_name);
    if (it == m_headers.end()) {
        return false;
    }

    m_headers.erase(it);
    return true;
}

auto HeaderMap::get(std::string_view t_name) const -> std::optional<std::string_view>
{
    auto it = m_headers.find(t_name);
    if (it == m_headers.end()) {
        return std::nullopt;
    }

    return std::string_view{it->second};
}

auto HeaderMap::contains(std::string_view t_name) const -> bool
{
    return m_headers.find(t_name) != m_headers.end();
}

auto HeaderMap::size() const noexcept -> std::size_t
{
    return m_headers.size();
}

auto HeaderMap::empty() const noexcept -> bool
{
    return m_headers.empty();
}

Body::Body(std::string t_bytes) : m_content{std::move(t_bytes)} {}

Body::Body(const char* t_bytes) : m_content{std::string{t_bytes}} {}

auto Body::fromStream(Stream t_stream) -> Body
{
    Body body;
    body.m_content = std::move(t_stream);

    return body;
}

auto Body::isStream() const noexcept -> bool
{
    return std::holds_alternative<Stream>(m_content);
}

auto Body::empty() const noexcept -> bool
{
    const auto* buffered = bytes();
    return buffered != nullptr && buffered->empty();
}

auto Body::bytes() const noexcept -> const std::string*
{
    return std::get_if<std::string>(&m_content);
}

auto Body::nextChunk() -> std::optional<std::string>
{
    if (auto* buffered = std::get_if<std::string>(&m_content)) {
        if (buffered->empty()) {
            return std::nullopt;
        }

        return std::exchange(*buffered, std::string{});
    }

    auto& stream = std::get<Stream>(m_content);
    if (!stream) {
        return std::nullopt;
    }

    return stream();
}

auto Body::tryClone() const -> std::optional<Body>
{
    if (const auto* buffered = bytes()) {
        return Body{*buffered};
    }

    return std::nullopt;
}

auto Request::tryClone() const -> std::optional<Request>
{
    auto clonedBody = body.tryClone();
    if (!clonedBody) {
        return std::nullopt;
    }

    Request copy;
    copy.method = method;
    copy.url = url;
    copy.headers = headers;
    copy.body = std::move(*clonedBody);
    copy.timeout = timeout;

    return copy;
}

auto Response::isSuccess() const noexcept -> bool
{
    return status_code >= 200 && status_code < 300;
}

auto Response::header(std::string_view t_name) const -> std::optional<std::string_view>
{
    return headers.get(t_name);
}

auto Response::ok(std::string t_body_text) -> Response
{
    Response r;
    r.body = std::move(t_body_text);
    return r;
}

auto Response::json(std::string t_json_text) -> Response
{
    Response r;
    r.headers.set("Content-Type", "application/json");
    r.body = std::move(t_json_text);
    return r;
}

auto Response::withStatus(int t_status_code, std::string t_status_text) -> Response
{
    Response r;
    r.status_code = t_status_code;
    r.status_text = std::move(t_status_text);
    return r;
}
}  // namespace conduit::http
