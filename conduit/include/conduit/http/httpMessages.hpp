#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "conduit/http/url.hpp"

namespace conduit::http
{
namespace method
{
inline constexpr std::string_view get = "GET";
inline constexpr std::string_view post = "POST";
inline constexpr std::string_view put = "PUT";
inline constexpr std::string_view patch = "PATCH";
inline constexpr std::string_view del = "DELETE";
inline constexpr std::string_view head = "HEAD";
inline constexpr std::string_view options = "OPTIONS";
}  // namespace method

[[nodiscard]] auto iequals(std::string_view t_lhs, std::string_view t_rhs) noexcept -> bool;

struct CaseInsensitiveLess
{
    using is_transparent = void;

    auto operator()(std::string_view t_lhs, std::string_view t_rhs) const noexcept -> bool;
};

class HeaderMap
{
public:
    using Storage = std::map<std::string, std::string, CaseInsensitiveLess>;

    auto set(std::string t_name, std::string t_value) -> void;

    // Repeated names are folded into one comma separated value.
    auto append(std::string t_name, std::string_view t_value) -> void;

    auto erase(std::string_view t_name) -> bool;

    [[nodiscard]] auto get(std::string_view t_name) const -> std::optional<std::string_view>;
    [[nodiscard]] auto contains(std::string_view t_name) const -> bool;

    [[nodiscard]] auto size() const noexcept -> std::size_t;
    [[nodiscard]] auto empty() const noexcept -> bool;

    [[nodiscard]] auto begin() const noexcept
    {
        return m_headers.begin();
    }

    [[nodiscard]] auto end() const noexcept
    {
        return m_headers.end();
    }

private:
    Storage m_headers;
};

class Body
{
public:
    // Produces the next chunk, or nullopt once the stream is exhausted.
    using Stream = std::move_only_function<std::optional<std::string>()>;

    Body() = default;
    Body(std::string t_bytes);
    Body(const char* t_bytes);

    static auto fromStream(Stream t_stream) -> Body;

    [[nodiscard]] auto isStream() const noexcept -> bool;
    [[nodiscard]] auto empty() const noexcept -> bool;

    // nullptr for stream bodies.
    [[nodiscard]] auto bytes() const noexcept -> const std::string*;

    [[nodiscard]] auto nextChunk() -> std::optional<std::string>;

    [[nodiscard]] auto tryClone() const -> std::optional<Body>;

private:
    std::variant<std::string, Stream> m_content{std::string{}};
};

struct Request
{
    std::string method{"GET"};
    Url url;
    HeaderMap headers;
    Body body;
    std::optional<std::chrono::milliseconds> timeout;

    [[nodiscard]] auto tryClone() const -> std::optional<Request>;
};

struct Response
{
    int status_code = 200;
    std::string status_text = "OK";
    std::string version = "HTTP/1.1";
    HeaderMap headers;
    std::string body;

    [[nodiscard]] auto isSuccess() const noexcept -> bool;
    [[nodiscard]] auto header(std::string_view t_name) const -> std::optional<std::string_view>;

    static auto ok(std::string t_body_text) -> Response;
    static auto json(std::string t_json_text) -> Response;
    static auto withStatus(int t_status_code, std::string t_status_text) -> Response;
};
}  // namespace conduit::http
