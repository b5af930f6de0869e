#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace conduit::http
{
// Only plain http:// targets; there is no TLS support.
struct Url
{
    std::string scheme{"http"};
    std::string host;
    uint16_t port = 80;
    std::string path{"/"};
    std::string query;

    [[nodiscard]] static auto parse(std::string_view t_text) -> std::optional<Url>;

    auto appendQuery(std::string_view t_key, std::string_view t_value) -> void;

    // Origin-form request target: path plus query.
    [[nodiscard]] auto target() const -> std::string;
    [[nodiscard]] auto hostHeader() const -> std::string;
    [[nodiscard]] auto toString() const -> std::string;
};

[[nodiscard]] auto percentEncode(std::string_view t_text) -> std::string;
}  // namespace conduit::http
