#pragma once

#include <chrono>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "conduit/error/error.hpp"
#include "conduit/http/httpMessages.hpp"
#include "conduit/http/multipartForm.hpp"

namespace conduit::http
{
// Setters never fail. The first invalid input is remembered and reported by
// build(), so a whole chain of calls can be written without checks.
class RequestBuilder
{
public:
    using Pairs = std::vector<std::pair<std::string, std::string>>;

    RequestBuilder(std::string_view t_method, std::string_view t_url);

    // Adds a value; a header given twice keeps both.
    auto header(std::string_view t_name, std::string_view t_value) && -> RequestBuilder;
    // Replaces any values already set under the same names.
    auto headers(const HeaderMap& t_headers) && -> RequestBuilder;

    auto basicAuth(std::string_view t_user, std::optional<std::string_view> t_password) && -> RequestBuilder;
    auto bearerAuth(std::string_view t_token) && -> RequestBuilder;

    auto body(Body t_body) && -> RequestBuilder;
    auto query(const Pairs& t_pairs) && -> RequestBuilder;
    auto form(const Pairs& t_pairs) && -> RequestBuilder;
    auto json(std::string t_json_text) && -> RequestBuilder;
    auto multipart(const MultipartForm& t_form) && -> RequestBuilder;
    auto timeout(std::chrono::milliseconds t_timeout) && -> RequestBuilder;

    [[nodiscard]] auto build() && -> std::expected<Request, error::Error>;

    // nullopt when the body is a stream and cannot be replayed.
    [[nodiscard]] auto tryClone() const -> std::optional<RequestBuilder>;

    // The request as assembled so far.
    [[nodiscard]] auto peek() const noexcept -> const Request&;
    [[nodiscard]] auto hasError() const noexcept -> bool;

private:
    RequestBuilder() = default;

    auto fail(std::string t_message) -> void;
    auto putHeader(std::string_view t_name, std::string_view t_value, bool t_replace) -> void;

    Request m_request;
    std::optional<error::Error> m_error;
};

[[nodiscard]] auto isValidHeaderName(std::string_view t_name) noexcept -> bool;
[[nodiscard]] auto isValidHeaderValue(std::string_view t_value) noexcept -> bool;
[[nodiscard]] auto isValidMethod(std::string_view t_method) noexcept -> bool;
}  // namespace conduit::http
