#pragma once

#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

namespace conduit::error
{
enum class Kind
{
    build,
    middleware,
    transport
};

[[nodiscard]] auto toString(Kind t_kind) noexcept -> std::string_view;

class Error : public std::runtime_error
{
public:
    Error(Kind t_kind, const std::string& t_message, std::error_code t_code = {});

    static auto build(const std::string& t_message) -> Error;
    static auto middleware(const std::string& t_message) -> Error;
    static auto transport(const std::string& t_message, std::error_code t_code = {}) -> Error;

    [[nodiscard]] auto kind() const noexcept -> Kind;
    [[nodiscard]] auto code() const noexcept -> std::error_code;

    [[nodiscard]] auto isBuild() const noexcept -> bool;
    [[nodiscard]] auto isMiddleware() const noexcept -> bool;
    [[nodiscard]] auto isTransport() const noexcept -> bool;

    [[nodiscard]] auto isTimeout() const noexcept -> bool;
    [[nodiscard]] auto isConnect() const noexcept -> bool;

private:
    Kind m_kind;
    std::error_code m_code;
};

// Recovers the Error carried on a sender error channel. Foreign exceptions
// become middleware errors, since only middleware code can raise them.
[[nodiscard]] auto toError(std::exception_ptr t_error) -> Error;

// Same as toError but rewraps anything that is not already an Error as a
// transport error.
[[nodiscard]] auto toTransportError(std::exception_ptr t_error) -> std::exception_ptr;

// Rewraps anything that is not already an Error the way toError does.
[[nodiscard]] auto toMiddlewareError(std::exception_ptr t_error) -> std::exception_ptr;
}  // namespace conduit::error
