#include "conduit/error/error.hpp"

#include <exception>
#include <string>
#include <string_view>
#include <system_error>

namespace conduit::error
{
auto toString(const Kind t_kind) noexcept -> std::string_view
{
    switch (t_kind) {
        case Kind::build:
            return "build";
        case Kind::middleware:
            return "middleware";
        case Kind::transport:
            return "transport";
    }

    return "unknown";
}

Error::Error(const Kind t_kind, const std::string& t_message, const std::error_code t_code)
    : std::runtime_error{std::string{toString(t_kind)} + " error: " + t_message}, m_kind{t_kind}, m_code{t_code}
{}

auto Error::build(const std::string& t_message) -> Error
{
    return Error{Kind::build, t_message};
}

auto Error::middleware(const std::string& t_message) -> Error
{
    return Error{Kind::middleware, t_message};
}

auto Error::transport(const std::string& t_message, const std::error_code t_code) -> Error
{
    return Error{Kind::transport, t_message, t_code};
}

auto Error::kind() const noexcept -> Kind
{
    return m_kind;
}

auto Error::code() const noexcept -> std::error_code
{
    return m_code;
}

auto Error::isBuild() const noexcept -> bool
{
    return m_kind == Kind::build;
}

auto Error::isMiddleware() const noexcept -> bool
{
    return m_kind == Kind::middleware;
}

auto Error::isTransport() const noexcept -> bool
{
    return m_kind == Kind::transport;
}

auto Error::isTimeout() const noexcept -> bool
{
    return m_code == std::errc::timed_out;
}

auto Error::isConnect() const noexcept -> bool
{
    return m_code == std::errc::connection_refused || m_code == std::errc::host_unreachable
           || m_code == std::errc::network_unreachable || m_code == std::errc::address_not_available;
}

auto toError(std::exception_ptr t_error) -> Error
{
    if (!t_error) {
        return Error::middleware("empty error");
    }

    try {
        std::rethrow_exception(t_error);
    } catch (const Error& e) {
        return e;
    } catch (const std::system_error& e) {
        return Error{Kind::middleware, e.what(), e.code()};
    } catch (const std::exception& e) {
        return Error::middleware(e.what());
    } catch (...) {
        return Error::middleware("unknown exception");
    }
}

auto toTransportError(std::exception_ptr t_error) -> std::exception_ptr
{
    if (!t_error) {
        return std::make_exception_ptr(Error::transport("empty error"));
    }

    try {
        std::rethrow_exception(t_error);
    } catch (const Error&) {
        return t_error;
    } catch (const std::system_error& e) {
        return std::make_exception_ptr(Error::transport(e.what(), e.code()));
    } catch (const std::exception& e) {
        return std::make_exception_ptr(Error::transport(e.what()));
    } catch (...) {
        return std::make_exception_ptr(Error::transport("unknown failure"));
    }
}

auto toMiddlewareError(std::exception_ptr t_error) -> std::exception_ptr
{
    if (!t_error) {
        return std::make_exception_ptr(toError(t_error));
    }

    try {
        std::rethrow_exception(t_error);
    } catch (const Error&) {
        return t_error;
    } catch (...) {
        return std::make_exception_ptr(toError(std::current_exception()));
    }
}
}  // namespace conduit::error
