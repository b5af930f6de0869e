#include "conduit/network/socket.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <fcntl.h>
#include <limits>
#include <memory>
#include <poll.h>
#include <span>
#include <string>
#include <system_error>
#include <unistd.h>
#include <utility>

#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>

#include "conduit/error/error.hpp"

namespace
{
auto errnoCode(int t_errno) -> std::error_code
{
    return {t_errno, std::system_category()};
}

auto timedOut() -> std::error_code
{
    return std::make_error_code(std::errc::timed_out);
}

auto setBlocking(int32_t t_fd, bool t_blocking) noexcept -> void
{
    const auto flags = fcntl(t_fd, F_GETFL, 0);
    fcntl(t_fd, F_SETFL, t_blocking ? (flags & ~O_NONBLOCK) : (flags | O_NONBLOCK));
}

// Non-blocking connect bounded by t_timeout; returns 0 or an errno value.
auto connectWithTimeout(int32_t t_fd, const addrinfo& t_address, std::chrono::milliseconds t_timeout) -> int
{
    setBlocking(t_fd, false);

    if (::connect(t_fd, t_address.ai_addr, t_address.ai_addrlen) == 0) {
        setBlocking(t_fd, true);
        return 0;
    }

    if (errno != EINPROGRESS) {
        return errno;
    }

    pollfd pfd{};
    pfd.fd = t_fd;
    pfd.events = POLLOUT;

    // poll() takes an int; longer waits are cut to the largest it accepts.
    const auto timeout = std::chrono::milliseconds{
        std::clamp<std::chrono::milliseconds::rep>(t_timeout.count(), 0, std::numeric_limits<int>::max())};
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        const auto wait = std::max<std::chrono::milliseconds::rep>(left.count(), 0);

        const auto ready = ::poll(&pfd, 1, static_cast<int>(wait));
        if (ready > 0) {
            break;
        }
        if (ready == 0) {
            return ETIMEDOUT;
        }
        if (errno != EINTR) {
            return errno;
        }
    }

    int error = 0;
    socklen_t length = sizeof(error);
    if (::getsockopt(t_fd, SOL_SOCKET, SO_ERROR, &error, &length) == -1) {
        return errno;
    }

    setBlocking(t_fd, true);
    return error;
}
}  // namespace

namespace conduit::network
{
Socket::Socket(int32_t t_fd) : m_fd{t_fd} {}

Socket::Socket(Socket&& t_other) noexcept : m_fd{t_other.m_fd}
{
    t_other.m_fd = -1;
}

Socket& Socket::operator=(Socket&& t_other) noexcept
{
    if (this != &t_other) {
        close();
        m_fd = std::exchange(t_other.m_fd, -1);
    }

    return *this;
}

Socket::~Socket()
{
    close();
}

auto Socket::connect(const std::string& t_host, uint16_t t_port, std::chrono::milliseconds t_timeout) -> Socket
{
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* resolved = nullptr;
    const auto port = std::to_string(t_port);
    if (const auto rc = ::getaddrinfo(t_host.c_str(), port.c_str(), &hints, &resolved); rc != 0) {
        throw error::Error::transport("cannot resolve " + t_host + ": " + ::gai_strerror(rc),
                                      std::make_error_code(std::errc::host_unreachable));
    }

    const std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)> addresses{resolved, &::freeaddrinfo};

    auto lastError = ECONNREFUSED;
    for (const auto* address = addresses.get(); address != nullptr; address = address->ai_next) {
        Socket socket{::socket(address->ai_family, address->ai_socktype, address->ai_protocol)};
        if (!socket.isValid()) {
            lastError = errno;
            continue;
        }

        lastError = connectWithTimeout(socket.fd(), *address, t_timeout);
        if (lastError == 0) {
            return socket;
        }
    }

    throw error::Error::transport("cannot connect to " + t_host + ":" + port, errnoCode(lastError));
}

auto Socket::setTimeouts(std::chrono::milliseconds t_timeout) const -> void
{
    const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(t_timeout);
    const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(t_timeout - seconds);

    timeval tv{};
    tv.tv_sec = static_cast<time_t>(seconds.count());
    tv.tv_usec = static_cast<suseconds_t>(micros.count());

    if (::setsockopt(m_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == -1
        || ::setsockopt(m_fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) == -1) {
        throw error::Error::transport("cannot set socket timeouts", errnoCode(errno));
    }
}

auto Socket::recv(std::span<std::byte> t_buffer) const noexcept -> ssize_t
{
    return ::recv(m_fd, t_buffer.data(), t_buffer.size(), 0);
}

auto Socket::send(const std::span<const std::byte> t_buffer) const noexcept -> ssize_t
{
    return ::send(m_fd, t_buffer.data(), t_buffer.size(), MSG_NOSIGNAL);
}

auto Socket::sendAll(std::span<const std::byte> t_buffer) const -> void
{
    while (!t_buffer.empty()) {
        const auto sent = send(t_buffer);
        if (sent < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                throw error::Error::transport("send timed out", timedOut());
            }
            throw error::Error::transport("send failed", errnoCode(errno));
        }

        t_buffer = t_buffer.subspan(static_cast<std::size_t>(sent));
    }
}

auto Socket::receiveSome(std::span<std::byte> t_buffer) const -> std::size_t
{
    while (true) {
        const auto received = recv(t_buffer);
        if (received >= 0) {
            return static_cast<std::size_t>(received);
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            throw error::Error::transport("receive timed out", timedOut());
        }

        throw error::Error::transport("receive failed", errnoCode(errno));
    }
}

auto Socket::close() -> void
{
    if (m_fd != -1) {
        ::close(m_fd);
        m_fd = -1;
    }
}

[[nodiscard]] auto Socket::fd() const noexcept -> int
{
    return m_fd;
}

[[nodiscard]] auto Socket::isValid() const noexcept -> bool
{
    return m_fd != -1;
}
}  // namespace conduit::network
