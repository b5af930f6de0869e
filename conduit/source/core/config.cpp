#include "conduit/core/config.hpp"

#include <charconv>
#include <chrono>
#include <cstdlib>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace
{
auto readEnv(const char* t_name) -> std::optional<std::string_view>
{
    const auto* value = std::getenv(t_name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }

    return std::string_view{value};
}

auto readNumber(const char* t_name) -> std::optional<std::size_t>
{
    const auto text = readEnv(t_name);
    if (!text) {
        return std::nullopt;
    }

    std::size_t value{};
    const auto [ptr, ec] = std::from_chars(text->data(), text->data() + text->size(), value);
    if (ec != std::errc{} || ptr != text->data() + text->size()) {
        throw std::invalid_argument(std::string{t_name} + " is not a number: " + std::string{*text});
    }

    return value;
}
}  // namespace

namespace conduit::core
{
auto TransportConfig::fromEnvironment() -> TransportConfig
{
    TransportConfig config;

    if (const auto threads = readNumber("CONDUIT_WORKER_THREADS")) {
        config.workerThreads = *threads;
    }
    if (const auto connect = readNumber("CONDUIT_CONNECT_TIMEOUT_MS")) {
        config.connectTimeout = std::chrono::milliseconds{*connect};
    }
    if (const auto request = readNumber("CONDUIT_REQUEST_TIMEOUT_MS")) {
        config.requestTimeout = std::chrono::milliseconds{*request};
    }
    if (const auto maxBytes = readNumber("CONDUIT_MAX_RESPONSE_BYTES")) {
        config.maxResponseBytes = *maxBytes;
    }
    if (const auto userAgent = readEnv("CONDUIT_USER_AGENT")) {
        config.userAgent = std::string{*userAgent};
    }

    config.validate();

    return config;
}

auto TransportConfig::validate() const -> void
{
    if (workerThreads == 0) {
        throw std::invalid_argument("TransportConfig: workerThreads must be > 0");
    }
    if (connectTimeout <= std::chrono::milliseconds::zero()) {
        throw std::invalid_argument("TransportConfig: connectTimeout must be positive");
    }
    if (requestTimeout <= std::chrono::milliseconds::zero()) {
        throw std::invalid_argument("TransportConfig: requestTimeout must be positive");
    }
    if (maxResponseBytes == 0) {
        throw std::invalid_argument("TransportConfig: maxResponseBytes must be > 0");
    }
}
}  // namespace conduit::core
