#pragma once

#include <memory>
#include <mutex>
#include <string_view>
#include <vector>

#include <spdlog/async_logger.h>
#include <spdlog/common.h>
#include <spdlog/spdlog.h>

// Conduit convenience logging macros mapped to spdlog
#ifndef CONDUIT_LOG_TRACE
#    define CONDUIT_LOG_TRACE(logger, ...) SPDLOG_LOGGER_TRACE(logger, __VA_ARGS__)
#endif
#ifndef CONDUIT_LOG_DEBUG
#    define CONDUIT_LOG_DEBUG(logger, ...) SPDLOG_LOGGER_DEBUG(logger, __VA_ARGS__)
#endif
#ifndef CONDUIT_LOG_INFO
#    define CONDUIT_LOG_INFO(logger, ...) SPDLOG_LOGGER_INFO(logger, __VA_ARGS__)
#endif
#ifndef CONDUIT_LOG_WARN
#    define CONDUIT_LOG_WARN(logger, ...) SPDLOG_LOGGER_WARN(logger, __VA_ARGS__)
#endif
#ifndef CONDUIT_LOG_ERROR
#    define CONDUIT_LOG_ERROR(logger, ...) SPDLOG_LOGGER_ERROR(logger, __VA_ARGS__)
#endif
#ifndef CONDUIT_LOG_CRITICAL
#    define CONDUIT_LOG_CRITICAL(logger, ...) SPDLOG_LOGGER_CRITICAL(logger, __VA_ARGS__)
#endif

namespace conduit::core
{
class Logger
{
public:
    using LoggerPtr = std::shared_ptr<spdlog::async_logger>;

    static auto init() -> void;
    static auto shutdown() -> void;

    // Loggers created before init() have no sinks and stay silent.
    static auto createLogger(std::string_view t_name) -> LoggerPtr;

private:
    static auto initSinks() -> void;

    inline static std::vector<spdlog::sink_ptr> m_sinks{};
    inline static std::mutex m_registryMutex{};
};
}  // namespace conduit::core
