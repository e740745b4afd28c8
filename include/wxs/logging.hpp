#pragma once

/// @file include/wxs/logging.hpp
/// @brief Process-wide spdlog logger and WXS_* logging macros.

#include <spdlog/spdlog.h>

#include <memory>

namespace wxs::util {

/// Singleton access to the "wxs" spdlog logger.
///
/// The logger is created lazily on first use with level `info`. Call init()
/// once at startup to change the level; later calls only adjust the level.
class Logging {
public:
    /// Returns the shared logger, creating it if needed.
    static std::shared_ptr<spdlog::logger>& getLogger();

    /// Create (if needed) and set the minimum level of the logger.
    static void init(spdlog::level::level_enum level = spdlog::level::info);

private:
    Logging() = default;

    static std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace wxs::util

#define WXS_TRACE(...)    ::wxs::util::Logging::getLogger()->trace(__VA_ARGS__)
#define WXS_DEBUG(...)    ::wxs::util::Logging::getLogger()->debug(__VA_ARGS__)
#define WXS_INFO(...)     ::wxs::util::Logging::getLogger()->info(__VA_ARGS__)
#define WXS_WARN(...)     ::wxs::util::Logging::getLogger()->warn(__VA_ARGS__)
#define WXS_ERROR(...)    ::wxs::util::Logging::getLogger()->error(__VA_ARGS__)
#define WXS_CRITICAL(...) ::wxs::util::Logging::getLogger()->critical(__VA_ARGS__)
