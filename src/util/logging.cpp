/// @file src/util/logging.cpp
/// @brief spdlog logger singleton.

#include "wxs/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>

namespace wxs::util {

std::shared_ptr<spdlog::logger> Logging::logger_;

namespace {

std::mutex& init_mutex() {
    static std::mutex m;
    return m;
}

// Precondition: init_mutex() held.
std::shared_ptr<spdlog::logger> create_logger() {
    // Scores go to stdout in the CLI; diagnostics stay on stderr.
    auto existing = spdlog::get("wxs");
    if (existing) {
        return existing;
    }
    auto logger = spdlog::stderr_color_mt("wxs");
    logger->set_level(spdlog::level::info);
    logger->flush_on(spdlog::level::warn);
    return logger;
}

}  // namespace

void Logging::init(spdlog::level::level_enum level) {
    auto& logger = getLogger();
    std::lock_guard<std::mutex> lock(init_mutex());
    logger->set_level(level);
}

std::shared_ptr<spdlog::logger>& Logging::getLogger() {
    static std::once_flag created;
    std::call_once(created, [] {
        std::lock_guard<std::mutex> lock(init_mutex());
        logger_ = create_logger();
    });
    return logger_;
}

}  // namespace wxs::util
