/**
 * @file Log.cpp
 * @brief Library logger implementation
 */

#include <VolSeg/Core/Log.h>

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>

namespace Vol::Seg::Log {

namespace {

std::shared_ptr<spdlog::logger> CreateLogger() {
    auto existing = spdlog::get(LOGGER_NAME);
    if (existing) {
        return existing;
    }
    auto logger = spdlog::stderr_color_mt(LOGGER_NAME);
    logger->set_level(spdlog::level::warn);
    logger->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
    return logger;
}

} // anonymous namespace

std::shared_ptr<spdlog::logger> Get() {
    static std::once_flag once;
    static std::shared_ptr<spdlog::logger> logger;
    std::call_once(once, [] { logger = CreateLogger(); });
    return logger;
}

void SetLevel(spdlog::level::level_enum level) {
    Get()->set_level(level);
}

} // namespace Vol::Seg::Log
