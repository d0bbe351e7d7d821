#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace zulu::utils {

/**
 * Logging system wrapper around spdlog
 */
class Logger {
public:
    /**
     * Initialize the logging system
     * @param level Log level (trace, debug, info, warn, error, critical)
     * @param log_to_file Whether to log to zulu.log in addition to console
     */
    static void init(const std::string& level = "info", bool log_to_file = false);

    /**
     * Change the level of an already initialized logger
     */
    static void set_level(const std::string& level);

    /**
     * Get the logger instance
     */
    static std::shared_ptr<spdlog::logger> get();

private:
    static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace zulu::utils

// Convenience macros
#define ZULU_LOG_TRACE(...)    zulu::utils::Logger::get()->trace(__VA_ARGS__)
#define ZULU_LOG_DEBUG(...)    zulu::utils::Logger::get()->debug(__VA_ARGS__)
#define ZULU_LOG_INFO(...)     zulu::utils::Logger::get()->info(__VA_ARGS__)
#define ZULU_LOG_WARN(...)     zulu::utils::Logger::get()->warn(__VA_ARGS__)
#define ZULU_LOG_ERROR(...)    zulu::utils::Logger::get()->error(__VA_ARGS__)
#define ZULU_LOG_CRITICAL(...) zulu::utils::Logger::get()->critical(__VA_ARGS__)
