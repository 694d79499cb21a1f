#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace skillmint::utils {

/**
 * Logging system wrapper around spdlog
 */
class Logger {
public:
    /**
     * Initialize the logging system
     * @param level Log level (trace, debug, info, warn, error, critical, off)
     * @param log_to_file Whether to log to file in addition to console
     * @param log_file Path of the rotating log file
     */
    static void init(const std::string& level = "info",
                     bool log_to_file = false,
                     const std::string& log_file = "skillmint.log");

    /**
     * Get the logger instance
     */
    static std::shared_ptr<spdlog::logger> get();

private:
    static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace skillmint::utils

// Convenience macros
#define SKILLMINT_LOG_TRACE(...)    skillmint::utils::Logger::get()->trace(__VA_ARGS__)
#define SKILLMINT_LOG_DEBUG(...)    skillmint::utils::Logger::get()->debug(__VA_ARGS__)
#define SKILLMINT_LOG_INFO(...)     skillmint::utils::Logger::get()->info(__VA_ARGS__)
#define SKILLMINT_LOG_WARN(...)     skillmint::utils::Logger::get()->warn(__VA_ARGS__)
#define SKILLMINT_LOG_ERROR(...)    skillmint::utils::Logger::get()->error(__VA_ARGS__)
#define SKILLMINT_LOG_CRITICAL(...) skillmint::utils::Logger::get()->critical(__VA_ARGS__)
