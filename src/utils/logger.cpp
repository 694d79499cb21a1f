#include "logger.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <mutex>
#include <vector>

namespace skillmint::utils {

std::shared_ptr<spdlog::logger> Logger::logger_;

namespace {
    std::mutex g_logger_mutex;

    spdlog::level::level_enum parse_level(const std::string& level) {
        if (level == "trace") return spdlog::level::trace;
        if (level == "debug") return spdlog::level::debug;
        if (level == "info") return spdlog::level::info;
        if (level == "warn") return spdlog::level::warn;
        if (level == "error") return spdlog::level::err;
        if (level == "critical") return spdlog::level::critical;
        if (level == "off") return spdlog::level::off;
        return spdlog::level::info;
    }

    std::shared_ptr<spdlog::logger> make_logger(const std::string& level,
                                                bool log_to_file,
                                                const std::string& log_file) {
        std::vector<spdlog::sink_ptr> sinks;

        // Console sink
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
        sinks.push_back(console_sink);

        // File sink (optional)
        if (log_to_file) {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file,
                1024 * 1024 * 10,  // 10MB
                3                   // 3 rotating files
            );
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
            sinks.push_back(file_sink);
        }

        auto logger = std::make_shared<spdlog::logger>("skillmint", sinks.begin(), sinks.end());
        logger->set_level(parse_level(level));

        // Flush on error or higher
        logger->flush_on(spdlog::level::err);
        return logger;
    }
}

void Logger::init(const std::string& level, bool log_to_file, const std::string& log_file) {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    logger_ = make_logger(level, log_to_file, log_file);
    spdlog::set_default_logger(logger_);
}

std::shared_ptr<spdlog::logger> Logger::get() {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    if (!logger_) {
        logger_ = make_logger("info", false, "skillmint.log");
        spdlog::set_default_logger(logger_);
    }
    return logger_;
}

} // namespace skillmint::utils
