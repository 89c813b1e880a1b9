#include "utils/logger.h"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>

#include <algorithm>
#include <cctype>
#include <iostream>
#include <vector>

namespace docbridge {
namespace utils {

std::shared_ptr<spdlog::logger> Logger::logger_;

spdlog::level::level_enum Logger::toSpdlog(Level level) {
    switch (level) {
        case Level::TRACE: return spdlog::level::trace;
        case Level::DEBUG: return spdlog::level::debug;
        case Level::INFO: return spdlog::level::info;
        case Level::WARN: return spdlog::level::warn;
        case Level::ERROR: return spdlog::level::err;
        case Level::CRITICAL: return spdlog::level::critical;
    }
    return spdlog::level::info;
}

void Logger::init(const std::string& log_file, Level level) {
    try {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        if (!log_file.empty()) {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false));
        }
        logger_ = std::make_shared<spdlog::logger>("docbridge", sinks.begin(), sinks.end());
        logger_->set_level(toSpdlog(level));
        logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "docbridge: log initialization failed: " << ex.what() << std::endl;
        logger_.reset();
    }
}

void Logger::shutdown() {
    if (!logger_) return;
    logger_->flush();
    logger_.reset();
}

bool Logger::isInitialized() {
    return logger_ != nullptr;
}

void Logger::setLevel(Level level) {
    if (logger_) logger_->set_level(toSpdlog(level));
}

void Logger::setPattern(const std::string& pattern) {
    if (logger_) logger_->set_pattern(pattern);
}

Logger::Level Logger::levelFromString(const std::string& lvl) {
    std::string s = lvl;
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "trace") return Level::TRACE;
    if (s == "debug") return Level::DEBUG;
    if (s == "warn" || s == "warning") return Level::WARN;
    if (s == "error" || s == "err") return Level::ERROR;
    if (s == "critical") return Level::CRITICAL;
    return Level::INFO;
}

const char* Logger::levelToString(Level lvl) {
    switch (lvl) {
        case Level::TRACE: return "trace";
        case Level::DEBUG: return "debug";
        case Level::INFO: return "info";
        case Level::WARN: return "warn";
        case Level::ERROR: return "error";
        case Level::CRITICAL: return "critical";
    }
    return "info";
}

} // namespace utils
} // namespace docbridge
