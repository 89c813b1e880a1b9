#pragma once

#include <memory>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>
#include <fmt/format.h>

#ifdef ERROR
#undef ERROR
#endif

namespace docbridge {
namespace utils {

/// Process-wide spdlog logger "docbridge". Every call is a no-op until init().
class Logger {
public:
    enum class Level { TRACE, DEBUG, INFO, WARN, ERROR, CRITICAL };

    // Empty log_file: console sink only
    static void init(const std::string& log_file = "", Level level = Level::INFO);
    static void shutdown();
    static bool isInitialized();

    static void setLevel(Level level);
    static void setPattern(const std::string& pattern);

    /// Unknown names map to INFO
    static Level levelFromString(const std::string& lvl);
    static const char* levelToString(Level lvl);

    template<typename FormatString, typename... Args>
    static void log(Level level, FormatString&& fmt, Args&&... args) {
        const auto lvl = toSpdlog(level);
        if (!logger_ || !logger_->should_log(lvl)) return;
        logger_->log(lvl, fmt::runtime(std::forward<FormatString>(fmt)), std::forward<Args>(args)...);
    }

private:
    static spdlog::level::level_enum toSpdlog(Level level);

    static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace utils
} // namespace docbridge

#define DOCBRIDGE_TRACE(...) ::docbridge::utils::Logger::log(::docbridge::utils::Logger::Level::TRACE, __VA_ARGS__)
#define DOCBRIDGE_DEBUG(...) ::docbridge::utils::Logger::log(::docbridge::utils::Logger::Level::DEBUG, __VA_ARGS__)
#define DOCBRIDGE_INFO(...) ::docbridge::utils::Logger::log(::docbridge::utils::Logger::Level::INFO, __VA_ARGS__)
#define DOCBRIDGE_WARN(...) ::docbridge::utils::Logger::log(::docbridge::utils::Logger::Level::WARN, __VA_ARGS__)
#define DOCBRIDGE_ERROR(...) ::docbridge::utils::Logger::log(::docbridge::utils::Logger::Level::ERROR, __VA_ARGS__)
#define DOCBRIDGE_CRITICAL(...) ::docbridge::utils::Logger::log(::docbridge::utils::Logger::Level::CRITICAL, __VA_ARGS__)
