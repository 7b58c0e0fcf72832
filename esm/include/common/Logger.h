#pragma once

#include <memory>
#include <source_location>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <string>

// Logger internals live in a hidden namespace reachable only through these macros
#define ESM_LOGGER_PRIVATE_NS __detail
#define ESM_PRIVATE_CALL(func) ESM_LOGGER_PRIVATE_NS::func

namespace ESM {

namespace ESM_LOGGER_PRIVATE_NS {
void doFormatAndLog(spdlog::level::level_enum level, const std::string &message, const std::source_location &loc);
void doInitializeLogger(const std::string &logDir, bool logToFile);
void doSetLevel(spdlog::level::level_enum level);
std::string extractCleanFunctionName(const std::source_location &loc);
void ensureLoggerInitialized();
}  // namespace ESM_LOGGER_PRIVATE_NS

/**
 * @brief Process-wide logger for the generator and its front ends
 *
 * Backed by a single spdlog logger named "ESM". The level comes from the
 * SPDLOG_LEVEL environment variable unless setLevel() overrides it.
 * Every message is prefixed with the calling function.
 */
class Logger {
public:
    static void initialize() {
        ESM_PRIVATE_CALL(doInitializeLogger)("", false);
    }

    /**
     * @brief Initialize with an additional file sink
     * @param logDir Directory receiving esm.log
     * @param logToFile Whether the file sink is attached
     */
    static void initialize(const std::string &logDir, bool logToFile = true) {
        ESM_PRIVATE_CALL(doInitializeLogger)(logDir, logToFile);
    }

    static void setLevel(spdlog::level::level_enum level) {
        ESM_PRIVATE_CALL(doSetLevel)(level);
    }

    static void trace(const std::string &message, const std::source_location &loc = std::source_location::current()) {
        ESM_PRIVATE_CALL(doFormatAndLog)(spdlog::level::trace, message, loc);
    }

    static void debug(const std::string &message, const std::source_location &loc = std::source_location::current()) {
        ESM_PRIVATE_CALL(doFormatAndLog)(spdlog::level::debug, message, loc);
    }

    static void info(const std::string &message, const std::source_location &loc = std::source_location::current()) {
        ESM_PRIVATE_CALL(doFormatAndLog)(spdlog::level::info, message, loc);
    }

    static void warn(const std::string &message, const std::source_location &loc = std::source_location::current()) {
        ESM_PRIVATE_CALL(doFormatAndLog)(spdlog::level::warn, message, loc);
    }

    static void error(const std::string &message, const std::source_location &loc = std::source_location::current()) {
        ESM_PRIVATE_CALL(doFormatAndLog)(spdlog::level::err, message, loc);
    }

private:
    static std::shared_ptr<spdlog::logger> logger_;

    friend void ESM_LOGGER_PRIVATE_NS::ensureLoggerInitialized();
    friend void ESM_LOGGER_PRIVATE_NS::doFormatAndLog(spdlog::level::level_enum level, const std::string &message,
                                                      const std::source_location &loc);
    friend void ESM_LOGGER_PRIVATE_NS::doInitializeLogger(const std::string &logDir, bool logToFile);
    friend void ESM_LOGGER_PRIVATE_NS::doSetLevel(spdlog::level::level_enum level);
};

}  // namespace ESM

// Macros capture the caller's source_location and format with fmt
#define LOG_TRACE(...) ESM::Logger::trace(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_DEBUG(...) ESM::Logger::debug(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_INFO(...) ESM::Logger::info(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_WARN(...) ESM::Logger::warn(fmt::format(__VA_ARGS__), std::source_location::current())
#define LOG_ERROR(...) ESM::Logger::error(fmt::format(__VA_ARGS__), std::source_location::current())
