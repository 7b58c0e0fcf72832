#include "common/Logger.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <vector>

namespace ESM {

std::shared_ptr<spdlog::logger> Logger::logger_;

namespace ESM_LOGGER_PRIVATE_NS {

namespace {

constexpr const char *LOGGER_NAME = "ESM";
constexpr const char *CONSOLE_PATTERN = "[%H:%M:%S.%e] [%^%l%$] %v";
constexpr const char *FILE_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v";

// Generator output goes to stdout, so diagnostics use stderr
std::shared_ptr<spdlog::logger> createConsoleLogger() {
    auto existing = spdlog::get(LOGGER_NAME);
    if (existing) {
        return existing;
    }
    auto logger = spdlog::stderr_color_mt(LOGGER_NAME);
    logger->set_pattern(CONSOLE_PATTERN);
    return logger;
}

spdlog::level::level_enum levelFromEnvironment() {
    const char *envLevel = std::getenv("SPDLOG_LEVEL");
    if (!envLevel) {
        return spdlog::level::info;
    }

    std::string levelStr(envLevel);
    std::transform(levelStr.begin(), levelStr.end(), levelStr.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (levelStr == "warning") {
        return spdlog::level::warn;
    }
    if (levelStr == "error") {
        return spdlog::level::err;
    }
    // spdlog understands trace/debug/info/warn/err/critical/off and maps anything else to off
    auto level = spdlog::level::from_str(levelStr);
    if (level == spdlog::level::off && levelStr != "off") {
        return spdlog::level::info;
    }
    return level;
}

}  // namespace

void ensureLoggerInitialized() {
    if (!Logger::logger_) {
        Logger::logger_ = createConsoleLogger();
        Logger::logger_->set_level(levelFromEnvironment());
    }
}

std::string extractCleanFunctionName(const std::source_location &loc) {
    std::string fullName = loc.function_name();

    size_t parenPos = fullName.find('(');
    if (parenPos == std::string::npos) {
        return "UnknownFunction";
    }

    size_t nameEnd = parenPos;
    while (nameEnd > 0 && std::isspace(static_cast<unsigned char>(fullName[nameEnd - 1]))) {
        nameEnd--;
    }

    // The qualified name starts after the last space outside template arguments (the return type separator)
    size_t nameStart = 0;
    int angleDepth = 0;
    for (size_t i = 0; i < nameEnd; i++) {
        char c = fullName[i];
        if (c == '<') {
            angleDepth++;
        } else if (c == '>') {
            angleDepth--;
        } else if (c == ' ' && angleDepth == 0) {
            nameStart = i + 1;
        }
    }

    std::string qualifiedName = fullName.substr(nameStart, nameEnd - nameStart);
    while (!qualifiedName.empty() && (qualifiedName.front() == '*' || qualifiedName.front() == '&')) {
        qualifiedName.erase(0, 1);
    }

    std::string result;
    angleDepth = 0;
    for (char c : qualifiedName) {
        if (c == '<') {
            angleDepth++;
        } else if (c == '>') {
            angleDepth--;
        } else if (angleDepth == 0) {
            result += c;
        }
    }

    return result.empty() ? "UnknownFunction" : result;
}

void doFormatAndLog(spdlog::level::level_enum level, const std::string &message, const std::source_location &loc) {
    ensureLoggerInitialized();
    if (Logger::logger_ && Logger::logger_->should_log(level)) {
        Logger::logger_->log(level, extractCleanFunctionName(loc) + "() - " + message);
    }
}

void doInitializeLogger(const std::string &logDir, bool logToFile) {
    if (Logger::logger_) {
        return;
    }

    if (!logToFile || logDir.empty()) {
        Logger::logger_ = createConsoleLogger();
    } else {
        std::vector<spdlog::sink_ptr> sinks;

        auto consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        consoleSink->set_pattern(CONSOLE_PATTERN);
        sinks.push_back(consoleSink);

        std::filesystem::create_directories(logDir);
        std::filesystem::path logPath = std::filesystem::path(logDir) / "esm.log";
        auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logPath.string(), true);
        fileSink->set_pattern(FILE_PATTERN);
        sinks.push_back(fileSink);

        Logger::logger_ = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
        spdlog::register_logger(Logger::logger_);
    }

    Logger::logger_->set_level(levelFromEnvironment());
}

void doSetLevel(spdlog::level::level_enum level) {
    ensureLoggerInitialized();
    Logger::logger_->set_level(level);
}

}  // namespace ESM_LOGGER_PRIVATE_NS

}  // namespace ESM
