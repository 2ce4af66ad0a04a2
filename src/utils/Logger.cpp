#include "Logger.hpp"
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <vector>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace kclick {

namespace {

spdlog::level::level_enum toSpdlogLevel(Logger::Level level) {
    switch (level) {
        case Logger::LOG_DEBUG: return spdlog::level::debug;
        case Logger::LOG_INFO: return spdlog::level::info;
        case Logger::LOG_WARNING: return spdlog::level::warn;
        case Logger::LOG_ERROR: return spdlog::level::err;
        case Logger::LOG_FATAL: return spdlog::level::critical;
    }
    return spdlog::level::info;
}

} // namespace

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::Logger() {
    // Console only until initialize() adds the file sink
    auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    logger = std::make_shared<spdlog::logger>("kclick", console);
    logger->set_pattern("%Y-%m-%d %H:%M:%S.%e [%^%l%$] %v");
    logger->set_level(spdlog::level::trace);
}

Logger::~Logger() {
    if (logger) {
        logger->flush();
    }
}

void Logger::initialize(bool useFileOutput, int logMaxPeriod, bool coloredOutput) {
    std::lock_guard<std::mutex> lock(mutex);

    std::vector<spdlog::sink_ptr> sinks;
    if (coloredOutput) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    } else {
        auto plain = std::make_shared<spdlog::sinks::stdout_color_sink_mt>(spdlog::color_mode::never);
        sinks.push_back(plain);
    }

    fileOutput = false;
    if (useFileOutput) {
        const std::string logDir = getLogDirectory();
        try {
            const auto maxFiles = static_cast<uint16_t>(logMaxPeriod > 0 ? logMaxPeriod : 0);
            sinks.push_back(std::make_shared<spdlog::sinks::daily_file_sink_mt>(
                logDir + "/kclick.log", 0, 0, false, maxFiles));
            fileOutput = true;
        } catch (const spdlog::spdlog_ex& e) {
            // Console keeps working without the file sink
            logger->warn("Could not open log file in {}: {}", logDir, e.what());
        }
    }

    auto replacement = std::make_shared<spdlog::logger>("kclick", sinks.begin(), sinks.end());
    replacement->set_pattern("%Y-%m-%d %H:%M:%S.%e [%^%l%$] [%t] %v");
    replacement->set_level(spdlog::level::trace);
    replacement->flush_on(spdlog::level::warn);
    logger = std::move(replacement);
}

void Logger::setLogLevel(Level level) {
    currentLevel = level;
}

Logger::Level Logger::getLogLevel() const {
    return currentLevel;
}

std::string Logger::getLogDirectory() const {
    std::filesystem::path logDir;
    if (const char* state = std::getenv("XDG_STATE_HOME"); state && *state) {
        logDir = std::filesystem::path(state) / "kclick/logs";
    } else if (const char* home = std::getenv("HOME"); home && *home) {
        logDir = std::filesystem::path(home) / ".local/state/kclick/logs";
    } else {
        logDir = "./logs";
    }

    std::error_code ec;
    std::filesystem::create_directories(logDir, ec);
    return logDir.string();
}

void Logger::log(Level level, const std::string& message) {
    if (level < currentLevel) return;

    std::shared_ptr<spdlog::logger> target;
    {
        std::lock_guard<std::mutex> lock(mutex);
        target = logger;
    }
    target->log(toSpdlogLevel(level), message);
}

} // namespace kclick
