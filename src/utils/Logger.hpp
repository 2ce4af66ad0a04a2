#pragma once
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <fmt/format.h>

namespace spdlog {
class logger;
}

namespace kclick {

class Logger {
public:
    enum Level { LOG_DEBUG, LOG_INFO, LOG_WARNING, LOG_ERROR, LOG_FATAL };

    static Logger& getInstance();

    // Adds the daily file sink next to the console sink.
    // logMaxPeriod is the number of daily files kept on disk.
    void initialize(bool useFileOutput = true,
                    int logMaxPeriod = 3,
                    bool coloredOutput = true);

    void setLogLevel(Level level);
    [[nodiscard]] Level getLogLevel() const;
    [[nodiscard]] std::string getLogDirectory() const;

    void debug(const std::string& message)   { log(LOG_DEBUG, message); }
    void info(const std::string& message)    { log(LOG_INFO, message); }
    void warning(const std::string& message) { log(LOG_WARNING, message); }
    void error(const std::string& message)   { log(LOG_ERROR, message); }
    void fatal(const std::string& message)   { log(LOG_FATAL, message); }

    /**
     * fmt-style formatting, checked at runtime
     * Usage: Logger::getInstance().debug("Value: {}, Name: {}", 42, "test");
     */
    template<typename... Args>
    void debug(const std::string& format, Args&&... args) {
        logFormatted(LOG_DEBUG, "debug", format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(const std::string& format, Args&&... args) {
        logFormatted(LOG_INFO, "info", format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warning(const std::string& format, Args&&... args) {
        logFormatted(LOG_WARNING, "warning", format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(const std::string& format, Args&&... args) {
        logFormatted(LOG_ERROR, "error", format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void fatal(const std::string& format, Args&&... args) {
        logFormatted(LOG_FATAL, "fatal", format, std::forward<Args>(args)...);
    }

private:
    Logger();
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    template<typename... Args>
    void logFormatted(Level level, const char* caller, const std::string& format, Args&&... args) {
        if (level < currentLevel) return;
        try {
            log(level, fmt::format(fmt::runtime(format), std::forward<Args>(args)...));
        } catch (const fmt::format_error& e) {
            log(LOG_ERROR, fmt::format("Logger format error in {}(): {} | Original format: {}",
                                       caller, e.what(), format));
            log(level, format);
        }
    }

    void log(Level level, const std::string& message);

    std::shared_ptr<spdlog::logger> logger;
    mutable std::mutex mutex;
    std::atomic<Level> currentLevel{LOG_INFO};
    bool fileOutput = false;
};

inline void debug(const std::string& message) {
    Logger::getInstance().debug(message);
}
inline void info(const std::string& message) {
    Logger::getInstance().info(message);
}
inline void warning(const std::string& message) {
    Logger::getInstance().warning(message);
}
inline void warn(const std::string& message) {
    Logger::getInstance().warning(message);
}
inline void error(const std::string& message) {
    Logger::getInstance().error(message);
}
inline void fatal(const std::string& message) {
    Logger::getInstance().fatal(message);
}
template<typename... Args>
inline void debug(const std::string& format, Args&&... args) {
    Logger::getInstance().debug(format, std::forward<Args>(args)...);
}
template<typename... Args>
inline void info(const std::string& format, Args&&... args) {
    Logger::getInstance().info(format, std::forward<Args>(args)...);
}
template<typename... Args>
inline void warning(const std::string& format, Args&&... args) {
    Logger::getInstance().warning(format, std::forward<Args>(args)...);
}
template<typename... Args>
inline void warn(const std::string& format, Args&&... args) {
    Logger::getInstance().warning(format, std::forward<Args>(args)...);
}
template<typename... Args>
inline void error(const std::string& format, Args&&... args) {
    Logger::getInstance().error(format, std::forward<Args>(args)...);
}
template<typename... Args>
inline void fatal(const std::string& format, Args&&... args) {
    Logger::getInstance().fatal(format, std::forward<Args>(args)...);
}

} // namespace kclick
