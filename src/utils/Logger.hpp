#pragma once
#include <string>
#include <mutex>
#include <memory>
#include <fstream>
#include <filesystem>
#include <chrono>
#include <unordered_map>
#include <sstream>
#include <version>

// Use std::format if C++20, otherwise fallback to fmt library
#ifdef __cpp_lib_format
    #include <format>
    namespace formatting = std;
#else
    #include <fmt/format.h>
    namespace formatting = fmt;
#endif

namespace configdesk {

class Logger {
public:
    enum Level { LOG_DEBUG, LOG_INFO, LOG_WARNING, LOG_ERROR, LOG_FATAL };

    static Logger& getInstance();

    // Initialize logger with daily file naming and configurations
    void initialize(bool useTimestampedFiles = true,
                   int logMaxPeriod = 3,  // 3 days default
                   bool coloredOutput = true); // Enable colored output by default

    // Reads Logging.* keys through Configs::Get().
    // Defined in the .cpp file to avoid a circular include with ConfigManager.hpp.
    void initializeWithConfig();

    void setLogLevel(Level level);

    // "debug", "info", "warning"/"warn", "error", "fatal"; anything else maps to fallback
    static Level parseLevel(const std::string& name, Level fallback = LOG_INFO);

    void debug(const std::string& message);
    void info(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);
    void fatal(const std::string& message);

    /**
     * Logging with {}-style formatting
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
    Logger(); // make constructor private
    ~Logger(); // and destructor
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    template<typename... Args>
    void logFormatted(Level level, const char* caller, const std::string& format, Args&&... args) {
        if constexpr (sizeof...(args) == 0) {
            log(level, format);
        } else {
            if (level < currentLevel) return;
            try {
#ifdef __cpp_lib_format
                log(level, std::vformat(format, std::make_format_args(args...)));
#else
                log(level, fmt::format(fmt::runtime(format), std::forward<Args>(args)...));
#endif
            } catch (const std::exception& e) {
                log(LOG_ERROR, "Logger format error in " + std::string(caller) + "(): " +
                              std::string(e.what()) + " | Original format: " + format);
                log(level, format); // Fallback to unformatted message
            }
        }
    }

    void log(Level level, const std::string& message);
    std::string getLevelString(Level level);
    std::string getCurrentTimestamp();
    std::string getFormattedTimestamp(); // For use in filename
    std::string getColorCode(Level level) const;
    std::string resetColorCode() const;
    std::string getLogDirectory() const;
    void cleanupOldLogs();
    void openNewLogFile();

    struct Impl;
    std::unique_ptr<Impl> pImpl;
    std::mutex mutex;
    Level currentLevel;
    bool consoleOutput;
    bool useTimestampedFiles = true;
    int logMaxPeriod = 3; // Maximum days to keep logs
    bool coloredOutput = true;

    // Color codes
    std::unordered_map<Level, std::string> colorCodes = {
        {LOG_DEBUG, "\033[36m"},    // Cyan
        {LOG_INFO, "\033[32m"},     // Green
        {LOG_WARNING, "\033[33m"},  // Yellow
        {LOG_ERROR, "\033[31m"},    // Red
        {LOG_FATAL, "\033[35m"}     // Magenta
    };
};

#define CONFIGDESK_LOG_DEBUG(...) configdesk::Logger::getInstance().debug(__VA_ARGS__)
#define CONFIGDESK_LOG_INFO(...)  configdesk::Logger::getInstance().info(__VA_ARGS__)
#define CONFIGDESK_LOG_WARN(...)  configdesk::Logger::getInstance().warning(__VA_ARGS__)
#define CONFIGDESK_LOG_ERROR(...) configdesk::Logger::getInstance().error(__VA_ARGS__)
#define CONFIGDESK_LOG_FATAL(...) configdesk::Logger::getInstance().fatal(__VA_ARGS__)

inline void debug(const std::string& message) {
    Logger::getInstance().debug(message);
}
inline void info(const std::string& message) {
    Logger::getInstance().info(message);
}
inline void warning(const std::string& message) {
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
inline void error(const std::string& format, Args&&... args) {
    Logger::getInstance().error(format, std::forward<Args>(args)...);
}
template<typename... Args>
inline void fatal(const std::string& format, Args&&... args) {
    Logger::getInstance().fatal(format, std::forward<Args>(args)...);
}
} // namespace configdesk
