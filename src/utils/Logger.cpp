#include "Logger.hpp"
#include "configdesk/Constants.hpp"
#include "core/ConfigManager.hpp"
#include "core/util/Env.hpp"
#include <iostream>
#include <iomanip>
#include <ctime>
#include <filesystem>
#include <chrono>
#include <sstream>
#include <algorithm>
#include <cctype>

namespace configdesk {

struct Logger::Impl {
    std::ofstream logFile;
    std::string currentFilename;  // Track current log filename
    std::string currentDate;      // Track current date for timestamped files
};

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::Logger()
    : pImpl(std::make_unique<Impl>())
    , currentLevel(LOG_INFO)
    , consoleOutput(true) {
    // Initialize with default settings
    initialize(true, 3, true);
}

Logger::~Logger() {
    if (pImpl->logFile.is_open()) {
        pImpl->logFile.close();
    }
}

void Logger::initialize(bool useTimestampedFiles, int logMaxPeriod, bool coloredOutput) {
    std::lock_guard<std::mutex> lock(mutex);
    this->useTimestampedFiles = useTimestampedFiles;
    this->logMaxPeriod = logMaxPeriod;
    this->coloredOutput = coloredOutput;

    // Set up the log file based on initialization preferences
    if (useTimestampedFiles) {
        openNewLogFile();  // Create new timestamped file
    } else {
        if (pImpl->logFile.is_open()) {
            pImpl->logFile.close();
        }
        pImpl->currentFilename = getLogDirectory() + "/" + APP_NAME + ".log";
        pImpl->logFile.open(pImpl->currentFilename, std::ios::app);
    }
}

void Logger::initializeWithConfig() {
    auto& config = Configs::Get();
    initialize(true,
               config.Get<int>(Configs::LOG_MAX_DAYS_KEY, Configs::DEFAULT_LOG_MAX_DAYS, 0, 365),
               config.Get<bool>(Configs::LOG_COLORED_KEY, true));
    setLogLevel(parseLevel(config.Get<std::string>(Configs::LOG_LEVEL_KEY, "info")));
}

Logger::Level Logger::parseLevel(const std::string& name, Level fallback) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") return LOG_DEBUG;
    if (lower == "info") return LOG_INFO;
    if (lower == "warning" || lower == "warn") return LOG_WARNING;
    if (lower == "error") return LOG_ERROR;
    if (lower == "fatal") return LOG_FATAL;
    return fallback;
}

void Logger::setLogLevel(Level level) {
    std::lock_guard<std::mutex> lock(mutex);
    currentLevel = level;
}

void Logger::debug(const std::string& message)   { log(LOG_DEBUG, message); }
void Logger::info(const std::string& message)    { log(LOG_INFO, message); }
void Logger::warning(const std::string& message) { log(LOG_WARNING, message); }
void Logger::error(const std::string& message)   { log(LOG_ERROR, message); }
void Logger::fatal(const std::string& message)   { log(LOG_FATAL, message); }

void Logger::log(Level level, const std::string& message) {
    if (level < currentLevel) return;

    std::lock_guard<std::mutex> lock(mutex);

    // Update the log file if we're using timestamped files and the date has changed
    if (useTimestampedFiles) {
        std::string currentDate = getFormattedTimestamp().substr(0, 10); // YYYY-MM-DD
        if (pImpl->currentDate != currentDate) {
            pImpl->currentDate = currentDate;
            openNewLogFile();
        }
    }

    std::string timestamp = getCurrentTimestamp();
    std::string levelStr = getLevelString(level);
    std::string logMessage = timestamp + " [" + levelStr + "] " + message + "\n";

    // Write to file
    if (pImpl->logFile.is_open()) {
        pImpl->logFile << logMessage;
        pImpl->logFile.flush();
    }

    // Write to console with optional coloring; errors go to stderr
    if (consoleOutput) {
        std::ostream& out = level >= LOG_ERROR ? std::cerr : std::cout;
        if (coloredOutput) {
            out << getColorCode(level) << logMessage << resetColorCode();
        } else {
            out << logMessage;
        }
        out.flush();
    }
}

std::string Logger::getLevelString(Level level) {
    switch (level) {
        case LOG_DEBUG: return "DEBUG";
        case LOG_INFO: return "INFO";
        case LOG_WARNING: return "WARNING";
        case LOG_ERROR: return "ERROR";
        case LOG_FATAL: return "FATAL";
        default: return "UNKNOWN";
    }
}

std::string Logger::getCurrentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::stringstream ss;
    ss << std::put_time(std::localtime(&time), "%Y-%m-%d %H:%M:%S")
       << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return ss.str();
}

std::string Logger::getFormattedTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);

    std::stringstream ss;
    ss << std::put_time(std::localtime(&time), "%Y-%m-%d_%H-%M-%S");
    return ss.str();
}

std::string Logger::getColorCode(Level level) const {
    if (coloredOutput) {
        auto it = colorCodes.find(level);
        if (it != colorCodes.end()) {
            return it->second;
        }
    }
    return "";
}

std::string Logger::resetColorCode() const {
    if (coloredOutput) {
        return "\033[0m";
    }
    return "";
}

std::string Logger::getLogDirectory() const {
    // $XDG_DATA_HOME/configdesk/logs, usually ~/.local/share/configdesk/logs
    std::string dataDir = Env::data();
    std::filesystem::path logDir = dataDir.empty()
        ? std::filesystem::path("./logs")
        : std::filesystem::path(dataDir) / APP_NAME / "logs";

    std::error_code ec;
    std::filesystem::create_directories(logDir, ec);
    return logDir.string();
}

void Logger::openNewLogFile() {
    if (!useTimestampedFiles) return;

    // configdesk-YYYY-MM-DD.log
    std::string currentDate = getFormattedTimestamp().substr(0, 10);
    std::filesystem::path path = std::filesystem::path(getLogDirectory()) /
        (std::string(APP_NAME) + "-" + currentDate + ".log");

    if (pImpl->logFile.is_open()) {
        pImpl->logFile.close();
    }
    pImpl->logFile.open(path, std::ios::app);
    pImpl->currentFilename = path.string();
    pImpl->currentDate = currentDate;

    cleanupOldLogs();
}

void Logger::cleanupOldLogs() {
    if (logMaxPeriod <= 0) return;

    const std::string prefix = std::string(APP_NAME) + "-";
    const auto cutoff = std::chrono::system_clock::now() - std::chrono::hours(24 * logMaxPeriod);

    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(getLogDirectory(), ec)) {
        const auto& path = entry.path();
        const std::string name = path.filename().string();
        if (path.extension() != ".log" || name.rfind(prefix, 0) != 0) continue;

        std::tm tm = {};
        std::istringstream date(name.substr(prefix.size(), 10));
        date >> std::get_time(&tm, "%Y-%m-%d");
        if (date.fail()) continue;

        std::time_t logTime = std::mktime(&tm);
        if (logTime == -1) continue;
        if (std::chrono::system_clock::from_time_t(logTime) < cutoff) {
            std::error_code removeError;
            std::filesystem::remove(path, removeError);
            if (removeError) {
                // Can't log through ourselves here, the mutex is held
                std::cerr << "Logger: failed to remove " << path << ": " << removeError.message() << "\n";
            }
        }
    }
}

} // namespace configdesk
