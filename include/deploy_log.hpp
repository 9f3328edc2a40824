/**
 * @file deploy_log.hpp
 * @brief Timestamped run log for PresetDeploy.
 *
 * Every line is appended to the main log file and echoed to the console; errors are
 * additionally appended to a separate error log and echoed to stderr.
 */

#ifndef DEPLOY_LOG_HPP
#define DEPLOY_LOG_HPP

#include <string>

/**
 * @brief File and console logger.
 */
class DeployLog {
public:
    /**
     * @brief Constructs a logger.
     *
     * @param logFile Path of the main log file. Empty disables file output.
     * @param errorLogFile Path of the error log file. Empty disables it.
     * @param echo Also print lines to stdout/stderr.
     * @note The parent directories are created on first write.
     */
    DeployLog(std::string logFile, std::string errorLogFile, bool echo = true);

    /**
     * @brief Logs an informational message.
     */
    void logMessage(const std::string& message) const;

    /**
     * @brief Logs a warning.
     */
    void logWarning(const std::string& message) const;

    /**
     * @brief Logs an error to both log files.
     */
    void logError(const std::string& message) const;

    const std::string& logFile() const { return logFile_; }
    const std::string& errorLogFile() const { return errorLogFile_; }

private:
    void append(const std::string& path, const std::string& entry) const;

    std::string logFile_;
    std::string errorLogFile_;
    bool echo_;
};

/**
 * @brief Current local time formatted with strftime.
 *
 * @param pattern strftime pattern, e.g. "%Y%m%d_%H%M%S".
 */
std::string formatLocalTime(const char* pattern);

#endif // DEPLOY_LOG_HPP
