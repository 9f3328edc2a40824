#include "deploy_log.hpp"
#include <chrono>
#include <ctime>
#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>

namespace fs = std::filesystem;

std::string formatLocalTime(const char* pattern) {
    auto now = std::chrono::system_clock::now();
    auto timeT = std::chrono::system_clock::to_time_t(now);
    char timeBuf[64];
    std::strftime(timeBuf, sizeof(timeBuf), pattern, std::localtime(&timeT));
    return timeBuf;
}

DeployLog::DeployLog(std::string logFile, std::string errorLogFile, bool echo)
    : logFile_(std::move(logFile)), errorLogFile_(std::move(errorLogFile)), echo_(echo) {}

void DeployLog::append(const std::string& path, const std::string& entry) const {
    if (path.empty()) {
        return;
    }
    std::error_code ec;
    fs::path parent = fs::path(path).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
    }
    std::ofstream log(path, std::ios::app);
    if (log.is_open()) {
        log << entry << '\n';
        log.flush();
    } else {
        std::cerr << "Error: Cannot write to log file: " << path << std::endl;
    }
}

void DeployLog::logMessage(const std::string& message) const {
    std::string logEntry = std::format("[{}] {}", formatLocalTime("%Y-%m-%d %H:%M:%S"), message);
    if (echo_) {
        std::cout << logEntry << std::endl;
    }
    append(logFile_, logEntry);
}

void DeployLog::logWarning(const std::string& message) const {
    std::string logEntry = std::format("[{}] WARN: {}", formatLocalTime("%Y-%m-%d %H:%M:%S"), message);
    if (echo_) {
        std::cout << logEntry << std::endl;
    }
    append(logFile_, logEntry);
}

void DeployLog::logError(const std::string& message) const {
    std::string logEntry = std::format("[{}] ERROR: {}", formatLocalTime("%Y-%m-%d %H:%M:%S"), message);
    if (echo_) {
        std::cerr << logEntry << std::endl;
    }
    append(logFile_, logEntry);
    append(errorLogFile_, logEntry);
}
