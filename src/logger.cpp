#include "logger.hpp"
#include "time_utils.hpp"
#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>
#include <mutex>

namespace fs = std::filesystem;

namespace {

struct LoggerState {
    std::mutex mutex;
    std::string logFile;
    std::string errorLogFile;
    bool debug = false;
};

LoggerState& state() {
    static LoggerState instance;
    return instance;
}

void appendLine(const std::string& path, const std::string& line) {
    if (path.empty()) {
        return;
    }
    std::ofstream log(path, std::ios::app);
    if (log.is_open()) {
        log << line << '\n';
        log.flush();
    } else {
        std::cerr << "Error: Cannot write to log file: " << path << std::endl;
    }
}

void ensureParentDirectory(const std::string& path) {
    if (path.empty()) {
        return;
    }
    std::error_code ec;
    fs::path parent = fs::path(path).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
    }
}

std::string stamp(const std::string& message) {
    return std::format("[{}] {}", formatLocalTime(Clock::now()), message);
}

}

void Logger::configure(const std::string& logFile, const std::string& errorLogFile, bool debug) {
    ensureParentDirectory(logFile);
    ensureParentDirectory(errorLogFile);

    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.logFile = logFile;
    s.errorLogFile = errorLogFile;
    s.debug = debug;
}

void Logger::logMessage(const std::string& message) {
    auto& s = state();
    std::string entry = stamp(message);
    std::lock_guard<std::mutex> lock(s.mutex);
    std::cout << entry << std::endl;
    appendLine(s.logFile, entry);
}

void Logger::logWarning(const std::string& message) {
    auto& s = state();
    std::string entry = stamp(std::format("WARNING: {}", message));
    std::lock_guard<std::mutex> lock(s.mutex);
    std::cerr << entry << std::endl;
    appendLine(s.logFile, entry);
}

void Logger::logError(const std::string& message) {
    auto& s = state();
    std::string entry = stamp(std::format("ERROR: {}", message));
    std::lock_guard<std::mutex> lock(s.mutex);
    std::cerr << entry << std::endl;
    appendLine(s.logFile, entry);
    appendLine(s.errorLogFile, entry);
}

void Logger::logDebug(const std::string& message) {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (!s.debug) {
        return;
    }
    std::string entry = stamp(std::format("Debug: {}", message));
    std::cout << entry << std::endl;
    appendLine(s.logFile, entry);
}

bool Logger::debugEnabled() {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.debug;
}
