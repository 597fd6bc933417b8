/**
 * @file logger.hpp
 * @brief Process-wide logging for the SnapVault daemon.
 *
 * Messages go to the console and are appended to the configured log files.
 * Errors additionally land in a dedicated error log. Debug output is only
 * written in diagnostic mode.
 *
 * @note All functions are safe to call from concurrent job threads.
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <string>

/**
 * @brief Static logging facade.
 */
class Logger {
public:
    /**
     * @brief Sets the log destinations.
     *
     * Creates the parent directories of both files. Until configured, messages
     * are only written to the console.
     *
     * @param logFile Path of the general log file (empty to disable).
     * @param errorLogFile Path of the error log file (empty to disable).
     * @param debug Enables debug output.
     */
    static void configure(const std::string& logFile, const std::string& errorLogFile, bool debug);

    /**
     * @brief Logs an informational message to stdout and the log file.
     */
    static void logMessage(const std::string& message);

    /**
     * @brief Logs a warning to stderr and the log file.
     */
    static void logWarning(const std::string& message);

    /**
     * @brief Logs an error to stderr, the log file and the error log file.
     */
    static void logError(const std::string& message);

    /**
     * @brief Logs a message only when diagnostic mode is on.
     */
    static void logDebug(const std::string& message);

    /**
     * @brief Returns true when diagnostic mode is enabled.
     */
    static bool debugEnabled();
};

#endif // LOGGER_HPP
