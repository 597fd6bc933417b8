/**
 * @file process_runner.hpp
 * @brief Runs external programs from an argument vector, never through a shell.
 *
 * Used for backup hooks. Arguments are passed to
 * execv unchanged, so shell metacharacters inside them have no effect.
 */

#ifndef PROCESS_RUNNER_HPP
#define PROCESS_RUNNER_HPP

#include <expected>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Result of a finished child process.
 */
struct ProcessResult {
    int exitCode = -1;   ///< Exit status, or 128 + signal number when killed.
    std::string output;  ///< Combined stdout/stderr when captured.
};

/**
 * @brief Resolves an executable name the way execvp would.
 *
 * Names containing a '/' are checked directly; other names are searched on
 * PATH.
 *
 * @param name Executable name or path.
 * @return std::optional<std::string> Absolute or relative path to an executable file.
 */
std::optional<std::string> resolveExecutable(const std::string& name);

/**
 * @brief Starts a program and waits for it.
 *
 * @param argv Program path followed by its arguments; argv[0] must already
 *             be resolved (see resolveExecutable()).
 * @param captureOutput If true, stdout and stderr are collected into
 *                      ProcessResult::output; otherwise they are inherited.
 * @return std::expected<ProcessResult, std::string> The exit status, or an
 *         error message if the process could not be started.
 */
std::expected<ProcessResult, std::string> runProcess(const std::vector<std::string>& argv,
                                                     bool captureOutput = false);

#endif // PROCESS_RUNNER_HPP
