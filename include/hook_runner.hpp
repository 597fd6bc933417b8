/**
 * @file hook_runner.hpp
 * @brief Validation and execution of pre/post backup hook commands.
 *
 * A hook is a single command line. It is checked against an allow-pattern and
 * a denylist of dangerous fragments, split into words honouring single and
 * double quotes, and started as an argument vector without a shell.
 */

#ifndef HOOK_RUNNER_HPP
#define HOOK_RUNNER_HPP

#include "backup_error.hpp"
#include <expected>
#include <string>
#include <vector>

/**
 * @brief Checks a hook command against the allow-pattern and the denylist.
 *
 * @param command Hook command line.
 * @return std::expected<void, BackupError> Success or a HookError.
 */
std::expected<void, BackupError> validateHookCommand(const std::string& command);

/**
 * @brief Splits a command line into words.
 *
 * Whitespace separates words; single quotes preserve everything literally,
 * double quotes group words. Adjacent quoted and unquoted parts join into one
 * word.
 *
 * @param command Command line.
 * @return std::expected<std::vector<std::string>, BackupError> The words, or a
 *         HookError for an unterminated quote or an empty command.
 */
std::expected<std::vector<std::string>, BackupError> splitCommandLine(const std::string& command);

/**
 * @brief Validates, resolves and runs a hook, waiting for it to finish.
 *
 * @param command Hook command line. Blank commands are a no-op.
 * @return std::expected<void, BackupError> Success, or a HookError when the
 *         command is rejected, its executable is missing or it exits non-zero.
 */
std::expected<void, BackupError> runHook(const std::string& command);

#endif // HOOK_RUNNER_HPP
