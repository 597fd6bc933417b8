#include "hook_runner.hpp"
#include "logger.hpp"
#include "process_runner.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <format>
#include <regex>

namespace {

const std::array<const char*, 10> kDangerousFragments = {
    "rm -rf", "mkfs", "dd if=", "> /dev/", "$(", "`", ";", "&&", "||", "|"
};

bool isBlank(const std::string& text) {
    return std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c); });
}

}

std::expected<void, BackupError> validateHookCommand(const std::string& command) {
    static const std::regex allowed(R"(^[a-zA-Z0-9_/\s.\-:"'=]+$)");
    if (!std::regex_match(command, allowed)) {
        return std::unexpected(BackupError(ErrorKind::Hook, "Invalid hook command format: contains unsafe characters"));
    }
    for (const char* fragment : kDangerousFragments) {
        if (command.find(fragment) != std::string::npos) {
            return std::unexpected(BackupError(ErrorKind::Hook, "Hook command contains potentially dangerous operations"));
        }
    }
    return {};
}

std::expected<std::vector<std::string>, BackupError> splitCommandLine(const std::string& command) {
    std::vector<std::string> words;
    std::string current;
    bool inWord = false;
    char quote = '\0';

    for (char c : command) {
        if (quote != '\0') {
            if (c == quote) {
                quote = '\0';
            } else {
                current += c;
            }
            continue;
        }
        if (c == '\'' || c == '"') {
            quote = c;
            inWord = true;
        } else if (std::isspace(static_cast<unsigned char>(c))) {
            if (inWord) {
                words.push_back(current);
                current.clear();
                inWord = false;
            }
        } else {
            current += c;
            inWord = true;
        }
    }

    if (quote != '\0') {
        return std::unexpected(BackupError(ErrorKind::Hook, "Unmatched quote in hook command"));
    }
    if (inWord) {
        words.push_back(current);
    }
    if (words.empty()) {
        return std::unexpected(BackupError(ErrorKind::Hook, "Empty hook command"));
    }
    return words;
}

std::expected<void, BackupError> runHook(const std::string& command) {
    if (isBlank(command)) {
        return {};
    }

    auto valid = validateHookCommand(command);
    if (!valid) {
        return valid;
    }

    auto words = splitCommandLine(command);
    if (!words) {
        return std::unexpected(words.error());
    }

    auto executable = resolveExecutable(words->front());
    if (!executable) {
        return std::unexpected(BackupError(ErrorKind::Hook, std::format("Hook executable not found: {}", words->front())));
    }

    std::vector<std::string> argv = *words;
    argv.front() = *executable;

    Logger::logMessage(std::format("Running hook: {}", words->front()));
    auto result = runProcess(argv);
    if (!result) {
        return std::unexpected(BackupError(ErrorKind::Hook, std::format("Failed to start hook: {}", result.error())));
    }
    if (result->exitCode != 0) {
        return std::unexpected(BackupError(ErrorKind::Hook,
            std::format("Hook command failed with exit code {}: {}", result->exitCode, words->front())));
    }
    return {};
}
