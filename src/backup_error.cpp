#include "backup_error.hpp"
#include <format>
#include <regex>
#include <utility>

namespace {

constexpr std::size_t kMaxErrorLength = 512;

}

BackupError::BackupError(ErrorKind kind, std::string message)
    : kind(kind), message(std::move(message)) {}

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::SourceAccess: return "SourceAccessError";
        case ErrorKind::Archive: return "ArchiveError";
        case ErrorKind::SizeLimitExceeded: return "SizeLimitExceeded";
        case ErrorKind::Encryption: return "EncryptionError";
        case ErrorKind::Hook: return "HookError";
        case ErrorKind::Upload: return "UploadError";
        case ErrorKind::Retention: return "RetentionError";
        case ErrorKind::Config: return "ConfigError";
    }
    return "Error";
}

std::string describeError(const BackupError& error) {
    return std::format("{}: {}", errorKindName(error.kind), error.message);
}

std::string sanitizeErrorMessage(const std::string& message, bool diagnostic) {
    if (diagnostic) {
        return message;
    }

    static const std::regex credentialPattern(
        R"(((password|passphrase|secret|token|key)\s*=\s*)[^\s,;]+)",
        std::regex::icase);
    static const std::regex pathPattern(R"((^|[\s'"(=:])(/[^\s'"),;]+))");

    std::string result = std::regex_replace(message, credentialPattern, "$1<redacted>");
    result = std::regex_replace(result, pathPattern, "$1<path>");

    if (result.size() > kMaxErrorLength) {
        result.resize(kMaxErrorLength - 3);
        result += "...";
    }
    return result;
}
