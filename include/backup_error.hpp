/**
 * @file backup_error.hpp
 * @brief Error taxonomy shared by every SnapVault component.
 *
 * Core operations report failures through std::expected<T, BackupError>. Only
 * configuration loading throws (ConfigError), since a bad configuration stops
 * the daemon before any job runs.
 */

#ifndef BACKUP_ERROR_HPP
#define BACKUP_ERROR_HPP

#include <stdexcept>
#include <string>

/**
 * @brief Category of a failed operation.
 */
enum class ErrorKind {
    SourceAccess,      ///< Source path missing or unreadable.
    Archive,           ///< Archive creation or verification failed.
    SizeLimitExceeded, ///< Plaintext or encrypted output above the ceiling.
    Encryption,        ///< Cryptographic or I/O fault while encrypting.
    Hook,              ///< Pre/post hook rejected or exited non-zero.
    Upload,            ///< Object store transfer failed.
    Retention,         ///< Retention listing or delete failed.
    Config             ///< Invalid configuration.
};

/**
 * @brief Error value carried by std::expected results.
 */
struct BackupError {
    ErrorKind kind;      ///< Failure category.
    std::string message; ///< Human readable description.

    BackupError(ErrorKind kind, std::string message);
};

/**
 * @brief Returns the taxonomy name of an error kind (e.g. "UploadError").
 */
const char* errorKindName(ErrorKind kind);

/**
 * @brief Formats an error as "<KindName>: <message>".
 */
std::string describeError(const BackupError& error);

/**
 * @brief Strips sensitive detail from an error message before it is stored.
 *
 * Outside diagnostic mode absolute paths are replaced by "<path>", credential
 * assignments are redacted and the message is truncated to 512 characters.
 *
 * @param message Raw error message.
 * @param diagnostic If true, the message is returned unchanged.
 * @return std::string The sanitized message.
 */
std::string sanitizeErrorMessage(const std::string& message, bool diagnostic = false);

/**
 * @brief Thrown by the configuration loader for any invalid setting.
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

#endif // BACKUP_ERROR_HPP
