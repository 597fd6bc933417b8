/**
 * @file backup_types.hpp
 * @brief Data model shared by the archive builder, uploader, retention engine and scheduler.
 */

#ifndef BACKUP_TYPES_HPP
#define BACKUP_TYPES_HPP

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

/**
 * @brief Kind of backup target.
 */
enum class SourceKind {
    Volume,   ///< Container-managed volume directory.
    Directory ///< Plain directory.
};

/**
 * @brief Encryption scheme applied to every archive.
 */
enum class EncryptionMethod {
    Gpg,
    Aes256
};

const char* sourceKindName(SourceKind kind);
std::optional<SourceKind> parseSourceKind(const std::string& name);
const char* encryptionMethodName(EncryptionMethod method);
std::optional<EncryptionMethod> parseEncryptionMethod(const std::string& name);

/**
 * @brief Layered keep-policy. An absent tier deletes nothing.
 */
struct RetentionPolicy {
    std::optional<int> keepLast; ///< Keep the N most recent backups.
    std::optional<int> daily;    ///< One backup per day older than N days.
    std::optional<int> weekly;   ///< One backup per week older than N weeks.
    std::optional<int> monthly;  ///< One backup per month older than N*30 days.
};

/**
 * @brief Optional shell-free commands run around a backup.
 */
struct HookConfig {
    std::optional<std::string> preBackup;
    std::optional<std::string> postBackup;
};

/**
 * @brief A named backup target, immutable once loaded.
 */
struct Source {
    std::string name;          ///< Unique identifier ([A-Za-z0-9_-]+).
    SourceKind kind;           ///< Volume or directory.
    std::string path;          ///< Filesystem path to archive.
    std::string schedule;      ///< Cron expression.
    RetentionPolicy retention; ///< Keep-policy applied after each upload.
    HookConfig hooks;          ///< Pre/post hook commands.
};

/**
 * @brief Description of one produced encrypted archive.
 */
struct BackupMetadata {
    std::string sourceName;       ///< Source identifier.
    std::string timestamp;        ///< ISO-8601 UTC, e.g. "2026-10-19T03:00:00Z".
    std::string filename;         ///< Encrypted file name.
    std::uint64_t size = 0;       ///< Bytes of the encrypted file.
    std::uint64_t archiveSize = 0; ///< Bytes of the plaintext archive.
    std::string checksum;         ///< SHA-256 hex digest of the encrypted bytes.
    double durationSeconds = 0.0; ///< Build duration.
    EncryptionMethod encryptionMethod = EncryptionMethod::Gpg;
    SourceKind sourceKind = SourceKind::Directory;
};

/**
 * @brief A stored backup as listed by the object store.
 */
struct RemoteObject {
    std::string key;
    std::uint64_t size = 0;
    std::chrono::system_clock::time_point lastModified;
    std::map<std::string, std::string> tags; ///< Object metadata (x-amz-meta-*).
};

/**
 * @brief Terminal or in-flight status of a job.
 */
enum class JobStatus {
    Running,
    Success,
    Failed
};

const char* jobStatusName(JobStatus status);

/**
 * @brief Immutable outcome of one backup attempt.
 */
struct JobRecord {
    std::string jobId;
    std::string sourceName;
    std::chrono::system_clock::time_point startedAt;
    std::chrono::system_clock::time_point completedAt;
    JobStatus status = JobStatus::Failed;
    std::optional<BackupMetadata> metadata; ///< Set on success.
    std::string objectKey;                  ///< Set on success.
    std::size_t retentionDeleted = 0;       ///< Set on success.
    std::string error;                      ///< Sanitized message, set on failure.
};

/**
 * @brief Transient marker of a job in flight for one source.
 */
struct RunningJobState {
    std::string jobId;
    std::string sourceName;
    std::chrono::system_clock::time_point startedAt;
    JobStatus status = JobStatus::Running;
    std::optional<std::chrono::system_clock::time_point> completedAt;
    std::optional<BackupMetadata> metadata;
    std::string error;
};

#endif // BACKUP_TYPES_HPP
