/**
 * @file uploader.hpp
 * @brief Transfers encrypted archives to the object store and lists stored backups.
 */

#ifndef UPLOADER_HPP
#define UPLOADER_HPP

#include "backup_error.hpp"
#include "backup_types.hpp"
#include "object_store.hpp"
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <vector>

/**
 * @brief Transfer tuning. Both sizes default to 100 MiB.
 */
struct UploadOptions {
    std::uint64_t multipartThreshold = 100ULL * 1024 * 1024; ///< Larger files use multi-part transfer.
    std::uint64_t partSize = 100ULL * 1024 * 1024;           ///< Size of every part except the last.
};

/**
 * @brief Outcome of one upload.
 */
struct UploadResult {
    std::string key;    ///< Target object key.
    bool success = false;
    std::string error;  ///< Set when success is false.
};

class Uploader {
public:
    /**
     * @brief Constructs an uploader.
     *
     * @param client Object store client; must outlive the uploader.
     * @param options Transfer tuning.
     */
    explicit Uploader(ObjectStoreClient& client, UploadOptions options = {});

    /**
     * @brief Uploads an encrypted archive.
     *
     * Files at or below the threshold are sent with a single put; larger ones
     * with a multi-part transfer that is aborted on any failure.
     *
     * @param file Encrypted archive.
     * @param metadata Description stored as object metadata.
     * @return UploadResult The key and the outcome.
     */
    UploadResult upload(const std::filesystem::path& file, const BackupMetadata& metadata);

    /**
     * @brief Lists the stored backups of a source, newest first.
     *
     * Tags are filled from each object's metadata on a best-effort basis.
     */
    std::expected<std::vector<RemoteObject>, BackupError> listBackups(const std::string& sourceName);

    std::expected<void, BackupError> deleteBackup(const std::string& key);

    /**
     * @brief "backups/<source>/<YYYYMMDD_HHMMSS>_<filename>" with both parts re-sanitized.
     */
    static std::string objectKey(const BackupMetadata& metadata);

    /**
     * @brief "backups/<source>/", the listing prefix of a source.
     */
    static std::string sourcePrefix(const std::string& sourceName);

    /**
     * @brief Replaces every character outside [A-Za-z0-9_-] (and '.' when allowed) with '_'.
     */
    static std::string sanitizeKeyComponent(const std::string& text, bool allowDot);

    /**
     * @brief Object metadata recorded for an archive.
     */
    static ObjectMetadata objectMetadata(const BackupMetadata& metadata);

private:
    std::expected<void, BackupError> multipartUpload(const std::filesystem::path& file, const std::string& key,
                                                     const ObjectMetadata& metadata);
    void abortQuietly(const std::string& key, const std::string& uploadId);

    ObjectStoreClient& client;
    UploadOptions options;
};

#endif // UPLOADER_HPP
