/**
 * @file object_store.hpp
 * @brief Store-facing interface used by the uploader and the retention engine.
 *
 * Mirrors the subset of the S3 API SnapVault needs. Production code uses
 * S3Client; tests substitute an in-memory implementation.
 */

#ifndef OBJECT_STORE_HPP
#define OBJECT_STORE_HPP

#include "backup_error.hpp"
#include "backup_types.hpp"
#include <cstddef>
#include <expected>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

/// User metadata attached to an object (sent as x-amz-meta-* headers).
using ObjectMetadata = std::map<std::string, std::string>;

/**
 * @brief One uploaded chunk of a multi-part transfer.
 */
struct CompletedPart {
    int partNumber = 0; ///< 1-based sequence number.
    std::string etag;   ///< Integrity tag returned by the store.
};

/**
 * @brief Interface for object store clients.
 *
 * Every failure is reported as an UploadError.
 */
class ObjectStoreClient {
public:
    virtual ~ObjectStoreClient() = default;

    /**
     * @brief Stores a file as one object with server-side encryption.
     */
    virtual std::expected<void, BackupError> putObject(const std::string& key, const std::filesystem::path& file,
                                                       const ObjectMetadata& metadata) = 0;

    /**
     * @brief Opens a multi-part transfer session.
     *
     * @return std::expected<std::string, BackupError> The upload id.
     */
    virtual std::expected<std::string, BackupError> createMultipartUpload(const std::string& key,
                                                                          const ObjectMetadata& metadata) = 0;

    /**
     * @brief Sends one chunk of a multi-part transfer.
     *
     * @return std::expected<std::string, BackupError> The chunk's ETag.
     */
    virtual std::expected<std::string, BackupError> uploadPart(const std::string& key, const std::string& uploadId,
                                                               int partNumber, const char* data, std::size_t size) = 0;

    /**
     * @brief Finalizes a multi-part transfer from its ordered parts.
     */
    virtual std::expected<void, BackupError> completeMultipartUpload(const std::string& key, const std::string& uploadId,
                                                                     const std::vector<CompletedPart>& parts) = 0;

    /**
     * @brief Discards a multi-part transfer session.
     */
    virtual std::expected<void, BackupError> abortMultipartUpload(const std::string& key, const std::string& uploadId) = 0;

    /**
     * @brief Lists every object under a prefix (tags are not filled).
     */
    virtual std::expected<std::vector<RemoteObject>, BackupError> listObjects(const std::string& prefix) = 0;

    /**
     * @brief Fetches the user metadata of an object.
     */
    virtual std::expected<ObjectMetadata, BackupError> headObject(const std::string& key) = 0;

    /**
     * @brief Deletes an object.
     */
    virtual std::expected<void, BackupError> deleteObject(const std::string& key) = 0;
};

#endif // OBJECT_STORE_HPP
