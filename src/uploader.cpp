#include "uploader.hpp"
#include "logger.hpp"
#include "time_utils.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <format>
#include <fstream>

namespace {

constexpr const char* kKeyRoot = "backups/";

std::string timestampComponent(const std::string& iso) {
    std::string compact = compactIsoTimestamp(iso);
    return Uploader::sanitizeKeyComponent(compact, false);
}

}

Uploader::Uploader(ObjectStoreClient& client, UploadOptions options) : client(client), options(options) {
    if (this->options.partSize == 0) {
        this->options.partSize = UploadOptions{}.partSize;
    }
}

std::string Uploader::sanitizeKeyComponent(const std::string& text, bool allowDot) {
    std::string result = text;
    std::replace_if(result.begin(), result.end(), [allowDot](unsigned char c) {
        return !(std::isalnum(c) || c == '_' || c == '-' || (allowDot && c == '.'));
    }, '_');
    return result;
}

std::string Uploader::sourcePrefix(const std::string& sourceName) {
    return std::format("{}{}/", kKeyRoot, sanitizeKeyComponent(sourceName, false));
}

std::string Uploader::objectKey(const BackupMetadata& metadata) {
    return std::format("{}{}_{}", sourcePrefix(metadata.sourceName), timestampComponent(metadata.timestamp),
                       sanitizeKeyComponent(metadata.filename, true));
}

ObjectMetadata Uploader::objectMetadata(const BackupMetadata& metadata) {
    return {
        {"source-name", metadata.sourceName},
        {"timestamp", metadata.timestamp},
        {"size", std::to_string(metadata.size)},
        {"checksum", metadata.checksum},
        {"encryption-method", encryptionMethodName(metadata.encryptionMethod)},
        {"source-kind", sourceKindName(metadata.sourceKind)}
    };
}

UploadResult Uploader::upload(const std::filesystem::path& file, const BackupMetadata& metadata) {
    UploadResult result;
    result.key = objectKey(metadata);

    std::error_code ec;
    const auto size = std::filesystem::file_size(file, ec);
    if (ec) {
        result.error = std::format("Cannot read upload file size: {}", ec.message());
        return result;
    }

    const ObjectMetadata tags = objectMetadata(metadata);
    std::expected<void, BackupError> outcome;
    if (size > options.multipartThreshold) {
        Logger::logDebug(std::format("Multi-part upload of {} bytes to {}", size, result.key));
        outcome = multipartUpload(file, result.key, tags);
    } else {
        outcome = client.putObject(result.key, file, tags);
    }

    if (!outcome) {
        result.error = outcome.error().message;
        Logger::logError(std::format("Upload of {} failed: {}", result.key, result.error));
        return result;
    }
    result.success = true;
    Logger::logMessage(std::format("Uploaded {}", result.key));
    return result;
}

std::expected<void, BackupError> Uploader::multipartUpload(const std::filesystem::path& file, const std::string& key,
                                                           const ObjectMetadata& metadata) {
    auto uploadId = client.createMultipartUpload(key, metadata);
    if (!uploadId) {
        return std::unexpected(uploadId.error());
    }

    std::ifstream in(file, std::ios::binary);
    if (!in) {
        abortQuietly(key, *uploadId);
        return std::unexpected(BackupError(ErrorKind::Upload,
            std::format("Multipart upload failed during file reading: {}", strerror(errno))));
    }

    std::vector<CompletedPart> parts;
    std::vector<char> buffer(options.partSize);
    int partNumber = 1;
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const std::streamsize got = in.gcount();
        if (in.bad()) {
            abortQuietly(key, *uploadId);
            return std::unexpected(BackupError(ErrorKind::Upload, "Multipart upload failed during file reading"));
        }
        if (got <= 0) {
            break;
        }

        auto etag = client.uploadPart(key, *uploadId, partNumber, buffer.data(), static_cast<std::size_t>(got));
        if (!etag) {
            abortQuietly(key, *uploadId);
            return std::unexpected(BackupError(ErrorKind::Upload,
                std::format("Multipart upload failed at part {}: {}", partNumber, etag.error().message)));
        }
        parts.push_back({partNumber, *etag});
        Logger::logDebug(std::format("Uploaded part {} of {}", partNumber, key));
        ++partNumber;
    }

    if (parts.empty()) {
        abortQuietly(key, *uploadId);
        return std::unexpected(BackupError(ErrorKind::Upload, "No parts uploaded for multipart upload"));
    }

    auto completed = client.completeMultipartUpload(key, *uploadId, parts);
    if (!completed) {
        abortQuietly(key, *uploadId);
        return std::unexpected(completed.error());
    }
    return {};
}

void Uploader::abortQuietly(const std::string& key, const std::string& uploadId) {
    auto aborted = client.abortMultipartUpload(key, uploadId);
    if (!aborted) {
        Logger::logWarning(std::format("Failed to abort multipart upload {}: {}", uploadId, aborted.error().message));
    }
}

std::expected<std::vector<RemoteObject>, BackupError> Uploader::listBackups(const std::string& sourceName) {
    auto objects = client.listObjects(sourcePrefix(sourceName));
    if (!objects) {
        return std::unexpected(objects.error());
    }

    for (auto& object : *objects) {
        auto tags = client.headObject(object.key);
        if (tags) {
            object.tags = std::move(*tags);
        } else {
            Logger::logDebug(std::format("No metadata for {}: {}", object.key, tags.error().message));
        }
    }

    std::stable_sort(objects->begin(), objects->end(), [](const RemoteObject& a, const RemoteObject& b) {
        return a.lastModified > b.lastModified;
    });
    return objects;
}

std::expected<void, BackupError> Uploader::deleteBackup(const std::string& key) {
    auto deleted = client.deleteObject(key);
    if (!deleted) {
        return std::unexpected(BackupError(ErrorKind::Retention,
            std::format("Failed to delete {}: {}", key, deleted.error().message)));
    }
    Logger::logMessage(std::format("Deleted backup {}", key));
    return {};
}
